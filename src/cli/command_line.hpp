#pragma once

// CLI parser for `vmrunner`.
//
// `vmrunner <command> [flags] [args]`. Tokenization follows
// `CommandLineToArgvW`. Flags use the single-dash long form (`-memory 4096`,
// `-memory=4096`); a double dash prefix is accepted too. A first token that is
// not a command name selects `run` with every token as its arguments.
//
// This module performs no side effects; defaults come from the loaded
// configuration so that command line values always win.

#include "config/app_config.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace vmr::cli
{
    enum class Subcommand : unsigned char
    {
        run,
        exec,
        attach,
        stop,
        kill,
        help,
    };

    struct ParseError final
    {
        std::wstring message;
    };

    class CommandLine final
    {
    public:
        // Parses a full process command line (argv[0] included).
        [[nodiscard]] static std::expected<CommandLine, ParseError> parse(std::wstring_view command_line, const config::AppConfig& defaults);

        // Parses already tokenized arguments (argv[0] excluded).
        [[nodiscard]] static std::expected<CommandLine, ParseError> parse_arguments(const std::vector<std::wstring>& args, const config::AppConfig& defaults);

        [[nodiscard]] static std::wstring_view usage() noexcept;

        [[nodiscard]] Subcommand subcommand() const noexcept
        {
            return _subcommand;
        }

        [[nodiscard]] bool interactive() const noexcept
        {
            return _interactive;
        }

        // `-trace` implies `-debug`.
        [[nodiscard]] bool debug() const noexcept
        {
            return _debug || _trace;
        }

        [[nodiscard]] bool trace() const noexcept
        {
            return _trace;
        }

        // VM id for run/exec, or the positional target of attach/stop/kill.
        [[nodiscard]] const std::wstring& vm_id() const noexcept
        {
            return _vm_id;
        }

        [[nodiscard]] const std::wstring& image_dir() const noexcept
        {
            return _image_dir;
        }

        [[nodiscard]] DWORD memory_mb() const noexcept
        {
            return _memory_mb;
        }

        [[nodiscard]] DWORD cpu_count() const noexcept
        {
            return _cpu_count;
        }

        [[nodiscard]] const std::wstring& kernel_args() const noexcept
        {
            return _kernel_args;
        }

        // The command to run for `exec`.
        [[nodiscard]] const std::vector<std::wstring>& command() const noexcept
        {
            return _command;
        }

    private:
        explicit CommandLine(const config::AppConfig& defaults);

        [[nodiscard]] std::expected<void, ParseError> parse_vm_flags(const std::vector<std::wstring>& args, size_t start, bool allow_command);
        [[nodiscard]] std::expected<void, ParseError> parse_target(const std::vector<std::wstring>& args, size_t start, std::wstring_view command_name);

        Subcommand _subcommand{ Subcommand::run };
        bool _interactive{ false };
        bool _debug{ false };
        bool _trace{ false };

        std::wstring _vm_id;
        std::wstring _image_dir;
        DWORD _memory_mb{ 0 };
        DWORD _cpu_count{ 0 };
        std::wstring _kernel_args;

        std::vector<std::wstring> _command;
    };
}
