#include "cli/command_line.hpp"

#include "core/unique_handle.hpp"
#include "serialization/fast_number.hpp"

#include <shellapi.h>

#include <format>
#include <optional>

namespace vmr::cli
{
    namespace
    {
        constexpr std::wstring_view kUsage =
            L"Usage: vmrunner <command> [flags] [args]\n"
            L"\n"
            L"Commands:\n"
            L"  run    [flags]           Start a VM (detached, or interactive with -i)\n"
            L"  exec   [flags] <cmd...>  Run a command in a VM (starts VM if not running)\n"
            L"  attach <vm-id>           Connect to a running VM's serial console\n"
            L"  stop   <vm-id>           Gracefully shut down a running VM\n"
            L"  kill   <vm-id>           Forcibly terminate a running VM\n"
            L"  help                     Show this help\n"
            L"\n"
            L"Run flags:\n"
            L"  -i                 Connect interactive shell (VM is shut down on exit)\n"
            L"  -id string         VM identifier (default \"vmrunner-vm\")\n"
            L"  -memory uint       Memory in MB (default 2048)\n"
            L"  -cpu uint          Number of virtual CPUs (default 2)\n"
            L"  -image-dir string  VM image directory (default C:\\source\\hcsshim\\vm-image)\n"
            L"  -kernel-args       Override kernel command line\n"
            L"  -debug             Print HCS JSON config before creating VM\n"
            L"  -trace             Like -debug, and log every console write\n"
            L"\n"
            L"Exec flags: the run flags except -i; the VM is left running.\n"
            L"\n"
            L"Examples:\n"
            L"  vmrunner run -memory 4096 -cpu 4 -i\n"
            L"  vmrunner exec -id my-vm ls -la\n"
            L"  vmrunner attach vmrunner-vm\n"
            L"  vmrunner stop   vmrunner-vm\n"
            L"  vmrunner kill   vmrunner-vm\n";

        struct Flag final
        {
            std::wstring_view name;
            std::optional<std::wstring_view> inline_value;
        };

        // "-name", "--name", "-name=value". Returns nullopt for non-flags,
        // including a lone "-" and the "--" terminator.
        [[nodiscard]] std::optional<Flag> split_flag(const std::wstring_view token) noexcept
        {
            if (token.size() < 2 || token.front() != L'-' || token == L"--")
            {
                return std::nullopt;
            }

            std::wstring_view body = token.substr(1);
            if (body.front() == L'-')
            {
                body.remove_prefix(1);
            }

            Flag flag{ .name = body };
            if (const size_t equals = body.find(L'='); equals != std::wstring_view::npos)
            {
                flag.name = body.substr(0, equals);
                flag.inline_value = body.substr(equals + 1);
            }
            return flag;
        }

        [[nodiscard]] std::expected<bool, ParseError> bool_value(const Flag& flag)
        {
            if (!flag.inline_value)
            {
                return true;
            }

            const std::wstring_view value = *flag.inline_value;
            if (value == L"true" || value == L"1")
            {
                return true;
            }
            if (value == L"false" || value == L"0")
            {
                return false;
            }
            return std::unexpected(ParseError{ .message = std::format(L"invalid boolean value \"{}\" for flag -{}", value, flag.name) });
        }

        [[nodiscard]] std::expected<std::wstring, ParseError> string_value(
            const Flag& flag,
            const std::vector<std::wstring>& args,
            size_t& index)
        {
            if (flag.inline_value)
            {
                return std::wstring(*flag.inline_value);
            }
            if (index + 1 >= args.size())
            {
                return std::unexpected(ParseError{ .message = std::format(L"flag needs an argument: -{}", flag.name) });
            }

            ++index;
            return args[index];
        }

        [[nodiscard]] std::expected<DWORD, ParseError> positive_value(
            const Flag& flag,
            const std::vector<std::wstring>& args,
            size_t& index)
        {
            auto text = string_value(flag, args, index);
            if (!text)
            {
                return std::unexpected(text.error());
            }

            auto parsed = serialization::parse_u32(*text);
            if (!parsed || *parsed == 0)
            {
                return std::unexpected(ParseError{ .message = std::format(L"invalid value \"{}\" for flag -{}: expected a positive integer", *text, flag.name) });
            }
            return static_cast<DWORD>(*parsed);
        }

        [[nodiscard]] std::optional<Subcommand> command_from_name(const std::wstring_view name) noexcept
        {
            if (name == L"run")
            {
                return Subcommand::run;
            }
            if (name == L"exec")
            {
                return Subcommand::exec;
            }
            if (name == L"attach")
            {
                return Subcommand::attach;
            }
            if (name == L"stop")
            {
                return Subcommand::stop;
            }
            if (name == L"kill")
            {
                return Subcommand::kill;
            }
            if (name == L"help" || name == L"-h" || name == L"--help" || name == L"-help")
            {
                return Subcommand::help;
            }
            return std::nullopt;
        }
    }

    CommandLine::CommandLine(const config::AppConfig& defaults) :
        _vm_id(defaults.vm_id),
        _image_dir(defaults.image_dir),
        _memory_mb(defaults.memory_mb),
        _cpu_count(defaults.cpu_count),
        _kernel_args(defaults.kernel_args)
    {
    }

    std::wstring_view CommandLine::usage() noexcept
    {
        return kUsage;
    }

    std::expected<CommandLine, ParseError> CommandLine::parse(const std::wstring_view command_line, const config::AppConfig& defaults)
    {
        std::vector<std::wstring> args;
        if (!command_line.empty())
        {
            const std::wstring mutable_command_line(command_line);
            int argc = 0;
            core::UniqueLocalPtr<wchar_t*> argv(::CommandLineToArgvW(mutable_command_line.c_str(), &argc));
            if (argv.get() == nullptr)
            {
                return std::unexpected(ParseError{ .message = L"CommandLineToArgvW failed" });
            }

            args.reserve(argc > 0 ? static_cast<size_t>(argc) - 1 : 0);
            for (int index = 1; index < argc; ++index)
            {
                args.emplace_back(argv.get()[index]);
            }
        }

        return parse_arguments(args, defaults);
    }

    std::expected<CommandLine, ParseError> CommandLine::parse_arguments(const std::vector<std::wstring>& args, const config::AppConfig& defaults)
    {
        CommandLine result(defaults);

        size_t start = 0;
        if (!args.empty())
        {
            if (const auto named = command_from_name(args.front()); named)
            {
                result._subcommand = *named;
                start = 1;
            }
        }

        switch (result._subcommand)
        {
        case Subcommand::help:
            return result;
        case Subcommand::run:
            if (auto parsed = result.parse_vm_flags(args, start, false); !parsed)
            {
                return std::unexpected(parsed.error());
            }
            return result;
        case Subcommand::exec:
            if (auto parsed = result.parse_vm_flags(args, start, true); !parsed)
            {
                return std::unexpected(parsed.error());
            }
            if (result._command.empty())
            {
                return std::unexpected(ParseError{ .message = L"exec: command required\nusage: vmrunner exec [flags] <cmd> [args...]" });
            }
            return result;
        case Subcommand::attach:
        case Subcommand::stop:
        case Subcommand::kill:
            if (auto parsed = result.parse_target(args, start, args.front()); !parsed)
            {
                return std::unexpected(parsed.error());
            }
            return result;
        default:
            return std::unexpected(ParseError{ .message = L"Unknown command" });
        }
    }

    std::expected<void, ParseError> CommandLine::parse_vm_flags(const std::vector<std::wstring>& args, const size_t start, const bool allow_command)
    {
        for (size_t index = start; index < args.size(); ++index)
        {
            const std::wstring& token = args[index];
            const std::optional<Flag> flag = split_flag(token);
            if (!flag)
            {
                const size_t first = token == L"--" ? index + 1 : index;
                if (!allow_command)
                {
                    if (first < args.size())
                    {
                        return std::unexpected(ParseError{ .message = std::format(L"unexpected argument \"{}\"", args[first]) });
                    }
                    return {};
                }

                _command.assign(args.begin() + static_cast<std::ptrdiff_t>(first), args.end());
                return {};
            }

            if (flag->name == L"i" && !allow_command)
            {
                auto value = bool_value(*flag);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                _interactive = *value;
                continue;
            }

            if (flag->name == L"debug" || flag->name == L"trace")
            {
                auto value = bool_value(*flag);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                (flag->name == L"debug" ? _debug : _trace) = *value;
                continue;
            }

            if (flag->name == L"id" || flag->name == L"image-dir" || flag->name == L"kernel-args")
            {
                auto value = string_value(*flag, args, index);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                if (flag->name == L"id")
                {
                    if (value->empty())
                    {
                        return std::unexpected(ParseError{ .message = L"flag -id must not be empty" });
                    }
                    _vm_id = std::move(*value);
                }
                else if (flag->name == L"image-dir")
                {
                    _image_dir = std::move(*value);
                }
                else
                {
                    _kernel_args = std::move(*value);
                }
                continue;
            }

            if (flag->name == L"memory" || flag->name == L"cpu")
            {
                auto value = positive_value(*flag, args, index);
                if (!value)
                {
                    return std::unexpected(value.error());
                }
                (flag->name == L"memory" ? _memory_mb : _cpu_count) = *value;
                continue;
            }

            return std::unexpected(ParseError{ .message = std::format(L"flag provided but not defined: {}", token) });
        }

        return {};
    }

    std::expected<void, ParseError> CommandLine::parse_target(const std::vector<std::wstring>& args, const size_t start, const std::wstring_view command_name)
    {
        if (start >= args.size() || args[start].empty())
        {
            return std::unexpected(ParseError{ .message = std::format(L"{}: VM ID required\nusage: vmrunner {} <vm-id>", command_name, command_name) });
        }
        if (start + 1 < args.size())
        {
            return std::unexpected(ParseError{ .message = std::format(L"{}: unexpected argument \"{}\"", command_name, args[start + 1]) });
        }

        _vm_id = args[start];
        return {};
    }
}
