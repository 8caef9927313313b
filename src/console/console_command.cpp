#include "console/console_command.hpp"

#include "console/prompt_scanner.hpp"
#include "core/shell_join.hpp"
#include "core/utf8.hpp"

#include <cstddef>
#include <format>

namespace vmr::console
{
    std::expected<void, ConsoleTransportError> wait_for_prompt(
        core::StreamReader& reader,
        const core::HandleView echo)
    {
        core::StreamWriter writer(echo);
        PromptScanner scanner;

        // One byte at a time: the prompt is the last thing the shell writes,
        // so a larger read would block waiting for bytes that never come.
        std::byte value{};
        for (;;)
        {
            auto read = reader.read(std::span<std::byte>(&value, 1));
            if (!read)
            {
                return std::unexpected(ConsoleTransportError{
                    .context = core::is_end_of_stream_error(read.error()) ? L"Console closed before a prompt appeared" : L"ReadFile failed for console pipe",
                    .win32_error = read.error(),
                });
            }
            if (read.value() == 0)
            {
                return std::unexpected(ConsoleTransportError{
                    .context = L"Console closed before a prompt appeared",
                    .win32_error = ERROR_HANDLE_EOF,
                });
            }

            if (echo)
            {
                auto written = writer.write_all(std::span<const std::byte>(&value, 1));
                if (!written)
                {
                    return std::unexpected(ConsoleTransportError{
                        .context = L"WriteFile failed for host output",
                        .win32_error = written.error(),
                    });
                }
            }

            if (scanner.feed(value))
            {
                return {};
            }
        }
    }

    std::expected<void, ConsoleTransportError> run_console_command(
        const core::HandleView channel,
        const std::span<const std::wstring> args,
        const core::HandleView host_output)
    {
        auto reader = core::StreamReader::overlapped(channel);
        auto writer = core::StreamWriter::overlapped(channel);

        if (auto ready = wait_for_prompt(reader, host_output); !ready)
        {
            ConsoleTransportError error = std::move(ready.error());
            error.context = std::format(L"Waiting for the guest prompt: {}", error.context);
            return std::unexpected(std::move(error));
        }

        const std::string command = core::to_utf8(core::shell_join(args)) + "\n";
        auto written = writer.write_all(core::as_bytes(command));
        if (!written)
        {
            return std::unexpected(ConsoleTransportError{
                .context = L"Writing the command to the console pipe",
                .win32_error = written.error(),
            });
        }

        return wait_for_prompt(reader, host_output);
    }
}
