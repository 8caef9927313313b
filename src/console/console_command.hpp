#pragma once

// One-shot command execution over the serial console: wait for a prompt, type
// the command line, echo everything up to the next prompt.

#include "console/console_pipe.hpp"
#include "core/handle_view.hpp"
#include "core/stream_io.hpp"

#include <expected>
#include <span>
#include <string>

namespace vmr::console
{
    // Copies bytes from `reader` to `echo` (when valid) until a prompt is seen.
    // End of stream before a prompt is an error.
    [[nodiscard]] std::expected<void, ConsoleTransportError> wait_for_prompt(
        core::StreamReader& reader,
        core::HandleView echo);

    [[nodiscard]] std::expected<void, ConsoleTransportError> run_console_command(
        core::HandleView channel,
        std::span<const std::wstring> args,
        core::HandleView host_output);
}
