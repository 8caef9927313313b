#pragma once

// Full-duplex bridge between the host terminal and the guest console pipe.
//
// One thread per direction. The session ends as soon as either direction
// finishes or the stop event is signaled; the other direction is cancelled
// and, if it does not return within `abandon_wait_ms`, left behind. Thread
// state lives in a reference-counted context with its own duplicate of the
// pipe handle, so a straggler never touches freed memory or a recycled handle.

#include "console/console_pipe.hpp"
#include "core/handle_view.hpp"
#include "logging/logger.hpp"

#include <Windows.h>

#include <expected>

namespace vmr::runtime
{
    enum class SessionEnd : unsigned char
    {
        guest_closed,
        host_closed,
        stop_requested,
    };

    struct InteractiveSessionOptions final
    {
        core::HandleView host_input;
        core::HandleView host_output;
        // Optional; typically the console control signal event.
        core::HandleView stop_event;
        // Enables per-write trace logging of host input.
        logging::Logger* trace_logger{ nullptr };
        DWORD abandon_wait_ms{ 500 };
    };

    // `channel` must be the overlapped console pipe. Raw input mode is applied
    // when `host_input` is a console and restored before returning.
    [[nodiscard]] std::expected<SessionEnd, console::ConsoleTransportError> run_interactive_session(
        core::HandleView channel,
        const InteractiveSessionOptions& options,
        logging::Logger& logger);

    [[nodiscard]] constexpr const wchar_t* session_end_name(const SessionEnd end) noexcept
    {
        switch (end)
        {
        case SessionEnd::guest_closed:
            return L"guest closed the console";
        case SessionEnd::host_closed:
            return L"host input ended";
        case SessionEnd::stop_requested:
            return L"stop requested";
        default:
            return L"unknown";
        }
    }
}
