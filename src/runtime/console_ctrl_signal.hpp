#pragma once

// Turns console control events into a manual-reset stop event.
//
// Ctrl+C and Ctrl+Break only set the event. Close, logoff and shutdown end the
// process as soon as the handler returns, so for those the handler also holds
// the event source until the owner calls `uninstall` (its cleanup is done) or
// `close_grace_ms` runs out. The grace period must stay below the roughly 5 s
// the system allows a close handler.
//
// Only one instance may be installed at a time; the handler routine is a
// process-wide callback.

#include "core/handle_view.hpp"
#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>

namespace vmr::runtime
{
    class ConsoleCtrlSignal final
    {
    public:
        static constexpr DWORD default_close_grace_ms = 4'000;

        ConsoleCtrlSignal() noexcept = default;
        ~ConsoleCtrlSignal() noexcept;

        ConsoleCtrlSignal(const ConsoleCtrlSignal&) = delete;
        ConsoleCtrlSignal& operator=(const ConsoleCtrlSignal&) = delete;

        ConsoleCtrlSignal(ConsoleCtrlSignal&& other) noexcept;
        ConsoleCtrlSignal& operator=(ConsoleCtrlSignal&& other) noexcept;

        // Fails with ERROR_ALREADY_EXISTS when another instance is installed.
        [[nodiscard]] static std::expected<ConsoleCtrlSignal, DWORD> install(DWORD close_grace_ms = default_close_grace_ms) noexcept;

        [[nodiscard]] core::HandleView event() const noexcept
        {
            return _stop.view();
        }

        // Releases a close handler that is waiting for cleanup, then removes
        // the handler. Safe to call more than once.
        void uninstall() noexcept;

        // The routine registered with SetConsoleCtrlHandler. Returns FALSE when
        // no instance is installed or the event is not one it handles.
        static BOOL WINAPI on_control_event(DWORD control_type) noexcept;

    private:
        core::UniqueHandle _stop;
        core::UniqueHandle _cleanup_done;
        bool _installed{ false };
    };
}
