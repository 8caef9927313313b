#include "runtime/console_ctrl_signal.hpp"

#include "core/unique_handle.hpp"
#include "core/worker_thread.hpp"

#include <Windows.h>

#include <atomic>
#include <cstdio>
#include <memory>

namespace
{
    using vmr::runtime::ConsoleCtrlSignal;

    [[nodiscard]] bool is_signaled(const vmr::core::HandleView event, const DWORD timeout_ms = 0) noexcept
    {
        return event && ::WaitForSingleObject(event.get(), timeout_ms) == WAIT_OBJECT_0;
    }

    bool test_ctrl_c_sets_stop_event()
    {
        auto signal = ConsoleCtrlSignal::install();
        if (!signal)
        {
            fwprintf(stderr, L"[ctrl signal] install failed: %lu\n", signal.error());
            return false;
        }

        if (is_signaled(signal->event()))
        {
            return false;
        }

        if (ConsoleCtrlSignal::on_control_event(CTRL_C_EVENT) != TRUE)
        {
            return false;
        }
        if (!is_signaled(signal->event()))
        {
            return false;
        }

        // Ctrl+Break is handled the same way; the event stays set.
        return ConsoleCtrlSignal::on_control_event(CTRL_BREAK_EVENT) == TRUE && is_signaled(signal->event());
    }

    bool test_second_install_is_rejected()
    {
        auto first = ConsoleCtrlSignal::install();
        if (!first)
        {
            return false;
        }

        auto second = ConsoleCtrlSignal::install();
        if (second || second.error() != ERROR_ALREADY_EXISTS)
        {
            fwprintf(stderr, L"[ctrl signal] second install was not rejected\n");
            return false;
        }

        // The rejected attempt must leave the first instance working.
        return ConsoleCtrlSignal::on_control_event(CTRL_C_EVENT) == TRUE && is_signaled(first->event());
    }

    bool test_uninstall_clears_handler()
    {
        {
            auto signal = ConsoleCtrlSignal::install();
            if (!signal)
            {
                return false;
            }
            signal->uninstall();
            signal->uninstall();

            if (ConsoleCtrlSignal::on_control_event(CTRL_C_EVENT) != FALSE || is_signaled(signal->event()))
            {
                return false;
            }
        }

        // Destruction of an uninstalled instance leaves room for a new one.
        auto again = ConsoleCtrlSignal::install();
        return again.has_value();
    }

    bool test_unrelated_events_are_passed_on()
    {
        auto signal = ConsoleCtrlSignal::install();
        if (!signal)
        {
            return false;
        }

        constexpr DWORD unknown_control_type = 0x7F;
        return ConsoleCtrlSignal::on_control_event(unknown_control_type) == FALSE && !is_signaled(signal->event());
    }

    bool test_close_event_waits_for_uninstall()
    {
        auto signal = ConsoleCtrlSignal::install(10'000);
        if (!signal)
        {
            return false;
        }

        auto returned = std::make_shared<std::atomic<BOOL>>(FALSE);
        auto handler_thread = vmr::core::start_thread([returned]() noexcept {
            returned->store(ConsoleCtrlSignal::on_control_event(CTRL_CLOSE_EVENT));
        });
        if (!handler_thread)
        {
            return false;
        }

        if (!is_signaled(signal->event(), 2'000))
        {
            fwprintf(stderr, L"[ctrl signal] close event did not set the stop event\n");
            return false;
        }

        // The process would end as soon as the handler returns.
        if (::WaitForSingleObject(handler_thread->get(), 200) != WAIT_TIMEOUT)
        {
            fwprintf(stderr, L"[ctrl signal] close handler returned before cleanup\n");
            return false;
        }

        const ULONGLONG released = ::GetTickCount64();
        signal->uninstall();
        if (::WaitForSingleObject(handler_thread->get(), 2'000) != WAIT_OBJECT_0)
        {
            return false;
        }

        return returned->load() == TRUE && ::GetTickCount64() - released < 2'000;
    }

    bool test_close_event_grace_is_bounded()
    {
        auto signal = ConsoleCtrlSignal::install(200);
        if (!signal)
        {
            return false;
        }

        const ULONGLONG started = ::GetTickCount64();
        const BOOL handled = ConsoleCtrlSignal::on_control_event(CTRL_CLOSE_EVENT);
        const ULONGLONG elapsed = ::GetTickCount64() - started;

        return handled == TRUE && is_signaled(signal->event()) && elapsed >= 150 && elapsed < 2'000;
    }
}

bool run_console_ctrl_signal_tests()
{
    if (!test_ctrl_c_sets_stop_event())
    {
        fwprintf(stderr, L"[ctrl signal] test_ctrl_c_sets_stop_event failed\n");
        return false;
    }

    if (!test_second_install_is_rejected())
    {
        fwprintf(stderr, L"[ctrl signal] test_second_install_is_rejected failed\n");
        return false;
    }

    if (!test_uninstall_clears_handler())
    {
        fwprintf(stderr, L"[ctrl signal] test_uninstall_clears_handler failed\n");
        return false;
    }

    if (!test_unrelated_events_are_passed_on())
    {
        fwprintf(stderr, L"[ctrl signal] test_unrelated_events_are_passed_on failed\n");
        return false;
    }

    if (!test_close_event_waits_for_uninstall())
    {
        fwprintf(stderr, L"[ctrl signal] test_close_event_waits_for_uninstall failed\n");
        return false;
    }

    if (!test_close_event_grace_is_bounded())
    {
        fwprintf(stderr, L"[ctrl signal] test_close_event_grace_is_bounded failed\n");
        return false;
    }

    return true;
}
