#include "runtime/console_ctrl_signal.hpp"

#include "core/win32_handle.hpp"

#include <mutex>
#include <shared_mutex>
#include <utility>

namespace vmr::runtime
{
    namespace
    {
        // Handles of the installed instance. The handler holds the lock shared
        // for as long as it uses them; uninstall takes it exclusively before
        // the handles may be closed.
        struct InstalledSignal final
        {
            HANDLE stop{ nullptr };
            HANDLE cleanup_done{ nullptr };
            DWORD close_grace_ms{ 0 };
        };

        std::shared_mutex g_signal_lock;
        InstalledSignal g_signal{};

        [[nodiscard]] constexpr bool ends_process(const DWORD control_type) noexcept
        {
            return control_type == CTRL_CLOSE_EVENT ||
                   control_type == CTRL_LOGOFF_EVENT ||
                   control_type == CTRL_SHUTDOWN_EVENT;
        }
    }

    ConsoleCtrlSignal::~ConsoleCtrlSignal() noexcept
    {
        uninstall();
    }

    ConsoleCtrlSignal::ConsoleCtrlSignal(ConsoleCtrlSignal&& other) noexcept :
        _stop(std::move(other._stop)),
        _cleanup_done(std::move(other._cleanup_done)),
        _installed(std::exchange(other._installed, false))
    {
    }

    ConsoleCtrlSignal& ConsoleCtrlSignal::operator=(ConsoleCtrlSignal&& other) noexcept
    {
        if (this != &other)
        {
            uninstall();
            _stop = std::move(other._stop);
            _cleanup_done = std::move(other._cleanup_done);
            _installed = std::exchange(other._installed, false);
        }
        return *this;
    }

    std::expected<ConsoleCtrlSignal, DWORD> ConsoleCtrlSignal::install(const DWORD close_grace_ms) noexcept
    {
        auto stop = core::create_event(true, false);
        if (!stop)
        {
            return std::unexpected(stop.error());
        }
        auto cleanup_done = core::create_event(true, false);
        if (!cleanup_done)
        {
            return std::unexpected(cleanup_done.error());
        }

        {
            const std::unique_lock lock(g_signal_lock);
            if (g_signal.stop != nullptr)
            {
                return std::unexpected(static_cast<DWORD>(ERROR_ALREADY_EXISTS));
            }
            g_signal = InstalledSignal{
                .stop = stop->get(),
                .cleanup_done = cleanup_done->get(),
                .close_grace_ms = close_grace_ms,
            };
        }

        if (::SetConsoleCtrlHandler(&ConsoleCtrlSignal::on_control_event, TRUE) == FALSE)
        {
            const DWORD error = ::GetLastError();
            const std::unique_lock lock(g_signal_lock);
            g_signal = InstalledSignal{};
            return std::unexpected(error);
        }

        ConsoleCtrlSignal signal{};
        signal._stop = std::move(stop.value());
        signal._cleanup_done = std::move(cleanup_done.value());
        signal._installed = true;
        return signal;
    }

    void ConsoleCtrlSignal::uninstall() noexcept
    {
        if (!_installed)
        {
            return;
        }

        // Wake a close handler first; it holds the lock shared while it waits.
        (void)::SetEvent(_cleanup_done.get());
        {
            const std::unique_lock lock(g_signal_lock);
            g_signal = InstalledSignal{};
        }
        (void)::SetConsoleCtrlHandler(&ConsoleCtrlSignal::on_control_event, FALSE);
        _installed = false;
    }

    BOOL WINAPI ConsoleCtrlSignal::on_control_event(const DWORD control_type) noexcept
    {
        switch (control_type)
        {
        case CTRL_C_EVENT:
        case CTRL_BREAK_EVENT:
        case CTRL_CLOSE_EVENT:
        case CTRL_LOGOFF_EVENT:
        case CTRL_SHUTDOWN_EVENT:
            break;
        default:
            return FALSE;
        }

        const std::shared_lock lock(g_signal_lock);
        if (g_signal.stop == nullptr)
        {
            return FALSE;
        }

        (void)::SetEvent(g_signal.stop);
        if (ends_process(control_type))
        {
            (void)::WaitForSingleObject(g_signal.cleanup_done, g_signal.close_grace_ms);
        }
        return TRUE;
    }
}
