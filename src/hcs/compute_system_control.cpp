#include "hcs/compute_system_control.hpp"

#include <format>
#include <new>
#include <string>

namespace vmr::hcs
{
    namespace
    {
        [[nodiscard]] ControlError with_context(ControlError error, std::wstring_view prefix)
        {
            error.context = std::format(L"{}: {}", prefix, error.context);
            return error;
        }
    }

    std::expected<ComputeSystem, ControlError> ComputeSystemControl::create(
        const std::wstring_view id,
        const std::wstring_view configuration)
    {
        HcsSystemHandle handle = nullptr;
        const CallOutcome outcome = _service.create_compute_system(id, configuration, handle);
        if (outcome.failed())
        {
            if (handle != nullptr)
            {
                (void)_service.close_compute_system(handle);
            }
            return std::unexpected(make_control_error(
                ControlErrorKind::call_failed,
                std::format(L"HcsCreateComputeSystem({})", id),
                outcome.hresult,
                outcome.detail));
        }

        ComputeSystem system(_service, handle);
        if (outcome.completed())
        {
            _logger.log(logging::LogLevel::debug, L"HcsCreateComputeSystem({}) completed synchronously", id);
            return system;
        }

        // The handle only exists once the call returns, so the subscription
        // cannot precede it. A completion racing ahead of the registration is
        // caught by the create timeout.
        _logger.log(logging::LogLevel::debug, L"HcsCreateComputeSystem({}) pending; waiting up to {} ms", id, _timeouts.create_ms);
        auto subscription = CompletionWaiter::register_wait(_service, system.get(), NotificationType::system_create_completed);
        if (!subscription)
        {
            return std::unexpected(with_context(std::move(subscription.error()), std::format(L"create {}", id)));
        }

        auto waited = subscription->wait(_timeouts.create_ms);
        subscription->release();
        if (!waited)
        {
            // `system` closes the half-created handle on the way out.
            return std::unexpected(with_context(std::move(waited.error()), std::format(L"create {}", id)));
        }

        return system;
    }

    std::expected<ComputeSystem, ControlError> ComputeSystemControl::open(const std::wstring_view id)
    {
        HcsSystemHandle handle = nullptr;
        const CallOutcome outcome = _service.open_compute_system(id, handle);
        if (!outcome.completed() || handle == nullptr)
        {
            if (handle != nullptr)
            {
                (void)_service.close_compute_system(handle);
            }
            return std::unexpected(make_control_error(
                ControlErrorKind::call_failed,
                std::format(L"HcsOpenComputeSystem({})", id),
                outcome.completed() ? E_HANDLE : outcome.hresult,
                outcome.detail));
        }

        return ComputeSystem(_service, handle);
    }

    std::expected<void, ControlError> ComputeSystemControl::start(const ComputeSystem& system)
    {
        return run_with_completion(
            system,
            &IComputeService::start_compute_system,
            L"HcsStartComputeSystem",
            NotificationType::system_start_completed,
            _timeouts.start_ms);
    }

    std::expected<void, ControlError> ComputeSystemControl::shutdown(const ComputeSystem& system)
    {
        return run_with_completion(
            system,
            &IComputeService::shutdown_compute_system,
            L"HcsShutdownComputeSystem",
            NotificationType::system_exited,
            _timeouts.shutdown_ms);
    }

    std::expected<void, ControlError> ComputeSystemControl::terminate(const ComputeSystem& system)
    {
        return run_with_completion(
            system,
            &IComputeService::terminate_compute_system,
            L"HcsTerminateComputeSystem",
            NotificationType::system_exited,
            _timeouts.terminate_ms);
    }

    std::expected<void, ControlError> ComputeSystemControl::close(ComputeSystem& system)
    {
        return system.close();
    }

    std::expected<void, ControlError> ComputeSystemControl::run_with_completion(
        const ComputeSystem& system,
        const SystemOperation operation,
        const wchar_t* const operation_name,
        const NotificationType completion,
        const DWORD timeout_ms)
    {
        if (!system.valid())
        {
            return std::unexpected(make_control_error(ControlErrorKind::call_failed, operation_name, E_HANDLE));
        }

        auto subscription = CompletionWaiter::register_wait(_service, system.get(), completion);
        if (!subscription)
        {
            return std::unexpected(with_context(std::move(subscription.error()), operation_name));
        }

        const CallOutcome outcome = (_service.*operation)(system.get(), {});
        if (outcome.failed())
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::call_failed,
                operation_name,
                outcome.hresult,
                outcome.detail));
        }

        if (outcome.completed())
        {
            // A completion notification may still arrive; releasing drops it.
            _logger.log(logging::LogLevel::debug, L"{} completed synchronously", operation_name);
            return {};
        }

        _logger.log(logging::LogLevel::debug, L"{} pending; waiting up to {} ms for {}", operation_name, timeout_ms, notification_name(completion));
        auto waited = subscription->wait(timeout_ms);
        if (!waited)
        {
            return std::unexpected(with_context(std::move(waited.error()), operation_name));
        }

        return {};
    }

    void ComputeSystemControl::cleanup_existing(const std::wstring_view id) noexcept
    {
        try
        {
            auto existing = open(id);
            if (!existing)
            {
                _logger.log(logging::LogLevel::debug, L"No existing VM named {}", id);
                return;
            }

            _logger.log(logging::LogLevel::info, L"Terminating leftover VM {}", id);
            auto terminated = terminate(*existing);
            if (!terminated)
            {
                _logger.log(logging::LogLevel::warning, L"Cleanup of {} ignored error: {}", id, describe(terminated.error()));
            }
            ::Sleep(_timeouts.cleanup_settle_ms);

            auto closed = close(*existing);
            if (!closed)
            {
                _logger.log(logging::LogLevel::warning, L"Cleanup of {} ignored error: {}", id, describe(closed.error()));
            }
        }
        catch (const std::bad_alloc&)
        {
            _logger.log_preformatted(logging::LogLevel::warning, L"Cleanup of an existing VM ran out of memory");
        }
    }
}
