#include "hcs/completion_waiter.hpp"

#include "core/win32_handle.hpp"

#include <format>
#include <new>
#include <utility>

namespace vmr::hcs
{
    Subscription::~Subscription() noexcept
    {
        release();
    }

    Subscription::Subscription(Subscription&& other) noexcept :
        _service(std::exchange(other._service, nullptr)),
        _callback(std::exchange(other._callback, nullptr)),
        _slot(std::move(other._slot))
    {
    }

    Subscription& Subscription::operator=(Subscription&& other) noexcept
    {
        if (this != &other)
        {
            release();
            _service = std::exchange(other._service, nullptr);
            _callback = std::exchange(other._callback, nullptr);
            _slot = std::move(other._slot);
        }
        return *this;
    }

    void Subscription::release() noexcept
    {
        if (_service == nullptr)
        {
            return;
        }

        // The slot must outlive the registration: the service guarantees no
        // callback is running once unregistration returns.
        (void)_service->unregister_compute_system_callback(_callback);
        _service = nullptr;
        _callback = nullptr;
        _slot.reset();
    }

    std::expected<void, ControlError> Subscription::wait(const DWORD timeout_ms) const
    {
        if (!_slot)
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::registration_failed,
                L"Wait on a released subscription",
                E_HANDLE));
        }

        const DWORD result = ::WaitForSingleObject(_slot->signaled.get(), timeout_ms);
        if (result == WAIT_TIMEOUT)
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::timeout,
                std::format(L"Waiting for {}", notification_name(_slot->wanted)),
                HRESULT_FROM_WIN32(ERROR_TIMEOUT),
                std::format(L"timed out after {} ms", timeout_ms)));
        }
        if (result != WAIT_OBJECT_0)
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::call_failed,
                std::format(L"WaitForSingleObject for {}", notification_name(_slot->wanted)),
                HRESULT_FROM_WIN32(::GetLastError())));
        }

        if (FAILED(_slot->status))
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::async_failed,
                std::format(L"{} reported failure", notification_name(_slot->wanted)),
                _slot->status,
                _slot->data));
        }

        return {};
    }

    void CALLBACK Subscription::on_notification(
        const DWORD notification_type,
        void* const context,
        const HRESULT status,
        const PCWSTR data) noexcept
    {
        auto* const slot = static_cast<Slot*>(context);
        if (slot == nullptr || notification_type != static_cast<DWORD>(slot->wanted))
        {
            return;
        }

        if (slot->delivered.exchange(true, std::memory_order_acq_rel))
        {
            return;
        }

        slot->status = status;
        if (data != nullptr)
        {
            try
            {
                slot->data.assign(data);
            }
            catch (const std::bad_alloc&)
            {
                // The status alone still resolves the wait.
            }
        }

        // SetEvent orders the slot writes before the waiter's reads.
        ::SetEvent(slot->signaled.get());
    }

    std::expected<Subscription, ControlError> CompletionWaiter::register_wait(
        IComputeService& service,
        const HcsSystemHandle system,
        const NotificationType kind)
    {
        auto slot = std::make_unique<Subscription::Slot>();
        slot->wanted = kind;

        auto signaled = core::create_event(true, false);
        if (!signaled)
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::registration_failed,
                L"CreateEventW for completion wait",
                HRESULT_FROM_WIN32(signaled.error())));
        }
        slot->signaled = std::move(signaled.value());

        HcsCallbackHandle callback = nullptr;
        const CallOutcome outcome = service.register_compute_system_callback(
            system,
            &Subscription::on_notification,
            slot.get(),
            callback);
        if (!outcome.completed())
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::registration_failed,
                std::format(L"HcsRegisterComputeSystemCallback for {}", notification_name(kind)),
                outcome.failed() ? outcome.hresult : E_UNEXPECTED,
                outcome.detail));
        }

        Subscription subscription{};
        subscription._service = &service;
        subscription._callback = callback;
        subscription._slot = std::move(slot);
        return subscription;
    }
}
