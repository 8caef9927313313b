#pragma once

// Blocking adapter over HCS completion notifications.
//
// A `Subscription` must exist before the operation that produces the event,
// otherwise a fast completion can fire before anyone listens. The callback
// runs on a service-owned thread and only ever hands its result over through
// a single slot; it never blocks.

#include "core/unique_handle.hpp"
#include "hcs/compute_service.hpp"
#include "hcs/control_error.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <memory>
#include <string>

namespace vmr::hcs
{
    class Subscription final
    {
    public:
        Subscription() noexcept = default;
        ~Subscription() noexcept;

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;

        // Blocks until the subscribed notification arrives or `timeout_ms`
        // elapses. A notification carrying a failure status is returned as
        // `async_failed` with the notification text as detail.
        [[nodiscard]] std::expected<void, ControlError> wait(DWORD timeout_ms) const;

        // Unregisters the callback. Safe to call more than once.
        void release() noexcept;

        [[nodiscard]] bool active() const noexcept
        {
            return _service != nullptr;
        }

    private:
        friend class CompletionWaiter;

        struct Slot final
        {
            NotificationType wanted{ NotificationType::system_exited };
            std::atomic<bool> delivered{ false };
            HRESULT status{ S_OK };
            std::wstring data;
            core::UniqueHandle signaled;
        };

        static void CALLBACK on_notification(DWORD notification_type, void* context, HRESULT status, PCWSTR data) noexcept;

        IComputeService* _service{};
        HcsCallbackHandle _callback{};
        std::unique_ptr<Slot> _slot;
    };

    class CompletionWaiter final
    {
    public:
        CompletionWaiter() = delete;

        // Registers interest in `kind` on `system`. Registration failure is
        // reported as `registration_failed`.
        [[nodiscard]] static std::expected<Subscription, ControlError> register_wait(
            IComputeService& service,
            HcsSystemHandle system,
            NotificationType kind);
    };
}
