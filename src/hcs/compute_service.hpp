#pragma once

// Seam between the lifecycle logic and the Host Compute Service.
//
// `VmComputeService` binds the real vmcompute.dll entry points; tests provide
// an in-process fake that can complete, fail, or go pending on demand and
// fire notifications from its own threads.
//
// Every call reports a `CallOutcome` instead of a bare HRESULT so that
// "pending" is never mistaken for a failure. Output handles are written even
// when the outcome is pending.

#include "hcs/hcs_types.hpp"

#include <string_view>

namespace vmr::hcs
{
    class IComputeService
    {
    public:
        virtual ~IComputeService() = default;

        virtual CallOutcome create_compute_system(std::wstring_view id, std::wstring_view configuration, HcsSystemHandle& system) noexcept = 0;
        virtual CallOutcome open_compute_system(std::wstring_view id, HcsSystemHandle& system) noexcept = 0;
        virtual CallOutcome start_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept = 0;
        virtual CallOutcome shutdown_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept = 0;
        virtual CallOutcome terminate_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept = 0;
        virtual CallOutcome close_compute_system(HcsSystemHandle system) noexcept = 0;

        // Unregistering must not return while a callback for `callback` is
        // still running; after it returns the context may be freed.
        virtual CallOutcome register_compute_system_callback(
            HcsSystemHandle system,
            NotificationCallback callback,
            void* context,
            HcsCallbackHandle& callback_handle) noexcept = 0;
        virtual CallOutcome unregister_compute_system_callback(HcsCallbackHandle callback_handle) noexcept = 0;

        virtual CallOutcome create_process(
            HcsSystemHandle system,
            std::wstring_view parameters,
            ProcessInformation& information,
            HcsProcessHandle& process) noexcept = 0;
        virtual CallOutcome close_process(HcsProcessHandle process) noexcept = 0;
    };
}
