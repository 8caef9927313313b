#pragma once

// Production `IComputeService` backed by the HCS v1 exports of vmcompute.dll.
//
// The DLL is loaded from System32 at runtime so the executable still starts
// (and can print help or a clean error) on hosts without the Hyper-V
// platform installed. It is never unloaded: completion callbacks run on
// threads owned by the DLL.

#include "hcs/compute_service.hpp"
#include "hcs/control_error.hpp"

#include <Windows.h>

#include <expected>

namespace vmr::hcs
{
    class VmComputeService final : public IComputeService
    {
    public:
        [[nodiscard]] static std::expected<VmComputeService, ControlError> load() noexcept;

        CallOutcome create_compute_system(std::wstring_view id, std::wstring_view configuration, HcsSystemHandle& system) noexcept override;
        CallOutcome open_compute_system(std::wstring_view id, HcsSystemHandle& system) noexcept override;
        CallOutcome start_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept override;
        CallOutcome shutdown_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept override;
        CallOutcome terminate_compute_system(HcsSystemHandle system, std::wstring_view options) noexcept override;
        CallOutcome close_compute_system(HcsSystemHandle system) noexcept override;

        CallOutcome register_compute_system_callback(
            HcsSystemHandle system,
            NotificationCallback callback,
            void* context,
            HcsCallbackHandle& callback_handle) noexcept override;
        CallOutcome unregister_compute_system_callback(HcsCallbackHandle callback_handle) noexcept override;

        CallOutcome create_process(
            HcsSystemHandle system,
            std::wstring_view parameters,
            ProcessInformation& information,
            HcsProcessHandle& process) noexcept override;
        CallOutcome close_process(HcsProcessHandle process) noexcept override;

    private:
        using CreateComputeSystemFn = HRESULT(WINAPI*)(PCWSTR id, PCWSTR configuration, HANDLE identity, HcsSystemHandle* system, PWSTR* result);
        using OpenComputeSystemFn = HRESULT(WINAPI*)(PCWSTR id, HcsSystemHandle* system, PWSTR* result);
        using SystemOperationFn = HRESULT(WINAPI*)(HcsSystemHandle system, PCWSTR options, PWSTR* result);
        using CloseComputeSystemFn = HRESULT(WINAPI*)(HcsSystemHandle system);
        using RegisterCallbackFn = HRESULT(WINAPI*)(HcsSystemHandle system, NotificationCallback callback, void* context, HcsCallbackHandle* callback_handle);
        using UnregisterCallbackFn = HRESULT(WINAPI*)(HcsCallbackHandle callback_handle);
        using CreateProcessFn = HRESULT(WINAPI*)(HcsSystemHandle system, PCWSTR parameters, ProcessInformation* information, HcsProcessHandle* process, PWSTR* result);
        using CloseProcessFn = HRESULT(WINAPI*)(HcsProcessHandle process);

        VmComputeService() noexcept = default;

        [[nodiscard]] static CallOutcome system_operation(SystemOperationFn fn, HcsSystemHandle system, std::wstring_view options) noexcept;

        CreateComputeSystemFn _create_compute_system{};
        OpenComputeSystemFn _open_compute_system{};
        SystemOperationFn _start_compute_system{};
        SystemOperationFn _shutdown_compute_system{};
        SystemOperationFn _terminate_compute_system{};
        CloseComputeSystemFn _close_compute_system{};
        RegisterCallbackFn _register_callback{};
        UnregisterCallbackFn _unregister_callback{};
        CreateProcessFn _create_process{};
        CloseProcessFn _close_process{};
    };
}
