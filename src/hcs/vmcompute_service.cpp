#include "hcs/vmcompute_service.hpp"

#include "core/unique_handle.hpp"

#include <objbase.h>

#include <string>

namespace vmr::hcs
{
    namespace
    {
        // Takes ownership of an HCS result document (CoTaskMemAlloc'ed) and
        // returns its text.
        [[nodiscard]] std::wstring take_result_text(PWSTR result)
        {
            if (result == nullptr)
            {
                return {};
            }

            std::wstring text(result);
            ::CoTaskMemFree(result);
            return text;
        }

        // The API wants NUL-terminated strings; a null pointer means "no options".
        [[nodiscard]] const wchar_t* optional_string(const std::wstring& value) noexcept
        {
            return value.empty() ? nullptr : value.c_str();
        }

        template<typename Fn>
        [[nodiscard]] bool resolve(const HMODULE module, const char* const name, Fn& target) noexcept
        {
            target = reinterpret_cast<Fn>(::GetProcAddress(module, name));
            return target != nullptr;
        }
    }

    std::expected<VmComputeService, ControlError> VmComputeService::load() noexcept
    {
        core::UniqueModule module(::LoadLibraryExW(L"vmcompute.dll", nullptr, LOAD_LIBRARY_SEARCH_SYSTEM32));
        if (!module.valid())
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::service_unavailable,
                L"LoadLibraryExW failed for vmcompute.dll (is Hyper-V enabled?)",
                HRESULT_FROM_WIN32(::GetLastError())));
        }

        VmComputeService service{};
        const bool resolved =
            resolve(module.get(), "HcsCreateComputeSystem", service._create_compute_system) &&
            resolve(module.get(), "HcsOpenComputeSystem", service._open_compute_system) &&
            resolve(module.get(), "HcsStartComputeSystem", service._start_compute_system) &&
            resolve(module.get(), "HcsShutdownComputeSystem", service._shutdown_compute_system) &&
            resolve(module.get(), "HcsTerminateComputeSystem", service._terminate_compute_system) &&
            resolve(module.get(), "HcsCloseComputeSystem", service._close_compute_system) &&
            resolve(module.get(), "HcsRegisterComputeSystemCallback", service._register_callback) &&
            resolve(module.get(), "HcsUnregisterComputeSystemCallback", service._unregister_callback) &&
            resolve(module.get(), "HcsCreateProcess", service._create_process) &&
            resolve(module.get(), "HcsCloseProcess", service._close_process);
        if (!resolved)
        {
            const DWORD error = ::GetLastError();
            return std::unexpected(make_control_error(
                ControlErrorKind::service_unavailable,
                L"GetProcAddress failed for an HCS entry point",
                HRESULT_FROM_WIN32(error)));
        }

        // The entry points must stay valid for the life of the process.
        (void)module.release();
        return service;
    }

    CallOutcome VmComputeService::create_compute_system(
        const std::wstring_view id,
        const std::wstring_view configuration,
        HcsSystemHandle& system) noexcept
    {
        const std::wstring id_text(id);
        const std::wstring configuration_text(configuration);

        system = nullptr;
        PWSTR result = nullptr;
        // Identity NULL selects the default security descriptor.
        const HRESULT hr = _create_compute_system(id_text.c_str(), configuration_text.c_str(), nullptr, &system, &result);
        return CallOutcome::from_hresult(hr, take_result_text(result));
    }

    CallOutcome VmComputeService::open_compute_system(const std::wstring_view id, HcsSystemHandle& system) noexcept
    {
        const std::wstring id_text(id);

        system = nullptr;
        PWSTR result = nullptr;
        const HRESULT hr = _open_compute_system(id_text.c_str(), &system, &result);
        return CallOutcome::from_hresult(hr, take_result_text(result));
    }

    CallOutcome VmComputeService::system_operation(
        const SystemOperationFn fn,
        const HcsSystemHandle system,
        const std::wstring_view options) noexcept
    {
        const std::wstring options_text(options);

        PWSTR result = nullptr;
        const HRESULT hr = fn(system, optional_string(options_text), &result);
        return CallOutcome::from_hresult(hr, take_result_text(result));
    }

    CallOutcome VmComputeService::start_compute_system(const HcsSystemHandle system, const std::wstring_view options) noexcept
    {
        return system_operation(_start_compute_system, system, options);
    }

    CallOutcome VmComputeService::shutdown_compute_system(const HcsSystemHandle system, const std::wstring_view options) noexcept
    {
        return system_operation(_shutdown_compute_system, system, options);
    }

    CallOutcome VmComputeService::terminate_compute_system(const HcsSystemHandle system, const std::wstring_view options) noexcept
    {
        return system_operation(_terminate_compute_system, system, options);
    }

    CallOutcome VmComputeService::close_compute_system(const HcsSystemHandle system) noexcept
    {
        return CallOutcome::from_hresult(_close_compute_system(system));
    }

    CallOutcome VmComputeService::register_compute_system_callback(
        const HcsSystemHandle system,
        const NotificationCallback callback,
        void* const context,
        HcsCallbackHandle& callback_handle) noexcept
    {
        callback_handle = nullptr;
        return CallOutcome::from_hresult(_register_callback(system, callback, context, &callback_handle));
    }

    CallOutcome VmComputeService::unregister_compute_system_callback(const HcsCallbackHandle callback_handle) noexcept
    {
        return CallOutcome::from_hresult(_unregister_callback(callback_handle));
    }

    CallOutcome VmComputeService::create_process(
        const HcsSystemHandle system,
        const std::wstring_view parameters,
        ProcessInformation& information,
        HcsProcessHandle& process) noexcept
    {
        const std::wstring parameters_text(parameters);

        information = ProcessInformation{};
        process = nullptr;
        PWSTR result = nullptr;
        const HRESULT hr = _create_process(system, parameters_text.c_str(), &information, &process, &result);
        return CallOutcome::from_hresult(hr, take_result_text(result));
    }

    CallOutcome VmComputeService::close_process(const HcsProcessHandle process) noexcept
    {
        return CallOutcome::from_hresult(_close_process(process));
    }
}
