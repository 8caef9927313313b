#pragma once

// In-process stand-in for vmcompute.dll.
//
// Each lifecycle operation follows a script: the HRESULT the call returns
// (S_OK, a failure, or HCS_OPERATION_PENDING) and an optional notification
// fired later from a helper thread. Callbacks are invoked while holding the
// registration lock, so unregistering waits for a running callback the same
// way the real service does.

#include "core/unique_handle.hpp"
#include "core/worker_thread.hpp"
#include "hcs/compute_service.hpp"

#include <Windows.h>

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace vmr::tests
{
    struct ScriptedNotification final
    {
        hcs::NotificationType type{ hcs::NotificationType::system_exited };
        HRESULT status{ S_OK };
        std::wstring data;
        DWORD delay_ms{ 0 };
    };

    struct OperationScript final
    {
        HRESULT hresult{ S_OK };
        std::wstring detail;
        std::optional<ScriptedNotification> notification;
    };

    class FakeComputeService final : public hcs::IComputeService
    {
    public:
        FakeComputeService() = default;

        ~FakeComputeService() override
        {
            join_notifiers();
        }

        FakeComputeService(const FakeComputeService&) = delete;
        FakeComputeService& operator=(const FakeComputeService&) = delete;

        OperationScript create_script;
        OperationScript open_script;
        OperationScript start_script;
        OperationScript shutdown_script;
        OperationScript terminate_script;
        HRESULT register_hresult{ S_OK };

        hcs::ProcessInformation process_information{};
        HRESULT create_process_hresult{ S_OK };

        std::atomic<int> create_calls{ 0 };
        std::atomic<int> open_calls{ 0 };
        std::atomic<int> start_calls{ 0 };
        std::atomic<int> shutdown_calls{ 0 };
        std::atomic<int> terminate_calls{ 0 };
        std::atomic<int> close_calls{ 0 };
        std::atomic<int> register_calls{ 0 };
        std::atomic<int> unregister_calls{ 0 };
        std::atomic<int> create_process_calls{ 0 };
        std::atomic<int> close_process_calls{ 0 };

        std::wstring last_configuration;
        std::wstring last_process_parameters;

        [[nodiscard]] static hcs::HcsSystemHandle system_handle() noexcept
        {
            return reinterpret_cast<hcs::HcsSystemHandle>(static_cast<ULONG_PTR>(0x5150));
        }

        [[nodiscard]] static hcs::HcsProcessHandle process_handle() noexcept
        {
            return reinterpret_cast<hcs::HcsProcessHandle>(static_cast<ULONG_PTR>(0x7070));
        }

        [[nodiscard]] size_t active_registrations()
        {
            const std::lock_guard lock(_mutex);
            return _registrations.size();
        }

        // Delivers a notification synchronously to every callback registered
        // on `system`.
        void fire(const hcs::HcsSystemHandle system, const hcs::NotificationType type, const HRESULT status, const std::wstring& data)
        {
            const std::lock_guard lock(_mutex);
            for (const auto& [handle, registration] : _registrations)
            {
                if (registration.system == system)
                {
                    registration.callback(static_cast<DWORD>(type), registration.context, status, data.empty() ? nullptr : data.c_str());
                }
            }
        }

        void join_notifiers()
        {
            std::vector<core::UniqueHandle> threads;
            {
                const std::lock_guard lock(_threads_mutex);
                threads.swap(_threads);
            }
            for (const auto& thread : threads)
            {
                (void)::WaitForSingleObject(thread.get(), INFINITE);
            }
        }

        hcs::CallOutcome create_compute_system(const std::wstring_view /*id*/, const std::wstring_view configuration, hcs::HcsSystemHandle& system) noexcept override
        {
            ++create_calls;
            last_configuration.assign(configuration);
            system = FAILED(create_script.hresult) && create_script.hresult != hcs::hcs_operation_pending ? nullptr : system_handle();
            return run_script(create_script, system);
        }

        hcs::CallOutcome open_compute_system(const std::wstring_view /*id*/, hcs::HcsSystemHandle& system) noexcept override
        {
            ++open_calls;
            system = FAILED(open_script.hresult) ? nullptr : system_handle();
            return hcs::CallOutcome::from_hresult(open_script.hresult, open_script.detail);
        }

        hcs::CallOutcome start_compute_system(const hcs::HcsSystemHandle system, const std::wstring_view /*options*/) noexcept override
        {
            ++start_calls;
            return run_script(start_script, system);
        }

        hcs::CallOutcome shutdown_compute_system(const hcs::HcsSystemHandle system, const std::wstring_view /*options*/) noexcept override
        {
            ++shutdown_calls;
            return run_script(shutdown_script, system);
        }

        hcs::CallOutcome terminate_compute_system(const hcs::HcsSystemHandle system, const std::wstring_view /*options*/) noexcept override
        {
            ++terminate_calls;
            return run_script(terminate_script, system);
        }

        hcs::CallOutcome close_compute_system(const hcs::HcsSystemHandle /*system*/) noexcept override
        {
            ++close_calls;
            return hcs::CallOutcome::from_hresult(S_OK);
        }

        hcs::CallOutcome register_compute_system_callback(
            const hcs::HcsSystemHandle system,
            const hcs::NotificationCallback callback,
            void* const context,
            hcs::HcsCallbackHandle& callback_handle) noexcept override
        {
            ++register_calls;
            callback_handle = nullptr;
            if (FAILED(register_hresult))
            {
                return hcs::CallOutcome::from_hresult(register_hresult);
            }

            const std::lock_guard lock(_mutex);
            ++_next_callback;
            callback_handle = reinterpret_cast<hcs::HcsCallbackHandle>(_next_callback);
            _registrations.emplace(callback_handle, Registration{ .system = system, .callback = callback, .context = context });
            return hcs::CallOutcome::from_hresult(S_OK);
        }

        hcs::CallOutcome unregister_compute_system_callback(const hcs::HcsCallbackHandle callback_handle) noexcept override
        {
            ++unregister_calls;
            const std::lock_guard lock(_mutex);
            _registrations.erase(callback_handle);
            return hcs::CallOutcome::from_hresult(S_OK);
        }

        hcs::CallOutcome create_process(
            const hcs::HcsSystemHandle /*system*/,
            const std::wstring_view parameters,
            hcs::ProcessInformation& information,
            hcs::HcsProcessHandle& process) noexcept override
        {
            ++create_process_calls;
            last_process_parameters.assign(parameters);
            information = process_information;
            process = FAILED(create_process_hresult) && create_process_hresult != hcs::hcs_operation_pending ? nullptr : process_handle();
            return hcs::CallOutcome::from_hresult(create_process_hresult);
        }

        hcs::CallOutcome close_process(const hcs::HcsProcessHandle /*process*/) noexcept override
        {
            ++close_process_calls;
            return hcs::CallOutcome::from_hresult(S_OK);
        }

    private:
        struct Registration final
        {
            hcs::HcsSystemHandle system{};
            hcs::NotificationCallback callback{};
            void* context{};
        };

        [[nodiscard]] hcs::CallOutcome run_script(const OperationScript& script, const hcs::HcsSystemHandle system) noexcept
        {
            if (script.notification && system != nullptr)
            {
                ScriptedNotification notification = *script.notification;
                auto thread = core::start_thread([this, system, notification]() noexcept {
                    ::Sleep(notification.delay_ms);
                    fire(system, notification.type, notification.status, notification.data);
                });
                if (thread)
                {
                    const std::lock_guard lock(_threads_mutex);
                    _threads.push_back(std::move(thread.value()));
                }
            }
            return hcs::CallOutcome::from_hresult(script.hresult, script.detail);
        }

        std::mutex _mutex;
        ULONG_PTR _next_callback{ 0x9000 };
        std::map<hcs::HcsCallbackHandle, Registration> _registrations;

        std::mutex _threads_mutex;
        std::vector<core::UniqueHandle> _threads;
    };
}
