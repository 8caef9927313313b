#pragma once

// Lifecycle operations against the compute service.
//
// Every HCS lifecycle call may complete inline, fail inline, or go pending and
// finish later through a notification. `ComputeSystemControl` folds the three
// outcomes into one blocking call per operation, subscribing to the matching
// notification before issuing the call whenever the handle already exists.

#include "hcs/completion_waiter.hpp"
#include "hcs/compute_service.hpp"
#include "hcs/compute_system.hpp"
#include "hcs/control_error.hpp"
#include "logging/logger.hpp"

#include <Windows.h>

#include <expected>
#include <string_view>

namespace vmr::hcs
{
    struct LifecycleTimeouts final
    {
        DWORD create_ms{ 60'000 };
        DWORD start_ms{ 120'000 };
        DWORD shutdown_ms{ 30'000 };
        DWORD terminate_ms{ 10'000 };
        // Pause after terminating a leftover VM so the service finishes
        // tearing it down before the id is reused.
        DWORD cleanup_settle_ms{ 300 };
        // Pause between a stop and the final close of the handle.
        DWORD shutdown_settle_ms{ 500 };
    };

    class ComputeSystemControl final
    {
    public:
        ComputeSystemControl(IComputeService& service, logging::Logger& logger, LifecycleTimeouts timeouts = {}) noexcept :
            _service(service),
            _logger(logger),
            _timeouts(timeouts)
        {
        }

        [[nodiscard]] std::expected<ComputeSystem, ControlError> create(std::wstring_view id, std::wstring_view configuration);
        [[nodiscard]] std::expected<ComputeSystem, ControlError> open(std::wstring_view id);

        [[nodiscard]] std::expected<void, ControlError> start(const ComputeSystem& system);
        [[nodiscard]] std::expected<void, ControlError> shutdown(const ComputeSystem& system);
        [[nodiscard]] std::expected<void, ControlError> terminate(const ComputeSystem& system);
        [[nodiscard]] std::expected<void, ControlError> close(ComputeSystem& system);

        // Best effort removal of a VM left behind under `id`. Never fails;
        // every problem is logged and dropped.
        void cleanup_existing(std::wstring_view id) noexcept;

        [[nodiscard]] IComputeService& service() const noexcept
        {
            return _service;
        }

        [[nodiscard]] logging::Logger& logger() const noexcept
        {
            return _logger;
        }

        [[nodiscard]] const LifecycleTimeouts& timeouts() const noexcept
        {
            return _timeouts;
        }

    private:
        using SystemOperation = CallOutcome (IComputeService::*)(HcsSystemHandle, std::wstring_view) noexcept;

        // Shared path of start/shutdown/terminate.
        [[nodiscard]] std::expected<void, ControlError> run_with_completion(
            const ComputeSystem& system,
            SystemOperation operation,
            const wchar_t* operation_name,
            NotificationType completion,
            DWORD timeout_ms);

        IComputeService& _service;
        logging::Logger& _logger;
        LifecycleTimeouts _timeouts;
    };
}
