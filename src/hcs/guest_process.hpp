#pragma once

// Runs a command through the in-guest agent (HcsCreateProcess).
//
// Older service builds accept the call but hand back no stdio handles. That
// case is reported as `GuestRunStatus::unsupported` so the caller can fall
// back to the serial console; it is not an error.

#include "core/handle_view.hpp"
#include "hcs/compute_service.hpp"
#include "hcs/compute_system.hpp"
#include "hcs/control_error.hpp"
#include "logging/logger.hpp"

#include <Windows.h>

#include <expected>
#include <span>
#include <string>

namespace vmr::hcs
{
    enum class GuestRunStatus : unsigned char
    {
        completed,
        unsupported,
    };

    struct GuestRunResult final
    {
        GuestRunStatus status{ GuestRunStatus::completed };
        // The agent channel reports no exit status here; a finished process
        // is reported as 0.
        DWORD exit_code{ 0 };
        DWORD process_id{ 0 };
    };

    struct GuestStdio final
    {
        core::HandleView input;
        core::HandleView output;
        core::HandleView error;
    };

    class GuestProcessRunner final
    {
    public:
        GuestProcessRunner(IComputeService& service, logging::Logger& logger) noexcept :
            _service(service),
            _logger(logger)
        {
        }

        // Blocks until the guest closes its stdout. Host input is forwarded on
        // a helper thread that is abandoned (not drained) once output ends.
        // Errors are only returned when the process could not be created, so
        // a caller may safely retry the command another way.
        [[nodiscard]] std::expected<GuestRunResult, ControlError> run(
            const ComputeSystem& system,
            std::span<const std::wstring> args,
            GuestStdio stdio);

        // Time granted to the stderr copy to drain after stdout has closed.
        static constexpr DWORD stderr_drain_ms = 500;

    private:
        IComputeService& _service;
        logging::Logger& _logger;
    };
}
