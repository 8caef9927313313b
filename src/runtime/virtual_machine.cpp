#include "runtime/virtual_machine.hpp"

#include <format>
#include <utility>

namespace vmr::runtime
{
    VirtualMachine::VirtualMachine(hcs::ComputeSystemControl& control, std::wstring id, hcs::ComputeSystem system) noexcept :
        _control(control),
        _id(std::move(id)),
        _system(std::move(system))
    {
    }

    std::expected<VirtualMachine, hcs::ControlError> VirtualMachine::start(
        hcs::ComputeSystemControl& control,
        const hcs::VmSettings& settings)
    {
        logging::Logger& logger = control.logger();

        control.cleanup_existing(settings.id);

        auto document = hcs::build_system_document(settings);
        if (!document)
        {
            return std::unexpected(hcs::make_control_error(
                hcs::ControlErrorKind::call_failed,
                L"Building the VM configuration",
                E_INVALIDARG,
                document.error().message));
        }

        logger.log(logging::LogLevel::info, L"creating VM \"{}\"", settings.id);
        auto system = control.create(settings.id, document.value());
        if (!system)
        {
            return std::unexpected(std::move(system.error()));
        }

        logger.log(logging::LogLevel::info, L"starting VM \"{}\"", settings.id);
        if (auto started = control.start(system.value()); !started)
        {
            if (auto closed = control.close(system.value()); !closed)
            {
                logger.log(logging::LogLevel::warning, L"Closing VM handle after failed start: {}", hcs::describe(closed.error()));
            }
            return std::unexpected(std::move(started.error()));
        }

        return VirtualMachine(control, settings.id, std::move(system.value()));
    }

    std::expected<void, hcs::ControlError> VirtualMachine::shutdown()
    {
        logging::Logger& logger = _control.logger();
        logger.log(logging::LogLevel::info, L"shutting down VM \"{}\"", _id);

        if (auto graceful = _control.shutdown(_system); !graceful)
        {
            logger.log(logging::LogLevel::warning, L"graceful shutdown failed ({}), terminating", hcs::describe(graceful.error()));
            if (auto terminated = _control.terminate(_system); !terminated)
            {
                if (auto closed = _control.close(_system); !closed)
                {
                    logger.log(logging::LogLevel::warning, L"Closing VM handle after failed terminate: {}", hcs::describe(closed.error()));
                }
                return std::unexpected(std::move(terminated.error()));
            }
        }

        ::Sleep(_control.timeouts().shutdown_settle_ms);
        return _control.close(_system);
    }

    std::expected<void, hcs::ControlError> VirtualMachine::detach()
    {
        return _control.close(_system);
    }
}
