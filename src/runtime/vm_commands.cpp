#include "runtime/vm_commands.hpp"

#include "console/console_command.hpp"
#include "console/console_pipe.hpp"
#include "hcs/guest_process.hpp"
#include "runtime/console_ctrl_signal.hpp"
#include "runtime/interactive_session.hpp"
#include "runtime/virtual_machine.hpp"

#include <format>
#include <optional>
#include <utility>

namespace vmr::runtime
{
    namespace
    {
        [[nodiscard]] CommandError command_error(const std::wstring_view prefix, const hcs::ControlError& error)
        {
            return CommandError{ .message = std::format(L"{}: {}", prefix, hcs::describe(error)) };
        }

        [[nodiscard]] CommandError command_error(const std::wstring_view prefix, const console::ConsoleTransportError& error)
        {
            return CommandError{ .message = std::format(L"{}: {} (error={})", prefix, error.context, error.win32_error) };
        }

        [[nodiscard]] std::wstring pipe_name_for(const hcs::VmSettings& settings)
        {
            return settings.pipe_name.empty() ? console::console_pipe_name(settings.id) : settings.pipe_name;
        }

        [[nodiscard]] console::PipeOpenPolicy pipe_policy(const ConsoleOptions& options, const core::HandleView stop_event = {}) noexcept
        {
            return console::PipeOpenPolicy{ .timeout_ms = options.pipe_open_timeout_ms, .stop_event = stop_event };
        }

        // Ctrl+C must end the session instead of the process, so the handler is
        // installed before anything long-running starts.
        [[nodiscard]] std::optional<ConsoleCtrlSignal> install_ctrl_signal(logging::Logger& logger)
        {
            auto installed = ConsoleCtrlSignal::install();
            if (!installed)
            {
                logger.log(logging::LogLevel::debug, L"SetConsoleCtrlHandler failed (error={}); Ctrl+C ends the process", installed.error());
                return std::nullopt;
            }
            return std::move(installed.value());
        }

        [[nodiscard]] std::expected<void, CommandError> interactive_shell(
            logging::Logger& logger,
            const std::wstring& pipe_name,
            const core::HandleView stop_event,
            const ConsoleOptions& options,
            const HostStdio& stdio)
        {
            auto pipe = console::open_console_pipe(pipe_name, pipe_policy(options, stop_event));
            if (!pipe)
            {
                return std::unexpected(command_error(std::format(L"open console pipe \"{}\"", pipe_name), pipe.error()));
            }
            logger.log(logging::LogLevel::info, L"connected to serial console \"{}\"", pipe_name);

            InteractiveSessionOptions session_options{};
            session_options.host_input = stdio.input;
            session_options.host_output = stdio.output;
            session_options.stop_event = stop_event;
            session_options.trace_logger = options.trace_io ? &logger : nullptr;

            auto ended = run_interactive_session(pipe->view(), session_options, logger);
            if (!ended)
            {
                return std::unexpected(command_error(L"interactive shell ended", ended.error()));
            }

            logger.log(logging::LogLevel::info, L"console session ended: {}", session_end_name(ended.value()));
            return {};
        }

        [[nodiscard]] std::expected<void, CommandError> run_over_console(
            const std::wstring& pipe_name,
            const std::span<const std::wstring> command,
            const ConsoleOptions& options,
            const HostStdio& stdio)
        {
            auto pipe = console::open_console_pipe(pipe_name, pipe_policy(options));
            if (!pipe)
            {
                return std::unexpected(command_error(std::format(L"open console pipe \"{}\"", pipe_name), pipe.error()));
            }

            auto completed = console::run_console_command(pipe->view(), command, stdio.output);
            if (!completed)
            {
                return std::unexpected(command_error(L"run command over serial console", completed.error()));
            }
            return {};
        }

        // Returns true when the command ran through the guest agent.
        [[nodiscard]] bool try_guest_process(
            hcs::ComputeSystemControl& control,
            const hcs::ComputeSystem& system,
            const std::span<const std::wstring> command,
            const HostStdio& stdio)
        {
            hcs::GuestProcessRunner runner(control.service(), control.logger());
            auto ran = runner.run(system, command, hcs::GuestStdio{ .input = stdio.input, .output = stdio.output, .error = stdio.error });
            if (!ran)
            {
                control.logger().log(logging::LogLevel::info, L"guest agent unavailable ({}); using serial console", hcs::describe(ran.error()));
                return false;
            }
            return ran->status == hcs::GuestRunStatus::completed;
        }

        [[nodiscard]] std::expected<void, CommandError> run_in_system(
            hcs::ComputeSystemControl& control,
            const hcs::ComputeSystem& system,
            const std::wstring& pipe_name,
            const std::span<const std::wstring> command,
            const ConsoleOptions& options,
            const HostStdio& stdio)
        {
            if (options.prefer_guest_process && try_guest_process(control, system, command, stdio))
            {
                return {};
            }
            return run_over_console(pipe_name, command, options, stdio);
        }
    }

    std::expected<void, CommandError> run_vm(
        hcs::ComputeSystemControl& control,
        const hcs::VmSettings& settings,
        const bool interactive,
        const ConsoleOptions& options,
        const HostStdio& stdio)
    {
        logging::Logger& logger = control.logger();

        auto machine = VirtualMachine::start(control, settings);
        if (!machine)
        {
            return std::unexpected(command_error(L"failed to start VM", machine.error()));
        }
        logger.log(logging::LogLevel::info, L"VM \"{}\" started", settings.id);

        if (!interactive)
        {
            if (auto detached = machine->detach(); !detached)
            {
                logger.log(logging::LogLevel::warning, L"close handle: {}", hcs::describe(detached.error()));
            }
            return {};
        }

        // Stays installed until the VM is down: a close event holds the process
        // open until `uninstall` releases it.
        std::optional<ConsoleCtrlSignal> ctrl_signal = install_ctrl_signal(logger);
        const core::HandleView stop_event = ctrl_signal ? ctrl_signal->event() : core::HandleView{};

        auto shell = interactive_shell(logger, pipe_name_for(settings), stop_event, options, stdio);
        if (!shell)
        {
            logger.log_preformatted(logging::LogLevel::warning, shell.error().message);
        }

        auto stopped = machine->shutdown();
        if (ctrl_signal)
        {
            ctrl_signal->uninstall();
        }
        if (!stopped)
        {
            return std::unexpected(command_error(L"shutdown", stopped.error()));
        }
        return {};
    }

    std::expected<void, CommandError> exec_command(
        hcs::ComputeSystemControl& control,
        const hcs::VmSettings& settings,
        const std::span<const std::wstring> command,
        const ConsoleOptions& options,
        const HostStdio& stdio)
    {
        logging::Logger& logger = control.logger();
        const std::wstring pipe_name = pipe_name_for(settings);

        if (auto existing = control.open(settings.id); existing)
        {
            auto ran = run_in_system(control, existing.value(), pipe_name, command, options, stdio);
            if (auto closed = control.close(existing.value()); !closed)
            {
                logger.log(logging::LogLevel::debug, L"Closing VM handle: {}", hcs::describe(closed.error()));
            }
            return ran;
        }

        logger.log(logging::LogLevel::info, L"VM \"{}\" not running, starting...", settings.id);
        auto machine = VirtualMachine::start(control, settings);
        if (!machine)
        {
            return std::unexpected(command_error(L"start VM", machine.error()));
        }

        auto ran = run_in_system(control, machine->system(), pipe_name, command, options, stdio);

        // The VM stays up for later commands.
        if (auto detached = machine->detach(); !detached)
        {
            logger.log(logging::LogLevel::debug, L"Closing VM handle: {}", hcs::describe(detached.error()));
        }
        return ran;
    }

    std::expected<void, CommandError> attach_vm(
        hcs::ComputeSystemControl& control,
        const std::wstring_view id,
        const ConsoleOptions& options,
        const HostStdio& stdio)
    {
        auto existing = control.open(id);
        if (!existing)
        {
            return std::unexpected(command_error(std::format(L"VM \"{}\" not found", id), existing.error()));
        }
        if (auto closed = control.close(existing.value()); !closed)
        {
            control.logger().log(logging::LogLevel::debug, L"Closing VM handle: {}", hcs::describe(closed.error()));
        }

        std::optional<ConsoleCtrlSignal> ctrl_signal = install_ctrl_signal(control.logger());
        const core::HandleView stop_event = ctrl_signal ? ctrl_signal->event() : core::HandleView{};
        return interactive_shell(control.logger(), console::console_pipe_name(id), stop_event, options, stdio);
    }

    std::expected<void, CommandError> stop_vm(hcs::ComputeSystemControl& control, const std::wstring_view id)
    {
        auto system = control.open(id);
        if (!system)
        {
            return std::unexpected(command_error(std::format(L"open VM \"{}\"", id), system.error()));
        }

        control.logger().log(logging::LogLevel::info, L"stopping VM \"{}\"", id);
        if (auto stopped = control.shutdown(system.value()); !stopped)
        {
            (void)control.close(system.value());
            return std::unexpected(command_error(std::format(L"shutdown VM \"{}\"", id), stopped.error()));
        }

        ::Sleep(control.timeouts().shutdown_settle_ms);
        if (auto closed = control.close(system.value()); !closed)
        {
            return std::unexpected(command_error(L"close", closed.error()));
        }
        return {};
    }

    std::expected<void, CommandError> kill_vm(hcs::ComputeSystemControl& control, const std::wstring_view id)
    {
        auto system = control.open(id);
        if (!system)
        {
            return std::unexpected(command_error(std::format(L"open VM \"{}\"", id), system.error()));
        }

        control.logger().log(logging::LogLevel::info, L"killing VM \"{}\"", id);
        if (auto terminated = control.terminate(system.value()); !terminated)
        {
            (void)control.close(system.value());
            return std::unexpected(command_error(std::format(L"terminate VM \"{}\"", id), terminated.error()));
        }

        if (auto closed = control.close(system.value()); !closed)
        {
            return std::unexpected(command_error(L"close", closed.error()));
        }
        return {};
    }
}
