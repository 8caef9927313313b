#include "app/application.hpp"

#include "cli/command_line.hpp"
#include "config/app_config.hpp"
#include "core/console_writer.hpp"
#include "core/handle_view.hpp"
#include "hcs/compute_system_control.hpp"
#include "hcs/system_document.hpp"
#include "hcs/vmcompute_service.hpp"
#include "logging/logger.hpp"
#include "runtime/vm_commands.hpp"

#include <Windows.h>

#include <expected>
#include <format>
#include <memory>
#include <string>

// Startup order: config -> logging -> CLI parse -> HCS binding -> dispatch.
// Everything that touches the compute service or the console pipe lives in
// `runtime`; this file only wires values together and maps results to exit
// codes.

namespace vmr::app
{
    namespace
    {
        constexpr int exit_success = 0;
        constexpr int exit_failure = 1;
        constexpr int exit_usage = 2;

        void configure_logging(logging::Logger& logger, const config::AppConfig& config)
        {
            if (config.enable_stderr_sink)
            {
                logger.add_sink(std::make_shared<logging::StderrLogSink>(core::HandleView::standard(STD_ERROR_HANDLE)));
            }
            if (config.enable_debug_sink)
            {
                logger.add_sink(std::make_shared<logging::DebugOutputSink>());
            }
            if (!config.enable_file_logging)
            {
                return;
            }

            auto path = logging::FileLogSink::session_log_path(config.log_directory_path);
            if (!path)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; no log path (error={})", path.error());
                return;
            }

            auto file_sink = logging::FileLogSink::open(path.value());
            if (!file_sink)
            {
                logger.log(logging::LogLevel::warning, L"File logging disabled; cannot open {} (error={})", path.value(), file_sink.error());
                return;
            }

            logger.add_sink(file_sink.value());
            logger.log(logging::LogLevel::debug, L"File logging enabled at {}", path.value());
        }

        [[nodiscard]] hcs::VmSettings vm_settings(const cli::CommandLine& args)
        {
            return hcs::VmSettings{
                .id = args.vm_id(),
                .image_dir = args.image_dir(),
                .memory_mb = args.memory_mb(),
                .cpu_count = args.cpu_count(),
                .kernel_args = args.kernel_args(),
            };
        }

        [[nodiscard]] int report(logging::Logger& logger, const std::expected<void, runtime::CommandError>& result, const std::wstring_view success_message)
        {
            if (!result)
            {
                logger.log_preformatted(logging::LogLevel::error, result.error().message);
                return exit_failure;
            }
            if (!success_message.empty())
            {
                logger.log_preformatted(logging::LogLevel::info, success_message);
            }
            return exit_success;
        }
    }

    int Application::run()
    {
        auto config_result = config::ConfigLoader::load();
        if (!config_result)
        {
            core::write_console_line(std::format(
                L"Failed to load configuration: {} (error={})",
                config_result.error().message,
                config_result.error().win32_error));
            return static_cast<int>(ERROR_BAD_CONFIGURATION);
        }
        config::AppConfig config = std::move(config_result.value());

        auto parsed_args = cli::CommandLine::parse(::GetCommandLineW(), config);
        if (!parsed_args)
        {
            core::write_console_line(parsed_args.error().message);
            core::write_console_line(cli::CommandLine::usage());
            return exit_usage;
        }
        const cli::CommandLine args = std::move(parsed_args.value());

        if (args.subcommand() == cli::Subcommand::help)
        {
            core::write_console_line(cli::CommandLine::usage());
            return exit_success;
        }

        if (args.trace())
        {
            config.trace_io = true;
            config.minimum_log_level = logging::LogLevel::trace;
        }
        else if (args.debug() && config.minimum_log_level > logging::LogLevel::debug)
        {
            config.minimum_log_level = logging::LogLevel::debug;
        }

        logging::Logger logger(config.minimum_log_level);
        configure_logging(logger, config);
        logger.log(logging::LogLevel::debug, L"Startup context: pid={}, command_line={}", ::GetCurrentProcessId(), ::GetCommandLineW());

        const hcs::VmSettings settings = vm_settings(args);
        const bool creates_vm = args.subcommand() == cli::Subcommand::run || args.subcommand() == cli::Subcommand::exec;
        if (creates_vm && args.debug())
        {
            auto document = hcs::build_system_document(settings);
            if (!document)
            {
                logger.log(logging::LogLevel::error, L"config build error: {}", document.error().message);
                return exit_failure;
            }
            logger.log(logging::LogLevel::info, L"HCS config JSON:\n{}", document.value());
        }

        auto service = hcs::VmComputeService::load();
        if (!service)
        {
            logger.log(logging::LogLevel::error, L"{}", hcs::describe(service.error()));
            return exit_failure;
        }

        hcs::ComputeSystemControl control(service.value(), logger);
        const runtime::HostStdio stdio = runtime::HostStdio::current();
        const runtime::ConsoleOptions console_options{
            .pipe_open_timeout_ms = config.pipe_open_timeout_ms,
            .trace_io = config.trace_io,
            .prefer_guest_process = config.prefer_guest_process,
        };

        switch (args.subcommand())
        {
        case cli::Subcommand::run:
            return report(logger, runtime::run_vm(control, settings, args.interactive(), console_options, stdio), {});
        case cli::Subcommand::exec:
            return report(logger, runtime::exec_command(control, settings, args.command(), console_options, stdio), {});
        case cli::Subcommand::attach:
            return report(logger, runtime::attach_vm(control, args.vm_id(), console_options, stdio), {});
        case cli::Subcommand::stop:
            return report(
                logger,
                runtime::stop_vm(control, args.vm_id()),
                std::format(L"VM \"{}\" stopped", args.vm_id()));
        case cli::Subcommand::kill:
            return report(
                logger,
                runtime::kill_vm(control, args.vm_id()),
                std::format(L"VM \"{}\" terminated", args.vm_id()));
        default:
            core::write_console_line(cli::CommandLine::usage());
            return exit_usage;
        }
    }
}
