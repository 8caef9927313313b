#include "hcs/guest_process.hpp"

#include "core/stream_io.hpp"
#include "core/unique_handle.hpp"
#include "core/worker_thread.hpp"
#include "hcs/system_document.hpp"

#include <array>
#include <cstddef>
#include <format>
#include <memory>
#include <utility>

namespace vmr::hcs
{
    namespace
    {
        // Owns the guest-side pipe handles. Shared with the helper threads so an
        // abandoned thread never reads through a closed handle.
        struct ProcessPipes final
        {
            core::UniqueHandle std_input;
            core::UniqueHandle std_output;
            core::UniqueHandle std_error;
            GuestStdio host;
        };

        class ProcessHandleCloser final
        {
        public:
            ProcessHandleCloser(IComputeService& service, const HcsProcessHandle process) noexcept :
                _service(service),
                _process(process)
            {
            }

            ~ProcessHandleCloser() noexcept
            {
                if (_process != nullptr)
                {
                    (void)_service.close_process(_process);
                }
            }

            ProcessHandleCloser(const ProcessHandleCloser&) = delete;
            ProcessHandleCloser& operator=(const ProcessHandleCloser&) = delete;

        private:
            IComputeService& _service;
            HcsProcessHandle _process;
        };

        // Copies until either side ends. Returns the error that stopped the
        // copy, or ERROR_SUCCESS on a normal end of stream.
        [[nodiscard]] DWORD copy_stream(const core::HandleView from, const core::HandleView to) noexcept
        {
            core::StreamReader reader(from);
            core::StreamWriter writer(to);

            std::array<std::byte, 4096> buffer{};
            for (;;)
            {
                auto read = reader.read(buffer);
                if (!read)
                {
                    const DWORD error = read.error();
                    return core::is_end_of_stream_error(error) || core::is_cancellation_error(error) ? ERROR_SUCCESS : error;
                }
                if (read.value() == 0)
                {
                    return ERROR_SUCCESS;
                }

                auto written = writer.write_all(std::span<const std::byte>(buffer.data(), read.value()));
                if (!written)
                {
                    const DWORD error = written.error();
                    return core::is_end_of_stream_error(error) || core::is_cancellation_error(error) ? ERROR_SUCCESS : error;
                }
            }
        }
    }

    std::expected<GuestRunResult, ControlError> GuestProcessRunner::run(
        const ComputeSystem& system,
        const std::span<const std::wstring> args,
        const GuestStdio stdio)
    {
        const std::wstring parameters = build_process_parameters(args);
        _logger.log(logging::LogLevel::info, L"creating process via guest agent: {}", parameters);

        ProcessInformation information{};
        HcsProcessHandle process = nullptr;
        const CallOutcome outcome = _service.create_process(system.get(), parameters, information, process);
        const ProcessHandleCloser closer(_service, process);
        if (outcome.failed())
        {
            return std::unexpected(make_control_error(
                ControlErrorKind::call_failed,
                L"HcsCreateProcess",
                outcome.hresult,
                outcome.detail));
        }
        if (outcome.pending())
        {
            // Accepted; the returned handles are already usable.
            _logger.log(logging::LogLevel::debug, L"HcsCreateProcess pending; continuing without waiting");
        }

        auto pipes = std::make_shared<ProcessPipes>();
        pipes->std_input.reset(information.std_input);
        pipes->std_output.reset(information.std_output);
        pipes->std_error.reset(information.std_error);
        pipes->host = stdio;

        if (!pipes->std_input.valid() && !pipes->std_output.valid() && !pipes->std_error.valid())
        {
            _logger.log(logging::LogLevel::info, L"guest agent returned no stdio handles; use the serial console");
            return GuestRunResult{ .status = GuestRunStatus::unsupported, .process_id = information.process_id };
        }

        core::UniqueHandle input_thread;
        if (pipes->std_input.valid() && stdio.input)
        {
            auto started = core::start_thread([pipes]() noexcept {
                (void)copy_stream(pipes->host.input, pipes->std_input.view());
                // Closing stdin tells the guest process no more input follows.
                pipes->std_input.reset();
            });
            if (!started)
            {
                _logger.log(logging::LogLevel::warning, L"CreateThread failed for guest stdin (error={})", started.error());
            }
            else
            {
                input_thread = std::move(started.value());
            }
        }

        core::UniqueHandle error_thread;
        if (pipes->std_error.valid() && stdio.error)
        {
            auto started = core::start_thread([pipes]() noexcept {
                (void)copy_stream(pipes->std_error.view(), pipes->host.error);
            });
            if (!started)
            {
                _logger.log(logging::LogLevel::warning, L"CreateThread failed for guest stderr (error={})", started.error());
            }
            else
            {
                error_thread = std::move(started.value());
            }
        }

        DWORD output_error = ERROR_SUCCESS;
        if (pipes->std_output.valid())
        {
            output_error = copy_stream(pipes->std_output.view(), stdio.output);
        }

        if (error_thread.valid() && ::WaitForSingleObject(error_thread.get(), stderr_drain_ms) != WAIT_OBJECT_0)
        {
            (void)::CancelSynchronousIo(error_thread.get());
            (void)::CancelIoEx(pipes->std_error.get(), nullptr);
        }

        if (input_thread.valid() && ::WaitForSingleObject(input_thread.get(), 0) != WAIT_OBJECT_0)
        {
            // The input thread usually sits in a read on host stdin. Unblock it
            // and leave it; `pipes` keeps its handles alive.
            (void)::CancelSynchronousIo(input_thread.get());
            if (stdio.input)
            {
                (void)::CancelIoEx(stdio.input.get(), nullptr);
            }
        }

        if (output_error != ERROR_SUCCESS)
        {
            // The process already ran; only its output was cut short.
            _logger.log(logging::LogLevel::warning, L"Copy of guest stdout stopped early (error={})", output_error);
        }

        return GuestRunResult{ .status = GuestRunStatus::completed, .exit_code = 0, .process_id = information.process_id };
    }
}
