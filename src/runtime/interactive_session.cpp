#include "runtime/interactive_session.hpp"

#include "console/stream_forwarding.hpp"
#include "core/unique_handle.hpp"
#include "core/win32_handle.hpp"
#include "core/win32_wait.hpp"
#include "core/worker_thread.hpp"
#include "terminal/raw_console_mode.hpp"

#include <memory>
#include <new>
#include <optional>
#include <utility>

namespace vmr::runtime
{
    namespace
    {
        struct SessionContext final
        {
            core::UniqueHandle channel;
            core::HandleView host_input;
            core::HandleView host_output;
            console::ForwardOptions forward_options;

            // Written by the owning thread right before it exits. Read only
            // after that thread's handle has been observed signaled.
            std::expected<void, console::ConsoleTransportError> guest_result;
            std::expected<void, console::ConsoleTransportError> host_result;
        };

        [[nodiscard]] console::ConsoleTransportError make_error(const wchar_t* const context, const DWORD error)
        {
            return console::ConsoleTransportError{ .context = context, .win32_error = error };
        }

        [[nodiscard]] bool thread_finished(const core::UniqueHandle& thread, const DWORD timeout_ms) noexcept
        {
            return thread.valid() && ::WaitForSingleObject(thread.get(), timeout_ms) == WAIT_OBJECT_0;
        }
    }

    std::expected<SessionEnd, console::ConsoleTransportError> run_interactive_session(
        const core::HandleView channel,
        const InteractiveSessionOptions& options,
        logging::Logger& logger)
    {
        auto duplicated = core::duplicate_handle_same_access(channel);
        if (!duplicated)
        {
            return std::unexpected(make_error(L"DuplicateHandle failed for console pipe", duplicated.error()));
        }

        auto context = std::make_shared<SessionContext>();
        context->channel = std::move(duplicated.value());
        context->host_input = options.host_input;
        context->host_output = options.host_output;
        context->forward_options.trace_logger = options.trace_logger;

        std::optional<terminal::RawConsoleMode> raw_mode;
        if (auto entered = terminal::RawConsoleMode::enter(options.host_input, options.host_output); entered)
        {
            raw_mode.emplace(std::move(entered.value()));
            logger.log(logging::LogLevel::debug, L"Raw console input enabled (previous mode=0x{:X})", raw_mode->original_input_mode());
        }
        else
        {
            logger.log(logging::LogLevel::debug, L"Host input is not a console (error={}); using plain reads", entered.error());
        }

        auto guest_thread = core::start_thread([context]() noexcept {
            context->guest_result = console::forward_to_host(context->channel.view(), context->host_output);
        });
        if (!guest_thread)
        {
            return std::unexpected(make_error(L"CreateThread failed for guest output forwarding", guest_thread.error()));
        }

        auto host_thread = core::start_thread([context]() noexcept {
            context->host_result = console::forward_from_host(context->channel.view(), context->host_input, context->forward_options);
        });
        if (!host_thread)
        {
            (void)::CancelIoEx(context->channel.get(), nullptr);
            (void)thread_finished(guest_thread.value(), options.abandon_wait_ms);
            return std::unexpected(make_error(L"CreateThread failed for host input forwarding", host_thread.error()));
        }

        const DWORD signaled = core::wait_for_any(
            { guest_thread->view(), host_thread->view(), options.stop_event },
            INFINITE);

        DWORD wait_error = ERROR_SUCCESS;
        SessionEnd end = SessionEnd::stop_requested;
        if (signaled == 0)
        {
            end = SessionEnd::guest_closed;
        }
        else if (signaled == 1)
        {
            end = SessionEnd::host_closed;
        }
        else if (signaled != 2)
        {
            wait_error = ::GetLastError();
            if (wait_error == ERROR_SUCCESS)
            {
                wait_error = ERROR_GEN_FAILURE;
            }
            logger.log(logging::LogLevel::warning, L"Waiting on the console session failed (error={})", wait_error);
        }

        if (wait_error == ERROR_SUCCESS)
        {
            logger.log(logging::LogLevel::debug, L"Console session ending: {}", session_end_name(end));
        }

        // Unblock whichever direction is still running. CancelIoEx on the pipe
        // covers the overlapped reads and writes of both threads; the host read
        // may be a synchronous console or pipe read.
        (void)::CancelIoEx(context->channel.get(), nullptr);
        (void)::CancelSynchronousIo(host_thread->get());
        if (options.host_input)
        {
            (void)::CancelIoEx(options.host_input.get(), nullptr);
        }

        const bool guest_done = thread_finished(guest_thread.value(), options.abandon_wait_ms);
        const bool host_done = thread_finished(host_thread.value(), options.abandon_wait_ms);
        if (!guest_done || !host_done)
        {
            logger.log(logging::LogLevel::debug, L"Abandoning a console forwarding thread that did not stop in {} ms", options.abandon_wait_ms);
        }

        raw_mode.reset();

        if (wait_error != ERROR_SUCCESS)
        {
            return std::unexpected(make_error(L"WaitForMultipleObjects failed for console session", wait_error));
        }

        if (end == SessionEnd::guest_closed && guest_done && !context->guest_result)
        {
            return std::unexpected(std::move(context->guest_result.error()));
        }
        if (end == SessionEnd::host_closed && host_done && !context->host_result)
        {
            return std::unexpected(std::move(context->host_result.error()));
        }

        return end;
    }
}
