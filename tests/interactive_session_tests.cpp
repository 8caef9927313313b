#include "runtime/interactive_session.hpp"

#include "console/console_pipe.hpp"
#include "core/unique_handle.hpp"
#include "core/win32_handle.hpp"
#include "logging/logger.hpp"
#include "test_pipes.hpp"

#include <Windows.h>

#include <array>
#include <cstdio>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    class CapturingSink final : public vmr::logging::ILogSink
    {
    public:
        void write(const vmr::logging::LogRecord& record) noexcept override
        {
            try
            {
                const std::lock_guard lock(_mutex);
                _lines.emplace_back(record.message);
            }
            catch (const std::bad_alloc&)
            {
                return;
            }
        }

        [[nodiscard]] bool contains(const std::wstring_view needle)
        {
            const std::lock_guard lock(_mutex);
            for (const auto& line : _lines)
            {
                if (line.find(needle) != std::wstring::npos)
                {
                    return true;
                }
            }
            return false;
        }

    private:
        std::mutex _mutex;
        std::vector<std::wstring> _lines;
    };

    struct AnonymousPipe final
    {
        vmr::core::UniqueHandle read;
        vmr::core::UniqueHandle write;

        [[nodiscard]] static std::optional<AnonymousPipe> create() noexcept
        {
            HANDLE read_end = nullptr;
            HANDLE write_end = nullptr;
            if (::CreatePipe(&read_end, &write_end, nullptr, 64 * 1024) == FALSE)
            {
                return std::nullopt;
            }
            AnonymousPipe pipe;
            pipe.read.reset(read_end);
            pipe.write.reset(write_end);
            return pipe;
        }
    };

    struct ConsoleFixture final
    {
        vmr::tests::PipeServer guest;
        vmr::core::UniqueHandle channel;
        AnonymousPipe host_input;
        AnonymousPipe host_output;
    };

    [[nodiscard]] std::optional<ConsoleFixture> make_fixture(const std::wstring_view suffix)
    {
        auto guest = vmr::tests::PipeServer::listen(suffix);
        if (!guest)
        {
            return std::nullopt;
        }

        auto channel = vmr::console::open_console_pipe(guest->name(), vmr::console::PipeOpenPolicy{ .timeout_ms = 2'000 });
        if (!channel || !guest->wait_connected(5'000))
        {
            return std::nullopt;
        }

        auto input = AnonymousPipe::create();
        auto output = AnonymousPipe::create();
        if (!input || !output)
        {
            return std::nullopt;
        }

        return ConsoleFixture{
            .guest = std::move(guest.value()),
            .channel = std::move(channel.value()),
            .host_input = std::move(input.value()),
            .host_output = std::move(output.value()),
        };
    }

    [[nodiscard]] vmr::runtime::InteractiveSessionOptions session_options(const ConsoleFixture& fixture)
    {
        vmr::runtime::InteractiveSessionOptions options{};
        options.host_input = fixture.host_input.read.view();
        options.host_output = fixture.host_output.write.view();
        options.abandon_wait_ms = 2'000;
        return options;
    }

    [[nodiscard]] std::string drain(vmr::core::UniqueHandle& read_end, vmr::core::UniqueHandle& write_end)
    {
        write_end.reset();

        std::string text;
        std::array<char, 256> buffer{};
        for (;;)
        {
            DWORD read = 0;
            if (::ReadFile(read_end.get(), buffer.data(), static_cast<DWORD>(buffer.size()), &read, nullptr) == FALSE || read == 0)
            {
                return text;
            }
            text.append(buffer.data(), read);
        }
    }

    bool test_guest_close_ends_session()
    {
        auto fixture = make_fixture(L"session_guest");
        if (!fixture)
        {
            return false;
        }

        if (!vmr::tests::write_overlapped(fixture->guest.view(), "Welcome to vmrunner\r\n"))
        {
            return false;
        }
        fixture->guest.close();

        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        const auto ended = vmr::runtime::run_interactive_session(fixture->channel.view(), session_options(*fixture), logger);
        if (!ended || ended.value() != vmr::runtime::SessionEnd::guest_closed)
        {
            fwprintf(stderr, L"[interactive session] expected guest_closed\n");
            return false;
        }

        const std::string shown = drain(fixture->host_output.read, fixture->host_output.write);
        return shown == "Welcome to vmrunner\r\n";
    }

    bool test_host_close_forwards_normalized_input()
    {
        auto fixture = make_fixture(L"session_host");
        if (!fixture)
        {
            return false;
        }

        constexpr std::string_view typed = "ls\r";
        DWORD written = 0;
        if (::WriteFile(fixture->host_input.write.get(), typed.data(), static_cast<DWORD>(typed.size()), &written, nullptr) == FALSE)
        {
            return false;
        }
        fixture->host_input.write.reset();

        auto sink = std::make_shared<CapturingSink>();
        vmr::logging::Logger logger(vmr::logging::LogLevel::trace);
        logger.add_sink(sink);

        auto options = session_options(*fixture);
        options.trace_logger = &logger;

        const auto ended = vmr::runtime::run_interactive_session(fixture->channel.view(), options, logger);
        if (!ended || ended.value() != vmr::runtime::SessionEnd::host_closed)
        {
            fwprintf(stderr, L"[interactive session] expected host_closed\n");
            return false;
        }

        const std::string received = vmr::tests::read_overlapped(fixture->guest.view(), 3, 2'000);
        if (received != "ls\n")
        {
            fwprintf(stderr, L"[interactive session] guest received %zu bytes\n", received.size());
            return false;
        }

        return sink->contains(L"host->guest 3 bytes: ls\\x0A");
    }

    bool test_stop_event_ends_session()
    {
        auto fixture = make_fixture(L"session_stop");
        if (!fixture)
        {
            return false;
        }

        auto stop = vmr::core::create_event(true, true);
        if (!stop)
        {
            return false;
        }

        auto options = session_options(*fixture);
        options.stop_event = stop->view();

        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        const ULONGLONG started = ::GetTickCount64();
        const auto ended = vmr::runtime::run_interactive_session(fixture->channel.view(), options, logger);
        const ULONGLONG elapsed = ::GetTickCount64() - started;

        // Both forwarding threads were blocked; cancellation must release them
        // well within the abandon window.
        return ended && ended.value() == vmr::runtime::SessionEnd::stop_requested && elapsed < 4'000;
    }

    bool test_guest_output_after_stop_is_not_forwarded()
    {
        auto fixture = make_fixture(L"session_late");
        if (!fixture)
        {
            return false;
        }

        auto stop = vmr::core::create_event(true, true);
        if (!stop)
        {
            return false;
        }

        auto options = session_options(*fixture);
        options.stop_event = stop->view();

        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        const auto ended = vmr::runtime::run_interactive_session(fixture->channel.view(), options, logger);
        if (!ended)
        {
            return false;
        }

        (void)vmr::tests::write_overlapped(fixture->guest.view(), "late output");
        ::Sleep(50);
        return drain(fixture->host_output.read, fixture->host_output.write).empty();
    }

    bool test_failed_wait_is_an_error()
    {
        auto fixture = make_fixture(L"session_wait_failed");
        if (!fixture)
        {
            return false;
        }

        auto event = vmr::core::create_event(true, false);
        if (!event)
        {
            return false;
        }

        // Without SYNCHRONIZE the handle cannot be waited on.
        HANDLE modify_only = nullptr;
        if (::DuplicateHandle(::GetCurrentProcess(), event->get(), ::GetCurrentProcess(), &modify_only, EVENT_MODIFY_STATE, FALSE, 0) == FALSE)
        {
            return false;
        }
        const vmr::core::UniqueHandle unwaitable(modify_only);

        auto options = session_options(*fixture);
        options.stop_event = unwaitable.view();

        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        const auto ended = vmr::runtime::run_interactive_session(fixture->channel.view(), options, logger);
        if (ended)
        {
            fwprintf(stderr, L"[interactive session] failed wait reported as %ls\n", vmr::runtime::session_end_name(ended.value()));
            return false;
        }

        return ended.error().win32_error == ERROR_ACCESS_DENIED &&
               ended.error().context.find(L"WaitForMultipleObjects") != std::wstring::npos;
    }
}

bool run_interactive_session_tests()
{
    if (!test_guest_close_ends_session())
    {
        fwprintf(stderr, L"[interactive session] test_guest_close_ends_session failed\n");
        return false;
    }

    if (!test_host_close_forwards_normalized_input())
    {
        fwprintf(stderr, L"[interactive session] test_host_close_forwards_normalized_input failed\n");
        return false;
    }

    if (!test_stop_event_ends_session())
    {
        fwprintf(stderr, L"[interactive session] test_stop_event_ends_session failed\n");
        return false;
    }

    if (!test_guest_output_after_stop_is_not_forwarded())
    {
        fwprintf(stderr, L"[interactive session] test_guest_output_after_stop_is_not_forwarded failed\n");
        return false;
    }

    if (!test_failed_wait_is_an_error())
    {
        fwprintf(stderr, L"[interactive session] test_failed_wait_is_an_error failed\n");
        return false;
    }

    return true;
}
