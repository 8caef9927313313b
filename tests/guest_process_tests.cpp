#include "fake_compute_service.hpp"

#include "core/unique_handle.hpp"
#include "hcs/compute_system.hpp"
#include "hcs/guest_process.hpp"
#include "logging/logger.hpp"

#include <Windows.h>

#include <array>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace
{
    using vmr::hcs::GuestProcessRunner;
    using vmr::hcs::GuestRunStatus;
    using vmr::tests::FakeComputeService;

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

    [[nodiscard]] bool write_text(const vmr::core::UniqueHandle& handle, const std::string_view text) noexcept
    {
        DWORD written = 0;
        return ::WriteFile(handle.get(), text.data(), static_cast<DWORD>(text.size()), &written, nullptr) != FALSE && written == text.size();
    }

    [[nodiscard]] std::string drain(const vmr::core::UniqueHandle& handle)
    {
        std::string text;
        std::array<char, 256> buffer{};
        for (;;)
        {
            DWORD read = 0;
            if (::ReadFile(handle.get(), buffer.data(), static_cast<DWORD>(buffer.size()), &read, nullptr) == FALSE || read == 0)
            {
                return text;
            }
            text.append(buffer.data(), read);
        }
    }

    bool test_missing_stdio_is_unsupported()
    {
        FakeComputeService service;
        service.process_information.process_id = 7;
        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        GuestProcessRunner runner(service, logger);

        vmr::hcs::ComputeSystem system(service, FakeComputeService::system_handle());
        const std::vector<std::wstring> args{ L"ls" };
        const auto ran = runner.run(system, args, {});
        system.release();

        return ran &&
               ran->status == GuestRunStatus::unsupported &&
               ran->process_id == 7 &&
               service.close_process_calls == 1;
    }

    bool test_create_failure_is_an_error()
    {
        FakeComputeService service;
        service.create_process_hresult = HRESULT_FROM_WIN32(ERROR_NOT_SUPPORTED);
        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        GuestProcessRunner runner(service, logger);

        vmr::hcs::ComputeSystem system(service, FakeComputeService::system_handle());
        const std::vector<std::wstring> args{ L"ls" };
        const auto ran = runner.run(system, args, {});
        system.release();

        return !ran &&
               ran.error().hresult == HRESULT_FROM_WIN32(ERROR_NOT_SUPPORTED) &&
               service.close_process_calls == 0;
    }

    // The guest side is played by anonymous pipes: the runner owns the
    // handles it is given, the test keeps the opposite ends.
    bool test_pending_create_streams_all_directions()
    {
        auto guest_in = AnonymousPipe::create();
        auto guest_out = AnonymousPipe::create();
        auto guest_err = AnonymousPipe::create();
        auto host_in = AnonymousPipe::create();
        auto host_out = AnonymousPipe::create();
        auto host_err = AnonymousPipe::create();
        if (!guest_in || !guest_out || !guest_err || !host_in || !host_out || !host_err)
        {
            return false;
        }

        if (!write_text(host_in->write, "input line\n") ||
            !write_text(guest_out->write, "output line\n") ||
            !write_text(guest_err->write, "error line\n"))
        {
            return false;
        }
        host_in->write.reset();
        guest_out->write.reset();
        guest_err->write.reset();

        FakeComputeService service;
        service.create_process_hresult = vmr::hcs::hcs_operation_pending;
        service.process_information.process_id = 99;
        service.process_information.std_input = guest_in->write.release();
        service.process_information.std_output = guest_out->read.release();
        service.process_information.std_error = guest_err->read.release();

        vmr::logging::Logger logger(vmr::logging::LogLevel::error);
        GuestProcessRunner runner(service, logger);

        vmr::hcs::ComputeSystem system(service, FakeComputeService::system_handle());
        const std::vector<std::wstring> args{ L"cat" };
        const auto ran = runner.run(
            system,
            args,
            vmr::hcs::GuestStdio{
                .input = host_in->read.view(),
                .output = host_out->write.view(),
                .error = host_err->write.view(),
            });
        system.release();

        if (!ran || ran->status != GuestRunStatus::completed || ran->exit_code != 0 || ran->process_id != 99)
        {
            return false;
        }

        // The stdin copy may still be finishing; give it the same grace the
        // runner gives stderr before inspecting the guest's input.
        ::Sleep(GuestProcessRunner::stderr_drain_ms);

        host_out->write.reset();
        host_err->write.reset();
        if (drain(host_out->read) != "output line\n" || drain(host_err->read) != "error line\n")
        {
            return false;
        }

        return drain(guest_in->read) == "input line\n" && service.close_process_calls == 1;
    }
}

bool run_guest_process_tests()
{
    if (!test_missing_stdio_is_unsupported())
    {
        fwprintf(stderr, L"[guest process] test_missing_stdio_is_unsupported failed\n");
        return false;
    }

    if (!test_create_failure_is_an_error())
    {
        fwprintf(stderr, L"[guest process] test_create_failure_is_an_error failed\n");
        return false;
    }

    if (!test_pending_create_streams_all_directions())
    {
        fwprintf(stderr, L"[guest process] test_pending_create_streams_all_directions failed\n");
        return false;
    }

    return true;
}
