#include "console/console_pipe.hpp"

#include <format>

namespace vmr::console
{
    std::wstring console_pipe_name(const std::wstring_view vm_id)
    {
        return std::format(L"\\\\.\\pipe\\{}-console", vm_id);
    }

    std::expected<core::UniqueHandle, ConsoleTransportError> open_console_pipe(
        const std::wstring_view name,
        const PipeOpenPolicy policy)
    {
        const std::wstring path(name);
        const ULONGLONG started = ::GetTickCount64();

        DWORD last_error = ERROR_FILE_NOT_FOUND;
        for (;;)
        {
            core::UniqueHandle pipe(::CreateFileW(
                path.c_str(),
                GENERIC_READ | GENERIC_WRITE,
                0,
                nullptr,
                OPEN_EXISTING,
                FILE_ATTRIBUTE_NORMAL | FILE_FLAG_OVERLAPPED,
                nullptr));
            if (pipe.valid())
            {
                return std::move(pipe);
            }
            last_error = ::GetLastError();

            const ULONGLONG elapsed = ::GetTickCount64() - started;
            if (elapsed >= policy.timeout_ms)
            {
                break;
            }

            const ULONGLONG remaining = policy.timeout_ms - elapsed;
            const DWORD pause = static_cast<DWORD>(remaining < policy.retry_interval_ms ? remaining : policy.retry_interval_ms);
            if (!policy.stop_event)
            {
                ::Sleep(pause);
                continue;
            }

            const DWORD waited = ::WaitForSingleObject(policy.stop_event.get(), pause);
            if (waited == WAIT_OBJECT_0)
            {
                return std::unexpected(ConsoleTransportError{
                    .context = std::format(L"Opening console pipe {} was cancelled", name),
                    .win32_error = ERROR_CANCELLED,
                });
            }
            if (waited == WAIT_FAILED)
            {
                const DWORD error = ::GetLastError();
                return std::unexpected(ConsoleTransportError{
                    .context = std::format(L"WaitForSingleObject failed while opening console pipe {}", name),
                    .win32_error = error,
                });
            }
        }

        return std::unexpected(ConsoleTransportError{
            .context = std::format(L"Console pipe {} did not appear within {} ms (last error={})", name, policy.timeout_ms, last_error),
            .win32_error = ERROR_TIMEOUT,
        });
    }
}
