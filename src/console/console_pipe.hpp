#pragma once

// Client side of the VM's COM1 named pipe.
//
// The pipe is created by the compute service once the VM has booted far
// enough, so opening it right after start usually fails for a while. Every
// failure inside the retry window counts as "not there yet".

#include "core/handle_view.hpp"
#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace vmr::console
{
    struct ConsoleTransportError final
    {
        std::wstring context;
        DWORD win32_error{ ERROR_GEN_FAILURE };
    };

    struct PipeOpenPolicy final
    {
        DWORD timeout_ms{ 30'000 };
        DWORD retry_interval_ms{ 100 };
        // Optional; when signaled the retry loop gives up with ERROR_CANCELLED.
        core::HandleView stop_event;
    };

    // `\\.\pipe\<vm-id>-console`
    [[nodiscard]] std::wstring console_pipe_name(std::wstring_view vm_id);

    // Opens `name` for overlapped duplex I/O. Fails with ERROR_TIMEOUT only
    // after at least `policy.timeout_ms` has passed since the first attempt,
    // or with ERROR_CANCELLED once `policy.stop_event` is signaled.
    [[nodiscard]] std::expected<core::UniqueHandle, ConsoleTransportError> open_console_pipe(
        std::wstring_view name,
        PipeOpenPolicy policy = {});
}
