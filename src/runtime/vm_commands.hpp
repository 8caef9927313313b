#pragma once

// The user-facing workflows behind each subcommand. This is the only layer
// that decides between retry, fallback and failure; everything below reports
// errors as values.

#include "core/handle_view.hpp"
#include "hcs/compute_system_control.hpp"
#include "hcs/system_document.hpp"

#include <Windows.h>

#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace vmr::runtime
{
    struct CommandError final
    {
        std::wstring message;
    };

    struct HostStdio final
    {
        core::HandleView input;
        core::HandleView output;
        core::HandleView error;

        [[nodiscard]] static HostStdio current() noexcept
        {
            return HostStdio{
                .input = core::HandleView::standard(STD_INPUT_HANDLE),
                .output = core::HandleView::standard(STD_OUTPUT_HANDLE),
                .error = core::HandleView::standard(STD_ERROR_HANDLE),
            };
        }
    };

    struct ConsoleOptions final
    {
        DWORD pipe_open_timeout_ms{ 30'000 };
        bool trace_io{ false };
        bool prefer_guest_process{ true };
    };

    // Starts the VM. Detached unless `interactive`, in which case a console
    // session runs and the VM is shut down when it ends.
    [[nodiscard]] std::expected<void, CommandError> run_vm(
        hcs::ComputeSystemControl& control,
        const hcs::VmSettings& settings,
        bool interactive,
        const ConsoleOptions& options,
        const HostStdio& stdio);

    // Runs `command` in the VM named by `settings.id`, starting it first (and
    // leaving it running) when it does not exist yet.
    [[nodiscard]] std::expected<void, CommandError> exec_command(
        hcs::ComputeSystemControl& control,
        const hcs::VmSettings& settings,
        std::span<const std::wstring> command,
        const ConsoleOptions& options,
        const HostStdio& stdio);

    [[nodiscard]] std::expected<void, CommandError> attach_vm(
        hcs::ComputeSystemControl& control,
        std::wstring_view id,
        const ConsoleOptions& options,
        const HostStdio& stdio);

    // Graceful shutdown without terminate fallback.
    [[nodiscard]] std::expected<void, CommandError> stop_vm(hcs::ComputeSystemControl& control, std::wstring_view id);

    [[nodiscard]] std::expected<void, CommandError> kill_vm(hcs::ComputeSystemControl& control, std::wstring_view id);
}
