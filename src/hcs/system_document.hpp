#pragma once

// HCS schema 2.1 documents: the VM configuration passed to create and the
// process parameters passed to HcsCreateProcess.

#include <Windows.h>

#include <expected>
#include <span>
#include <string>
#include <string_view>

namespace vmr::hcs
{
    inline constexpr std::wstring_view default_kernel_command_line = L"console=ttyS0 root=/dev/sda rw init=/sbin/init";

    struct VmSettings final
    {
        std::wstring id;
        std::wstring image_dir;
        DWORD memory_mb{ 2048 };
        DWORD cpu_count{ 2 };
        // Empty selects `default_kernel_command_line`.
        std::wstring kernel_args;
        // Empty selects `\\.\pipe\<id>-console`.
        std::wstring pipe_name;
    };

    struct DocumentError final
    {
        std::wstring message;
    };

    // Linux direct-boot VM: vmlinuz + initrd from `image_dir`, rootfs.vhdx on
    // SCSI 0:0, COM1 bridged to `pipe_name`.
    [[nodiscard]] std::expected<std::wstring, DocumentError> build_system_document(const VmSettings& settings);

    // Command line for the in-guest agent. Empty `args` runs /bin/sh.
    [[nodiscard]] std::wstring build_process_parameters(std::span<const std::wstring> args);

    // Joins `directory` and `file_name` with exactly one backslash.
    [[nodiscard]] std::wstring join_windows_path(std::wstring_view directory, std::wstring_view file_name);
}
