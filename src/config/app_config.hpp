#pragma once

#include "logging/log_level.hpp"

#include <Windows.h>

#include <expected>
#include <string>
#include <string_view>

namespace vmr::config
{
    struct ConfigError final
    {
        std::wstring message;
        DWORD win32_error{ ERROR_SUCCESS };
    };

    // Defaults used when neither the config file, the environment nor the
    // command line say otherwise. Command line flags always win.
    struct AppConfig final
    {
        vmr::logging::LogLevel minimum_log_level{ vmr::logging::LogLevel::info };
        bool enable_stderr_sink{ true };
        bool enable_debug_sink{ false };
        bool enable_file_logging{ false };
        std::wstring log_directory_path;

        // Logs every host->guest write at trace level. Threaded into the
        // interactive session as an option rather than kept as global state.
        bool trace_io{ false };

        std::wstring vm_id{ L"vmrunner-vm" };
        std::wstring image_dir{ L"C:\\source\\hcsshim\\vm-image" };
        DWORD memory_mb{ 2048 };
        DWORD cpu_count{ 2 };
        std::wstring kernel_args;

        DWORD pipe_open_timeout_ms{ 30'000 };
        bool prefer_guest_process{ true };
    };

    class ConfigLoader final
    {
    public:
        [[nodiscard]] static std::expected<AppConfig, ConfigError> load() noexcept;
        [[nodiscard]] static std::expected<AppConfig, ConfigError> parse_text(std::wstring_view text) noexcept;
    };
}
