#include "config/app_config.hpp"

#include "core/unique_handle.hpp"
#include "core/utf8.hpp"
#include "serialization/fast_number.hpp"

#include <Windows.h>

#include <algorithm>
#include <cstring>
#include <format>
#include <new>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace vmr::config
{
    namespace
    {
        constexpr std::wstring_view config_path_variable = L"VMRUNNER_CONFIG";
        constexpr LONGLONG max_config_bytes = 1024 * 1024;

        using Apply = void (*)(AppConfig&, std::wstring&&);

        // One row per key. The same key is read from the config file as
        // `key=value` and from the environment as `VMRUNNER_<KEY>`.
        struct Setting final
        {
            std::wstring_view key;
            std::wstring_view variable;
            Apply apply;
        };

        [[nodiscard]] bool is_true(const std::wstring_view text) noexcept
        {
            return text == L"1" || text == L"true" || text == L"TRUE" || text == L"on" || text == L"ON";
        }

        // Unparseable numbers keep whatever value was there before.
        void assign_number(DWORD& target, const std::wstring_view text) noexcept
        {
            if (const auto parsed = serialization::parse_u32(text))
            {
                target = *parsed;
            }
        }

        [[nodiscard]] logging::LogLevel log_level_from(const std::wstring_view text) noexcept
        {
            constexpr std::pair<std::wstring_view, logging::LogLevel> names[] = {
                { L"trace", logging::LogLevel::trace },
                { L"debug", logging::LogLevel::debug },
                { L"warning", logging::LogLevel::warning },
                { L"error", logging::LogLevel::error },
            };
            for (const auto& [name, level] : names)
            {
                if (text == name)
                {
                    return level;
                }
            }
            return logging::LogLevel::info;
        }

        constexpr Setting settings[] = {
            { L"log_level", L"VMRUNNER_LOG_LEVEL", [](AppConfig& c, std::wstring&& v) { c.minimum_log_level = log_level_from(v); } },
            { L"log_dir", L"VMRUNNER_LOG_DIR", [](AppConfig& c, std::wstring&& v) {
                 c.log_directory_path = std::move(v);
                 c.enable_file_logging = true;
             } },
            { L"file_logging", L"VMRUNNER_FILE_LOGGING", [](AppConfig& c, std::wstring&& v) { c.enable_file_logging = is_true(v); } },
            { L"debug_sink", L"VMRUNNER_DEBUG_SINK", [](AppConfig& c, std::wstring&& v) { c.enable_debug_sink = is_true(v); } },
            { L"stderr_sink", L"VMRUNNER_STDERR_SINK", [](AppConfig& c, std::wstring&& v) { c.enable_stderr_sink = is_true(v); } },
            { L"trace_io", L"VMRUNNER_TRACE_IO", [](AppConfig& c, std::wstring&& v) { c.trace_io = is_true(v); } },
            { L"vm_id", L"VMRUNNER_VM_ID", [](AppConfig& c, std::wstring&& v) {
                 if (!v.empty())
                 {
                     c.vm_id = std::move(v);
                 }
             } },
            { L"image_dir", L"VMRUNNER_IMAGE_DIR", [](AppConfig& c, std::wstring&& v) { c.image_dir = std::move(v); } },
            { L"memory_mb", L"VMRUNNER_MEMORY_MB", [](AppConfig& c, std::wstring&& v) { assign_number(c.memory_mb, v); } },
            { L"cpu_count", L"VMRUNNER_CPU_COUNT", [](AppConfig& c, std::wstring&& v) { assign_number(c.cpu_count, v); } },
            { L"kernel_args", L"VMRUNNER_KERNEL_ARGS", [](AppConfig& c, std::wstring&& v) { c.kernel_args = std::move(v); } },
            { L"pipe_open_timeout_ms", L"VMRUNNER_PIPE_OPEN_TIMEOUT_MS", [](AppConfig& c, std::wstring&& v) { assign_number(c.pipe_open_timeout_ms, v); } },
            { L"prefer_guest_process", L"VMRUNNER_PREFER_GUEST_PROCESS", [](AppConfig& c, std::wstring&& v) { c.prefer_guest_process = is_true(v); } },
        };

        [[nodiscard]] std::wstring_view trim(std::wstring_view text) noexcept
        {
            constexpr std::wstring_view blanks = L" \t\r\n";
            const size_t first = text.find_first_not_of(blanks);
            if (first == std::wstring_view::npos)
            {
                return {};
            }
            const size_t last = text.find_last_not_of(blanks);
            return text.substr(first, last - first + 1);
        }

        // Unknown keys are ignored so older binaries accept newer files.
        void apply_setting(AppConfig& config, const std::wstring_view key, const std::wstring_view value)
        {
            for (const Setting& setting : settings)
            {
                if (setting.key == key)
                {
                    setting.apply(config, std::wstring(value));
                    return;
                }
            }
        }

        [[nodiscard]] std::optional<std::wstring> environment_value(const std::wstring_view name)
        {
            const std::wstring variable(name);
            const DWORD required = ::GetEnvironmentVariableW(variable.c_str(), nullptr, 0);
            if (required == 0)
            {
                return std::nullopt;
            }

            std::wstring value(required, L'\0');
            const DWORD written = ::GetEnvironmentVariableW(variable.c_str(), value.data(), required);
            if (written == 0 || written >= required)
            {
                return std::nullopt;
            }
            value.resize(written);
            return value;
        }

        [[nodiscard]] ConfigError file_error(const std::wstring_view what, const std::wstring_view path, const DWORD error)
        {
            return ConfigError{ .message = std::format(L"{} for config file {}", what, path), .win32_error = error };
        }

        // UTF-16LE when the file starts with FF FE, UTF-8 (optional BOM)
        // otherwise. Invalid UTF-8 is an error rather than replacement
        // characters in a path.
        [[nodiscard]] std::expected<std::wstring, ConfigError> decode(const std::string_view bytes, const std::wstring_view path)
        {
            if (bytes.starts_with("\xFF\xFE"))
            {
                const std::string_view body = bytes.substr(2);
                std::wstring text(body.size() / sizeof(wchar_t), L'\0');
                std::memcpy(text.data(), body.data(), text.size() * sizeof(wchar_t));
                return text;
            }

            const std::string_view body = bytes.starts_with("\xEF\xBB\xBF") ? bytes.substr(3) : bytes;
            if (body.empty())
            {
                return std::wstring{};
            }
            if (::MultiByteToWideChar(CP_UTF8, MB_ERR_INVALID_CHARS, body.data(), static_cast<int>(body.size()), nullptr, 0) <= 0)
            {
                return std::unexpected(file_error(L"Text is neither UTF-8 nor UTF-16LE", path, ::GetLastError()));
            }
            return core::from_utf8(body);
        }

        [[nodiscard]] std::expected<std::wstring, ConfigError> read_text_file(const std::wstring& path)
        {
            core::UniqueHandle file(::CreateFileW(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr));
            if (!file.valid())
            {
                return std::unexpected(file_error(L"Cannot open", path, ::GetLastError()));
            }

            LARGE_INTEGER size{};
            if (::GetFileSizeEx(file.get(), &size) == FALSE)
            {
                return std::unexpected(file_error(L"Cannot size", path, ::GetLastError()));
            }
            if (size.QuadPart > max_config_bytes)
            {
                return std::unexpected(file_error(L"Too large", path, ERROR_FILE_TOO_LARGE));
            }

            std::string bytes(static_cast<size_t>(size.QuadPart), '\0');
            DWORD read = 0;
            if (!bytes.empty() &&
                (::ReadFile(file.get(), bytes.data(), static_cast<DWORD>(bytes.size()), &read, nullptr) == FALSE || read != bytes.size()))
            {
                return std::unexpected(file_error(L"Cannot read", path, ::GetLastError()));
            }
            return decode(bytes, path);
        }

        [[nodiscard]] std::expected<AppConfig, ConfigError> load_config()
        {
            AppConfig config{};

            if (const auto path = environment_value(config_path_variable))
            {
                auto text = read_text_file(*path);
                if (!text)
                {
                    return std::unexpected(std::move(text.error()));
                }
                auto parsed = ConfigLoader::parse_text(text.value());
                if (!parsed)
                {
                    return std::unexpected(std::move(parsed.error()));
                }
                config = std::move(parsed.value());
            }

            for (const Setting& setting : settings)
            {
                if (const auto value = environment_value(setting.variable))
                {
                    apply_setting(config, setting.key, trim(*value));
                }
            }
            return config;
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::load() noexcept
    {
        try
        {
            return load_config();
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{ .message = L"Out of memory loading configuration", .win32_error = ERROR_OUTOFMEMORY });
        }
    }

    std::expected<AppConfig, ConfigError> ConfigLoader::parse_text(const std::wstring_view text) noexcept
    {
        try
        {
            AppConfig config{};
            size_t line_number = 0;
            for (size_t begin = 0; begin <= text.size();)
            {
                const size_t end = std::min(text.find(L'\n', begin), text.size());
                const std::wstring_view line = trim(text.substr(begin, end - begin));
                begin = end + 1;
                ++line_number;

                if (line.empty() || line.front() == L'#' || line.front() == L';')
                {
                    continue;
                }

                const size_t equals = line.find(L'=');
                if (equals == std::wstring_view::npos)
                {
                    return std::unexpected(ConfigError{
                        .message = std::format(L"Config line {} has no '=': {}", line_number, line),
                        .win32_error = ERROR_BAD_FORMAT,
                    });
                }
                apply_setting(config, trim(line.substr(0, equals)), trim(line.substr(equals + 1)));
            }
            return config;
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ConfigError{ .message = L"Out of memory parsing configuration", .win32_error = ERROR_OUTOFMEMORY });
        }
    }
}
