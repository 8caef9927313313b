#include "logging/logger.hpp"

#include "core/assert.hpp"
#include "core/console_writer.hpp"
#include "core/utf8.hpp"

#include <new>

namespace vmr::logging
{
    namespace
    {
        [[nodiscard]] std::wstring_view stderr_tag(const LogLevel level) noexcept
        {
            switch (level)
            {
            case LogLevel::trace:
                return L"trace";
            case LogLevel::debug:
                return L"debug";
            case LogLevel::warning:
                return L"warning";
            case LogLevel::error:
                return L"error";
            default:
                return {};
            }
        }

        [[nodiscard]] std::expected<std::wstring, DWORD> temp_directory()
        {
            const DWORD required = ::GetTempPathW(0, nullptr);
            if (required == 0)
            {
                return std::unexpected(::GetLastError());
            }

            std::wstring path(required, L'\0');
            const DWORD written = ::GetTempPathW(required, path.data());
            if (written == 0 || written >= required)
            {
                return std::unexpected(written == 0 ? ::GetLastError() : static_cast<DWORD>(ERROR_BUFFER_OVERFLOW));
            }
            path.resize(written);
            return path;
        }

        [[nodiscard]] bool ends_with_separator(const std::wstring_view path) noexcept
        {
            return !path.empty() && (path.back() == L'\\' || path.back() == L'/');
        }
    }

    std::wstring_view level_name(const LogLevel level) noexcept
    {
        switch (level)
        {
        case LogLevel::trace:
            return L"TRACE";
        case LogLevel::debug:
            return L"DEBUG";
        case LogLevel::info:
            return L"INFO";
        case LogLevel::warning:
            return L"WARN";
        case LogLevel::error:
            return L"ERROR";
        default:
            return L"?";
        }
    }

    StderrLogSink::StderrLogSink(const core::HandleView stream) noexcept :
        _stream(stream)
    {
    }

    std::wstring StderrLogSink::format(const LogRecord& record)
    {
        const std::wstring_view tag = stderr_tag(record.level);
        if (tag.empty())
        {
            return std::format(L"[vmrunner] {}", record.message);
        }
        return std::format(L"[vmrunner] {}: {}", tag, record.message);
    }

    void StderrLogSink::write(const LogRecord& record) noexcept
    {
        try
        {
            core::write_line(_stream, format(record));
        }
        catch (const std::bad_alloc&)
        {
            return;
        }
    }

    void DebugOutputSink::write(const LogRecord& record) noexcept
    {
        try
        {
            const std::wstring line = std::format(L"vmrunner [{}] {}\n", level_name(record.level), record.message);
            ::OutputDebugStringW(line.c_str());
        }
        catch (const std::bad_alloc&)
        {
            return;
        }
    }

    FileLogSink::FileLogSink(core::UniqueHandle file) noexcept :
        _file(std::move(file))
    {
    }

    std::expected<std::shared_ptr<FileLogSink>, DWORD> FileLogSink::open(const std::wstring& path) noexcept
    {
        core::UniqueHandle file(::CreateFileW(
            path.c_str(),
            FILE_APPEND_DATA,
            FILE_SHARE_READ,
            nullptr,
            OPEN_ALWAYS,
            FILE_ATTRIBUTE_NORMAL,
            nullptr));
        if (!file.valid())
        {
            return std::unexpected(::GetLastError());
        }

        try
        {
            return std::shared_ptr<FileLogSink>(new FileLogSink(std::move(file)));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::expected<std::wstring, DWORD> FileLogSink::session_log_path(const std::wstring_view directory) noexcept
    {
        try
        {
            std::wstring base;
            if (directory.empty())
            {
                auto temp = temp_directory();
                if (!temp)
                {
                    return std::unexpected(temp.error());
                }
                base = std::move(temp.value());
                if (!ends_with_separator(base))
                {
                    base.push_back(L'\\');
                }
                base.append(L"vmrunner");
            }
            else
            {
                base.assign(directory);
            }

            if (::CreateDirectoryW(base.c_str(), nullptr) == FALSE)
            {
                const DWORD error = ::GetLastError();
                if (error != ERROR_ALREADY_EXISTS)
                {
                    return std::unexpected(error);
                }
            }

            SYSTEMTIME now{};
            ::GetLocalTime(&now);
            return std::format(
                L"{}{}vmrunner-{:04}{:02}{:02}-{:02}{:02}{:02}-{}.log",
                base,
                ends_with_separator(base) ? L"" : L"\\",
                now.wYear,
                now.wMonth,
                now.wDay,
                now.wHour,
                now.wMinute,
                now.wSecond,
                ::GetCurrentProcessId());
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(static_cast<DWORD>(ERROR_OUTOFMEMORY));
        }
    }

    std::wstring FileLogSink::format(const LogRecord& record)
    {
        const SYSTEMTIME& t = record.time;
        return std::format(
            L"{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03} [{}] {}",
            t.wYear,
            t.wMonth,
            t.wDay,
            t.wHour,
            t.wMinute,
            t.wSecond,
            t.wMilliseconds,
            level_name(record.level),
            record.message);
    }

    void FileLogSink::write(const LogRecord& record) noexcept
    {
        std::string payload;
        try
        {
            payload = core::to_utf8(format(record));
            payload.append("\r\n");
        }
        catch (const std::bad_alloc&)
        {
            return;
        }

        DWORD written = 0;
        (void)::WriteFile(_file.get(), payload.data(), static_cast<DWORD>(payload.size()), &written, nullptr);
    }

    Logger::Logger(const LogLevel minimum_level) noexcept :
        _minimum_level(minimum_level)
    {
    }

    void Logger::add_sink(std::shared_ptr<ILogSink> sink)
    {
        VMR_ASSERT(sink != nullptr);
        _sinks.push_back(std::move(sink));
    }

    void Logger::set_minimum_level(const LogLevel level) noexcept
    {
        _minimum_level.store(level, std::memory_order_relaxed);
    }

    LogLevel Logger::minimum_level() const noexcept
    {
        return _minimum_level.load(std::memory_order_relaxed);
    }

    bool Logger::enabled(const LogLevel level) const noexcept
    {
        return level >= minimum_level();
    }

    void Logger::log_preformatted(const LogLevel level, const std::wstring_view message)
    {
        if (!enabled(level))
        {
            return;
        }

        LogRecord record{ .level = level, .message = message };
        ::GetLocalTime(&record.time);

        // Session pump threads log too; keep their lines whole.
        const std::lock_guard lock(_dispatch_lock);
        for (const auto& sink : _sinks)
        {
            sink->write(record);
        }
    }
}
