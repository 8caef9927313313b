#pragma once

// Leveled logging for vmrunner.
//
// Every record goes to each sink once; the sink decides how it looks. The
// stderr sink is the one a user sees: it prints the `[vmrunner] ...` progress
// lines the tool is driven by. The file and debugger sinks are opt-in through
// configuration and keep timestamps for later reading.

#include "core/handle_view.hpp"
#include "core/unique_handle.hpp"
#include "logging/log_level.hpp"

#include <Windows.h>

#include <atomic>
#include <expected>
#include <format>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace vmr::logging
{
    struct LogRecord final
    {
        LogLevel level{ LogLevel::info };
        SYSTEMTIME time{};
        std::wstring_view message;
    };

    [[nodiscard]] std::wstring_view level_name(LogLevel level) noexcept;

    class ILogSink
    {
    public:
        virtual ~ILogSink() = default;
        virtual void write(const LogRecord& record) noexcept = 0;
    };

    // `[vmrunner] <message>` for info, `[vmrunner] <level>: <message>` for
    // everything else. Goes to stderr so it never mixes with guest output on
    // stdout.
    class StderrLogSink final : public ILogSink
    {
    public:
        explicit StderrLogSink(core::HandleView stream) noexcept;

        [[nodiscard]] static std::wstring format(const LogRecord& record);
        void write(const LogRecord& record) noexcept override;

    private:
        core::HandleView _stream;
    };

    class DebugOutputSink final : public ILogSink
    {
    public:
        void write(const LogRecord& record) noexcept override;
    };

    // Appends `yyyy-mm-dd hh:mm:ss.mmm [LEVEL] message` lines as UTF-8.
    class FileLogSink final : public ILogSink
    {
    public:
        [[nodiscard]] static std::expected<std::shared_ptr<FileLogSink>, DWORD> open(const std::wstring& path) noexcept;

        // `<directory>\vmrunner-<yyyymmdd-hhmmss>-<pid>.log`, creating the
        // directory when needed. An empty directory means `<temp>\vmrunner`.
        [[nodiscard]] static std::expected<std::wstring, DWORD> session_log_path(std::wstring_view directory) noexcept;

        [[nodiscard]] static std::wstring format(const LogRecord& record);
        void write(const LogRecord& record) noexcept override;

    private:
        explicit FileLogSink(core::UniqueHandle file) noexcept;

        core::UniqueHandle _file;
    };

    class Logger final
    {
    public:
        explicit Logger(LogLevel minimum_level) noexcept;

        Logger(const Logger&) = delete;
        Logger& operator=(const Logger&) = delete;

        // Not synchronized with logging; add sinks before other threads log.
        void add_sink(std::shared_ptr<ILogSink> sink);

        void set_minimum_level(LogLevel level) noexcept;
        [[nodiscard]] LogLevel minimum_level() const noexcept;
        [[nodiscard]] bool enabled(LogLevel level) const noexcept;

        template<typename... Args>
        void log(const LogLevel level, const std::wformat_string<Args...> format_text, Args&&... args)
        {
            if (enabled(level))
            {
                log_preformatted(level, std::format(format_text, std::forward<Args>(args)...));
            }
        }

        void log_preformatted(LogLevel level, std::wstring_view message);

    private:
        std::atomic<LogLevel> _minimum_level;
        std::mutex _dispatch_lock;
        std::vector<std::shared_ptr<ILogSink>> _sinks;
    };
}
