#pragma once

// Blocking ReadFile/WriteFile helpers that adapt to overlapped handles.
//
// Why this exists:
// - The guest console pipe is opened with FILE_FLAG_OVERLAPPED. Two threads
//   read and write that one handle at the same time; with a synchronous handle
//   the I/O manager serializes the calls and a pending read starves every
//   write, so the directions deadlock against each other.
// - ReadFile/WriteFile with `lpOverlapped == nullptr` on an overlapped handle
//   fails with ERROR_INVALID_PARAMETER, while the host's standard handles
//   (console, redirected file, anonymous pipe) are synchronous. The same
//   reader type serves both by detecting the mode on first use.
//
// Design notes:
// - Each reader/writer owns its own event object and OVERLAPPED block, reset
//   before every operation. A reader and a writer on one handle therefore
//   never share wait state.
// - These helpers perform "blocking overlapped I/O": issue the I/O with an
//   OVERLAPPED structure, then wait with GetOverlappedResult(..., TRUE).
// - Owners cancel with CancelIoEx(handle, nullptr); the blocked call then
//   fails with ERROR_OPERATION_ABORTED.

#include "core/handle_view.hpp"
#include "core/unique_handle.hpp"

#include <Windows.h>

#include <cstddef>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string_view>

namespace vmr::core
{
    // Errors that mean "the other side went away". Stream loops treat these
    // like a zero-byte read: a normal end of data, not an I/O failure.
    [[nodiscard]] constexpr bool is_end_of_stream_error(const DWORD error) noexcept
    {
        return error == ERROR_BROKEN_PIPE ||
               error == ERROR_PIPE_NOT_CONNECTED ||
               error == ERROR_NO_DATA ||
               error == ERROR_HANDLE_EOF;
    }

    [[nodiscard]] constexpr bool is_cancellation_error(const DWORD error) noexcept
    {
        return error == ERROR_OPERATION_ABORTED || error == ERROR_CANCELLED;
    }

    namespace detail
    {
        enum class IoMode : unsigned char
        {
            unknown,
            synchronous,
            overlapped,
        };

        class OverlappedEvent final
        {
        public:
            OverlappedEvent() noexcept = default;

            explicit OverlappedEvent(UniqueHandle event) noexcept :
                _event(std::move(event))
            {
                reset();
            }

            OverlappedEvent(const OverlappedEvent&) = delete;
            OverlappedEvent& operator=(const OverlappedEvent&) = delete;

            OverlappedEvent(OverlappedEvent&& other) noexcept :
                _event(std::move(other._event))
            {
                reset();
            }

            OverlappedEvent& operator=(OverlappedEvent&& other) noexcept
            {
                if (this != &other)
                {
                    _event = std::move(other._event);
                    reset();
                }
                return *this;
            }

            [[nodiscard]] static std::expected<OverlappedEvent, DWORD> create() noexcept
            {
                UniqueHandle event(::CreateEventW(nullptr, TRUE, FALSE, nullptr));
                if (!event.valid())
                {
                    return std::unexpected(::GetLastError());
                }

                return OverlappedEvent(std::move(event));
            }

            void reset() noexcept
            {
                _overlapped = OVERLAPPED{};
                _overlapped.hEvent = _event.get();
                if (_event.valid())
                {
                    (void)::ResetEvent(_event.get());
                }
            }

            [[nodiscard]] OVERLAPPED* overlapped() noexcept
            {
                return &_overlapped;
            }

        private:
            UniqueHandle _event;
            OVERLAPPED _overlapped{};
        };

        // Shared transfer loop for both directions. `Transfer` is ReadFile or
        // WriteFile with a compatible buffer pointer type.
        template<typename Buffer, typename Transfer>
        [[nodiscard]] std::expected<DWORD, DWORD> blocking_transfer(
            const HandleView handle,
            IoMode& mode,
            std::optional<OverlappedEvent>& overlapped,
            Buffer* const data,
            const DWORD size,
            Transfer transfer) noexcept
        {
            DWORD transferred = 0;

            if (mode != IoMode::overlapped)
            {
                if (transfer(handle.get(), data, size, &transferred, nullptr) != FALSE)
                {
                    mode = IoMode::synchronous;
                    return transferred;
                }

                const DWORD error = ::GetLastError();
                if (error != ERROR_INVALID_PARAMETER || mode == IoMode::synchronous)
                {
                    return std::unexpected(error);
                }

                mode = IoMode::overlapped;
            }

            if (!overlapped.has_value())
            {
                auto created = OverlappedEvent::create();
                if (!created)
                {
                    return std::unexpected(created.error());
                }

                overlapped.emplace(std::move(created.value()));
            }

            overlapped->reset();

            if (transfer(handle.get(), data, size, &transferred, overlapped->overlapped()) != FALSE)
            {
                return transferred;
            }

            const DWORD error = ::GetLastError();
            if (error != ERROR_IO_PENDING)
            {
                return std::unexpected(error);
            }

            if (::GetOverlappedResult(handle.get(), overlapped->overlapped(), &transferred, TRUE) == FALSE)
            {
                return std::unexpected(::GetLastError());
            }

            return transferred;
        }
    }

    class StreamReader final
    {
    public:
        StreamReader() noexcept = default;

        explicit StreamReader(const HandleView handle) noexcept :
            _handle(handle)
        {
        }

        // For handles known to be opened with FILE_FLAG_OVERLAPPED. Skips the
        // synchronous attempt, which is undefined on such handles.
        [[nodiscard]] static StreamReader overlapped(const HandleView handle) noexcept
        {
            StreamReader stream(handle);
            stream._mode = detail::IoMode::overlapped;
            return stream;
        }

        // Returns the byte count; zero means end of stream.
        [[nodiscard]] std::expected<DWORD, DWORD> read(const std::span<std::byte> dest) noexcept
        {
            if (!_handle)
            {
                return std::unexpected(ERROR_INVALID_HANDLE);
            }

            if (dest.empty())
            {
                return DWORD{ 0 };
            }

            const DWORD to_read = dest.size() > static_cast<size_t>(std::numeric_limits<DWORD>::max())
                ? std::numeric_limits<DWORD>::max()
                : static_cast<DWORD>(dest.size());

            return detail::blocking_transfer(
                _handle,
                _mode,
                _overlapped,
                dest.data(),
                to_read,
                [](HANDLE file, std::byte* buffer, DWORD size, DWORD* done, OVERLAPPED* overlapped) noexcept {
                    return ::ReadFile(file, buffer, size, done, overlapped);
                });
        }

    private:
        HandleView _handle{};
        detail::IoMode _mode{ detail::IoMode::unknown };
        std::optional<detail::OverlappedEvent> _overlapped;
    };

    class StreamWriter final
    {
    public:
        StreamWriter() noexcept = default;

        explicit StreamWriter(const HandleView handle) noexcept :
            _handle(handle)
        {
        }

        // For handles known to be opened with FILE_FLAG_OVERLAPPED. Skips the
        // synchronous attempt, which is undefined on such handles.
        [[nodiscard]] static StreamWriter overlapped(const HandleView handle) noexcept
        {
            StreamWriter stream(handle);
            stream._mode = detail::IoMode::overlapped;
            return stream;
        }

        [[nodiscard]] std::expected<DWORD, DWORD> write(const std::span<const std::byte> bytes) noexcept
        {
            if (!_handle)
            {
                return std::unexpected(ERROR_INVALID_HANDLE);
            }

            if (bytes.empty())
            {
                return DWORD{ 0 };
            }

            const DWORD to_write = bytes.size() > static_cast<size_t>(std::numeric_limits<DWORD>::max())
                ? std::numeric_limits<DWORD>::max()
                : static_cast<DWORD>(bytes.size());

            return detail::blocking_transfer(
                _handle,
                _mode,
                _overlapped,
                bytes.data(),
                to_write,
                [](HANDLE file, const std::byte* buffer, DWORD size, DWORD* done, OVERLAPPED* overlapped) noexcept {
                    return ::WriteFile(file, buffer, size, done, overlapped);
                });
        }

        [[nodiscard]] std::expected<size_t, DWORD> write_all(const std::span<const std::byte> bytes) noexcept
        {
            size_t total_written = 0;
            while (total_written < bytes.size())
            {
                auto written = write(bytes.subspan(total_written));
                if (!written)
                {
                    return std::unexpected(written.error());
                }

                if (written.value() == 0)
                {
                    break;
                }
                total_written += static_cast<size_t>(written.value());
            }

            return total_written;
        }

    private:
        HandleView _handle{};
        detail::IoMode _mode{ detail::IoMode::unknown };
        std::optional<detail::OverlappedEvent> _overlapped;
    };

    [[nodiscard]] inline std::span<const std::byte> as_bytes(const std::string_view text) noexcept
    {
        return std::span<const std::byte>(reinterpret_cast<const std::byte*>(text.data()), text.size());
    }
}
