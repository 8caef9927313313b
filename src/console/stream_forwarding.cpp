#include "console/stream_forwarding.hpp"

#include "core/stream_io.hpp"
#include "terminal/line_ending_normalizer.hpp"

#include <array>
#include <new>
#include <span>
#include <string>
#include <vector>

namespace vmr::console
{
    namespace
    {
        [[nodiscard]] bool is_clean_stop(const DWORD error) noexcept
        {
            return core::is_end_of_stream_error(error) || core::is_cancellation_error(error);
        }

        [[nodiscard]] std::unexpected<ConsoleTransportError> transport_error(const wchar_t* const context, const DWORD error) noexcept
        {
            try
            {
                return std::unexpected(ConsoleTransportError{ .context = context, .win32_error = error });
            }
            catch (const std::bad_alloc&)
            {
                return std::unexpected(ConsoleTransportError{ .win32_error = error });
            }
        }

        // Printable form of a trace payload: control bytes as \xNN.
        [[nodiscard]] std::wstring describe_bytes(const std::span<const std::byte> bytes)
        {
            static constexpr wchar_t hex[] = L"0123456789ABCDEF";

            std::wstring text;
            text.reserve(bytes.size());
            for (const std::byte value : bytes)
            {
                const auto code = static_cast<unsigned char>(value);
                if (code >= 0x20 && code < 0x7F)
                {
                    text.push_back(static_cast<wchar_t>(code));
                    continue;
                }
                text.append(L"\\x");
                text.push_back(hex[code >> 4]);
                text.push_back(hex[code & 0x0F]);
            }
            return text;
        }
    }

    std::expected<void, ConsoleTransportError> forward_to_host(
        const core::HandleView channel,
        const core::HandleView host_output) noexcept
    {
        auto reader = core::StreamReader::overlapped(channel);
        core::StreamWriter writer(host_output);

        std::array<std::byte, forward_chunk_size> buffer{};
        for (;;)
        {
            auto read = reader.read(buffer);
            if (!read)
            {
                if (is_clean_stop(read.error()))
                {
                    return {};
                }
                return transport_error(L"ReadFile failed for console pipe", read.error());
            }
            if (read.value() == 0)
            {
                return {};
            }

            auto written = writer.write_all(std::span<const std::byte>(buffer.data(), read.value()));
            if (!written)
            {
                if (is_clean_stop(written.error()))
                {
                    return {};
                }
                return transport_error(L"WriteFile failed for host output", written.error());
            }
        }
    }

    std::expected<void, ConsoleTransportError> forward_from_host(
        const core::HandleView channel,
        const core::HandleView host_input,
        const ForwardOptions options) noexcept
    {
        core::StreamReader reader(host_input);
        auto writer = core::StreamWriter::overlapped(channel);
        terminal::LineEndingNormalizer normalizer;

        std::array<std::byte, forward_chunk_size> buffer{};
        std::vector<std::byte> normalized;
        for (;;)
        {
            auto read = reader.read(buffer);
            if (!read)
            {
                if (is_clean_stop(read.error()))
                {
                    return {};
                }
                return transport_error(L"ReadFile failed for host input", read.error());
            }
            if (read.value() == 0)
            {
                return {};
            }

            try
            {
                normalized.clear();
                normalizer.transform(std::span<const std::byte>(buffer.data(), read.value()), normalized);

                if (options.trace_logger != nullptr && options.trace_logger->enabled(logging::LogLevel::trace))
                {
                    options.trace_logger->log(
                        logging::LogLevel::trace,
                        L"host->guest {} bytes: {}",
                        normalized.size(),
                        describe_bytes(normalized));
                }
            }
            catch (const std::bad_alloc&)
            {
                return transport_error(L"Out of memory while forwarding host input", ERROR_OUTOFMEMORY);
            }

            auto written = writer.write_all(normalized);
            if (!written)
            {
                if (is_clean_stop(written.error()))
                {
                    return {};
                }
                return transport_error(L"WriteFile failed for console pipe", written.error());
            }
        }
    }
}
