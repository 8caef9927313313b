#pragma once

// The two byte pumps of a console session.
//
// Both loops end cleanly when their source reports end of stream or when the
// owner cancels the pending I/O; only real I/O failures are errors.

#include "console/console_pipe.hpp"
#include "core/handle_view.hpp"
#include "logging/logger.hpp"

#include <cstddef>
#include <expected>

namespace vmr::console
{
    inline constexpr std::size_t forward_chunk_size = 4096;

    struct ForwardOptions final
    {
        // When set, every host->guest write is logged at trace level.
        logging::Logger* trace_logger{ nullptr };
    };

    // Guest -> host. `channel` must be the overlapped console pipe.
    [[nodiscard]] std::expected<void, ConsoleTransportError> forward_to_host(
        core::HandleView channel,
        core::HandleView host_output) noexcept;

    // Host -> guest with line-ending normalization.
    [[nodiscard]] std::expected<void, ConsoleTransportError> forward_from_host(
        core::HandleView channel,
        core::HandleView host_input,
        ForwardOptions options = {}) noexcept;
}
