#pragma once

// Host terminals send CR for Enter; the guest's line discipline expects LF.
// Bare CR becomes LF and CR LF collapses to a single LF. The CR/LF pair may be
// split across reads, so the normalizer remembers whether the last byte of the
// previous chunk was a CR.

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vmr::terminal
{
    class LineEndingNormalizer final
    {
    public:
        // Appends the normalized form of `input` to `output`.
        void transform(std::span<const std::byte> input, std::vector<std::byte>& output);

        void reset() noexcept
        {
            _previous_was_cr = false;
        }

    private:
        bool _previous_was_cr{ false };
    };

    [[nodiscard]] std::string normalize_line_endings(std::string_view text);
}
