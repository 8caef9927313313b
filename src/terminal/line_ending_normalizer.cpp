#include "terminal/line_ending_normalizer.hpp"

namespace vmr::terminal
{
    void LineEndingNormalizer::transform(const std::span<const std::byte> input, std::vector<std::byte>& output)
    {
        output.reserve(output.size() + input.size());
        for (const std::byte value : input)
        {
            if (value == std::byte{ '\r' })
            {
                output.push_back(std::byte{ '\n' });
                _previous_was_cr = true;
                continue;
            }

            if (value == std::byte{ '\n' } && _previous_was_cr)
            {
                // Already emitted for the CR.
                _previous_was_cr = false;
                continue;
            }

            output.push_back(value);
            _previous_was_cr = false;
        }
    }

    std::string normalize_line_endings(const std::string_view text)
    {
        LineEndingNormalizer normalizer;
        std::vector<std::byte> bytes;
        normalizer.transform(
            std::span<const std::byte>(reinterpret_cast<const std::byte*>(text.data()), text.size()),
            bytes);
        return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
    }
}
