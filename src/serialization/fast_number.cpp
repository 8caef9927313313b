#include "serialization/fast_number.hpp"

#include <limits>

namespace vmr::serialization
{
    namespace
    {
        [[nodiscard]] constexpr NumberError make_error(const NumberErrorCode code) noexcept
        {
            return NumberError{ .code = code };
        }
    }

    std::expected<std::uint32_t, NumberError> parse_u32(const std::wstring_view text) noexcept
    {
        if (text.empty())
        {
            return std::unexpected(make_error(NumberErrorCode::empty_input));
        }

        size_t index = 0;
        if (text[index] == L'+')
        {
            ++index;
        }
        if (index >= text.size())
        {
            return std::unexpected(make_error(NumberErrorCode::invalid_character));
        }

        std::uint64_t accumulator = 0;
        for (; index < text.size(); ++index)
        {
            const wchar_t ch = text[index];
            if (ch < L'0' || ch > L'9')
            {
                return std::unexpected(make_error(NumberErrorCode::invalid_character));
            }

            accumulator = accumulator * 10 + static_cast<std::uint32_t>(ch - L'0');
            if (accumulator > std::numeric_limits<std::uint32_t>::max())
            {
                return std::unexpected(make_error(NumberErrorCode::overflow));
            }
        }

        return static_cast<std::uint32_t>(accumulator);
    }
}
