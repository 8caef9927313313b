#pragma once

#include <cstdint>
#include <expected>
#include <string_view>

namespace vmr::serialization
{
    enum class NumberErrorCode
    {
        empty_input,
        invalid_character,
        overflow,
    };

    struct NumberError final
    {
        NumberErrorCode code{ NumberErrorCode::invalid_character };
    };

    // Decimal unsigned parsing for configuration values and CLI flags
    // (memory size, CPU count, timeouts). An optional leading '+' is accepted;
    // whitespace is not.
    [[nodiscard]] std::expected<std::uint32_t, NumberError> parse_u32(std::wstring_view text) noexcept;
}
