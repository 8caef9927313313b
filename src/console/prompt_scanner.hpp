#pragma once

// Detects the guest shell prompt in the console byte stream.
//
// Heuristic: a `#` or `$` directly after a space ("root@host:/# ",
// "user@host:~$ "). Output that happens to contain " $" or " #" ends a
// command early; the serial console offers nothing better without an agent.

#include <cstddef>

namespace vmr::console
{
    class PromptScanner final
    {
    public:
        // Returns true when `value` completes a prompt.
        [[nodiscard]] constexpr bool feed(const std::byte value) noexcept
        {
            const bool prompt = _previous == std::byte{ ' ' } && (value == std::byte{ '#' } || value == std::byte{ '$' });
            _previous = value;
            return prompt;
        }

        constexpr void reset() noexcept
        {
            _previous = std::byte{ 0 };
        }

    private:
        std::byte _previous{ 0 };
    };
}
