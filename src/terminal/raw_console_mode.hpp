#pragma once

// Character-at-a-time input for the interactive session.
//
// Line input and local echo are switched off (the guest shell echoes) and VT
// input is switched on so arrow keys and friends arrive as escape sequences.
// Processed input stays on so Ctrl+C still reaches the control handler.
// While the mode is active, read with ReadFile: ReadConsoleW can block
// indefinitely under a pseudo console once the mode was changed.

#include "core/handle_view.hpp"

#include <Windows.h>

#include <expected>

namespace vmr::terminal
{
    [[nodiscard]] constexpr DWORD compute_raw_input_mode(const DWORD original) noexcept
    {
        return (original & ~static_cast<DWORD>(ENABLE_LINE_INPUT | ENABLE_ECHO_INPUT)) | ENABLE_VIRTUAL_TERMINAL_INPUT;
    }

    class RawConsoleMode final
    {
    public:
        RawConsoleMode() noexcept = default;
        ~RawConsoleMode() noexcept;

        RawConsoleMode(const RawConsoleMode&) = delete;
        RawConsoleMode& operator=(const RawConsoleMode&) = delete;

        RawConsoleMode(RawConsoleMode&& other) noexcept;
        RawConsoleMode& operator=(RawConsoleMode&& other) noexcept;

        // Fails with the GetConsoleMode error when `input` is not a console;
        // callers then read it as a plain byte stream. `output` is optional:
        // when it is a console, VT processing and the UTF-8 code pages are
        // enabled for the session as well.
        [[nodiscard]] static std::expected<RawConsoleMode, DWORD> enter(core::HandleView input, core::HandleView output) noexcept;

        [[nodiscard]] bool active() const noexcept
        {
            return static_cast<bool>(_input);
        }

        [[nodiscard]] DWORD original_input_mode() const noexcept
        {
            return _input_mode;
        }

        void restore() noexcept;

    private:
        core::HandleView _input{};
        DWORD _input_mode{ 0 };

        core::HandleView _output{};
        DWORD _output_mode{ 0 };

        UINT _input_code_page{ 0 };
        UINT _output_code_page{ 0 };
    };
}
