#pragma once

#include "core/handle_view.hpp"
#include "core/utf8.hpp"

#include <new>
#include <string>
#include <string_view>

namespace vmr::core
{
    // Writes one line to `stream`. Console handles receive UTF-16 through
    // `WriteConsoleW`; redirected handles (files, pipes) receive UTF-8 so the
    // output stays readable for scripts that capture stderr.
    inline void write_line(const HandleView stream, const std::wstring_view message) noexcept
    {
        if (!stream)
        {
            return;
        }

        DWORD mode = 0;
        if (::GetConsoleMode(stream.get(), &mode) != FALSE)
        {
            DWORD written = 0;
            (void)::WriteConsoleW(stream.get(), message.data(), static_cast<DWORD>(message.size()), &written, nullptr);
            (void)::WriteConsoleW(stream.get(), L"\r\n", 2, &written, nullptr);
            return;
        }

        std::string payload;
        try
        {
            payload = to_utf8(message);
            payload.append("\r\n");
        }
        catch (const std::bad_alloc&)
        {
            return;
        }

        DWORD written = 0;
        (void)::WriteFile(stream.get(), payload.data(), static_cast<DWORD>(payload.size()), &written, nullptr);
    }

    inline void write_console_line(const std::wstring_view message) noexcept
    {
        write_line(HandleView::standard(STD_ERROR_HANDLE), message);
    }
}
