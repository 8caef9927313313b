#pragma once

// UTF-16 <-> UTF-8 conversion.
//
// The HCS API and the command line are UTF-16; the guest console and the
// process-parameter payload are byte streams, so conversions happen at those
// two boundaries only.

#include <Windows.h>

#include <string>
#include <string_view>

namespace vmr::core
{
    [[nodiscard]] inline std::string to_utf8(const std::wstring_view text)
    {
        if (text.empty())
        {
            return {};
        }

        const int required = ::WideCharToMultiByte(
            CP_UTF8,
            0,
            text.data(),
            static_cast<int>(text.size()),
            nullptr,
            0,
            nullptr,
            nullptr);
        if (required <= 0)
        {
            return {};
        }

        std::string converted(static_cast<size_t>(required), '\0');
        const int written = ::WideCharToMultiByte(
            CP_UTF8,
            0,
            text.data(),
            static_cast<int>(text.size()),
            converted.data(),
            required,
            nullptr,
            nullptr);
        if (written <= 0)
        {
            return {};
        }

        converted.resize(static_cast<size_t>(written));
        return converted;
    }

    [[nodiscard]] inline std::wstring from_utf8(const std::string_view text)
    {
        if (text.empty())
        {
            return {};
        }

        const int required = ::MultiByteToWideChar(
            CP_UTF8,
            0,
            text.data(),
            static_cast<int>(text.size()),
            nullptr,
            0);
        if (required <= 0)
        {
            return {};
        }

        std::wstring converted(static_cast<size_t>(required), L'\0');
        const int written = ::MultiByteToWideChar(
            CP_UTF8,
            0,
            text.data(),
            static_cast<int>(text.size()),
            converted.data(),
            required);
        if (written <= 0)
        {
            return {};
        }

        converted.resize(static_cast<size_t>(written));
        return converted;
    }
}
