#pragma once

#include <Windows.h>

#include <cwchar>

namespace vmr::core
{
    inline void fail_fast_assert(const wchar_t* expression, const wchar_t* file, const unsigned line) noexcept
    {
        wchar_t buffer[768]{};
        _snwprintf_s(
            buffer,
            _TRUNCATE,
            L"[vmrunner] assertion failed: %ls (%ls:%u)\n",
            expression,
            file,
            line);
        ::OutputDebugStringW(buffer);
        __fastfail(FAST_FAIL_FATAL_APP_EXIT);
    }
}

#define VMR_WIDEN_INNER(value) L##value
#define VMR_WIDEN(value) VMR_WIDEN_INNER(value)
#define VMR_ASSERT(expr) ((expr) ? static_cast<void>(0) : ::vmr::core::fail_fast_assert(VMR_WIDEN(#expr), VMR_WIDEN(__FILE__), __LINE__))
