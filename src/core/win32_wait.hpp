#pragma once

// Small wrappers around Win32 wait APIs.
//
// Wait APIs want contiguous `HANDLE` arrays; keep that conversion here so the
// rest of the code base only passes `HandleView` values.

#include "core/handle_view.hpp"

#include <Windows.h>

#include <array>
#include <cstddef>
#include <initializer_list>

namespace vmr::core
{
    inline constexpr DWORD wait_failed_index = static_cast<DWORD>(-1);
    inline constexpr DWORD wait_timeout_index = static_cast<DWORD>(-2);

    // Waits until any of the valid handles is signaled and returns its index in
    // `handles`. Invalid views are skipped so optional objects (for example an
    // absent stop event) can be passed unconditionally.
    [[nodiscard]] inline DWORD wait_for_any(const std::initializer_list<HandleView> handles, const DWORD timeout_ms) noexcept
    {
        std::array<HANDLE, MAXIMUM_WAIT_OBJECTS> raw{};
        std::array<DWORD, MAXIMUM_WAIT_OBJECTS> positions{};
        DWORD count = 0;
        DWORD position = 0;
        for (const HandleView handle : handles)
        {
            if (handle && count < MAXIMUM_WAIT_OBJECTS)
            {
                raw[count] = handle.get();
                positions[count] = position;
                ++count;
            }
            ++position;
        }

        if (count == 0)
        {
            return wait_failed_index;
        }

        const DWORD result = ::WaitForMultipleObjects(count, raw.data(), FALSE, timeout_ms);
        if (result == WAIT_TIMEOUT)
        {
            return wait_timeout_index;
        }
        if (result >= WAIT_OBJECT_0 && result < WAIT_OBJECT_0 + count)
        {
            return positions[result - WAIT_OBJECT_0];
        }
        return wait_failed_index;
    }
}
