#pragma once

// Win32 object creation helpers that return RAII wrappers.

#include "core/handle_view.hpp"
#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>

namespace vmr::core
{
    [[nodiscard]] inline std::expected<UniqueHandle, DWORD> create_event(
        const bool manual_reset,
        const bool initial_state) noexcept
    {
        UniqueHandle event(::CreateEventW(nullptr, manual_reset ? TRUE : FALSE, initial_state ? TRUE : FALSE, nullptr));
        if (!event.valid())
        {
            return std::unexpected(::GetLastError());
        }
        return std::move(event);
    }

    // Forwarding threads get their own duplicate of the console pipe so that a
    // thread abandoned at session end never touches a handle value the owner
    // has already closed (and the system may have reused).
    [[nodiscard]] inline std::expected<UniqueHandle, DWORD> duplicate_handle_same_access(const HandleView source) noexcept
    {
        if (!source)
        {
            return std::unexpected(ERROR_INVALID_HANDLE);
        }

        UniqueHandle duplicated{};
        if (::DuplicateHandle(
                ::GetCurrentProcess(),
                source.get(),
                ::GetCurrentProcess(),
                duplicated.put(),
                0,
                FALSE,
                DUPLICATE_SAME_ACCESS) == FALSE)
        {
            return std::unexpected(::GetLastError());
        }

        return std::move(duplicated);
    }
}
