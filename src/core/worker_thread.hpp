#pragma once

// Starts a Win32 thread that runs a callable.
//
// The callable is moved to the heap and owned by the new thread, so whatever
// it captures must stay valid for as long as the thread may run. Session code
// captures `std::shared_ptr` contexts for exactly that reason.

#include "core/unique_handle.hpp"

#include <Windows.h>

#include <expected>
#include <memory>
#include <new>
#include <type_traits>
#include <utility>

namespace vmr::core
{
    namespace detail
    {
        template<typename Body>
        DWORD WINAPI run_thread_body(void* param) noexcept
        {
            std::unique_ptr<Body> body(static_cast<Body*>(param));
            (*body)();
            return 0;
        }
    }

    template<typename Fn>
    [[nodiscard]] std::expected<UniqueHandle, DWORD> start_thread(Fn&& body) noexcept
    {
        using Body = std::decay_t<Fn>;

        std::unique_ptr<Body> owned;
        try
        {
            owned = std::make_unique<Body>(std::forward<Fn>(body));
        }
        catch (const std::bad_alloc&)
        {
            return std::unexpected(ERROR_OUTOFMEMORY);
        }

        UniqueHandle thread(::CreateThread(
            nullptr,
            0,
            &detail::run_thread_body<Body>,
            owned.get(),
            0,
            nullptr));
        if (!thread.valid())
        {
            return std::unexpected(::GetLastError());
        }

        // Ownership moved to the thread.
        (void)owned.release();
        return std::move(thread);
    }
}
