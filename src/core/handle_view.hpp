#pragma once

// A non-owning view of a Win32 HANDLE.
//
// vmrunner passes borrowed handles around constantly: the process standard
// handles from `GetStdHandle`, the console pipe shared by the two forwarding
// threads, and the stdio pipes returned for an in-guest process. A view makes
// "this function does not own the handle" visible in the signature.
//
// This type never closes the handle. For owning semantics use `UniqueHandle`.

#include <Windows.h>

#include <type_traits>

namespace vmr::core
{
    class HandleView final
    {
    public:
        constexpr HandleView() noexcept = default;

        explicit constexpr HandleView(const HANDLE value) noexcept :
            _value(value)
        {
        }

        [[nodiscard]] static HandleView standard(const DWORD which) noexcept
        {
            return HandleView(::GetStdHandle(which));
        }

        [[nodiscard]] constexpr HANDLE get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] constexpr bool valid() const noexcept
        {
            return _value != nullptr && _value != INVALID_HANDLE_VALUE;
        }

        [[nodiscard]] explicit constexpr operator bool() const noexcept
        {
            return valid();
        }

    private:
        HANDLE _value{ nullptr };
    };

    static_assert(sizeof(HandleView) == sizeof(HANDLE), "HandleView must remain layout-compatible with HANDLE");
    static_assert(std::is_trivially_copyable_v<HandleView>, "HandleView must remain trivially copyable");
}
