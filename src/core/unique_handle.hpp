#pragma once

// Single-owner wrappers for Win32 resources.
//
// `UniqueResource<Traits>` owns one value of `Traits::pointer` and releases it
// with `Traits::close`. The aliases at the bottom cover what vmrunner holds:
// kernel handles, the vmcompute.dll module, and LocalAlloc'ed API results.

#include "core/handle_view.hpp"

#include <Windows.h>

#include <concepts>
#include <utility>

namespace vmr::core
{
    template<typename Traits>
    class UniqueResource final
    {
    public:
        using pointer = typename Traits::pointer;

        UniqueResource() noexcept = default;

        explicit UniqueResource(const pointer value) noexcept :
            _value(value)
        {
        }

        ~UniqueResource() noexcept
        {
            reset();
        }

        UniqueResource(const UniqueResource&) = delete;
        UniqueResource& operator=(const UniqueResource&) = delete;

        UniqueResource(UniqueResource&& other) noexcept :
            _value(std::exchange(other._value, pointer{}))
        {
        }

        UniqueResource& operator=(UniqueResource&& other) noexcept
        {
            if (this != &other)
            {
                reset(std::exchange(other._value, pointer{}));
            }
            return *this;
        }

        [[nodiscard]] pointer get() const noexcept
        {
            return _value;
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return Traits::valid(_value);
        }

        [[nodiscard]] HandleView view() const noexcept
            requires std::same_as<pointer, HANDLE>
        {
            return HandleView(_value);
        }

        // Out-parameter for APIs that return the resource through a pointer.
        // Anything held before is released first.
        [[nodiscard]] pointer* put() noexcept
        {
            reset();
            return &_value;
        }

        pointer release() noexcept
        {
            return std::exchange(_value, pointer{});
        }

        void reset(const pointer replacement = pointer{}) noexcept
        {
            const pointer previous = std::exchange(_value, replacement);
            if (Traits::valid(previous))
            {
                Traits::close(previous);
            }
        }

    private:
        pointer _value{};
    };

    struct KernelHandleTraits final
    {
        using pointer = HANDLE;

        // Win32 uses both conventions for "no handle".
        static bool valid(const HANDLE value) noexcept
        {
            return value != nullptr && value != INVALID_HANDLE_VALUE;
        }

        static void close(const HANDLE value) noexcept
        {
            (void)::CloseHandle(value);
        }
    };

    struct ModuleTraits final
    {
        using pointer = HMODULE;

        static bool valid(const HMODULE value) noexcept
        {
            return value != nullptr;
        }

        static void close(const HMODULE value) noexcept
        {
            (void)::FreeLibrary(value);
        }
    };

    template<typename T>
    struct LocalMemoryTraits final
    {
        using pointer = T*;

        static bool valid(T* const value) noexcept
        {
            return value != nullptr;
        }

        static void close(T* const value) noexcept
        {
            (void)::LocalFree(value);
        }
    };

    using UniqueHandle = UniqueResource<KernelHandleTraits>;
    using UniqueModule = UniqueResource<ModuleTraits>;

    // `CommandLineToArgvW` and `FormatMessageW(FORMAT_MESSAGE_ALLOCATE_BUFFER)`.
    template<typename T>
    using UniqueLocalPtr = UniqueResource<LocalMemoryTraits<T>>;
}
