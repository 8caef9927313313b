#include "hcs/control_error.hpp"

#include "core/unique_handle.hpp"

#include <format>

namespace vmr::hcs
{
    namespace
    {
        [[nodiscard]] std::wstring system_message(const HRESULT hresult)
        {
            core::UniqueLocalPtr<wchar_t> buffer;
            const DWORD length = ::FormatMessageW(
                FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS,
                nullptr,
                static_cast<DWORD>(hresult),
                0,
                reinterpret_cast<LPWSTR>(buffer.put()),
                0,
                nullptr);
            if (length == 0 || buffer.get() == nullptr)
            {
                return {};
            }

            std::wstring message(buffer.get(), length);
            while (!message.empty() && (message.back() == L'\r' || message.back() == L'\n' || message.back() == L' ' || message.back() == L'.'))
            {
                message.pop_back();
            }
            return message;
        }
    }

    ControlError make_control_error(
        const ControlErrorKind kind,
        std::wstring context,
        const HRESULT hresult,
        std::wstring detail)
    {
        return ControlError{
            .kind = kind,
            .context = std::move(context),
            .hresult = hresult,
            .detail = std::move(detail),
        };
    }

    std::wstring format_hresult(const HRESULT hresult, const std::wstring_view detail)
    {
        const unsigned int code = static_cast<unsigned int>(hresult);
        const std::wstring message = system_message(hresult);

        if (!detail.empty() && !message.empty())
        {
            return std::format(L"HRESULT 0x{:08X} ({}): {}", code, message, detail);
        }
        if (!detail.empty())
        {
            return std::format(L"HRESULT 0x{:08X}: {}", code, detail);
        }
        if (!message.empty())
        {
            return std::format(L"HRESULT 0x{:08X} ({})", code, message);
        }
        return std::format(L"HRESULT 0x{:08X}", code);
    }

    std::wstring describe(const ControlError& error)
    {
        if (error.kind == ControlErrorKind::timeout)
        {
            return std::format(L"{}: {}", error.context, error.detail);
        }
        return std::format(L"{}: {}", error.context, format_hresult(error.hresult, error.detail));
    }
}
