#pragma once

#include "hcs/hcs_types.hpp"

#include <Windows.h>

#include <string>
#include <string_view>

namespace vmr::hcs
{
    enum class ControlErrorKind : unsigned char
    {
        // The call itself returned a failure HRESULT.
        call_failed,
        // The call was pending and the completion notification carried a failure.
        async_failed,
        // No completion notification arrived before the deadline.
        timeout,
        // The completion callback could not be registered.
        registration_failed,
        // vmcompute.dll or one of its entry points is missing.
        service_unavailable,
    };

    struct ControlError final
    {
        ControlErrorKind kind{ ControlErrorKind::call_failed };
        std::wstring context;
        HRESULT hresult{ E_FAIL };
        std::wstring detail;
    };

    [[nodiscard]] ControlError make_control_error(
        ControlErrorKind kind,
        std::wstring context,
        HRESULT hresult,
        std::wstring detail = {});

    // "HRESULT 0x%08X (<system message>): <detail>", leaving out the parts that
    // are unavailable.
    [[nodiscard]] std::wstring format_hresult(HRESULT hresult, std::wstring_view detail);

    // "<context>: <formatted hresult>" or "<context>: timed out ..." for waits.
    [[nodiscard]] std::wstring describe(const ControlError& error);

    [[nodiscard]] constexpr bool is_timeout(const ControlError& error) noexcept
    {
        return error.kind == ControlErrorKind::timeout;
    }
}
