#pragma once

// Types of the Host Compute Service (HCS) v1 API exported by vmcompute.dll.
//
// The SDK only ships headers for the newer computecore.dll surface, so the
// handful of declarations the old surface needs are spelled out here. Layouts
// and numeric values are fixed by vmcompute.dll and must not change.

#include <Windows.h>

#include <string>
#include <utility>

namespace vmr::hcs
{
    using HcsSystemHandle = HANDLE;
    using HcsProcessHandle = HANDLE;
    using HcsCallbackHandle = HANDLE;

    // HCS_OPERATION_PENDING: the call was accepted and completes later through
    // a notification. Any handle returned alongside it is already valid.
    inline constexpr HRESULT hcs_operation_pending = static_cast<HRESULT>(0xC0370103L);

    // Subset of HCS_NOTIFICATION_TYPE that lifecycle waits care about.
    enum class NotificationType : DWORD
    {
        system_exited = 0x00000001,
        system_create_completed = 0x00000002,
        system_start_completed = 0x00000003,
    };

    // Invoked on a service-owned thread. `data` is optional free-form text
    // (usually JSON) describing a failure.
    using NotificationCallback = void(CALLBACK*)(DWORD notification_type, void* context, HRESULT status, PCWSTR data);

    // HCS_PROCESS_INFORMATION.
    struct ProcessInformation final
    {
        DWORD process_id{};
        DWORD reserved{};
        HANDLE std_input{};
        HANDLE std_output{};
        HANDLE std_error{};
    };

    static_assert(sizeof(ProcessInformation) == 8 + 3 * sizeof(HANDLE), "ProcessInformation must match HCS_PROCESS_INFORMATION");

    enum class OutcomeKind : unsigned char
    {
        completed,
        failed,
        pending,
    };

    // Result of one HCS call. `pending` is a success variant, not an error
    // code: it must be matched explicitly at every lifecycle call site.
    struct CallOutcome final
    {
        OutcomeKind kind{ OutcomeKind::completed };
        HRESULT hresult{ S_OK };
        std::wstring detail;

        [[nodiscard]] static CallOutcome from_hresult(const HRESULT hresult, std::wstring detail = {})
        {
            if (hresult == hcs_operation_pending)
            {
                return CallOutcome{ .kind = OutcomeKind::pending, .hresult = hresult, .detail = std::move(detail) };
            }
            if (FAILED(hresult))
            {
                return CallOutcome{ .kind = OutcomeKind::failed, .hresult = hresult, .detail = std::move(detail) };
            }
            return CallOutcome{ .kind = OutcomeKind::completed, .hresult = hresult, .detail = std::move(detail) };
        }

        [[nodiscard]] bool completed() const noexcept
        {
            return kind == OutcomeKind::completed;
        }

        [[nodiscard]] bool failed() const noexcept
        {
            return kind == OutcomeKind::failed;
        }

        [[nodiscard]] bool pending() const noexcept
        {
            return kind == OutcomeKind::pending;
        }
    };

    [[nodiscard]] constexpr const wchar_t* notification_name(const NotificationType type) noexcept
    {
        switch (type)
        {
        case NotificationType::system_exited:
            return L"SystemExited";
        case NotificationType::system_create_completed:
            return L"SystemCreateCompleted";
        case NotificationType::system_start_completed:
            return L"SystemStartCompleted";
        default:
            return L"Unknown";
        }
    }
}
