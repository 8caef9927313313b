#pragma once

// A VM started by this process.
//
// `start` replaces any leftover VM with the same id, creates and boots the new
// one. The owner then either detaches (the VM keeps running under the compute
// service) or shuts it down: graceful first, terminate as fallback, then one
// close of the handle.

#include "hcs/compute_system.hpp"
#include "hcs/compute_system_control.hpp"
#include "hcs/control_error.hpp"
#include "hcs/system_document.hpp"

#include <expected>
#include <string>

namespace vmr::runtime
{
    class VirtualMachine final
    {
    public:
        VirtualMachine(VirtualMachine&&) noexcept = default;
        VirtualMachine& operator=(VirtualMachine&&) = delete;
        VirtualMachine(const VirtualMachine&) = delete;
        VirtualMachine& operator=(const VirtualMachine&) = delete;
        ~VirtualMachine() = default;

        [[nodiscard]] static std::expected<VirtualMachine, hcs::ControlError> start(
            hcs::ComputeSystemControl& control,
            const hcs::VmSettings& settings);

        [[nodiscard]] const std::wstring& id() const noexcept
        {
            return _id;
        }

        [[nodiscard]] const hcs::ComputeSystem& system() const noexcept
        {
            return _system;
        }

        // Graceful shutdown with terminate fallback. The handle is closed
        // exactly once whatever happens.
        [[nodiscard]] std::expected<void, hcs::ControlError> shutdown();

        // Releases the handle and leaves the VM running.
        [[nodiscard]] std::expected<void, hcs::ControlError> detach();

    private:
        VirtualMachine(hcs::ComputeSystemControl& control, std::wstring id, hcs::ComputeSystem system) noexcept;

        hcs::ComputeSystemControl& _control;
        std::wstring _id;
        hcs::ComputeSystem _system;
    };
}
