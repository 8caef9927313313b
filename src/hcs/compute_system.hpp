#pragma once

#include "hcs/compute_service.hpp"
#include "hcs/control_error.hpp"

#include <expected>

namespace vmr::hcs
{
    // Owning reference to an HCS_SYSTEM. Closing it releases the handle only;
    // the VM keeps whatever state it had.
    class ComputeSystem final
    {
    public:
        ComputeSystem() noexcept = default;

        ComputeSystem(IComputeService& service, const HcsSystemHandle handle) noexcept :
            _service(&service),
            _handle(handle)
        {
        }

        ~ComputeSystem() noexcept
        {
            reset();
        }

        ComputeSystem(const ComputeSystem&) = delete;
        ComputeSystem& operator=(const ComputeSystem&) = delete;

        ComputeSystem(ComputeSystem&& other) noexcept;
        ComputeSystem& operator=(ComputeSystem&& other) noexcept;

        [[nodiscard]] HcsSystemHandle get() const noexcept
        {
            return _handle;
        }

        [[nodiscard]] bool valid() const noexcept
        {
            return _handle != nullptr;
        }

        // Gives up ownership without closing; the VM is left to run on its own.
        HcsSystemHandle release() noexcept;

        // Closes the handle and reports the service result. A second call is
        // a no-op.
        [[nodiscard]] std::expected<void, ControlError> close() noexcept;

        void reset() noexcept;

    private:
        IComputeService* _service{};
        HcsSystemHandle _handle{};
    };
}
