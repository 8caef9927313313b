#include "hcs/compute_system.hpp"

#include <new>
#include <utility>

namespace vmr::hcs
{
    ComputeSystem::ComputeSystem(ComputeSystem&& other) noexcept :
        _service(std::exchange(other._service, nullptr)),
        _handle(std::exchange(other._handle, nullptr))
    {
    }

    ComputeSystem& ComputeSystem::operator=(ComputeSystem&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            _service = std::exchange(other._service, nullptr);
            _handle = std::exchange(other._handle, nullptr);
        }
        return *this;
    }

    HcsSystemHandle ComputeSystem::release() noexcept
    {
        _service = nullptr;
        return std::exchange(_handle, nullptr);
    }

    std::expected<void, ControlError> ComputeSystem::close() noexcept
    {
        if (_handle == nullptr || _service == nullptr)
        {
            return {};
        }

        IComputeService* const service = std::exchange(_service, nullptr);
        const HcsSystemHandle handle = std::exchange(_handle, nullptr);
        const CallOutcome outcome = service->close_compute_system(handle);
        if (outcome.failed())
        {
            try
            {
                return std::unexpected(make_control_error(ControlErrorKind::call_failed, L"HcsCloseComputeSystem", outcome.hresult));
            }
            catch (const std::bad_alloc&)
            {
                return std::unexpected(ControlError{ .kind = ControlErrorKind::call_failed, .hresult = outcome.hresult });
            }
        }
        return {};
    }

    void ComputeSystem::reset() noexcept
    {
        (void)close();
    }
}
