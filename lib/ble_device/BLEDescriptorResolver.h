/**
 * @file BLEDescriptorResolver.h
 * @brief Strategies for locating a characteristic's configuration descriptor
 *
 * Subscribing writes to the Client Characteristic Configuration Descriptor
 * (CCCD) of a characteristic. Some backends only report value handles and
 * rely on the CCCD immediately following the value attribute; others report
 * the real descriptor handle during discovery. The strategy is chosen per
 * session.
 */
#pragma once

#include "BLETypes.h"
#include "BLEServiceCatalog.h"

#include <memory>

namespace GattLink { namespace BLE {

class IDescriptorResolver {
public:
    using Ptr = std::shared_ptr<IDescriptorResolver>;

    virtual ~IDescriptorResolver() = default;

    /**
     * @brief Get the configuration descriptor handle for a characteristic
     *
     * @param characteristic Resolved characteristic
     * @return Descriptor handle, or Handle::INVALID if none can be determined
     */
    virtual uint16_t configHandleFor(const Characteristic& characteristic) const = 0;

    /**
     * @brief Strategy name for logging
     */
    virtual const char* name() const = 0;

    /**
     * @brief Create a built-in strategy
     */
    static Ptr create(DescriptorStrategy strategy);
};

/**
 * @brief CCCD at value handle + 1
 *
 * Not guaranteed by GATT (extended properties or user description
 * descriptors may come first), but true for most peripherals.
 */
class AdjacentHandleDescriptorResolver : public IDescriptorResolver {
public:
    uint16_t configHandleFor(const Characteristic& characteristic) const override;
    const char* name() const override { return "adjacent-handle"; }
};

/**
 * @brief CCCD handle reported by discovery, adjacent handle as fallback
 */
class DiscoveredDescriptorResolver : public IDescriptorResolver {
public:
    uint16_t configHandleFor(const Characteristic& characteristic) const override;
    const char* name() const override { return "discovered"; }

private:
    AdjacentHandleDescriptorResolver _fallback;
};

}} // namespace GattLink::BLE
