/**
 * @file BLEDescriptorResolver.cpp
 * @brief Configuration descriptor strategies
 */

#include "BLEDescriptorResolver.h"

namespace GattLink { namespace BLE {

IDescriptorResolver::Ptr IDescriptorResolver::create(DescriptorStrategy strategy) {
    switch (strategy) {
        case DescriptorStrategy::DISCOVERED:
            return std::make_shared<DiscoveredDescriptorResolver>();
        case DescriptorStrategy::ADJACENT_HANDLE:
        default:
            return std::make_shared<AdjacentHandleDescriptorResolver>();
    }
}

uint16_t AdjacentHandleDescriptorResolver::configHandleFor(const Characteristic& characteristic) const {
    if (!characteristic.isValid() || characteristic.handle == Handle::MAX) {
        return Handle::INVALID;
    }
    return static_cast<uint16_t>(characteristic.handle + 1);
}

uint16_t DiscoveredDescriptorResolver::configHandleFor(const Characteristic& characteristic) const {
    if (characteristic.cccd_handle != Handle::INVALID) {
        return characteristic.cccd_handle;
    }

    DEBUG("DescriptorResolver: No discovered CCCD for " + characteristic.uuid.toString() +
          ", assuming value handle + 1");
    return _fallback.configHandleFor(characteristic);
}

}} // namespace GattLink::BLE
