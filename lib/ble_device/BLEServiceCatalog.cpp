/**
 * @file BLEServiceCatalog.cpp
 * @brief Service catalog implementation
 */

#include "BLEServiceCatalog.h"

namespace GattLink { namespace BLE {

//=============================================================================
// Service
//=============================================================================

bool Service::addCharacteristic(const Characteristic& characteristic) {
    if (!characteristic.isValid()) {
        WARNING("ServiceCatalog: Rejected characteristic " + characteristic.uuid.toString() +
                " with invalid handle");
        return false;
    }

    auto result = characteristics.insert(std::make_pair(characteristic.uuid, characteristic));
    if (!result.second) {
        WARNING("ServiceCatalog: Duplicate characteristic " + characteristic.uuid.toString() +
                " in service " + uuid.toString());
        return false;
    }
    return true;
}

const Characteristic* Service::getCharacteristic(const BLEUUID& char_uuid) const {
    auto it = characteristics.find(char_uuid);
    return it != characteristics.end() ? &it->second : nullptr;
}

//=============================================================================
// ServiceCatalog
//=============================================================================

Service* ServiceCatalog::addService(const BLEUUID& uuid, uint16_t start_handle,
                                    uint16_t end_handle) {
    if (start_handle == Handle::INVALID) {
        WARNING("ServiceCatalog: Rejected service " + uuid.toString() +
                " with invalid start handle");
        return nullptr;
    }

    Service service;
    service.uuid = uuid;
    service.start_handle = start_handle;
    service.end_handle = end_handle;

    auto result = _services.insert(std::make_pair(start_handle, service));
    if (!result.second) {
        WARNING("ServiceCatalog: Service handle " + handleToString(start_handle) +
                " already in use");
        return nullptr;
    }
    return &result.first->second;
}

Service* ServiceCatalog::getServiceByHandle(uint16_t start_handle) {
    auto it = _services.find(start_handle);
    return it != _services.end() ? &it->second : nullptr;
}

std::vector<const Characteristic*> ServiceCatalog::findCharacteristics(
    const BLEUUID& uuid, const BLEUUID* service) const {
    std::vector<const Characteristic*> matches;

    for (const auto& entry : _services) {
        const Service& svc = entry.second;
        if (service && svc.uuid != *service) {
            continue;
        }
        const Characteristic* chr = svc.getCharacteristic(uuid);
        if (chr) {
            matches.push_back(chr);
        }
    }

    return matches;
}

const Characteristic* ServiceCatalog::findByHandle(uint16_t handle) const {
    for (const auto& entry : _services) {
        for (const auto& chr_entry : entry.second.characteristics) {
            if (chr_entry.second.handle == handle) {
                return &chr_entry.second;
            }
        }
    }
    return nullptr;
}

const Service* ServiceCatalog::getService(const BLEUUID& uuid) const {
    for (const auto& entry : _services) {
        if (entry.second.uuid == uuid) {
            return &entry.second;
        }
    }
    return nullptr;
}

size_t ServiceCatalog::characteristicCount() const {
    size_t count = 0;
    for (const auto& entry : _services) {
        count += entry.second.characteristics.size();
    }
    return count;
}

std::string ServiceCatalog::toString() const {
    std::string out;
    for (const auto& entry : _services) {
        const Service& svc = entry.second;
        out += "service " + svc.uuid.toString() + " [" + handleToString(svc.start_handle) +
               ".." + handleToString(svc.end_handle) + "]\n";
        for (const auto& chr_entry : svc.characteristics) {
            const Characteristic& chr = chr_entry.second;
            out += "  characteristic " + chr.uuid.toString() + " handle " +
                   handleToString(chr.handle);
            if (chr.cccd_handle != Handle::INVALID) {
                out += " cccd " + handleToString(chr.cccd_handle);
            }
            out += "\n";
        }
    }
    return out;
}

}} // namespace GattLink::BLE
