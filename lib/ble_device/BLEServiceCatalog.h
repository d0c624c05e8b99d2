/**
 * @file BLEServiceCatalog.h
 * @brief Snapshot of a peer's services, characteristics and handles
 *
 * A catalog is produced wholesale by one service discovery round. Once it is
 * published to the session (as std::shared_ptr<const ServiceCatalog>) it is
 * never modified; a refresh replaces the whole snapshot.
 *
 * Services are keyed by their start handle so that two instances of the same
 * service UUID can coexist. Iteration order is handle order, which makes
 * unscoped lookups deterministic.
 */
#pragma once

#include "BLETypes.h"
#include "BLEUUID.h"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace GattLink { namespace BLE {

/**
 * @brief A discovered characteristic
 */
struct Characteristic {
    BLEUUID uuid;
    uint16_t handle = Handle::INVALID;          // Value handle
    uint16_t cccd_handle = Handle::INVALID;     // Configuration descriptor, if discovered

    Characteristic() = default;

    Characteristic(const BLEUUID& char_uuid, uint16_t value_handle,
                   uint16_t config_handle = Handle::INVALID)
        : uuid(char_uuid), handle(value_handle), cccd_handle(config_handle) {}

    bool isValid() const { return handle != Handle::INVALID; }
};

/**
 * @brief A discovered primary service
 */
struct Service {
    BLEUUID uuid;
    uint16_t start_handle = Handle::INVALID;
    uint16_t end_handle = Handle::MAX;
    std::map<BLEUUID, Characteristic> characteristics;

    /**
     * @brief Add a characteristic to this service
     *
     * @return false if the handle is invalid or the UUID is already present
     */
    bool addCharacteristic(const Characteristic& characteristic);

    /**
     * @brief Get characteristic by UUID
     * @return Pointer to Characteristic or nullptr if not found
     */
    const Characteristic* getCharacteristic(const BLEUUID& uuid) const;
};

class ServiceCatalog {
public:
    using Ptr = std::shared_ptr<const ServiceCatalog>;

    ServiceCatalog() = default;

    //=========================================================================
    // Construction (discovery side)
    //=========================================================================

    /**
     * @brief Add a service
     *
     * @param uuid Service UUID
     * @param start_handle First attribute handle of the service (catalog key)
     * @param end_handle Last attribute handle of the service
     * @return Pointer to the new Service, or nullptr if start_handle is
     *         invalid or already used
     */
    Service* addService(const BLEUUID& uuid, uint16_t start_handle,
                        uint16_t end_handle = Handle::MAX);

    /**
     * @brief Get a service by its start handle for further population
     */
    Service* getServiceByHandle(uint16_t start_handle);

    void clear() { _services.clear(); }

    //=========================================================================
    // Lookup
    //=========================================================================

    /**
     * @brief Find characteristics by UUID
     *
     * @param uuid Characteristic UUID
     * @param service Restrict to services with this UUID (nullptr = all)
     * @return All matches in catalog iteration order
     */
    std::vector<const Characteristic*> findCharacteristics(const BLEUUID& uuid,
                                                           const BLEUUID* service = nullptr) const;

    /**
     * @brief Find the characteristic owning a value handle
     * @return Pointer to Characteristic or nullptr if not found
     */
    const Characteristic* findByHandle(uint16_t handle) const;

    /**
     * @brief Get the first service with a UUID
     * @return Pointer to Service or nullptr if not found
     */
    const Service* getService(const BLEUUID& uuid) const;

    const std::map<uint16_t, Service>& services() const { return _services; }

    size_t size() const { return _services.size(); }
    bool empty() const { return _services.empty(); }
    size_t characteristicCount() const;

    /**
     * @brief Multi-line dump for debug logs
     */
    std::string toString() const;

private:
    std::map<uint16_t, Service> _services;
};

}} // namespace GattLink::BLE
