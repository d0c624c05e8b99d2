/**
 * @file BLEHandleResolver.cpp
 * @brief UUID to handle resolution with refresh-on-miss
 */

#include "BLEHandleResolver.h"
#include "BLEErrors.h"
#include "Log.h"

namespace GattLink { namespace BLE {

BLEHandleResolver::BLEHandleResolver(IBLETransport& transport, std::recursive_mutex& mutex)
    : _transport(transport),
      _mutex(mutex),
      _catalog(std::make_shared<const ServiceCatalog>()) {
}

Characteristic BLEHandleResolver::resolve(const BLEUUID& characteristic, const BLEUUID* service) {
    TRACE("BLEHandleResolver: Looking up handle for " + describe(characteristic, service));

    Characteristic found;
    if (lookup(*snapshot(), characteristic, service, found)) {
        DEBUG("BLEHandleResolver: Found " + characteristic.toString() + " at handle " +
              handleToString(found.handle));
        return found;
    }

    bool refresh_on_miss;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        refresh_on_miss = _refresh_on_miss;
    }

    if (refresh_on_miss) {
        // Reload the catalog once, the characteristic may have appeared since
        DEBUG("BLEHandleResolver: Cache miss for " + describe(characteristic, service) +
              ", refreshing services");
        ServiceCatalog::Ptr fresh = refresh();

        if (lookup(*fresh, characteristic, service, found)) {
            DEBUG("BLEHandleResolver: Found " + characteristic.toString() + " at handle " +
                  handleToString(found.handle) + " after refresh");
            return found;
        }
    }

    WARNING("BLEHandleResolver: No characteristic found matching " +
            describe(characteristic, service));
    throw CharacteristicNotFoundError(characteristic, service);
}

ServiceCatalog::Ptr BLEHandleResolver::refresh() {
    std::shared_ptr<ServiceCatalog> fresh = std::make_shared<ServiceCatalog>();

    // Discovery is slow, run it outside the lock
    OperationResult result = _transport.discoverServices(*fresh);
    if (result != OperationResult::SUCCESS) {
        ERROR("BLEHandleResolver: Service discovery failed: " +
              std::string(operationResultToString(result)));
        throw TransportError("Service discovery", result);
    }

    ServiceCatalog::Ptr published = fresh;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        _catalog = published;
        _refresh_count++;
    }

    DEBUG("BLEHandleResolver: Discovered " + std::to_string(published->size()) +
          " services, " + std::to_string(published->characteristicCount()) +
          " characteristics");
    TRACE("BLEHandleResolver: Catalog:\n" + published->toString());

    return published;
}

ServiceCatalog::Ptr BLEHandleResolver::snapshot() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _catalog;
}

void BLEHandleResolver::reset() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _catalog = std::make_shared<const ServiceCatalog>();
}

void BLEHandleResolver::setAmbiguityPolicy(AmbiguityPolicy policy) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _ambiguity_policy = policy;
}

AmbiguityPolicy BLEHandleResolver::getAmbiguityPolicy() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _ambiguity_policy;
}

void BLEHandleResolver::setRefreshOnMiss(bool enabled) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _refresh_on_miss = enabled;
}

uint32_t BLEHandleResolver::refreshCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _refresh_count;
}

bool BLEHandleResolver::lookup(const ServiceCatalog& catalog, const BLEUUID& characteristic,
                               const BLEUUID* service, Characteristic& found) const {
    std::vector<const Characteristic*> matches = catalog.findCharacteristics(characteristic, service);
    if (matches.empty()) {
        return false;
    }

    // A scoped lookup can still match several instances of one service UUID
    if (matches.size() > 1) {
        if (getAmbiguityPolicy() == AmbiguityPolicy::REJECT) {
            WARNING("BLEHandleResolver: " + characteristic.toString() + " matched " +
                    std::to_string(matches.size()) + " services");
            throw AmbiguousCharacteristicError(characteristic, matches.size());
        }
        DEBUG("BLEHandleResolver: " + characteristic.toString() + " matched " +
              std::to_string(matches.size()) + " services, using the first");
    }

    found = *matches.front();
    return true;
}

std::string BLEHandleResolver::describe(const BLEUUID& characteristic, const BLEUUID* service) {
    if (service) {
        return characteristic.toString() + " in service " + service->toString();
    }
    return characteristic.toString();
}

}} // namespace GattLink::BLE
