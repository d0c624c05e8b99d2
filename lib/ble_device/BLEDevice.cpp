/**
 * @file BLEDevice.cpp
 * @brief GATT client session implementation
 */

#include "BLEDevice.h"
#include "Log.h"
#include "Utilities/OS.h"

namespace GattLink { namespace BLE {

BLEDevice::BLEDevice(const std::string& address, IBLETransport::Ptr transport,
                     const DeviceConfig& config)
    : _address(address),
      _transport(transport),
      _config(config),
      _descriptor_resolver(IDescriptorResolver::create(config.descriptor_strategy)),
      _resolver(*transport, _mutex),
      _subscriptions(*transport, _mutex),
      _dispatcher(_subscriptions, _mutex) {
    _resolver.setAmbiguityPolicy(config.ambiguity_policy);
    _resolver.setRefreshOnMiss(config.refresh_on_miss);
    _subscriptions.setWriteWithResponse(config.config_write_with_response);

    _transport->setOnNotification([this](uint16_t handle, const Bytes& value) {
        receiveNotification(handle, value);
    });

    INFO("BLEDevice: Opened session with " + _address + " via " +
         _transport->getTransportName() + ", descriptors: " + _descriptor_resolver->name());
}

BLEDevice::~BLEDevice() {
    // Waits for a delivery in progress on another thread
    _transport->setOnNotification(nullptr);
}

//=============================================================================
// Configuration
//=============================================================================

void BLEDevice::setDescriptorResolver(IDescriptorResolver::Ptr resolver) {
    if (!resolver) {
        WARNING("BLEDevice: Ignoring empty descriptor resolver");
        return;
    }

    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _descriptor_resolver = resolver;
    DEBUG("BLEDevice: Descriptor resolver set to " + std::string(resolver->name()));
}

void BLEDevice::setAmbiguityPolicy(AmbiguityPolicy policy) {
    _resolver.setAmbiguityPolicy(policy);
}

//=============================================================================
// Link
//=============================================================================

void BLEDevice::bond(bool permanent) {
    OperationResult result = _transport->bond(permanent);
    if (result != OperationResult::SUCCESS) {
        ERROR("BLEDevice: Bonding with " + _address + " failed: " +
              operationResultToString(result));
        throw TransportError("Bond", result);
    }
    INFO("BLEDevice: Bonded with " + _address + (permanent ? " (permanent)" : ""));
}

int8_t BLEDevice::getRSSI() {
    int8_t rssi = 0;
    OperationResult result = _transport->readRSSI(rssi);
    if (result != OperationResult::SUCCESS) {
        WARNING("BLEDevice: RSSI read from " + _address + " failed: " +
                operationResultToString(result));
        throw TransportError("RSSI read", result);
    }
    return rssi;
}

void BLEDevice::disconnect() {
    _transport->disconnect();

    // Descriptors reset with the connection, nothing to write
    _subscriptions.clear();
    _resolver.reset();

    INFO("BLEDevice: Disconnected from " + _address);
}

bool BLEDevice::isConnected() const {
    return _transport->isConnected();
}

//=============================================================================
// Characteristic Access
//=============================================================================

Bytes BLEDevice::charRead(const std::string& uuid, const std::string& service_uuid) {
    return charReadHandle(resolve(uuid, service_uuid).handle);
}

Bytes BLEDevice::charReadHandle(uint16_t handle) {
    Bytes value;
    OperationResult result = _transport->readHandle(handle, value);
    if (result != OperationResult::SUCCESS) {
        ERROR("BLEDevice: Read of handle " + handleToString(handle) + " failed: " +
              operationResultToString(result));
        throw TransportError("Read", result, handle);
    }

    TRACE("BLEDevice: Read handle " + handleToString(handle) + " value=0x" + value.toHex());
    return value;
}

void BLEDevice::charWrite(const std::string& uuid, const Bytes& value,
                          const std::string& service_uuid, bool wait_for_response) {
    charWriteHandle(resolve(uuid, service_uuid).handle, value, wait_for_response);
}

void BLEDevice::charWriteHandle(uint16_t handle, const Bytes& value, bool wait_for_response) {
    TRACE("BLEDevice: Writing 0x" + value.toHex() + " to handle " + handleToString(handle) +
          (wait_for_response ? " (with response)" : ""));

    OperationResult result = _transport->writeHandle(handle, value, wait_for_response);
    if (result != OperationResult::SUCCESS) {
        ERROR("BLEDevice: Write to handle " + handleToString(handle) + " failed: " +
              operationResultToString(result));
        throw TransportError("Write", result, handle);
    }
}

uint16_t BLEDevice::getHandle(const std::string& uuid, const std::string& service_uuid) {
    return resolve(uuid, service_uuid).handle;
}

Characteristic BLEDevice::getCharacteristic(const std::string& uuid,
                                            const std::string& service_uuid) {
    return resolve(uuid, service_uuid);
}

//=============================================================================
// Notifications
//=============================================================================

CallbackHandle BLEDevice::subscribe(const std::string& uuid, const std::string& service_uuid,
                                    NotificationCallback callback, bool indication) {
    CallbackHandle handle = makeCallbackHandle(std::move(callback));
    subscribe(uuid, service_uuid, handle, indication);
    return handle;
}

void BLEDevice::subscribe(const std::string& uuid, const std::string& service_uuid,
                          const CallbackHandle& callback, bool indication) {
    uint16_t value_handle = Handle::INVALID;
    uint16_t config_handle = Handle::INVALID;
    notificationHandles(uuid, service_uuid, value_handle, config_handle);

    if (_subscriptions.subscribe(value_handle, config_handle, callback, indication)) {
        INFO("BLEDevice: Subscribed to uuid=" + uuid);
    } else {
        DEBUG("BLEDevice: Already subscribed to uuid=" + uuid);
    }
}

void BLEDevice::unsubscribe(const std::string& uuid, const std::string& service_uuid) {
    // The descriptor to clear is the one recorded at subscribe time
    uint16_t value_handle = resolve(uuid, service_uuid).handle;

    if (_subscriptions.unsubscribe(value_handle)) {
        INFO("BLEDevice: Unsubscribed from uuid=" + uuid);
    } else {
        DEBUG("BLEDevice: Already unsubscribed from uuid=" + uuid);
    }
}

bool BLEDevice::isSubscribed(const std::string& uuid, const std::string& service_uuid) {
    return _subscriptions.isSubscribed(resolve(uuid, service_uuid).handle);
}

void BLEDevice::receiveNotification(uint16_t handle, const Bytes& value) {
    _dispatcher.dispatch(handle, value);
}

//=============================================================================
// Service Catalog
//=============================================================================

ServiceCatalog::Ptr BLEDevice::discoverServices() {
    return _resolver.refresh();
}

ServiceCatalog::Ptr BLEDevice::getServices() const {
    return _resolver.snapshot();
}

//=============================================================================
// Status
//=============================================================================

std::map<std::string, float> BLEDevice::getStats() const {
    std::map<std::string, float> stats;

    stats["catalog_refreshes"] = static_cast<float>(_resolver.refreshCount());
    stats["config_writes"] = static_cast<float>(_subscriptions.configWriteCount());
    stats["subscriptions"] = static_cast<float>(_subscriptions.size());
    stats["notifications_received"] = static_cast<float>(_dispatcher.receivedCount());
    stats["notifications_dispatched"] = static_cast<float>(_dispatcher.dispatchedCount());
    stats["notifications_dropped"] = static_cast<float>(_dispatcher.droppedCount());
    stats["callback_failures"] = static_cast<float>(_dispatcher.callbackFailureCount());

    // Seconds since the last notification, -1 if none arrived yet
    double last = _dispatcher.lastNotificationAt();
    stats["notification_age"] = last > 0.0 ?
        static_cast<float>(RNS::Utilities::OS::time() - last) : -1.0f;

    return stats;
}

//=============================================================================
// Internal Operations
//=============================================================================

Characteristic BLEDevice::resolve(const std::string& uuid, const std::string& service_uuid) {
    // Parse both before touching the catalog
    BLEUUID characteristic = BLEUUID::fromString(uuid);
    if (service_uuid.empty()) {
        return _resolver.resolve(characteristic, nullptr);
    }
    BLEUUID service = BLEUUID::fromString(service_uuid);
    return _resolver.resolve(characteristic, &service);
}

void BLEDevice::notificationHandles(const std::string& uuid, const std::string& service_uuid,
                                    uint16_t& value_handle, uint16_t& config_handle) {
    // Notifications arrive on the value handle...
    Characteristic characteristic = resolve(uuid, service_uuid);
    value_handle = characteristic.handle;

    // ...but the configuration descriptor is what gets written
    IDescriptorResolver::Ptr descriptor_resolver;
    {
        std::lock_guard<std::recursive_mutex> lock(_mutex);
        descriptor_resolver = _descriptor_resolver;
    }
    config_handle = descriptor_resolver->configHandleFor(characteristic);

    if (config_handle == Handle::INVALID) {
        ERROR("BLEDevice: No configuration descriptor for " + characteristic.uuid.toString() +
              " at handle " + handleToString(value_handle));
        throw BLEError("No configuration descriptor for characteristic " +
                       characteristic.uuid.toString());
    }
}

}} // namespace GattLink::BLE
