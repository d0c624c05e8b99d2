/**
 * @file BLEDevice.h
 * @brief GATT client session addressed by UUID
 *
 * A BLEDevice wraps one connected transport and lets callers address
 * characteristics by UUID (optionally scoped to a service UUID) instead of
 * attribute handles. It caches the peer's service catalog, manages
 * notification/indication subscriptions, and fans notifications out to the
 * registered callbacks.
 *
 * Usage:
 *   IBLETransport::Ptr transport = ...;   // connected backend
 *   BLEDevice device("AA:BB:CC:DD:EE:FF", transport);
 *
 *   uint16_t handle = device.getHandle("2a37", "180d");
 *   CallbackHandle cb = device.subscribe("2a37", "180d",
 *       [](uint16_t handle, const Bytes& value) { ... });
 *   device.charWrite("2a39", value, "180d", true);
 *   device.unsubscribe("2a37", "180d");
 *
 * An empty service UUID string means "any service". All operations are
 * thread-safe; failures are reported as BLEError subclasses (see BLEErrors.h).
 */
#pragma once

#include "BLETypes.h"
#include "BLEUUID.h"
#include "BLEErrors.h"
#include "BLEServiceCatalog.h"
#include "BLETransport.h"
#include "BLEDescriptorResolver.h"
#include "BLEHandleResolver.h"
#include "BLESubscriptionManager.h"
#include "BLENotificationDispatcher.h"
#include "Bytes.h"

#include <map>
#include <mutex>
#include <string>

namespace GattLink { namespace BLE {

class BLEDevice {
public:
    /**
     * @brief Open a session on a connected transport
     *
     * Registers the session as the transport's notification receiver.
     *
     * @param address Device address (string form, e.g. a MAC address)
     * @param transport Connected backend
     * @param config Session configuration
     */
    BLEDevice(const std::string& address, IBLETransport::Ptr transport,
              const DeviceConfig& config = DeviceConfig());

    virtual ~BLEDevice();

    BLEDevice(const BLEDevice&) = delete;
    BLEDevice& operator=(const BLEDevice&) = delete;

    const std::string& getAddress() const { return _address; }

    //=========================================================================
    // Configuration
    //=========================================================================

    /**
     * @brief Install a configuration descriptor strategy
     */
    void setDescriptorResolver(IDescriptorResolver::Ptr resolver);

    void setAmbiguityPolicy(AmbiguityPolicy policy);

    //=========================================================================
    // Link
    //=========================================================================

    /**
     * @brief Create a new bond or use an existing one and encrypt the link
     * @throws TransportError
     */
    void bond(bool permanent = false);

    /**
     * @brief Get the RSSI of the link in dBm
     * @throws TransportError
     */
    int8_t getRSSI();

    /**
     * @brief Disconnect and drop all session state
     *
     * The session cannot be used afterwards; open a new one on a fresh
     * connection.
     */
    void disconnect();

    bool isConnected() const;

    //=========================================================================
    // Characteristic Access
    //=========================================================================

    /**
     * @brief Read a characteristic by UUID
     * @throws InvalidUUIDError, CharacteristicNotFoundError, TransportError
     */
    Bytes charRead(const std::string& uuid, const std::string& service_uuid = "");

    /**
     * @brief Read a characteristic by handle
     * @throws TransportError
     */
    Bytes charReadHandle(uint16_t handle);

    /**
     * @brief Write a characteristic by UUID
     *
     * @param uuid Characteristic UUID
     * @param value Value to write
     * @param service_uuid Service scope ("" = any service)
     * @param wait_for_response Use a write request instead of a write command
     * @throws InvalidUUIDError, CharacteristicNotFoundError, TransportError
     */
    void charWrite(const std::string& uuid, const Bytes& value,
                   const std::string& service_uuid = "", bool wait_for_response = false);

    /**
     * @brief Write a value to a handle
     *
     * Can also be used to write a characteristic's configuration descriptor
     * directly.
     *
     * @throws TransportError
     */
    void charWriteHandle(uint16_t handle, const Bytes& value, bool wait_for_response = false);

    /**
     * @brief Look up the value handle of a characteristic
     *
     * Re-runs service discovery once if the characteristic is not in the
     * cached catalog.
     *
     * @throws InvalidUUIDError, CharacteristicNotFoundError,
     *         AmbiguousCharacteristicError, TransportError
     */
    uint16_t getHandle(const std::string& uuid, const std::string& service_uuid = "");

    /**
     * @brief Resolve a characteristic with its discovery metadata
     */
    Characteristic getCharacteristic(const std::string& uuid, const std::string& service_uuid = "");

    //=========================================================================
    // Notifications
    //=========================================================================

    /**
     * @brief Enable notifications or indications and register a callback
     *
     * Writes the configuration descriptor only if its value changes, so
     * repeated calls with the same arguments produce at most one write.
     *
     * @param uuid Characteristic UUID
     * @param service_uuid Service scope ("" = any service)
     * @param callback Called with (value handle, payload); may be empty
     * @param indication Use indications (acknowledged) instead of notifications
     * @return Handle of the registered callback (empty if callback was empty)
     * @throws InvalidUUIDError, CharacteristicNotFoundError, TransportError
     */
    CallbackHandle subscribe(const std::string& uuid, const std::string& service_uuid,
                             NotificationCallback callback, bool indication = false);

    /**
     * @brief Same as above with an already registered callback handle
     *
     * Registering one CallbackHandle twice on a characteristic adds it once.
     */
    void subscribe(const std::string& uuid, const std::string& service_uuid = "",
                   const CallbackHandle& callback = CallbackHandle(), bool indication = false);

    /**
     * @brief Disable notifications and drop all callbacks of a characteristic
     *
     * Unsubscribing a characteristic that is not subscribed is a no-op. The
     * descriptor written at subscribe time is the one cleared.
     *
     * @throws InvalidUUIDError, CharacteristicNotFoundError, TransportError
     */
    void unsubscribe(const std::string& uuid, const std::string& service_uuid = "");

    bool isSubscribed(const std::string& uuid, const std::string& service_uuid = "");

    /**
     * @brief Entry point for the transport's notification delivery
     *
     * Invokes every callback registered for the handle. Never throws.
     */
    void receiveNotification(uint16_t handle, const Bytes& value);

    //=========================================================================
    // Service Catalog
    //=========================================================================

    /**
     * @brief Run service discovery now and replace the cached catalog
     * @throws TransportError
     */
    ServiceCatalog::Ptr discoverServices();

    /**
     * @brief Get the cached catalog (empty until the first discovery)
     */
    ServiceCatalog::Ptr getServices() const;

    //=========================================================================
    // Status
    //=========================================================================

    /**
     * @brief Get session statistics
     * @return Map of counter name to value
     */
    std::map<std::string, float> getStats() const;

    std::string toString() const {
        return "BLEDevice[" + _address + "/" + _transport->getTransportName() + "]";
    }

private:
    /**
     * @brief Parse the public UUID pair and resolve it
     */
    Characteristic resolve(const std::string& uuid, const std::string& service_uuid);

    /**
     * @brief Value handle and configuration descriptor handle for subscribe
     */
    void notificationHandles(const std::string& uuid, const std::string& service_uuid,
                             uint16_t& value_handle, uint16_t& config_handle);

    std::string _address;
    IBLETransport::Ptr _transport;
    DeviceConfig _config;

    // Guards catalog pointer, subscription table and callback sets. Recursive
    // so callbacks running under dispatch may call back into the session.
    mutable std::recursive_mutex _mutex;

    IDescriptorResolver::Ptr _descriptor_resolver;
    BLEHandleResolver _resolver;
    BLESubscriptionManager _subscriptions;
    BLENotificationDispatcher _dispatcher;
};

}} // namespace GattLink::BLE
