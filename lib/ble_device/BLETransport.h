/**
 * @file BLETransport.h
 * @brief Backend interface consumed by the device session
 *
 * A transport owns one physical connection to a peripheral. It performs the
 * wire-level work (service discovery, attribute reads and writes, bonding,
 * RSSI) and delivers incoming notifications by value handle. Backends for a
 * specific BLE stack implement this interface; BLEDevice layers UUID
 * resolution and subscription state on top of it.
 *
 * Every operation reports an OperationResult and never throws. Calls may be
 * made from several threads; implementations serialize access to their own
 * stack as needed.
 */
#pragma once

#include "BLETypes.h"
#include "BLEServiceCatalog.h"
#include "Bytes.h"

#include <memory>
#include <string>

namespace GattLink { namespace BLE {

class IBLETransport {
public:
    using Ptr = std::shared_ptr<IBLETransport>;

    virtual ~IBLETransport() = default;

    //=========================================================================
    // Discovery
    //=========================================================================

    /**
     * @brief Discover all primary services and their characteristics
     *
     * May be slow (several round trips). The caller passes an empty catalog.
     *
     * @param catalog Receives the discovered services
     * @return SUCCESS if the catalog was filled
     */
    virtual OperationResult discoverServices(ServiceCatalog& catalog) = 0;

    //=========================================================================
    // Attribute Access
    //=========================================================================

    /**
     * @brief Read an attribute value
     *
     * @param handle Attribute handle
     * @param value Receives the value
     */
    virtual OperationResult readHandle(uint16_t handle, Bytes& value) = 0;

    /**
     * @brief Write an attribute value
     *
     * @param handle Attribute handle
     * @param data Value to write
     * @param with_response true for write request, false for write command
     */
    virtual OperationResult writeHandle(uint16_t handle, const Bytes& data,
                                        bool with_response) = 0;

    //=========================================================================
    // Link
    //=========================================================================

    /**
     * @brief Read the current RSSI of the link
     * @param rssi Receives the RSSI in dBm
     */
    virtual OperationResult readRSSI(int8_t& rssi) = 0;

    /**
     * @brief Create or reuse a bond and encrypt the link
     * @param permanent Store the bond beyond this connection
     */
    virtual OperationResult bond(bool permanent) = 0;

    /**
     * @brief Terminate the connection
     */
    virtual void disconnect() = 0;

    /**
     * @brief Check if the link is up
     */
    virtual bool isConnected() const = 0;

    //=========================================================================
    // Callback Registration
    //=========================================================================

    /**
     * @brief Set callback for notifications and indications
     *
     * Invoked with (value handle, payload) for every notification or
     * indication received on this connection. Pass nullptr to unregister.
     *
     * Must not return while a delivery to the previous callback is still
     * running on another thread: once it returns, the old callback is never
     * called again. BLEDevice relies on this when it unregisters in its
     * destructor.
     */
    virtual void setOnNotification(Callbacks::OnNotification callback) = 0;

    //=========================================================================
    // Info
    //=========================================================================

    /**
     * @brief Get human-readable transport name
     */
    virtual std::string getTransportName() const = 0;
};

}} // namespace GattLink::BLE
