/**
 * @file SimulatedTransport.h
 * @brief In-memory GATT peripheral implementing IBLETransport
 *
 * Plays both sides of a connection without a radio: it serves a configurable
 * service table to discovery, keeps attribute values per handle, records
 * every write, and can push notifications the way a peripheral would. Used by
 * the demo program and the test suites, and handy for exercising application
 * code on hosts without a BLE stack.
 */
#pragma once

#include "../BLETransport.h"
#include "../BLEServiceCatalog.h"

#include <map>
#include <mutex>
#include <vector>

namespace GattLink { namespace BLE {

class SimulatedTransport : public IBLETransport {
public:
    /**
     * @brief A write seen by the peripheral
     */
    struct WriteRecord {
        uint16_t handle = Handle::INVALID;
        Bytes data;
        bool with_response = false;
        double at = 0.0;
    };

    explicit SimulatedTransport(const std::string& name = "simulated");
    virtual ~SimulatedTransport() = default;

    //=========================================================================
    // Peripheral Setup
    //=========================================================================

    /**
     * @brief Replace the service table served to discovery
     *
     * Takes effect on the next discovery, the session keeps its cached
     * snapshot until then.
     */
    void setServiceTable(const ServiceCatalog& catalog);

    /**
     * @brief Set an attribute value
     */
    void setAttributeValue(uint16_t handle, const Bytes& value);

    /**
     * @brief Get an attribute value as last set or written
     */
    Bytes getAttributeValue(uint16_t handle) const;

    void setRSSI(int8_t rssi);

    //=========================================================================
    // Fault Injection
    //=========================================================================

    /**
     * @brief Make the next write fail with a result code
     */
    void failNextWrite(OperationResult result);

    /**
     * @brief Result of every following discovery (SUCCESS to recover)
     */
    void setDiscoveryResult(OperationResult result);

    //=========================================================================
    // Peripheral Notifications
    //=========================================================================

    /**
     * @brief Notify a value as a peripheral would
     *
     * Delivered only if the characteristic's configuration descriptor
     * currently enables notifications or indications. The attribute value is
     * updated either way.
     *
     * @return true if delivered
     */
    bool notifyValue(uint16_t value_handle, const Bytes& payload);

    /**
     * @brief Deliver a notification unconditionally
     */
    void injectNotification(uint16_t handle, const Bytes& payload);

    //=========================================================================
    // Inspection
    //=========================================================================

    std::vector<WriteRecord> getWrites() const;

    /**
     * @brief Writes to one handle, in order
     */
    std::vector<WriteRecord> getWritesTo(uint16_t handle) const;

    void clearWrites();

    uint32_t getDiscoveryCount() const;

    bool isBonded() const;

    //=========================================================================
    // IBLETransport
    //=========================================================================

    OperationResult discoverServices(ServiceCatalog& catalog) override;
    OperationResult readHandle(uint16_t handle, Bytes& value) override;
    OperationResult writeHandle(uint16_t handle, const Bytes& data, bool with_response) override;
    OperationResult readRSSI(int8_t& rssi) override;
    OperationResult bond(bool permanent) override;
    void disconnect() override;
    bool isConnected() const override;
    void setOnNotification(Callbacks::OnNotification callback) override;
    std::string getTransportName() const override { return _name; }

private:
    /**
     * @brief Configuration descriptor handle for a value handle
     *
     * Uses the discovered CCCD handle from the table, value handle + 1
     * otherwise.
     */
    uint16_t configHandleLocked(uint16_t value_handle) const;

    void deliver(uint16_t handle, const Bytes& payload);

    std::string _name;

    mutable std::mutex _state_mutex;
    ServiceCatalog _table;
    std::map<uint16_t, Bytes> _values;
    std::vector<WriteRecord> _writes;
    int8_t _rssi = -60;
    bool _connected = true;
    bool _bonded = false;
    uint32_t _discovery_count = 0;
    OperationResult _discovery_result = OperationResult::SUCCESS;
    OperationResult _next_write_result = OperationResult::SUCCESS;

    // Held for the whole delivery, never together with _state_mutex.
    // Recursive so a callback may trigger a nested delivery.
    std::recursive_mutex _callback_mutex;
    Callbacks::OnNotification _on_notification;
};

}} // namespace GattLink::BLE
