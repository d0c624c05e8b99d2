/**
 * @file BLESubscriptionManager.h
 * @brief Notification/indication subscription state per value handle
 *
 * Tracks, for every value handle, the configuration value last written to its
 * configuration descriptor and the callbacks registered for it. A descriptor
 * write is only issued when the desired value differs from the recorded one,
 * so repeating a subscribe call costs nothing on the wire.
 *
 * The decision to write and the write itself happen under the session mutex,
 * so two concurrent subscribe calls for one handle cannot both write.
 *
 * Table invariant: a handle has a record iff its configured value is non-zero
 * or at least one callback is registered for it.
 */
#pragma once

#include "BLETypes.h"
#include "BLETransport.h"
#include "Bytes.h"

#include <map>
#include <mutex>
#include <set>
#include <vector>

namespace GattLink { namespace BLE {

/**
 * @brief Subscription state of one value handle
 */
struct SubscriptionRecord {
    uint16_t configured_properties = CCCD::DISABLED;  // Last value actually written
    uint16_t config_handle = Handle::INVALID;         // Where it was written, disabled here
    std::set<CallbackHandle> callbacks;

    bool empty() const {
        return configured_properties == CCCD::DISABLED && callbacks.empty();
    }
};

class BLESubscriptionManager {
public:
    /**
     * @param transport Backend used for descriptor writes
     * @param mutex Session mutex guarding the subscription table
     */
    BLESubscriptionManager(IBLETransport& transport, std::recursive_mutex& mutex);

    /**
     * @brief Enable notifications or indications and register a callback
     *
     * @param value_handle Characteristic value handle (table key)
     * @param config_handle Configuration descriptor handle
     * @param callback Callback to add (nullptr = none)
     * @param indication Use indications instead of notifications
     * @return true if a descriptor write was issued
     * @throws TransportError if the descriptor write fails (state unchanged)
     */
    bool subscribe(uint16_t value_handle, uint16_t config_handle,
                   const CallbackHandle& callback, bool indication);

    /**
     * @brief Disable notifications and drop all callbacks for a value handle
     *
     * The disable value goes to the descriptor handle the enable was written
     * to, even if descriptor resolution has changed since. No-op (no write)
     * if the handle is not subscribed.
     *
     * @return true if a descriptor write was issued
     * @throws TransportError if the descriptor write fails; callbacks are
     *         still dropped, the configured value is kept
     */
    bool unsubscribe(uint16_t value_handle);

    /**
     * @brief Copy of the callbacks registered for a value handle
     */
    std::vector<CallbackHandle> callbacksFor(uint16_t value_handle) const;

    /**
     * @brief Configuration value last written for a value handle (0 if none)
     */
    uint16_t configuredProperties(uint16_t value_handle) const;

    bool isSubscribed(uint16_t value_handle) const;

    /**
     * @brief Value handles currently in the table
     */
    std::vector<uint16_t> handles() const;

    size_t size() const;

    /**
     * @brief Forget all state without writing (connection is gone)
     */
    void clear();

    void setWriteWithResponse(bool with_response);

    /**
     * @brief Number of descriptor writes issued
     */
    uint32_t configWriteCount() const;

    /**
     * @brief Encode a configuration value (2 bytes, little-endian)
     */
    static Bytes encodeProperties(uint16_t properties);

private:
    OperationResult writeConfig(uint16_t config_handle, uint16_t properties);

    IBLETransport& _transport;
    std::recursive_mutex& _mutex;

    std::map<uint16_t, SubscriptionRecord> _records;
    bool _write_with_response = false;
    uint32_t _config_writes = 0;
};

}} // namespace GattLink::BLE
