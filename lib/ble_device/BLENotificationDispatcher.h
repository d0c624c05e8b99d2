/**
 * @file BLENotificationDispatcher.h
 * @brief Fans incoming notifications out to registered callbacks
 *
 * Called on the transport's delivery thread. Callbacks run synchronously,
 * one after another, with the session mutex held. The mutex is recursive and
 * the callback list is copied before the first call, so a callback may call
 * back into the same session (subscribe, unsubscribe, resolve, reads and
 * writes) and may remove itself. Callbacks must not block on another thread
 * that is waiting for the session.
 *
 * Notifications for handles without callbacks are dropped silently.
 */
#pragma once

#include "BLETypes.h"
#include "BLESubscriptionManager.h"
#include "Bytes.h"

#include <mutex>

namespace GattLink { namespace BLE {

class BLENotificationDispatcher {
public:
    /**
     * @param subscriptions Source of callbacks per value handle
     * @param mutex Session mutex
     */
    BLENotificationDispatcher(const BLESubscriptionManager& subscriptions,
                              std::recursive_mutex& mutex);

    /**
     * @brief Deliver one notification
     *
     * Never throws: a callback raising anything is logged and counted and the
     * remaining callbacks still run.
     *
     * @param handle Value handle the notification arrived on
     * @param payload Notification payload
     * @return Number of callbacks invoked
     */
    size_t dispatch(uint16_t handle, const Bytes& payload);

    //=========================================================================
    // Statistics
    //=========================================================================

    uint32_t receivedCount() const;
    uint32_t dispatchedCount() const;
    uint32_t droppedCount() const;
    uint32_t callbackFailureCount() const;

    /**
     * @brief Time of the last notification (Utilities::OS::time(), 0 if none)
     */
    double lastNotificationAt() const;

private:
    const BLESubscriptionManager& _subscriptions;
    std::recursive_mutex& _mutex;

    uint32_t _received = 0;
    uint32_t _dispatched = 0;
    uint32_t _dropped = 0;
    uint32_t _callback_failures = 0;
    double _last_notification_at = 0.0;
};

}} // namespace GattLink::BLE
