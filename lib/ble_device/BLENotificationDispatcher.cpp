/**
 * @file BLENotificationDispatcher.cpp
 * @brief Notification fan-out implementation
 */

#include "BLENotificationDispatcher.h"
#include "Log.h"
#include "Utilities/OS.h"

#include <exception>

namespace GattLink { namespace BLE {

BLENotificationDispatcher::BLENotificationDispatcher(const BLESubscriptionManager& subscriptions,
                                                     std::recursive_mutex& mutex)
    : _subscriptions(subscriptions),
      _mutex(mutex) {
}

size_t BLENotificationDispatcher::dispatch(uint16_t handle, const Bytes& payload) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    _received++;
    _last_notification_at = RNS::Utilities::OS::time();

    DEBUG("BLENotificationDispatcher: Received notification on handle=" + handleToString(handle) +
          ", value=0x" + payload.toHex());

    // Copy so callbacks can change the set while we iterate
    std::vector<CallbackHandle> callbacks = _subscriptions.callbacksFor(handle);
    if (callbacks.empty()) {
        _dropped++;
        TRACE("BLENotificationDispatcher: No callbacks for handle " + handleToString(handle));
        return 0;
    }

    size_t invoked = 0;
    for (const CallbackHandle& callback : callbacks) {
        try {
            (*callback)(handle, payload);
            invoked++;
        } catch (std::exception& e) {
            _callback_failures++;
            ERROR("BLENotificationDispatcher: Callback for handle " + handleToString(handle) +
                  " threw: " + std::string(e.what()));
        } catch (...) {
            _callback_failures++;
            ERROR("BLENotificationDispatcher: Callback for handle " + handleToString(handle) +
                  " threw a non-standard exception");
        }
    }

    _dispatched++;
    return invoked;
}

uint32_t BLENotificationDispatcher::receivedCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _received;
}

uint32_t BLENotificationDispatcher::dispatchedCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _dispatched;
}

uint32_t BLENotificationDispatcher::droppedCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _dropped;
}

uint32_t BLENotificationDispatcher::callbackFailureCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _callback_failures;
}

double BLENotificationDispatcher::lastNotificationAt() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _last_notification_at;
}

}} // namespace GattLink::BLE
