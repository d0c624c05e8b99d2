/**
 * @file BLESubscriptionManager.cpp
 * @brief Subscription state tracking implementation
 */

#include "BLESubscriptionManager.h"
#include "BLEErrors.h"
#include "Log.h"

namespace GattLink { namespace BLE {

BLESubscriptionManager::BLESubscriptionManager(IBLETransport& transport,
                                               std::recursive_mutex& mutex)
    : _transport(transport),
      _mutex(mutex) {
}

bool BLESubscriptionManager::subscribe(uint16_t value_handle, uint16_t config_handle,
                                       const CallbackHandle& callback, bool indication) {
    uint16_t desired = indication ? CCCD::INDICATE : CCCD::NOTIFY;

    std::lock_guard<std::recursive_mutex> lock(_mutex);

    SubscriptionRecord& record = _records[value_handle];

    bool callback_added = false;
    if (callback) {
        callback_added = record.callbacks.insert(callback).second;
    }

    if (record.configured_properties == desired) {
        DEBUG("BLESubscriptionManager: Already subscribed to handle " +
              handleToString(value_handle));
        return false;
    }

    OperationResult result = writeConfig(config_handle, desired);
    if (result != OperationResult::SUCCESS) {
        // Leave the table as it was before this call
        if (callback_added) {
            record.callbacks.erase(callback);
        }
        if (record.empty()) {
            _records.erase(value_handle);
        }
        ERROR("BLESubscriptionManager: Failed to configure handle " +
              handleToString(config_handle) + ": " + operationResultToString(result));
        throw TransportError("Configuration write", result, config_handle);
    }

    record.configured_properties = desired;
    record.config_handle = config_handle;

    INFO("BLESubscriptionManager: Subscribed to handle " + handleToString(value_handle) +
         (indication ? " (indication)" : " (notification)"));
    return true;
}

bool BLESubscriptionManager::unsubscribe(uint16_t value_handle) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    auto it = _records.find(value_handle);
    if (it == _records.end()) {
        DEBUG("BLESubscriptionManager: Already unsubscribed from handle " +
              handleToString(value_handle));
        return false;
    }

    it->second.callbacks.clear();

    if (it->second.configured_properties == CCCD::DISABLED) {
        _records.erase(it);
        DEBUG("BLESubscriptionManager: Already unsubscribed from handle " +
              handleToString(value_handle));
        return false;
    }

    uint16_t config_handle = it->second.config_handle;
    OperationResult result = writeConfig(config_handle, CCCD::DISABLED);
    if (result != OperationResult::SUCCESS) {
        ERROR("BLESubscriptionManager: Failed to clear handle " +
              handleToString(config_handle) + ": " + operationResultToString(result));
        throw TransportError("Configuration write", result, config_handle);
    }

    _records.erase(it);

    INFO("BLESubscriptionManager: Unsubscribed from handle " + handleToString(value_handle));
    return true;
}

std::vector<CallbackHandle> BLESubscriptionManager::callbacksFor(uint16_t value_handle) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    std::vector<CallbackHandle> callbacks;
    auto it = _records.find(value_handle);
    if (it != _records.end()) {
        callbacks.assign(it->second.callbacks.begin(), it->second.callbacks.end());
    }
    return callbacks;
}

uint16_t BLESubscriptionManager::configuredProperties(uint16_t value_handle) const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    auto it = _records.find(value_handle);
    return it != _records.end() ? it->second.configured_properties : CCCD::DISABLED;
}

bool BLESubscriptionManager::isSubscribed(uint16_t value_handle) const {
    return configuredProperties(value_handle) != CCCD::DISABLED;
}

std::vector<uint16_t> BLESubscriptionManager::handles() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);

    std::vector<uint16_t> result;
    for (const auto& entry : _records) {
        result.push_back(entry.first);
    }
    return result;
}

size_t BLESubscriptionManager::size() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _records.size();
}

void BLESubscriptionManager::clear() {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _records.clear();
}

void BLESubscriptionManager::setWriteWithResponse(bool with_response) {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    _write_with_response = with_response;
}

uint32_t BLESubscriptionManager::configWriteCount() const {
    std::lock_guard<std::recursive_mutex> lock(_mutex);
    return _config_writes;
}

Bytes BLESubscriptionManager::encodeProperties(uint16_t properties) {
    uint8_t value[CCCD::VALUE_SIZE] = {
        static_cast<uint8_t>(properties & 0xFF),
        static_cast<uint8_t>((properties >> 8) & 0xFF)
    };
    return Bytes(value, CCCD::VALUE_SIZE);
}

OperationResult BLESubscriptionManager::writeConfig(uint16_t config_handle, uint16_t properties) {
    Bytes value = encodeProperties(properties);

    TRACE("BLESubscriptionManager: Writing " + value.toHex() + " to handle " +
          handleToString(config_handle));

    _config_writes++;
    return _transport.writeHandle(config_handle, value, _write_with_response);
}

}} // namespace GattLink::BLE
