/**
 * @file BLETypes.h
 * @brief GATT client session types, constants, and common structures
 *
 * This file defines the core types used throughout the BLE device session
 * implementation. It includes attribute handle and configuration descriptor
 * constants, enumerations, the session configuration, and the callback types
 * used by all BLE components.
 */
#pragma once

#include "Bytes.h"
#include "Log.h"

#include <functional>
#include <memory>
#include <string>
#include <cstdint>
#include <cstdio>

namespace GattLink { namespace BLE {

using RNS::Bytes;

//=============================================================================
// Attribute Handles
//=============================================================================

namespace Handle {
    static constexpr uint16_t INVALID = 0x0000;     // Never assigned to an attribute
    static constexpr uint16_t MAX = 0xFFFF;         // Highest attribute handle
}

//=============================================================================
// Client Characteristic Configuration Descriptor values
//=============================================================================

namespace CCCD {
    static constexpr uint16_t DISABLED = 0x0000;
    static constexpr uint16_t NOTIFY = 0x0001;
    static constexpr uint16_t INDICATE = 0x0002;

    static constexpr size_t VALUE_SIZE = 2;         // Written little-endian
}

//=============================================================================
// Enumerations
//=============================================================================

/**
 * @brief Result codes reported by every transport operation
 */
enum class OperationResult : uint8_t {
    SUCCESS,
    PENDING,
    TIMEOUT,
    DISCONNECTED,
    NOT_FOUND,
    NOT_SUPPORTED,
    INVALID_HANDLE,
    INSUFFICIENT_AUTH,
    INSUFFICIENT_ENC,
    BUSY,
    ERROR
};

/**
 * @brief How the configuration descriptor of a characteristic is located
 */
enum class DescriptorStrategy : uint8_t {
    ADJACENT_HANDLE,    // Value handle + 1 (backend convention)
    DISCOVERED          // CCCD handle reported by service discovery
};

/**
 * @brief What an unscoped lookup does when several services match
 */
enum class AmbiguityPolicy : uint8_t {
    REJECT,             // Fail with AmbiguousCharacteristicError
    FIRST_MATCH         // Take the first match in catalog order
};

//=============================================================================
// Configuration
//=============================================================================

/**
 * @brief Device session configuration
 */
struct DeviceConfig {
    DescriptorStrategy descriptor_strategy = DescriptorStrategy::ADJACENT_HANDLE;
    AmbiguityPolicy ambiguity_policy = AmbiguityPolicy::REJECT;

    // Configuration descriptor writes do not wait for a response by default
    bool config_write_with_response = false;

    // Re-run service discovery once when a lookup misses the cached catalog
    bool refresh_on_miss = true;
};

//=============================================================================
// Callback Type Definitions
//=============================================================================

/**
 * @brief Receives (value handle, payload) for each notification/indication
 */
using NotificationCallback = std::function<void(uint16_t handle, const Bytes& payload)>;

/**
 * @brief Stable reference to a registered notification callback
 *
 * Callback sets compare entries by pointer identity, so registering the
 * same handle twice on one characteristic adds it only once.
 */
using CallbackHandle = std::shared_ptr<const NotificationCallback>;

namespace Callbacks {
    // Transport -> session notification delivery
    using OnNotification = std::function<void(uint16_t handle, const Bytes& payload)>;
}

//=============================================================================
// Utility Functions
//=============================================================================

/**
 * @brief Wrap a callable into a CallbackHandle
 */
inline CallbackHandle makeCallbackHandle(NotificationCallback callback) {
    if (!callback) {
        return CallbackHandle();
    }
    return std::make_shared<const NotificationCallback>(std::move(callback));
}

/**
 * @brief Convert OperationResult to string for logging
 */
inline const char* operationResultToString(OperationResult result) {
    switch (result) {
        case OperationResult::SUCCESS:           return "SUCCESS";
        case OperationResult::PENDING:           return "PENDING";
        case OperationResult::TIMEOUT:           return "TIMEOUT";
        case OperationResult::DISCONNECTED:      return "DISCONNECTED";
        case OperationResult::NOT_FOUND:         return "NOT_FOUND";
        case OperationResult::NOT_SUPPORTED:     return "NOT_SUPPORTED";
        case OperationResult::INVALID_HANDLE:    return "INVALID_HANDLE";
        case OperationResult::INSUFFICIENT_AUTH: return "INSUFFICIENT_AUTH";
        case OperationResult::INSUFFICIENT_ENC:  return "INSUFFICIENT_ENC";
        case OperationResult::BUSY:              return "BUSY";
        case OperationResult::ERROR:             return "ERROR";
        default:                                 return "UNKNOWN";
    }
}

/**
 * @brief Format a handle as 0x%04x for logging
 */
inline std::string handleToString(uint16_t handle) {
    char buf[8];
    snprintf(buf, sizeof(buf), "0x%04x", handle);
    return std::string(buf);
}

}} // namespace GattLink::BLE
