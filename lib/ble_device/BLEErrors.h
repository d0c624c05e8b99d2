/**
 * @file BLEErrors.h
 * @brief Exceptions raised by the device session at its public boundary
 *
 * Transport calls report OperationResult codes; BLEDevice converts failures
 * into these exceptions so callers see either a value or an error naming the
 * offending UUID pair or handle.
 */
#pragma once

#include "BLETypes.h"
#include "BLEUUID.h"

#include <stdexcept>
#include <string>

namespace GattLink { namespace BLE {

/**
 * @brief Base class for all session errors
 */
class BLEError : public std::runtime_error {
public:
    explicit BLEError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A UUID string could not be normalized
 */
class InvalidUUIDError : public BLEError {
public:
    explicit InvalidUUIDError(const std::string& text);

    const std::string& text() const { return _text; }

private:
    std::string _text;
};

/**
 * @brief No characteristic matched, even after the catalog refresh
 */
class CharacteristicNotFoundError : public BLEError {
public:
    /**
     * @param characteristic Characteristic UUID that was requested
     * @param service Service scope, or nullptr for an unscoped lookup
     */
    CharacteristicNotFoundError(const BLEUUID& characteristic, const BLEUUID* service);

    const BLEUUID& characteristicUUID() const { return _characteristic; }
    bool hasService() const { return _has_service; }
    const BLEUUID& serviceUUID() const { return _service; }

private:
    BLEUUID _characteristic;
    BLEUUID _service;
    bool _has_service = false;
};

/**
 * @brief An unscoped lookup matched characteristics in several services
 */
class AmbiguousCharacteristicError : public BLEError {
public:
    AmbiguousCharacteristicError(const BLEUUID& characteristic, size_t matches);

    const BLEUUID& characteristicUUID() const { return _characteristic; }
    size_t matches() const { return _matches; }

private:
    BLEUUID _characteristic;
    size_t _matches = 0;
};

/**
 * @brief A transport operation failed; the result code is kept unchanged
 */
class TransportError : public BLEError {
public:
    TransportError(const std::string& operation, OperationResult result,
                   uint16_t handle = Handle::INVALID);

    OperationResult result() const { return _result; }
    uint16_t handle() const { return _handle; }

private:
    OperationResult _result;
    uint16_t _handle;
};

}} // namespace GattLink::BLE
