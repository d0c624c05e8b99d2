/**
 * @file BLEErrors.cpp
 * @brief Session error messages
 */

#include "BLEErrors.h"

namespace GattLink { namespace BLE {

InvalidUUIDError::InvalidUUIDError(const std::string& text)
    : BLEError("Invalid UUID \"" + text + "\""),
      _text(text) {
}

CharacteristicNotFoundError::CharacteristicNotFoundError(const BLEUUID& characteristic,
                                                         const BLEUUID* service)
    : BLEError("No characteristic found matching " + characteristic.toString() +
               (service ? " in service " + service->toString() : std::string())),
      _characteristic(characteristic),
      _has_service(service != nullptr) {
    if (service) {
        _service = *service;
    }
}

AmbiguousCharacteristicError::AmbiguousCharacteristicError(const BLEUUID& characteristic,
                                                           size_t matches)
    : BLEError("Characteristic " + characteristic.toString() + " is exposed by " +
               std::to_string(matches) + " services"),
      _characteristic(characteristic),
      _matches(matches) {
}

TransportError::TransportError(const std::string& operation, OperationResult result,
                               uint16_t handle)
    : BLEError(operation + " failed: " + operationResultToString(result) +
               (handle != Handle::INVALID ? " (handle " + handleToString(handle) + ")"
                                          : std::string())),
      _result(result),
      _handle(handle) {
}

}} // namespace GattLink::BLE
