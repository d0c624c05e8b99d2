/**
 * @file SimulatedTransport.cpp
 * @brief In-memory GATT peripheral implementation
 */

#include "SimulatedTransport.h"
#include "Log.h"
#include "Utilities/OS.h"

namespace GattLink { namespace BLE {

SimulatedTransport::SimulatedTransport(const std::string& name) : _name(name) {
}

//=============================================================================
// Peripheral Setup
//=============================================================================

void SimulatedTransport::setServiceTable(const ServiceCatalog& catalog) {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _table = catalog;
    DEBUG("SimulatedTransport: Service table now has " + std::to_string(_table.size()) +
          " services");
}

void SimulatedTransport::setAttributeValue(uint16_t handle, const Bytes& value) {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _values[handle] = value;
}

Bytes SimulatedTransport::getAttributeValue(uint16_t handle) const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    auto it = _values.find(handle);
    return it != _values.end() ? it->second : Bytes();
}

void SimulatedTransport::setRSSI(int8_t rssi) {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _rssi = rssi;
}

//=============================================================================
// Fault Injection
//=============================================================================

void SimulatedTransport::failNextWrite(OperationResult result) {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _next_write_result = result;
}

void SimulatedTransport::setDiscoveryResult(OperationResult result) {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _discovery_result = result;
}

//=============================================================================
// Peripheral Notifications
//=============================================================================

bool SimulatedTransport::notifyValue(uint16_t value_handle, const Bytes& payload) {
    {
        std::lock_guard<std::mutex> lock(_state_mutex);
        if (!_connected) {
            return false;
        }

        _values[value_handle] = payload;

        uint16_t config_handle = configHandleLocked(value_handle);
        auto it = _values.find(config_handle);
        if (it == _values.end() || it->second.size() < CCCD::VALUE_SIZE) {
            TRACE("SimulatedTransport: Handle " + handleToString(value_handle) +
                  " not configured, notification suppressed");
            return false;
        }

        const uint8_t* cccd = it->second.data();
        uint16_t enabled = static_cast<uint16_t>(cccd[0] | (cccd[1] << 8));
        if ((enabled & (CCCD::NOTIFY | CCCD::INDICATE)) == 0) {
            TRACE("SimulatedTransport: Handle " + handleToString(value_handle) +
                  " disabled, notification suppressed");
            return false;
        }
    }

    deliver(value_handle, payload);
    return true;
}

void SimulatedTransport::injectNotification(uint16_t handle, const Bytes& payload) {
    deliver(handle, payload);
}

void SimulatedTransport::deliver(uint16_t handle, const Bytes& payload) {
    // Held across the call so setOnNotification() waits for us
    std::lock_guard<std::recursive_mutex> lock(_callback_mutex);
    if (_on_notification) {
        _on_notification(handle, payload);
    }
}

//=============================================================================
// Inspection
//=============================================================================

std::vector<SimulatedTransport::WriteRecord> SimulatedTransport::getWrites() const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _writes;
}

std::vector<SimulatedTransport::WriteRecord> SimulatedTransport::getWritesTo(uint16_t handle) const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    std::vector<WriteRecord> result;
    for (const WriteRecord& record : _writes) {
        if (record.handle == handle) {
            result.push_back(record);
        }
    }
    return result;
}

void SimulatedTransport::clearWrites() {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _writes.clear();
}

uint32_t SimulatedTransport::getDiscoveryCount() const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _discovery_count;
}

bool SimulatedTransport::isBonded() const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _bonded;
}

//=============================================================================
// IBLETransport
//=============================================================================

OperationResult SimulatedTransport::discoverServices(ServiceCatalog& catalog) {
    std::lock_guard<std::mutex> lock(_state_mutex);

    _discovery_count++;

    if (!_connected) {
        return OperationResult::DISCONNECTED;
    }
    if (_discovery_result != OperationResult::SUCCESS) {
        WARNING("SimulatedTransport: Discovery failing with " +
                std::string(operationResultToString(_discovery_result)));
        return _discovery_result;
    }

    catalog = _table;
    DEBUG("SimulatedTransport: Served " + std::to_string(catalog.size()) + " services");
    return OperationResult::SUCCESS;
}

OperationResult SimulatedTransport::readHandle(uint16_t handle, Bytes& value) {
    std::lock_guard<std::mutex> lock(_state_mutex);

    if (!_connected) {
        return OperationResult::DISCONNECTED;
    }

    auto it = _values.find(handle);
    if (it != _values.end()) {
        value = it->second;
        return OperationResult::SUCCESS;
    }

    // Characteristic that was never written reads as empty
    if (_table.findByHandle(handle)) {
        value = Bytes();
        return OperationResult::SUCCESS;
    }

    return OperationResult::INVALID_HANDLE;
}

OperationResult SimulatedTransport::writeHandle(uint16_t handle, const Bytes& data,
                                                bool with_response) {
    std::lock_guard<std::mutex> lock(_state_mutex);

    if (!_connected) {
        return OperationResult::DISCONNECTED;
    }
    if (handle == Handle::INVALID) {
        return OperationResult::INVALID_HANDLE;
    }
    if (_next_write_result != OperationResult::SUCCESS) {
        OperationResult result = _next_write_result;
        _next_write_result = OperationResult::SUCCESS;
        WARNING("SimulatedTransport: Injected write failure " +
                std::string(operationResultToString(result)) + " on handle " +
                handleToString(handle));
        return result;
    }

    WriteRecord record;
    record.handle = handle;
    record.data = data;
    record.with_response = with_response;
    record.at = RNS::Utilities::OS::time();
    _writes.push_back(record);

    _values[handle] = data;

    TRACE("SimulatedTransport: Write 0x" + data.toHex() + " to handle " + handleToString(handle));
    return OperationResult::SUCCESS;
}

OperationResult SimulatedTransport::readRSSI(int8_t& rssi) {
    std::lock_guard<std::mutex> lock(_state_mutex);

    if (!_connected) {
        return OperationResult::DISCONNECTED;
    }
    rssi = _rssi;
    return OperationResult::SUCCESS;
}

OperationResult SimulatedTransport::bond(bool permanent) {
    std::lock_guard<std::mutex> lock(_state_mutex);

    if (!_connected) {
        return OperationResult::DISCONNECTED;
    }
    _bonded = true;
    DEBUG("SimulatedTransport: Bonded" + std::string(permanent ? " (permanent)" : ""));
    return OperationResult::SUCCESS;
}

void SimulatedTransport::disconnect() {
    std::lock_guard<std::mutex> lock(_state_mutex);

    _connected = false;

    // The peripheral forgets client configuration when the link drops
    for (const auto& entry : _table.services()) {
        for (const auto& chr_entry : entry.second.characteristics) {
            _values.erase(configHandleLocked(chr_entry.second.handle));
        }
    }

    DEBUG("SimulatedTransport: Disconnected");
}

bool SimulatedTransport::isConnected() const {
    std::lock_guard<std::mutex> lock(_state_mutex);
    return _connected;
}

void SimulatedTransport::setOnNotification(Callbacks::OnNotification callback) {
    std::lock_guard<std::recursive_mutex> lock(_callback_mutex);
    _on_notification = callback;
}

uint16_t SimulatedTransport::configHandleLocked(uint16_t value_handle) const {
    const Characteristic* chr = _table.findByHandle(value_handle);
    if (chr && chr->cccd_handle != Handle::INVALID) {
        return chr->cccd_handle;
    }
    return static_cast<uint16_t>(value_handle + 1);
}

}} // namespace GattLink::BLE
