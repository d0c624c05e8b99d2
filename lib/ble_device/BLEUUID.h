/**
 * @file BLEUUID.h
 * @brief Normalized 128-bit UUID value type
 *
 * Every UUID that enters the session is parsed once at the public API edge
 * into this fixed binary form. Catalog lookups and resolution only compare
 * BLEUUID values, never strings.
 *
 * Accepted text forms (case-insensitive, surrounding whitespace ignored):
 *   "2a37", "0x2a37"                            16-bit Bluetooth alias
 *   "0000180d"                                  32-bit Bluetooth alias
 *   "0000180d00001000800000805f9b34fb"          32 hex digits
 *   "0000180d-0000-1000-8000-00805f9b34fb"      canonical
 *   "{0000180d-...}", "urn:uuid:0000180d-..."   wrapped canonical
 *
 * Short aliases expand onto the Bluetooth base UUID
 * 00000000-0000-1000-8000-00805f9b34fb.
 */
#pragma once

#include <string>
#include <cstdint>
#include <cstring>

namespace GattLink { namespace BLE {

class BLEUUID {
public:
    static constexpr size_t SIZE = 16;

    /**
     * @brief Construct the nil UUID (all zeros)
     */
    BLEUUID();

    /**
     * @brief Construct from 16 bytes, most significant byte first
     */
    explicit BLEUUID(const uint8_t* bytes);

    /**
     * @brief Construct a 16-bit alias on the Bluetooth base UUID
     */
    static BLEUUID fromShort(uint16_t alias);

    /**
     * @brief Construct a 32-bit alias on the Bluetooth base UUID
     */
    static BLEUUID fromShort32(uint32_t alias);

    /**
     * @brief Parse text into a UUID
     *
     * @param text UUID in any accepted form
     * @param out Receives the parsed value (untouched on failure)
     * @return true if text was a valid UUID
     */
    static bool parse(const std::string& text, BLEUUID& out);

    /**
     * @brief Parse text into a UUID, throwing on failure
     *
     * @throws InvalidUUIDError if text is not a valid UUID
     */
    static BLEUUID fromString(const std::string& text);

    /**
     * @brief Canonical lowercase 8-4-4-4-12 form
     */
    std::string toString() const;

    /**
     * @brief Check if this UUID is a 16-bit alias on the Bluetooth base UUID
     */
    bool isShort() const;

    /**
     * @brief Get the 16-bit alias (only meaningful if isShort())
     */
    uint16_t toShort() const;

    /**
     * @brief Check for the nil UUID
     */
    bool isNil() const;

    const uint8_t* data() const { return _bytes; }

    bool operator==(const BLEUUID& other) const {
        return memcmp(_bytes, other._bytes, SIZE) == 0;
    }

    bool operator!=(const BLEUUID& other) const {
        return !(*this == other);
    }

    bool operator<(const BLEUUID& other) const {
        return memcmp(_bytes, other._bytes, SIZE) < 0;
    }

private:
    uint8_t _bytes[SIZE];
};

}} // namespace GattLink::BLE
