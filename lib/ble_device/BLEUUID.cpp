/**
 * @file BLEUUID.cpp
 * @brief Normalized 128-bit UUID value type implementation
 */

#include "BLEUUID.h"
#include "BLEErrors.h"

#include <cctype>
#include <cstdio>

namespace GattLink { namespace BLE {

namespace {

// 00000000-0000-1000-8000-00805f9b34fb
const uint8_t BASE_UUID[BLEUUID::SIZE] = {
    0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00,
    0x80, 0x00, 0x00, 0x80, 0x5f, 0x9b, 0x34, 0xfb
};

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isspace(static_cast<unsigned char>(text[begin]))) begin++;
    while (end > begin && isspace(static_cast<unsigned char>(text[end - 1]))) end--;
    return text.substr(begin, end - begin);
}

bool startsWithNoCase(const std::string& text, const char* prefix) {
    size_t len = strlen(prefix);
    if (text.size() < len) return false;
    for (size_t i = 0; i < len; i++) {
        if (tolower(static_cast<unsigned char>(text[i])) != prefix[i]) return false;
    }
    return true;
}

// Decode an even-length run of hex digits, false on any non-hex character
bool decodeHex(const std::string& digits, uint8_t* out) {
    for (size_t i = 0; i + 1 < digits.size(); i += 2) {
        int hi = hexValue(digits[i]);
        int lo = hexValue(digits[i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i / 2] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace

BLEUUID::BLEUUID() {
    memset(_bytes, 0, SIZE);
}

BLEUUID::BLEUUID(const uint8_t* bytes) {
    if (bytes) {
        memcpy(_bytes, bytes, SIZE);
    } else {
        memset(_bytes, 0, SIZE);
    }
}

BLEUUID BLEUUID::fromShort(uint16_t alias) {
    return fromShort32(alias);
}

BLEUUID BLEUUID::fromShort32(uint32_t alias) {
    BLEUUID result(BASE_UUID);
    result._bytes[0] = static_cast<uint8_t>((alias >> 24) & 0xFF);
    result._bytes[1] = static_cast<uint8_t>((alias >> 16) & 0xFF);
    result._bytes[2] = static_cast<uint8_t>((alias >> 8) & 0xFF);
    result._bytes[3] = static_cast<uint8_t>(alias & 0xFF);
    return result;
}

bool BLEUUID::parse(const std::string& text, BLEUUID& out) {
    std::string str = trim(text);

    bool wrapped = false;
    if (startsWithNoCase(str, "urn:uuid:")) {
        str = str.substr(9);
        wrapped = true;
    } else if (str.size() >= 2 && str.front() == '{' && str.back() == '}') {
        str = str.substr(1, str.size() - 2);
        wrapped = true;
    } else if (startsWithNoCase(str, "0x")) {
        str = str.substr(2);
    }

    // Braces and urn:uuid: only wrap the canonical form
    if (wrapped && str.size() != 36) {
        return false;
    }

    // Dashes are only allowed in canonical 8-4-4-4-12 positions
    std::string digits;
    if (str.size() == 36) {
        for (size_t i = 0; i < str.size(); i++) {
            bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
            if (dash_position != (str[i] == '-')) {
                return false;
            }
            if (!dash_position) {
                digits.push_back(str[i]);
            }
        }
    } else {
        digits = str;
    }

    uint8_t bytes[SIZE];
    switch (digits.size()) {
        case 4:
        case 8: {
            uint8_t alias[4] = {0};
            if (!decodeHex(digits, alias)) return false;
            uint32_t value = 0;
            for (size_t i = 0; i < digits.size() / 2; i++) {
                value = (value << 8) | alias[i];
            }
            out = fromShort32(value);
            return true;
        }
        case 32:
            if (!decodeHex(digits, bytes)) return false;
            out = BLEUUID(bytes);
            return true;
        default:
            return false;
    }
}

BLEUUID BLEUUID::fromString(const std::string& text) {
    BLEUUID result;
    if (!parse(text, result)) {
        throw InvalidUUIDError(text);
    }
    return result;
}

std::string BLEUUID::toString() const {
    char buf[37];
    snprintf(buf, sizeof(buf),
             "%02x%02x%02x%02x-%02x%02x-%02x%02x-%02x%02x-%02x%02x%02x%02x%02x%02x",
             _bytes[0], _bytes[1], _bytes[2], _bytes[3],
             _bytes[4], _bytes[5], _bytes[6], _bytes[7],
             _bytes[8], _bytes[9], _bytes[10], _bytes[11],
             _bytes[12], _bytes[13], _bytes[14], _bytes[15]);
    return std::string(buf);
}

bool BLEUUID::isShort() const {
    return _bytes[0] == 0 && _bytes[1] == 0 &&
           memcmp(_bytes + 4, BASE_UUID + 4, SIZE - 4) == 0;
}

uint16_t BLEUUID::toShort() const {
    return static_cast<uint16_t>((_bytes[2] << 8) | _bytes[3]);
}

bool BLEUUID::isNil() const {
    for (size_t i = 0; i < SIZE; i++) {
        if (_bytes[i] != 0) return false;
    }
    return true;
}

}} // namespace GattLink::BLE
