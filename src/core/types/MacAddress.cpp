#include "core/types/MacAddress.hpp"

#include <cstdio>

namespace hostwake::core {

namespace {

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

} // namespace

bool isUsableMacAddress(const std::string& mac) {
    return !mac.empty() && mac != kZeroMacAddress && mac.size() >= kMacAddressTextLength;
}

std::optional<MacBytes> parseMacAddress(const std::string& mac) {
    std::string digits;
    digits.reserve(12);

    for (char c : mac) {
        if (c == ':' || c == '-' || c == '.') {
            continue;
        }
        if (hexValue(c) < 0) {
            return std::nullopt;
        }
        digits.push_back(c);
    }

    if (digits.size() != 12) {
        return std::nullopt;
    }

    MacBytes bytes{};
    for (size_t i = 0; i < bytes.size(); ++i) {
        bytes[i] = static_cast<uint8_t>((hexValue(digits[2 * i]) << 4) | hexValue(digits[2 * i + 1]));
    }
    return bytes;
}

std::string formatMacAddress(const MacBytes& bytes) {
    char buffer[18];
    std::snprintf(buffer, sizeof(buffer), "%02x:%02x:%02x:%02x:%02x:%02x", bytes[0], bytes[1],
                  bytes[2], bytes[3], bytes[4], bytes[5]);
    return buffer;
}

} // namespace hostwake::core
