/**
 * @file MacAddress.hpp
 * @brief Hardware address validation and parsing helpers.
 */

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace hostwake::core {

using MacBytes = std::array<uint8_t, 6>;

inline constexpr const char* kZeroMacAddress = "00:00:00:00:00:00";
inline constexpr size_t kMacAddressTextLength = 17;

/**
 * @brief Validity filter applied before a hardware address is stored.
 *
 * Rejects the empty string, the all-zero address that incomplete neighbor
 * entries report, and anything shorter than the colon-separated hex form.
 *
 * @param mac Candidate address.
 * @return True if the address may be stored as a known MAC.
 */
[[nodiscard]] bool isUsableMacAddress(const std::string& mac);

/**
 * @brief Parses a MAC address into its six octets.
 *
 * Accepts 12 hex digits, optionally separated by ':', '-' or '.'
 * (e.g. "aa:bb:cc:dd:ee:ff", "AA-BB-CC-DD-EE-FF", "aabb.ccdd.eeff").
 *
 * @param mac Address text.
 * @return The octets, or nullopt if the text is malformed.
 */
[[nodiscard]] std::optional<MacBytes> parseMacAddress(const std::string& mac);

/**
 * @brief Formats octets as lowercase colon-separated hex.
 */
[[nodiscard]] std::string formatMacAddress(const MacBytes& bytes);

} // namespace hostwake::core
