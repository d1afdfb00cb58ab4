#ifndef NFCOLLECT_UTILS_HPP
#define NFCOLLECT_UTILS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nfcollect {
namespace utils {

/**
 * Convert IPv4 string to uint32_t (host byte order)
 *
 * @param ip_str IPv4 address string (e.g., "192.168.1.1")
 * @return IPv4 address as uint32_t
 */
uint32_t ip_str_to_uint32(const std::string& ip_str);

/**
 * Convert uint32_t to IPv4 string (host byte order)
 *
 * @param ip IPv4 address as uint32_t
 * @return IPv4 address string
 */
std::string uint32_to_ip_str(uint32_t ip);

/**
 * Format 16 bytes in network order as a compressed IPv6 string
 */
std::string ipv6_bytes_to_str(const uint8_t* bytes);

/**
 * Parse an IPv6 string into 16 bytes in network order
 */
std::array<uint8_t, 16> ipv6_str_to_bytes(const std::string& ip_str);

/**
 * Format 6 bytes as "aa:bb:cc:dd:ee:ff"
 */
std::string mac_to_str(const uint8_t* bytes);

/**
 * Lower-case hex rendering of a byte span
 */
std::string bytes_to_hex(const uint8_t* bytes, size_t length);

/**
 * Read an unsigned big-endian integer of 1 to 8 bytes
 */
uint64_t read_be(const uint8_t* data, size_t length);

inline uint16_t read_be16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

inline uint32_t read_be32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

/**
 * Append the low `length` bytes of value in big-endian order
 */
void append_be(std::vector<uint8_t>& out, uint64_t value, size_t length);

} // namespace utils
} // namespace nfcollect

#endif // NFCOLLECT_UTILS_HPP
