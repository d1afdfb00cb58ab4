#include "nfcollect/utils.hpp"
#include <arpa/inet.h>
#include <stdexcept>
#include <sstream>
#include <iomanip>

namespace nfcollect {
namespace utils {

// Convert IPv4 string to uint32_t (host byte order)
uint32_t ip_str_to_uint32(const std::string& ip_str) {
    std::istringstream iss(ip_str);
    std::string token;
    std::vector<int> octets;

    while (std::getline(iss, token, '.')) {
        if (token.empty() || token.size() > 3 ||
            token.find_first_not_of("0123456789") != std::string::npos) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
        octets.push_back(std::stoi(token));
    }

    if (octets.size() != 4) {
        throw std::runtime_error("Invalid IPv4 address: " + ip_str);
    }

    for (int octet : octets) {
        if (octet > 255) {
            throw std::runtime_error("Invalid IPv4 address: " + ip_str);
        }
    }

    // Convert to uint32_t (host byte order: big-endian)
    return (static_cast<uint32_t>(octets[0]) << 24) |
           (static_cast<uint32_t>(octets[1]) << 16) |
           (static_cast<uint32_t>(octets[2]) << 8) |
           static_cast<uint32_t>(octets[3]);
}

// Convert uint32_t to IPv4 string (host byte order)
std::string uint32_to_ip_str(uint32_t ip) {
    std::ostringstream oss;
    oss << ((ip >> 24) & 0xFF) << "."
        << ((ip >> 16) & 0xFF) << "."
        << ((ip >> 8) & 0xFF) << "."
        << (ip & 0xFF);
    return oss.str();
}

std::string ipv6_bytes_to_str(const uint8_t* bytes) {
    char buf[INET6_ADDRSTRLEN];
    if (inet_ntop(AF_INET6, bytes, buf, sizeof(buf)) == nullptr) {
        return bytes_to_hex(bytes, 16);
    }
    return buf;
}

std::array<uint8_t, 16> ipv6_str_to_bytes(const std::string& ip_str) {
    std::array<uint8_t, 16> bytes{};
    if (inet_pton(AF_INET6, ip_str.c_str(), bytes.data()) != 1) {
        throw std::runtime_error("Invalid IPv6 address: " + ip_str);
    }
    return bytes;
}

std::string mac_to_str(const uint8_t* bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (int i = 0; i < 6; ++i) {
        if (i > 0) oss << ":";
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

std::string bytes_to_hex(const uint8_t* bytes, size_t length) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

uint64_t read_be(const uint8_t* data, size_t length) {
    if (length > 8) {
        throw std::runtime_error("Integer field wider than 8 bytes: " + std::to_string(length));
    }

    uint64_t value = 0;
    for (size_t i = 0; i < length; ++i) {
        value = (value << 8) | data[i];
    }
    return value;
}

void append_be(std::vector<uint8_t>& out, uint64_t value, size_t length) {
    for (size_t i = length; i > 0; --i) {
        size_t shift = (i - 1) * 8;
        out.push_back(shift >= 64 ? 0 : static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

} // namespace utils
} // namespace nfcollect
