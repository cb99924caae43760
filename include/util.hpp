#pragma once
#include <string>
#include <cstdint>
#include <cstring>
#include <optional>
#include <vector>
#include "protocol.hpp"

namespace zxboot {

// Network-order conversions. Swapping is its own inverse, so the same
// function converts in both directions.
inline uint16_t hton16(uint16_t v) {
    uint8_t b[2] = {(uint8_t)(v >> 8), (uint8_t)(v & 0xFF)};
    uint16_t r;
    std::memcpy(&r, b, 2);
    return r;
}
inline uint16_t ntoh16(uint16_t v) {
    uint8_t b[2];
    std::memcpy(b, &v, 2);
    return (uint16_t)((b[0] << 8) | b[1]);
}

inline uint16_t load_be16(const uint8_t* p) { return (uint16_t)((p[0] << 8) | p[1]); }
inline uint16_t load_le16(const uint8_t* p) { return (uint16_t)(p[0] | (p[1] << 8)); }
inline void store_be16(uint8_t* p, uint16_t v) { p[0] = (uint8_t)(v >> 8); p[1] = (uint8_t)v; }

template <size_t N>
bool same_address(const std::array<uint8_t, N>& a, const uint8_t* b) {
    return std::memcmp(a.data(), b, N) == 0;
}

// Strict dotted-decimal: four octets 0..255, at most three digits each.
// A single trailing '.' after the last octet is tolerated.
std::optional<Ipv4Address> parse_ipv4(const char* s, size_t max_len);
std::optional<MacAddress> parse_mac(const std::string& s);
std::string format_ipv4(const Ipv4Address& a);
std::string format_mac(const MacAddress& a);
std::vector<uint8_t> hex_to_bytes(const std::string& hex);

} // namespace zxboot
