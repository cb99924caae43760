#include "util.hpp"
#include <cstdio>
#include <sstream>

namespace zxboot {

std::optional<Ipv4Address> parse_ipv4(const char *s, size_t max_len) {
  Ipv4Address out{};
  size_t i = 0;
  for (int octet = 0; octet < 4; octet++) {
    unsigned value = 0;
    int digits = 0;
    while (i < max_len && s[i] >= '0' && s[i] <= '9') {
      if (++digits > 3)
        return std::nullopt;
      value = value * 10 + (unsigned)(s[i] - '0');
      i++;
    }
    if (digits == 0 || value > 255)
      return std::nullopt;
    out[octet] = (uint8_t)value;
    char c = (i < max_len) ? s[i] : '\0';
    if (c == '.') {
      i++;
      continue;
    }
    if (c != '\0' || octet != 3)
      return std::nullopt;
  }
  if (i < max_len && s[i] != '\0')
    return std::nullopt;
  return out;
}

std::optional<MacAddress> parse_mac(const std::string &s) {
  unsigned int b[6];
  char tail;
  if (std::sscanf(s.c_str(), "%x:%x:%x:%x:%x:%x%c", &b[0], &b[1], &b[2],
                  &b[3], &b[4], &b[5], &tail) != 6)
    return std::nullopt;
  MacAddress out{};
  for (int i = 0; i < 6; i++) {
    if (b[i] > 0xFF)
      return std::nullopt;
    out[i] = (uint8_t)b[i];
  }
  return out;
}

std::string format_ipv4(const Ipv4Address &a) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%u.%u.%u.%u", a[0], a[1], a[2], a[3]);
  return buf;
}

std::string format_mac(const MacAddress &a) {
  char buf[18];
  std::snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x", a[0], a[1],
                a[2], a[3], a[4], a[5]);
  return buf;
}

std::vector<uint8_t> hex_to_bytes(const std::string &hex) {
  std::vector<uint8_t> out;
  if (hex.empty() || (hex.size() % 2) != 0)
    return out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    unsigned int v;
    std::stringstream ss;
    ss << std::hex << hex.substr(i, 2);
    if (!(ss >> v))
      return {};
    out.push_back((uint8_t)v);
  }
  return out;
}

} // namespace zxboot
