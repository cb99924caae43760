#include "protocol.hpp"

namespace zxboot {

void InetChecksum::add(const uint8_t *data, size_t len) {
  size_t i = 0;
  if (odd_ && len > 0) {
    acc_ += (uint32_t)((pending_ << 8) | data[0]);
    odd_ = false;
    i = 1;
  }
  for (; i + 1 < len; i += 2)
    acc_ += (uint32_t)((data[i] << 8) | data[i + 1]);
  if (i < len) {
    pending_ = data[i];
    odd_ = true;
  }
  // fold early so long streams cannot overflow the accumulator
  acc_ = (acc_ & 0xFFFF) + (acc_ >> 16);
}

void InetChecksum::add_word(uint16_t w) {
  uint8_t b[2] = {(uint8_t)(w >> 8), (uint8_t)(w & 0xFF)};
  add(b, 2);
}

uint16_t InetChecksum::sum() const {
  uint32_t s = acc_;
  if (odd_)
    s += (uint32_t)(pending_ << 8);
  while (s >> 16)
    s = (s & 0xFFFF) + (s >> 16);
  return (uint16_t)s;
}

} // namespace zxboot
