#include "ethernet.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstring>

namespace zxboot {

EthernetLink::EthernetLink(FrameIo &io, const RetransmitPolicy &policy)
    : io_(io), policy_(policy), timeout_(policy.initial_ticks) {}

void EthernetLink::send_frame(const MacAddress &dst, uint16_t ethertype,
                              FrameClass cls,
                              const std::vector<uint8_t> &payload) {
  EthHeader h{};
  h.dst = dst;
  h.src = io_.local_address();
  h.ethertype = hton16(ethertype);

  std::vector<uint8_t> frame(sizeof(EthHeader) + payload.size());
  std::memcpy(frame.data(), &h, sizeof(h));
  if (!payload.empty())
    std::memcpy(frame.data() + sizeof(EthHeader), payload.data(),
                payload.size());

  if (cls == FrameClass::Priority) {
    pending_ = frame;
    ticks_ = 0;
    timeout_ = policy_.initial_ticks;
  }
  io_.transmit(frame);
}

std::optional<ReceivedFrame> EthernetLink::poll() {
  while (auto raw = io_.poll_frame()) {
    if (raw->size() < sizeof(EthHeader))
      continue;
    ReceivedFrame f;
    std::memcpy(&f.hdr, raw->data(), sizeof(EthHeader));
    if (f.hdr.src == io_.local_address())
      continue;
    uint16_t type = ntoh16(f.hdr.ethertype);
    if (type != kEtherTypeIpv4 && type != kEtherTypeArp) {
      Logger::instance().log(LogLevel::TRACE, "ignoring ethertype 0x%04x",
                             type);
      continue;
    }
    f.payload.assign(raw->begin() + sizeof(EthHeader), raw->end());
    return f;
  }
  return std::nullopt;
}

void EthernetLink::on_timer_tick() {
  if (!timer_enabled_)
    return;
  if (++ticks_ < timeout_)
    return;
  ticks_ = 0;
  if (pending_.empty())
    return;
  if (timeout_ >= policy_.max_ticks) {
    if (policy_.give_up)
      throw BootError(FatalCode::NoResponse, "no response from server");
  } else {
    timeout_ = (uint16_t)(timeout_ * 2);
  }
  Logger::instance().log(LogLevel::DEBUG,
                         "retransmitting priority frame, next timeout %u ticks",
                         timeout_);
  io_.transmit(pending_);
}

void EthernetLink::cancel_retransmission() {
  timer_enabled_ = false;
  pending_.clear();
}

} // namespace zxboot
