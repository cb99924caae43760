#include "bootp.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <algorithm>
#include <cstddef>
#include <cstring>

namespace zxboot {

BootpClient::BootpClient(DatagramEngine &net, AddressConfig &config,
                         std::string default_file, BootFilePolicy policy)
    : net_(net), config_(config), default_file_(std::move(default_file)),
      policy_(policy) {}

void BootpClient::start(const std::array<uint8_t, 4> &xid) {
  xid_ = xid;
  state_ = State::Requesting;

  BootpPacket req{};
  req.op = BOOTREQUEST;
  req.htype = 1; // 10 Mbit Ethernet
  req.hlen = 6;
  req.hops = 0;
  std::memcpy(req.xid, xid_.data(), 4);
  const MacAddress &mac = net_.link().local_address();
  std::memcpy(req.chaddr, mac.data(), mac.size());

  std::vector<uint8_t> payload(sizeof(req));
  std::memcpy(payload.data(), &req, sizeof(req));

  Logger::instance().log(LogLevel::INFO, "BOOTP request, xid %02x%02x%02x%02x",
                         xid_[0], xid_[1], xid_[2], xid_[3]);
  net_.send_udp(kBroadcastMac, kBroadcastIp, kPortBootpClient,
                kPortBootpServer, payload, FrameClass::Priority);
}

void BootpClient::on_datagram(const Datagram &d) {
  if (state_ != State::Requesting)
    return;
  // everything up to and including FILE must be present
  if (d.payload.size() < offsetof(BootpPacket, vend))
    return;
  BootpPacket rep{};
  std::memcpy(&rep, d.payload.data(),
              std::min(d.payload.size(), sizeof(rep)));

  if (rep.op != BOOTREPLY || std::memcmp(rep.xid, xid_.data(), 4) != 0) {
    Logger::instance().log(LogLevel::DEBUG, "ignoring unrelated BOOTP packet");
    return;
  }
  if (rep.yiaddr[0] == 0) {
    Logger::instance().log(LogLevel::WARN, "BOOTP reply without address");
    return;
  }

  Ipv4Address server = rep.siaddr;
  if (rep.sname[0] != '\0') {
    auto parsed = parse_ipv4(rep.sname, sizeof(rep.sname));
    if (!parsed)
      throw BootError(FatalCode::InvalidBootServer,
                      "boot server name is not a dotted-decimal address");
    server = *parsed;
  }

  boot_file_ = default_file_;
  if (policy_ == BootFilePolicy::PreferReply && rep.file[0] != '\0')
    boot_file_.assign(rep.file, strnlen(rep.file, sizeof(rep.file)));

  config_.host = rep.yiaddr;
  config_.boot_server = server;
  state_ = State::Bound;

  Logger::instance().log(LogLevel::INFO, "bound to %s, boot server %s, file %s",
                         format_ipv4(config_.host).c_str(),
                         format_ipv4(config_.boot_server).c_str(),
                         boot_file_.c_str());
  if (on_bound_)
    on_bound_(boot_file_);
}

} // namespace zxboot
