#include "raw_socket_link.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <arpa/inet.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/if.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace zxboot {

RawSocketLink::RawSocketLink(asio::io_context &io, const std::string &ifname,
                             const MacAddress &local_mac)
    : sock_(io), mac_(local_mac), ifname_(ifname) {
  unsigned ifindex = if_nametoindex(ifname.c_str());
  if (ifindex == 0)
    throw std::system_error(errno, std::system_category(),
                            "unknown interface " + ifname);

  sock_.open(asio::generic::raw_protocol(AF_PACKET, htons(ETH_P_ALL)));

  sockaddr_ll sll;
  std::memset(&sll, 0, sizeof(sll));
  sll.sll_family = AF_PACKET;
  sll.sll_protocol = htons(ETH_P_ALL);
  sll.sll_ifindex = (int)ifindex;
  sock_.bind(asio::generic::raw_protocol::endpoint(&sll, sizeof(sll)));

  // frames for our own (virtual) address must reach us
  packet_mreq mreq;
  std::memset(&mreq, 0, sizeof(mreq));
  mreq.mr_ifindex = (int)ifindex;
  mreq.mr_type = PACKET_MR_PROMISC;
  if (setsockopt(sock_.native_handle(), SOL_PACKET, PACKET_ADD_MEMBERSHIP,
                 &mreq, sizeof(mreq)) < 0)
    throw std::system_error(errno, std::system_category(),
                            "promiscuous mode on " + ifname);

  Logger::instance().log(LogLevel::INFO, "raw link on %s (ifindex %u), mac %s",
                         ifname.c_str(), ifindex, format_mac(mac_).c_str());
}

void RawSocketLink::start(std::function<void()> on_frame) {
  on_frame_ = std::move(on_frame);
  do_receive();
}

void RawSocketLink::close() {
  std::error_code ec;
  sock_.close(ec);
}

void RawSocketLink::do_receive() {
  sock_.async_receive(
      asio::buffer(rx_buf_), [this](std::error_code ec, std::size_t n) {
        if (ec) {
          if (ec != asio::error::operation_aborted)
            Logger::instance().log(LogLevel::ERROR, "receive on %s failed: %s",
                                   ifname_.c_str(), ec.message().c_str());
          return;
        }
        if (rx_queue_.size() >= kMaxQueuedFrames) {
          if (++dropped_ % 100 == 1)
            Logger::instance().log(LogLevel::WARN,
                                   "receive queue full, %zu frames dropped",
                                   dropped_);
        } else {
          rx_queue_.emplace_back(rx_buf_.begin(), rx_buf_.begin() + n);
        }
        if (on_frame_)
          on_frame_();
        if (sock_.is_open())
          do_receive();
      });
}

void RawSocketLink::transmit(const std::vector<uint8_t> &frame) {
  std::error_code ec;
  sock_.send(asio::buffer(frame), 0, ec);
  // a lost frame is recovered by retransmission, like on the wire
  if (ec)
    Logger::instance().log(LogLevel::WARN, "send on %s failed: %s",
                           ifname_.c_str(), ec.message().c_str());
}

std::optional<std::vector<uint8_t>> RawSocketLink::poll_frame() {
  if (rx_queue_.empty())
    return std::nullopt;
  std::vector<uint8_t> f = std::move(rx_queue_.front());
  rx_queue_.pop_front();
  return f;
}

void RawSocketLink::check_range(uint16_t addr, size_t len) const {
  if ((size_t)addr + len > buffer_memory_.size())
    throw BootError(FatalCode::Internal, "buffer memory access out of range");
}

void RawSocketLink::write_bytes(uint16_t addr, const uint8_t *data,
                                size_t len) {
  check_range(addr, len);
  std::memcpy(buffer_memory_.data() + addr, data, len);
}

void RawSocketLink::read_bytes(uint16_t addr, uint8_t *out, size_t len,
                               InetChecksum &checksum) {
  check_range(addr, len);
  std::memcpy(out, buffer_memory_.data() + addr, len);
  checksum.add(out, len);
}

} // namespace zxboot
