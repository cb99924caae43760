#include "datagram.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstring>

namespace zxboot {

// RFC 3164: facility kernel, severity informational, no HEADER part
static const char kSyslogPrefix[] = "<6>zxboot: ";

DatagramEngine::DatagramEngine(EthernetLink &link, AddressConfig &config)
    : link_(link), config_(config) {}

std::vector<uint8_t>
DatagramEngine::build_ipv4_udp(const Ipv4Address &dst_ip, uint16_t src_port,
                               uint16_t dst_port,
                               const std::vector<uint8_t> &payload) {
  size_t udp_len = sizeof(UdpHeader) + payload.size();
  size_t total = sizeof(Ipv4Header) + udp_len;

  Ipv4Header ip{};
  ip.version_ihl = 0x45;
  ip.tos = 0;
  ip.total_length = hton16((uint16_t)total);
  ip.id = 0;
  ip.frag = hton16(0x4000); // don't fragment
  ip.ttl = kIpDefaultTtl;
  ip.protocol = kIpProtocolUdp;
  ip.checksum = 0;
  ip.src = config_.host;
  ip.dst = dst_ip;

  InetChecksum cs;
  cs.add((const uint8_t *)&ip, sizeof(ip));
  ip.checksum = hton16(cs.value());

  UdpHeader udp{};
  udp.src_port = hton16(src_port);
  udp.dst_port = hton16(dst_port);
  udp.length = hton16((uint16_t)udp_len);
  udp.checksum = 0; // optional for IPv4

  std::vector<uint8_t> out(total);
  std::memcpy(out.data(), &ip, sizeof(ip));
  std::memcpy(out.data() + sizeof(ip), &udp, sizeof(udp));
  if (!payload.empty())
    std::memcpy(out.data() + sizeof(ip) + sizeof(udp), payload.data(),
                payload.size());
  return out;
}

void DatagramEngine::send_udp(const MacAddress &dst_mac,
                              const Ipv4Address &dst_ip, uint16_t src_port,
                              uint16_t dst_port,
                              const std::vector<uint8_t> &payload,
                              FrameClass cls) {
  link_.send_frame(dst_mac, kEtherTypeIpv4, cls,
                   build_ipv4_udp(dst_ip, src_port, dst_port, payload));
}

void DatagramEngine::send_to_server(uint16_t src_port, uint16_t dst_port,
                                    const std::vector<uint8_t> &payload,
                                    FrameClass cls) {
  // No ARP client: the link destination stays broadcast, the IP
  // destination follows the configuration.
  const Ipv4Address &dst =
      config_.configured() ? config_.boot_server : kBroadcastIp;
  send_udp(kBroadcastMac, dst, src_port, dst_port, payload, cls);
}

void DatagramEngine::send_reply(const Datagram &to,
                                const std::vector<uint8_t> &payload,
                                FrameClass cls) {
  send_udp(to.src_mac, to.src_ip, to.dst_port, to.src_port, payload, cls);
}

void DatagramEngine::send_syslog(const std::string &msg) {
  std::vector<uint8_t> payload(kSyslogPrefix,
                               kSyslogPrefix + sizeof(kSyslogPrefix) - 1);
  payload.insert(payload.end(), msg.begin(), msg.end());
  send_udp(kBroadcastMac, kBroadcastIp, kPortSyslog, kPortSyslog, payload,
           FrameClass::Optional);
}

bool DatagramEngine::poll() {
  bool any = false;
  while (auto f = link_.poll()) {
    handle_frame(*f);
    any = true;
  }
  return any;
}

void DatagramEngine::handle_frame(const ReceivedFrame &frame) {
  uint16_t type = ntoh16(frame.hdr.ethertype);
  if (type == kEtherTypeIpv4)
    handle_ipv4(frame);
  else if (type == kEtherTypeArp)
    handle_arp(frame);
}

void DatagramEngine::handle_ipv4(const ReceivedFrame &frame) {
  const std::vector<uint8_t> &p = frame.payload;
  if (p.size() < sizeof(Ipv4Header))
    return;
  Ipv4Header ip;
  std::memcpy(&ip, p.data(), sizeof(ip));
  size_t ihl = (size_t)(ip.version_ihl & 0x0F) * 4;
  size_t total = ntoh16(ip.total_length);
  if ((ip.version_ihl >> 4) != 4 || ihl < sizeof(Ipv4Header) || total < ihl ||
      total > p.size())
    return;

  // Once configured, only datagrams for our own address are accepted
  // (broadcasts included).
  if (config_.configured() && ip.dst != config_.host)
    return;
  if (ip.protocol != kIpProtocolUdp)
    return;

  InetChecksum hcs;
  hcs.add(p.data(), ihl);
  if (!hcs.ok()) {
    Logger::instance().log(LogLevel::DEBUG, "bad IP header checksum");
    return;
  }

  if (total - ihl < sizeof(UdpHeader))
    return;
  UdpHeader udp;
  std::memcpy(&udp, p.data() + ihl, sizeof(udp));
  size_t udp_len = ntoh16(udp.length);
  if (udp_len < sizeof(UdpHeader) || udp_len > total - ihl)
    return;

  if (udp.checksum != 0) {
    InetChecksum ucs;
    ucs.add(ip.src.data(), ip.src.size());
    ucs.add(ip.dst.data(), ip.dst.size());
    ucs.add_word(kIpProtocolUdp);
    ucs.add_word((uint16_t)udp_len);
    ucs.add(p.data() + ihl, udp_len);
    if (!ucs.ok()) {
      Logger::instance().log(LogLevel::DEBUG, "bad UDP checksum");
      return;
    }
  }

  Datagram d;
  d.src_mac = frame.hdr.src;
  d.src_ip = ip.src;
  d.dst_ip = ip.dst;
  d.src_port = ntoh16(udp.src_port);
  d.dst_port = ntoh16(udp.dst_port);
  d.payload.assign(p.begin() + ihl + sizeof(UdpHeader),
                   p.begin() + ihl + udp_len);

  if (tftp_port_ != 0 && d.dst_port == tftp_port_) {
    if (config_.configured() && tftp_handler_)
      tftp_handler_(d);
    return;
  }
  if (d.dst_port == kPortBootpClient && bootp_handler_)
    bootp_handler_(d);
}

void DatagramEngine::handle_arp(const ReceivedFrame &frame) {
  if (frame.payload.size() < sizeof(ArpPacket) || !config_.configured())
    return;
  ArpPacket req;
  std::memcpy(&req, frame.payload.data(), sizeof(req));
  if (ntoh16(req.oper) != kArpRequest || ntoh16(req.htype) != kArpHwEthernet ||
      ntoh16(req.ptype) != kEtherTypeIpv4 || req.tpa != config_.host)
    return;

  ArpPacket rep{};
  rep.htype = hton16(kArpHwEthernet);
  rep.ptype = hton16(kEtherTypeIpv4);
  rep.hlen = 6;
  rep.plen = 4;
  rep.oper = hton16(kArpReply);
  rep.sha = link_.local_address();
  rep.spa = config_.host;
  rep.tha = frame.hdr.src;
  rep.tpa = req.spa;

  std::vector<uint8_t> payload(sizeof(rep));
  std::memcpy(payload.data(), &rep, sizeof(rep));
  link_.send_frame(frame.hdr.src, kEtherTypeArp, FrameClass::Optional,
                   payload);
}

} // namespace zxboot
