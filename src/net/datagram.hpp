#pragma once
#include <functional>
#include <string>
#include <vector>
#include "ethernet.hpp"
#include "protocol.hpp"

namespace zxboot {

// A validated UDP datagram, as handed to BOOTP/TFTP.
struct Datagram {
    MacAddress  src_mac{};
    Ipv4Address src_ip{};
    Ipv4Address dst_ip{};
    uint16_t    src_port{0};
    uint16_t    dst_port{0};
    std::vector<uint8_t> payload;
};

// IPv4/UDP on top of EthernetLink: header construction, receive-side
// validation and dispatch by port, plus the ARP responder and syslog.
class DatagramEngine {
public:
    using Handler = std::function<void(const Datagram&)>;

    DatagramEngine(EthernetLink& link, AddressConfig& config);

    void set_bootp_handler(Handler h) { bootp_handler_ = std::move(h); }
    void set_tftp_handler(Handler h) { tftp_handler_ = std::move(h); }
    void set_tftp_port(uint16_t port) { tftp_port_ = port; }
    uint16_t tftp_port() const { return tftp_port_; }

    void send_udp(const MacAddress& dst_mac, const Ipv4Address& dst_ip,
                  uint16_t src_port, uint16_t dst_port,
                  const std::vector<uint8_t>& payload, FrameClass cls);
    // Broadcast until configured, boot server afterwards.
    void send_to_server(uint16_t src_port, uint16_t dst_port,
                        const std::vector<uint8_t>& payload, FrameClass cls);
    // Reply to the sender of 'to', ports swapped.
    void send_reply(const Datagram& to, const std::vector<uint8_t>& payload,
                    FrameClass cls);
    void send_syslog(const std::string& msg);

    // Drains received frames; returns true if any frame was processed.
    bool poll();
    void handle_frame(const ReceivedFrame& frame);

    const AddressConfig& config() const { return config_; }
    EthernetLink& link() { return link_; }
private:
    void handle_ipv4(const ReceivedFrame& frame);
    void handle_arp(const ReceivedFrame& frame);
    std::vector<uint8_t> build_ipv4_udp(const Ipv4Address& dst_ip,
                                        uint16_t src_port, uint16_t dst_port,
                                        const std::vector<uint8_t>& payload);

    EthernetLink& link_;
    AddressConfig& config_;
    Handler bootp_handler_;
    Handler tftp_handler_;
    uint16_t tftp_port_{0};
};

} // namespace zxboot
