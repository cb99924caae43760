#pragma once
#include <array>
#include <cstdint>
#include <cstddef>

namespace zxboot {

using MacAddress = std::array<uint8_t, 6>;
using Ipv4Address = std::array<uint8_t, 4>;

constexpr MacAddress kBroadcastMac{0xff, 0xff, 0xff, 0xff, 0xff, 0xff};
constexpr Ipv4Address kBroadcastIp{0xff, 0xff, 0xff, 0xff};
constexpr Ipv4Address kNoAddress{0, 0, 0, 0};

constexpr uint16_t kEtherTypeIpv4 = 0x0800;
constexpr uint16_t kEtherTypeArp  = 0x0806;

constexpr uint8_t  kIpProtocolUdp = 17;
constexpr uint8_t  kIpDefaultTtl  = 0x40;

constexpr uint16_t kPortBootpServer = 67;
constexpr uint16_t kPortBootpClient = 68;
constexpr uint16_t kPortTftpServer  = 69;
constexpr uint16_t kPortSyslog      = 514;

// All multi-byte integer fields below are stored in network order.
#pragma pack(push, 1)
struct EthHeader {
    MacAddress dst;
    MacAddress src;
    uint16_t   ethertype;
};

struct Ipv4Header {
    uint8_t     version_ihl;
    uint8_t     tos;
    uint16_t    total_length;
    uint16_t    id;
    uint16_t    frag;
    uint8_t     ttl;
    uint8_t     protocol;
    uint16_t    checksum;
    Ipv4Address src;
    Ipv4Address dst;
};

struct UdpHeader {
    uint16_t src_port;
    uint16_t dst_port;
    uint16_t length;
    uint16_t checksum;
};

struct ArpPacket {
    uint16_t    htype;
    uint16_t    ptype;
    uint8_t     hlen;
    uint8_t     plen;
    uint16_t    oper;
    MacAddress  sha;
    Ipv4Address spa;
    MacAddress  tha;
    Ipv4Address tpa;
};

struct BootpPacket {
    uint8_t     op;
    uint8_t     htype;
    uint8_t     hlen;
    uint8_t     hops;
    uint8_t     xid[4];
    uint16_t    secs;
    uint16_t    flags;
    Ipv4Address ciaddr;
    Ipv4Address yiaddr;
    Ipv4Address siaddr;
    Ipv4Address giaddr;
    uint8_t     chaddr[16];
    char        sname[64];
    char        file[128];
    uint8_t     vend[64];
};

struct TftpHeader {
    uint16_t opcode;
    uint16_t block_no;
};
#pragma pack(pop)
static_assert(sizeof(EthHeader) == 14, "EthHeader must be 14 bytes");
static_assert(sizeof(Ipv4Header) == 20, "Ipv4Header must be 20 bytes");
static_assert(sizeof(UdpHeader) == 8, "UdpHeader must be 8 bytes");
static_assert(sizeof(ArpPacket) == 28, "ArpPacket must be 28 bytes");
static_assert(sizeof(BootpPacket) == 300, "BootpPacket must be 300 bytes");
static_assert(sizeof(TftpHeader) == 4, "TftpHeader must be 4 bytes");

enum BootpOp : uint8_t { BOOTREQUEST = 1, BOOTREPLY = 2 };

enum class TftpOpcode : uint16_t {
    RRQ   = 1,
    DATA  = 3,
    ACK   = 4,
    ERROR = 5
};

constexpr size_t   kTftpBlockSize = 512;
constexpr uint16_t kTftpErrIllegalOperation = 4;
constexpr uint16_t kTftpErrUnknownTransferId = 5;

constexpr uint16_t kArpHwEthernet = 1;
constexpr uint16_t kArpRequest = 1;
constexpr uint16_t kArpReply = 2;

// Running 16-bit one's complement sum (RFC 1071). Bytes are summed as
// big-endian words; an odd trailing byte is carried over to the next add().
class InetChecksum {
public:
    explicit InetChecksum(uint16_t initial = 0) : acc_(initial) {}
    void add(const uint8_t* data, size_t len);
    void add_word(uint16_t w);
    uint16_t sum() const;
    // value to store in a header checksum field (host order)
    uint16_t value() const { return (uint16_t)~sum(); }
    // true if the summed range included a correct checksum field
    bool ok() const { return sum() == 0xFFFF; }
private:
    uint32_t acc_;
    bool     odd_{false};
    uint8_t  pending_{0};
};

// IP configuration, set once by the BOOTP client. A host address with a
// zero first octet means "not configured".
struct AddressConfig {
    Ipv4Address host{};
    Ipv4Address boot_server{};

    bool configured() const { return host[0] != 0; }
};

} // namespace zxboot
