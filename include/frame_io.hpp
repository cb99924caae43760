#pragma once
#include <cstdint>
#include <cstddef>
#include <optional>
#include <vector>
#include "protocol.hpp"

namespace zxboot {

// Size of the controller-side buffer memory reachable through
// read_bytes()/write_bytes().
constexpr size_t kBufferMemorySize = 0x2000;

// Raw link driver: whole Ethernet frames in and out, plus the controller's
// own buffer memory, which doubles as the staging area for evacuated data.
class FrameIo {
public:
    virtual ~FrameIo() = default;
    virtual const MacAddress& local_address() const = 0;
    // 'frame' starts with the Ethernet header
    virtual void transmit(const std::vector<uint8_t>& frame) = 0;
    virtual std::optional<std::vector<uint8_t>> poll_frame() = 0;
    virtual void write_bytes(uint16_t addr, const uint8_t* data, size_t len) = 0;
    // Reads 'len' bytes at 'addr' into 'out', adding them to 'checksum'.
    virtual void read_bytes(uint16_t addr, uint8_t* out, size_t len,
                            InetChecksum& checksum) = 0;
};

} // namespace zxboot
