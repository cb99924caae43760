#pragma once
#include <optional>
#include <vector>
#include "frame_io.hpp"
#include "protocol.hpp"

namespace zxboot {

enum class FrameClass : uint8_t {
    Priority,   // remembered and resent on time-out until superseded
    Optional    // fire and forget
};

// Timer ticks are 20 ms (one display frame).
struct RetransmitPolicy {
    uint16_t initial_ticks{128};   // 2.56 s
    uint16_t max_ticks{1024};      // 20.48 s
    bool     give_up{true};
};

struct ReceivedFrame {
    EthHeader            hdr{};
    std::vector<uint8_t> payload;
};

class EthernetLink {
public:
    EthernetLink(FrameIo& io, const RetransmitPolicy& policy);

    const MacAddress& local_address() const { return io_.local_address(); }
    void send_frame(const MacAddress& dst, uint16_t ethertype, FrameClass cls,
                    const std::vector<uint8_t>& payload);
    // Next frame of interest (IPv4 or ARP, not sent by us), if any.
    std::optional<ReceivedFrame> poll();
    // Called once per timer tick; may throw BootError(NoResponse).
    void on_timer_tick();
    void cancel_retransmission();
    bool retransmission_pending() const { return !pending_.empty(); }
    uint16_t current_timeout() const { return timeout_; }
    uint16_t ticks() const { return ticks_; }
    FrameIo& io() { return io_; }
private:
    FrameIo& io_;
    RetransmitPolicy policy_;
    std::vector<uint8_t> pending_;
    uint16_t timeout_;
    uint16_t ticks_{0};
    bool     timer_enabled_{true};
};

} // namespace zxboot
