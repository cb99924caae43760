#pragma once
#include <array>
#include <deque>
#include <functional>
#include <string>
#include <asio.hpp>
#include "frame_io.hpp"

namespace zxboot {

// FrameIo over a Linux AF_PACKET socket bound to one interface. Frames
// arrive asynchronously and are queued until polled, like the receive
// buffer of an Ethernet controller.
class RawSocketLink : public FrameIo {
public:
    static constexpr size_t kMaxQueuedFrames = 64;

    RawSocketLink(asio::io_context& io, const std::string& ifname,
                  const MacAddress& local_mac);

    // Begins receiving; 'on_frame' runs after each queued frame.
    void start(std::function<void()> on_frame);
    void close();

    const MacAddress& local_address() const override { return mac_; }
    void transmit(const std::vector<uint8_t>& frame) override;
    std::optional<std::vector<uint8_t>> poll_frame() override;
    void write_bytes(uint16_t addr, const uint8_t* data, size_t len) override;
    void read_bytes(uint16_t addr, uint8_t* out, size_t len,
                    InetChecksum& checksum) override;
private:
    void do_receive();
    void check_range(uint16_t addr, size_t len) const;

    asio::generic::raw_protocol::socket sock_;
    MacAddress mac_;
    std::string ifname_;
    std::array<uint8_t, 1536> rx_buf_{};
    std::deque<std::vector<uint8_t>> rx_queue_;
    std::array<uint8_t, kBufferMemorySize> buffer_memory_{};
    std::function<void()> on_frame_;
    size_t dropped_{0};
};

} // namespace zxboot
