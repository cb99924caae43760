#pragma once
#include <functional>
#include <string>
#include "datagram.hpp"

namespace zxboot {

// TFTP read client (RFC 1350, octet mode, no options). Block numbers are
// compared on their low 8 bits only.
class TftpClient {
public:
    enum class State { Idle, RequestSent, Transferring, Complete, Failed };
    using DataSink = std::function<void(const uint8_t* data, size_t len, bool last)>;

    explicit TftpClient(DatagramEngine& net);

    void set_data_sink(DataSink sink) { sink_ = std::move(sink); }
    void read_request(const std::string& filename, uint16_t local_port);
    void on_datagram(const Datagram& d);

    State state() const { return state_; }
    uint16_t expected_block() const { return expected_block_; }
    uint16_t local_port() const { return local_port_; }
    uint16_t server_port() const { return server_port_; }
    size_t bytes_received() const { return bytes_received_; }
private:
    void send_ack(const Datagram& to, uint16_t block);
    void send_error(const Datagram& to, uint16_t code, const char* msg);

    DatagramEngine& net_;
    DataSink sink_;
    State state_{State::Idle};
    uint16_t expected_block_{1};
    uint16_t local_port_{0};
    uint16_t server_port_{0};
    size_t bytes_received_{0};
};

} // namespace zxboot
