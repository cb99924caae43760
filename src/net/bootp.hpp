#pragma once
#include <array>
#include <functional>
#include <string>
#include "datagram.hpp"

namespace zxboot {

enum class BootFilePolicy {
    PreferReply,    // non-empty FILE field in the reply replaces the default
    AlwaysDefault   // FILE field is ignored
};

class BootpClient {
public:
    enum class State { Idle, Requesting, Bound };
    using BoundCallback = std::function<void(const std::string& boot_file)>;

    BootpClient(DatagramEngine& net, AddressConfig& config,
                std::string default_file, BootFilePolicy policy);

    // Enters Requesting: broadcasts a BOOTREQUEST with transaction id 'xid'.
    void start(const std::array<uint8_t, 4>& xid);
    void on_datagram(const Datagram& d);
    void set_bound_callback(BoundCallback cb) { on_bound_ = std::move(cb); }

    State state() const { return state_; }
    const std::string& boot_file() const { return boot_file_; }
    const std::array<uint8_t, 4>& xid() const { return xid_; }
private:
    DatagramEngine& net_;
    AddressConfig& config_;
    std::string default_file_;
    BootFilePolicy policy_;
    State state_{State::Idle};
    std::array<uint8_t, 4> xid_{};
    std::string boot_file_;
    BoundCallback on_bound_;
};

} // namespace zxboot
