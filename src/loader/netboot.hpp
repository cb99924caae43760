#pragma once
#include <memory>
#include <string>
#include "bootp.hpp"
#include "context_switch.hpp"
#include "datagram.hpp"
#include "digest.hpp"
#include "ethernet.hpp"
#include "evacuation.hpp"
#include "frame_io.hpp"
#include "machine.hpp"
#include "snapshot_decoder.hpp"
#include "tftp.hpp"

namespace zxboot {

struct BootConfig {
    std::string      default_boot_file{"boot.z80"};
    BootFilePolicy   boot_file_policy{BootFilePolicy::PreferReply};
    std::string      tftp_directory;     // prepended to the file name
    RetransmitPolicy retransmit;
    bool             remote_log{true};   // WARN and above as syslog
};

// The boot sequence: BOOTP, then a TFTP download streamed through the
// snapshot decoder, then the context switch. Every BootError raised along
// the way ends here and halts the target.
class Netboot {
public:
    enum class State { Idle, Configuring, Loading, Switched, Halted };

    Netboot(FrameIo& io, Machine& machine, const BootConfig& config);
    ~Netboot();
    Netboot(const Netboot&) = delete;
    Netboot& operator=(const Netboot&) = delete;

    // Must be called before start().
    void set_verifier(std::unique_ptr<ImageVerifier> verifier);

    // 'seed' should be time-derived; it picks the BOOTP transaction id
    // and the TFTP source port.
    void start(uint32_t seed);
    // Processes pending frames; returns true if any were handled.
    bool poll();
    // 20 ms tick.
    void on_timer_tick();

    State state() const { return state_; }
    bool finished() const { return state_ == State::Switched || state_ == State::Halted; }
    FatalCode fatal_code() const { return fatal_code_; }
    const std::string& fatal_message() const { return fatal_message_; }
    const std::string& boot_file() const { return boot_file_; }
    const AddressConfig& address_config() const { return address_; }
    const SnapshotDecoder& decoder() const { return decoder_; }
    const TftpClient& tftp() const { return tftp_; }
    const EthernetLink& link() const { return link_; }
private:
    template <typename F> void guarded(F&& body);
    void on_bound(const std::string& file);
    void on_data(const uint8_t* data, size_t len, bool last);
    void maybe_switch();
    void fail(const BootError& e);
    uint16_t pick_tftp_port() const;

    Machine& machine_;
    BootConfig config_;
    AddressConfig address_;
    EthernetLink link_;
    DatagramEngine net_;
    BootpClient bootp_;
    TftpClient tftp_;
    EvacuationBuffer evacuation_;
    SnapshotDecoder decoder_;
    ContextSwitch switch_;
    std::unique_ptr<ImageVerifier> verifier_;

    State state_{State::Idle};
    FatalCode fatal_code_{FatalCode::Internal};
    std::string fatal_message_;
    std::string boot_file_;
    uint32_t seed_{0};
    uint32_t elapsed_ticks_{0};
    bool transfer_complete_{false};
    bool sink_installed_{false};
};

} // namespace zxboot
