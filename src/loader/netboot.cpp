#include "netboot.hpp"
#include "logging.hpp"

namespace zxboot {

namespace {
constexpr uint16_t kEphemeralPortBase = 0xC000;
constexpr uint16_t kEphemeralPortMask = 0x3FFF;
} // namespace

Netboot::Netboot(FrameIo &io, Machine &machine, const BootConfig &config)
    : machine_(machine), config_(config), link_(io, config.retransmit),
      net_(link_, address_),
      bootp_(net_, address_, config.default_boot_file,
             config.boot_file_policy),
      tftp_(net_), evacuation_(io, machine), decoder_(machine, evacuation_),
      switch_(machine, evacuation_) {
  net_.set_bootp_handler([this](const Datagram &d) { bootp_.on_datagram(d); });
  net_.set_tftp_handler([this](const Datagram &d) { tftp_.on_datagram(d); });
  bootp_.set_bound_callback(
      [this](const std::string &file) { on_bound(file); });
  tftp_.set_data_sink([this](const uint8_t *data, size_t len, bool last) {
    on_data(data, len, last);
  });
  decoder_.set_done_callback(
      [this](const SnapshotHeader &h) { switch_.prepare(h); });
}

Netboot::~Netboot() {
  if (sink_installed_)
    Logger::instance().clear_sink();
}

void Netboot::set_verifier(std::unique_ptr<ImageVerifier> verifier) {
  verifier_ = std::move(verifier);
}

template <typename F> void Netboot::guarded(F &&body) {
  if (finished())
    return;
  try {
    body();
  } catch (const BootError &e) {
    fail(e);
  }
}

void Netboot::start(uint32_t seed) {
  guarded([&] {
    if (state_ != State::Idle)
      throw BootError(FatalCode::Internal, "boot sequence already started");
    seed_ = seed;
    state_ = State::Configuring;
    bootp_.start({(uint8_t)(seed >> 24), (uint8_t)(seed >> 16),
                  (uint8_t)(seed >> 8), (uint8_t)seed});
  });
}

bool Netboot::poll() {
  bool any = false;
  guarded([&] { any = net_.poll(); });
  return any;
}

void Netboot::on_timer_tick() {
  guarded([&] {
    elapsed_ticks_++;
    link_.on_timer_tick();
  });
}

uint16_t Netboot::pick_tftp_port() const {
  return (uint16_t)(kEphemeralPortBase |
                    (((seed_ >> 16) ^ seed_ ^ elapsed_ticks_) &
                     kEphemeralPortMask));
}

void Netboot::on_bound(const std::string &file) {
  if (config_.remote_log) {
    Logger::instance().set_sink(
        [this](LogLevel, const std::string &msg) { net_.send_syslog(msg); });
    sink_installed_ = true;
  }
  boot_file_ = config_.tftp_directory + file;
  state_ = State::Loading;
  tftp_.read_request(boot_file_, pick_tftp_port());
}

void Netboot::on_data(const uint8_t *data, size_t len, bool last) {
  if (verifier_)
    verifier_->update(data, len);
  decoder_.feed(data, len);
  if (!last)
    return;
  transfer_complete_ = true;
  decoder_.finish();
  maybe_switch();
}

void Netboot::maybe_switch() {
  if (!transfer_complete_ || !decoder_.done())
    return;
  if (verifier_ && !verifier_->verify())
    throw BootError(FatalCode::FileNotFound,
                    "image digest mismatch for " + boot_file_);

  link_.cancel_retransmission();
  if (sink_installed_) {
    Logger::instance().clear_sink();
    sink_installed_ = false;
  }
  switch_.execute();
  state_ = State::Switched;
}

void Netboot::fail(const BootError &e) {
  fatal_code_ = e.code();
  fatal_message_ = e.what();
  Logger::instance().log(LogLevel::ERROR, "boot failed (%s): %s",
                         fatal_code_name(e.code()), e.what());
  state_ = State::Halted;

  link_.cancel_retransmission();
  if (sink_installed_) {
    Logger::instance().clear_sink();
    sink_installed_ = false;
  }
  machine_.disable_interrupts();
  machine_.out_port(kPortUla, (uint8_t)e.code());
  machine_.halt(e.code());
}

} // namespace zxboot
