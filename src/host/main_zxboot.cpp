#include "digest.hpp"
#include "emulated_spectrum.hpp"
#include "logging.hpp"
#include "netboot.hpp"
#include "raw_socket_link.hpp"
#include "util.hpp"
#include <asio.hpp>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <functional>
#include <iostream>
#include <memory>
#include <system_error>

using namespace zxboot;

static void usage() {
  std::cerr
      << "usage: zxboot --interface <ifname> [--mac <aa:bb:cc:dd:ee:ff>]\n"
         "              [--file <name>] [--file-policy reply|default]\n"
         "              [--tftp-dir <prefix>] [--no-give-up] [--no-syslog]\n"
         "              [--log-level trace|debug|info|warn|error]\n"
         "              [--dump <file>] [--expect-digest <hex>]\n";
}

int main(int argc, char **argv) {
  std::string ifname;
  std::string mac_text = "02:5a:58:38:32:00";
  std::string dump_path;
  std::string digest_hex;
  BootConfig cfg;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto next = [&](int &i) -> std::string {
      if (i + 1 < argc)
        return std::string(argv[++i]);
      std::cerr << "missing value for " << a << "\n";
      std::exit(1);
    };
    if (a == "--interface")
      ifname = next(i);
    else if (a == "--mac")
      mac_text = next(i);
    else if (a == "--file")
      cfg.default_boot_file = next(i);
    else if (a == "--file-policy") {
      std::string p = next(i);
      if (p == "reply")
        cfg.boot_file_policy = BootFilePolicy::PreferReply;
      else if (p == "default")
        cfg.boot_file_policy = BootFilePolicy::AlwaysDefault;
      else {
        std::cerr << "bad file policy " << p << "\n";
        return 1;
      }
    } else if (a == "--tftp-dir")
      cfg.tftp_directory = next(i);
    else if (a == "--no-give-up")
      cfg.retransmit.give_up = false;
    else if (a == "--no-syslog")
      cfg.remote_log = false;
    else if (a == "--log-level") {
      std::string l = next(i);
      auto lvl = parse_log_level(l);
      if (!lvl) {
        std::cerr << "bad log level " << l << "\n";
        return 1;
      }
      Logger::instance().set_level(*lvl);
    } else if (a == "--dump")
      dump_path = next(i);
    else if (a == "--expect-digest")
      digest_hex = next(i);
    else if (a == "--help" || a == "-h") {
      usage();
      return 0;
    } else {
      std::cerr << "unknown option " << a << "\n";
      usage();
      return 1;
    }
  }

  if (ifname.empty()) {
    usage();
    return 1;
  }
  auto mac = parse_mac(mac_text);
  if (!mac) {
    std::cerr << "bad mac address" << std::endl;
    return 1;
  }

  std::unique_ptr<ImageVerifier> verifier;
  if (!digest_hex.empty()) {
#ifdef ZXBOOT_HAVE_SODIUM
    auto digest = hex_to_bytes(digest_hex);
    if (digest.size() != Blake2bVerifier::kDigestSize) {
      std::cerr << "digest must be 64 hex digits" << std::endl;
      return 1;
    }
    try {
      verifier.reset(new Blake2bVerifier(digest));
    } catch (const BootError &e) {
      std::cerr << e.what() << std::endl;
      return 1;
    }
#else
    std::cerr << "--expect-digest needs a build with libsodium" << std::endl;
    return 1;
#endif
  }

  asio::io_context io;
  std::unique_ptr<RawSocketLink> link;
  try {
    link.reset(new RawSocketLink(io, ifname, *mac));
  } catch (const std::system_error &e) {
    Logger::instance().log(LogLevel::ERROR, "cannot open %s: %s",
                           ifname.c_str(), e.what());
    return 1;
  }

  EmulatedSpectrum machine;
  Netboot boot(*link, machine, cfg);
  if (verifier)
    boot.set_verifier(std::move(verifier));

  asio::steady_timer tick(io);
  const auto period = std::chrono::milliseconds(20);
  std::function<void()> arm = [&]() {
    tick.expires_after(period);
    tick.async_wait([&](std::error_code ec) {
      if (ec)
        return;
      boot.on_timer_tick();
      boot.poll();
      if (boot.finished()) {
        link->close();
        return;
      }
      arm();
    });
  };

  link->start([&]() {
    boot.poll();
    if (boot.finished()) {
      tick.cancel();
      link->close();
    }
  });
  arm();

  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  boot.start((uint32_t)now ^ (uint32_t)std::time(nullptr));
  if (boot.finished())
    link->close();
  io.run();

  if (boot.state() != Netboot::State::Switched) {
    std::cerr << "boot failed: " << boot.fatal_message() << std::endl;
    return (int)boot.fatal_code();
  }

  std::cout << "loaded " << boot.boot_file() << ": "
            << machine.register_summary() << std::endl;
  if (!dump_path.empty() && !machine.dump(dump_path)) {
    Logger::instance().log(LogLevel::ERROR, "cannot write %s",
                           dump_path.c_str());
    return 1;
  }
  return 0;
}
