#include "../src/loader/netboot.hpp"
#include "../include/logging.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <string>

using namespace zxboot;
using namespace zxboot::test;

namespace {

constexpr uint32_t kSeed = 0x01020304;
const std::array<uint8_t, 4> kSeedXid{0x01, 0x02, 0x03, 0x04};
constexpr uint16_t kServerTid = 3001;

class FixedVerifier : public ImageVerifier {
public:
    FixedVerifier(bool result, size_t* bytes) : result_(result), bytes_(bytes) {}
    void update(const uint8_t*, size_t len) override { *bytes_ += len; }
    bool verify() override { return result_; }
private:
    bool result_;
    size_t* bytes_;
};

std::vector<uint8_t> make_snapshot() {
    return concat({make_z80_ext_header(Z80Registers{}, 0),
                   make_z80_page(8, patterned(kPageSize, 8), true),
                   make_z80_page(4, patterned(kPageSize, 4), true),
                   make_z80_page(5, patterned(kPageSize, 5), true)});
}

class NetbootTest : public ::testing::Test {
protected:
    ~NetbootTest() override { Logger::instance().clear_sink(); }

    void bind(const std::string& file = "") {
        io.rx.push_back(server_frame(kPortBootpServer, kPortBootpClient,
                                     make_bootp_reply(kSeedXid, kHostIp, kServerIp, "", file),
                                     kBroadcastIp));
        boot.poll();
    }
    std::optional<SentUdp> read_request() const {
        for (const auto& s : sent_udp(io))
            if (s.dst_port == kPortTftpServer)
                return s;
        return std::nullopt;
    }
    void serve(const std::vector<uint8_t>& file, uint16_t port) {
        uint16_t block = 1;
        for (size_t off = 0;; off += 512, block++) {
            size_t n = std::min<size_t>(512, file.size() - off);
            std::vector<uint8_t> chunk(file.begin() + off, file.begin() + off + n);
            io.rx.push_back(server_frame(kServerTid, port, make_tftp_data(block, chunk)));
            boot.poll();
            if (n < 512 || boot.finished())
                break;
        }
    }
    std::vector<std::string> syslog_messages() const {
        std::vector<std::string> out;
        for (const auto& s : sent_udp(io))
            if (s.dst_port == kPortSyslog)
                out.emplace_back(s.payload.begin(), s.payload.end());
        return out;
    }

    FakeFrameIo io;
    RecordingMachine machine;
    BootConfig config;
    Netboot boot{io, machine, config};
};

} // namespace

TEST_F(NetbootTest, LoadsAndStartsSnapshot) {
    boot.start(kSeed);
    EXPECT_EQ(boot.state(), Netboot::State::Configuring);
    bind();
    EXPECT_EQ(boot.state(), Netboot::State::Loading);
    EXPECT_EQ(boot.address_config().host, kHostIp);

    auto rrq = read_request();
    ASSERT_TRUE(rrq.has_value());
    EXPECT_EQ(rrq->dst_ip, kServerIp);
    EXPECT_GE(rrq->src_port, 0xC000);
    EXPECT_EQ(boot.boot_file(), "boot.z80");

    serve(make_snapshot(), rrq->src_port);
    EXPECT_EQ(boot.state(), Netboot::State::Switched);
    EXPECT_TRUE(boot.finished());
    EXPECT_TRUE(boot.decoder().done());
    EXPECT_EQ(boot.tftp().state(), TftpClient::State::Complete);
    EXPECT_FALSE(boot.link().retransmission_pending());

    EXPECT_EQ(machine.events.back(), "jump 8000 ei");
    EXPECT_EQ(machine.banks[2], patterned(kPageSize, 4));
    EXPECT_EQ(machine.banks[5], patterned(kPageSize, 8));
    EXPECT_LT(machine.event_index("write 5800"), machine.event_index("main"));
}

TEST_F(NetbootTest, PrefixesTftpDirectory) {
    config.tftp_directory = "spectrum/";
    Netboot b(io, machine, config);
    b.start(kSeed);
    io.rx.push_back(server_frame(kPortBootpServer, kPortBootpClient,
                                 make_bootp_reply(kSeedXid, kHostIp, kServerIp, "", "jetpac.z80"),
                                 kBroadcastIp));
    b.poll();
    EXPECT_EQ(b.boot_file(), "spectrum/jetpac.z80");
    auto rrq = read_request();
    ASSERT_TRUE(rrq.has_value());
    std::string payload(rrq->payload.begin(), rrq->payload.end());
    EXPECT_NE(payload.find("spectrum/jetpac.z80"), std::string::npos);
}

TEST_F(NetbootTest, TftpErrorHaltsWithFileNotFound) {
    boot.start(kSeed);
    bind();
    auto rrq = read_request();
    ASSERT_TRUE(rrq.has_value());
    io.rx.push_back(server_frame(kServerTid, rrq->src_port, make_tftp_error(1, "File not found")));
    EXPECT_NO_THROW(boot.poll());

    EXPECT_EQ(boot.state(), Netboot::State::Halted);
    EXPECT_EQ(boot.fatal_code(), FatalCode::FileNotFound);
    EXPECT_TRUE(machine.has_event("out 00fe 06"));
    EXPECT_EQ(machine.events.back(), "halt 6");
    EXPECT_LT(machine.event_index("di"), machine.event_index("out 00fe"));
    EXPECT_EQ(machine.event_index("jump"), -1);
}

TEST_F(NetbootTest, SilentNetworkHaltsWithNoResponse) {
    config.retransmit.initial_ticks = 2;
    config.retransmit.max_ticks = 4;
    Netboot b(io, machine, config);
    b.start(kSeed);
    for (int i = 0; i < 100; i++)
        EXPECT_NO_THROW(b.on_timer_tick());
    EXPECT_EQ(b.state(), Netboot::State::Halted);
    EXPECT_EQ(b.fatal_code(), FatalCode::NoResponse);
    EXPECT_TRUE(machine.has_event("halt 2"));
}

TEST_F(NetbootTest, BadServerNameHalts) {
    boot.start(kSeed);
    io.rx.push_back(server_frame(kPortBootpServer, kPortBootpClient,
                                 make_bootp_reply(kSeedXid, kHostIp, kServerIp, "bootserver"),
                                 kBroadcastIp));
    boot.poll();
    EXPECT_EQ(boot.fatal_code(), FatalCode::InvalidBootServer);
    EXPECT_TRUE(machine.has_event("out 00fe 03"));
}

TEST_F(NetbootTest, IncompatibleSnapshotHalts) {
    boot.start(kSeed);
    bind();
    auto rrq = read_request();
    ASSERT_TRUE(rrq.has_value());
    serve(concat({make_z80_ext_header(Z80Registers{}, 9), std::vector<uint8_t>(600, 0)}),
          rrq->src_port);
    EXPECT_EQ(boot.state(), Netboot::State::Halted);
    EXPECT_EQ(boot.fatal_code(), FatalCode::Incompatible);
    EXPECT_EQ(machine.events.back(), "halt 5");
}

TEST_F(NetbootTest, DigestMismatchPreventsSwitch) {
    size_t hashed = 0;
    boot.set_verifier(std::make_unique<FixedVerifier>(false, &hashed));
    boot.start(kSeed);
    bind();
    auto snapshot = make_snapshot();
    serve(snapshot, read_request()->src_port);
    EXPECT_EQ(hashed, snapshot.size());
    EXPECT_EQ(boot.state(), Netboot::State::Halted);
    EXPECT_EQ(boot.fatal_code(), FatalCode::FileNotFound);
    EXPECT_EQ(machine.event_index("jump"), -1);
}

TEST_F(NetbootTest, MatchingDigestSwitches) {
    size_t hashed = 0;
    boot.set_verifier(std::make_unique<FixedVerifier>(true, &hashed));
    boot.start(kSeed);
    bind();
    serve(make_snapshot(), read_request()->src_port);
    EXPECT_EQ(boot.state(), Netboot::State::Switched);
}

TEST_F(NetbootTest, WarningsGoToSyslogWhileLoading) {
    boot.start(kSeed);
    Logger::instance().log(LogLevel::WARN, "before bind");
    EXPECT_TRUE(syslog_messages().empty());

    bind();
    Logger::instance().log(LogLevel::WARN, "while loading");
    Logger::instance().log(LogLevel::INFO, "too quiet");
    auto msgs = syslog_messages();
    ASSERT_EQ(msgs.size(), 1u);
    EXPECT_EQ(msgs[0], "<6>zxboot: while loading");

    io.rx.push_back(server_frame(kServerTid, read_request()->src_port,
                                 make_tftp_error(2, "Access violation")));
    boot.poll();
    msgs = syslog_messages();
    ASSERT_EQ(msgs.size(), 3u);
    EXPECT_NE(msgs[1].find("Access violation"), std::string::npos);
    EXPECT_NE(msgs[2].find("boot failed"), std::string::npos);

    Logger::instance().log(LogLevel::WARN, "after halt");
    EXPECT_EQ(syslog_messages().size(), 3u);
}

TEST_F(NetbootTest, RemoteLogCanBeDisabled) {
    config.remote_log = false;
    Netboot b(io, machine, config);
    b.start(kSeed);
    io.rx.push_back(server_frame(kPortBootpServer, kPortBootpClient,
                                 make_bootp_reply(kSeedXid, kHostIp, kServerIp),
                                 kBroadcastIp));
    b.poll();
    Logger::instance().log(LogLevel::WARN, "local only");
    EXPECT_TRUE(syslog_messages().empty());
}

TEST_F(NetbootTest, StartTwiceIsInternalError) {
    boot.start(kSeed);
    boot.start(kSeed);
    EXPECT_EQ(boot.state(), Netboot::State::Halted);
    EXPECT_EQ(boot.fatal_code(), FatalCode::Internal);
}
