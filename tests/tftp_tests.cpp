#include "../src/net/tftp.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <string>

using namespace zxboot;
using namespace zxboot::test;

namespace {

constexpr uint16_t kLocalPort = 0xC321;
constexpr uint16_t kServerTid = 40000;

class TftpTest : public ::testing::Test {
protected:
    TftpTest() : link(io, RetransmitPolicy{}), net(link, config), client(net) {
        config.host = kHostIp;
        config.boot_server = kServerIp;
        net.set_tftp_handler([this](const Datagram& d) { client.on_datagram(d); });
        client.set_data_sink([this](const uint8_t* p, size_t n, bool last) {
            received.insert(received.end(), p, p + n);
            deliveries++;
            if (last)
                last_seen++;
        });
    }
    void data(uint16_t block, size_t len, uint8_t fill, uint16_t tid = kServerTid) {
        std::vector<uint8_t> payload(len, fill);
        io.rx.push_back(server_frame(tid, kLocalPort, make_tftp_data(block, payload)));
        net.poll();
    }

    FakeFrameIo io;
    AddressConfig config;
    EthernetLink link;
    DatagramEngine net;
    TftpClient client;
    std::vector<uint8_t> received;
    int deliveries = 0;
    int last_seen = 0;
};

} // namespace

TEST_F(TftpTest, SendsReadRequest) {
    client.read_request("boot.z80", kLocalPort);
    auto s = sent_udp(io);
    ASSERT_EQ(s.size(), 1u);
    EXPECT_EQ(s[0].dst_ip, kServerIp);
    EXPECT_EQ(s[0].src_port, kLocalPort);
    EXPECT_EQ(s[0].dst_port, kPortTftpServer);
    std::string expected("\0\1boot.z80\0octet\0", 17);
    EXPECT_EQ(std::string(s[0].payload.begin(), s[0].payload.end()), expected);
    EXPECT_EQ(client.state(), TftpClient::State::RequestSent);
    EXPECT_TRUE(link.retransmission_pending());
}

TEST_F(TftpTest, AcknowledgesAndForwardsInOrder) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    data(2, 512, 0x22);
    data(3, 100, 0x33);
    EXPECT_EQ(sent_acks(io), (std::vector<uint16_t>{1, 2, 3}));
    EXPECT_EQ(received.size(), 1124u);
    EXPECT_EQ(received[0], 0x11);
    EXPECT_EQ(received[600], 0x22);
    EXPECT_EQ(received.back(), 0x33);
    EXPECT_EQ(last_seen, 1);
    EXPECT_EQ(client.state(), TftpClient::State::Complete);
    EXPECT_EQ(client.server_port(), kServerTid);
}

TEST_F(TftpTest, DuplicatesAreAcknowledgedButForwardedOnce) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    data(2, 512, 0x22);
    data(2, 512, 0x22);
    data(1, 512, 0x11);
    data(3, 512, 0x33);
    EXPECT_EQ(sent_acks(io), (std::vector<uint16_t>{1, 2, 2, 1, 3}));
    EXPECT_EQ(deliveries, 3);
    EXPECT_EQ(received.size(), 3u * 512);
}

TEST_F(TftpTest, PreviousBlockProducesOneAckAndNoData) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    size_t sent_before = io.sent.size();
    int deliveries_before = deliveries;
    data(1, 512, 0x11);
    EXPECT_EQ(io.sent.size(), sent_before + 1);
    EXPECT_EQ(sent_acks(io).back(), 1);
    EXPECT_EQ(deliveries, deliveries_before);
}

TEST_F(TftpTest, BlockGapIsFatal) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    try {
        data(3, 512, 0x33);
        FAIL() << "expected BootError";
    } catch (const BootError& e) {
        EXPECT_EQ(e.code(), FatalCode::Internal);
    }
    EXPECT_EQ(client.state(), TftpClient::State::Failed);
    auto s = sent_udp(io);
    ASSERT_FALSE(s.empty());
    EXPECT_EQ(load_be16(s.back().payload.data()), (uint16_t)TftpOpcode::ERROR);
    EXPECT_EQ(load_be16(s.back().payload.data() + 2), kTftpErrIllegalOperation);
}

TEST_F(TftpTest, ErrorPacketMeansFileNotFound) {
    client.read_request("missing.z80", kLocalPort);
    io.rx.push_back(server_frame(kServerTid, kLocalPort, make_tftp_error(1, "File not found")));
    try {
        net.poll();
        FAIL() << "expected BootError";
    } catch (const BootError& e) {
        EXPECT_EQ(e.code(), FatalCode::FileNotFound);
        EXPECT_NE(std::string(e.what()).find("File not found"), std::string::npos);
    }
    EXPECT_EQ(client.state(), TftpClient::State::Failed);
}

TEST_F(TftpTest, ForeignTransferIdIsRejectedWithoutHalting) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    EXPECT_NO_THROW(data(2, 512, 0x99, kServerTid + 1));
    EXPECT_EQ(deliveries, 1);
    auto s = sent_udp(io);
    EXPECT_EQ(s.back().dst_port, kServerTid + 1);
    EXPECT_EQ(load_be16(s.back().payload.data()), (uint16_t)TftpOpcode::ERROR);
    EXPECT_EQ(load_be16(s.back().payload.data() + 2), kTftpErrUnknownTransferId);
    data(2, 100, 0x22);
    EXPECT_EQ(client.state(), TftpClient::State::Complete);
}

TEST_F(TftpTest, BlockNumbersWrapOnLowByte) {
    client.read_request("boot.z80", kLocalPort);
    for (uint32_t block = 1; block <= 300; block++)
        data((uint16_t)block, 512, (uint8_t)block);
    data(301, 0, 0);
    EXPECT_EQ(deliveries, 301);
    EXPECT_EQ(received.size(), 300u * 512);
    EXPECT_EQ(client.state(), TftpClient::State::Complete);
    EXPECT_EQ(client.expected_block(), 302);
}

TEST_F(TftpTest, FinalAckIsRepeatedAfterCompletion) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 10, 0x11);
    data(1, 10, 0x11);
    EXPECT_EQ(sent_acks(io), (std::vector<uint16_t>{1, 1}));
    EXPECT_EQ(deliveries, 1);
}

TEST_F(TftpTest, AckIsSentBeforeDataIsForwarded) {
    client.read_request("boot.z80", kLocalPort);
    size_t acks_at_delivery = 0;
    client.set_data_sink([&](const uint8_t*, size_t, bool) {
        acks_at_delivery = sent_acks(io).size();
    });
    data(1, 512, 0x11);
    EXPECT_EQ(acks_at_delivery, 1u);
}

TEST_F(TftpTest, AckReplacesRequestForRetransmission) {
    client.read_request("boot.z80", kLocalPort);
    data(1, 512, 0x11);
    for (int i = 0; i < 128; i++)
        link.on_timer_tick();
    auto acks = sent_acks(io);
    EXPECT_EQ(acks, (std::vector<uint16_t>{1, 1}));
}

TEST_F(TftpTest, OlderBlocksAreAcknowledgedNotForwarded) {
    client.read_request("boot.z80", kLocalPort);
    for (uint16_t block = 1; block <= 4; block++)
        data(block, 512, (uint8_t)block);
    EXPECT_NO_THROW(data(2, 512, 0x02));
    EXPECT_EQ(sent_acks(io).back(), 2);
    EXPECT_EQ(deliveries, 4);
    data(5, 512, 0x05);
    EXPECT_EQ(deliveries, 5);
    EXPECT_EQ(client.state(), TftpClient::State::Transferring);
}

TEST_F(TftpTest, StaleBlockBeforeFirstIsAcknowledged) {
    client.read_request("boot.z80", kLocalPort);
    EXPECT_NO_THROW(data(0, 512, 0x00, kServerTid + 7));
    EXPECT_EQ(client.state(), TftpClient::State::RequestSent);
    EXPECT_EQ(deliveries, 0);
    data(1, 100, 0x11);
    EXPECT_EQ(sent_acks(io), (std::vector<uint16_t>{0, 1}));
    EXPECT_EQ(deliveries, 1);
    EXPECT_EQ(client.server_port(), kServerTid);
    EXPECT_EQ(client.state(), TftpClient::State::Complete);
}
