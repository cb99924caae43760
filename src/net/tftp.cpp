#include "tftp.hpp"
#include "error.hpp"
#include "logging.hpp"
#include "util.hpp"
#include <cstring>

namespace zxboot {

static const char kTransferMode[] = "octet";
// blocks up to this far behind the expected one are duplicates
static constexpr uint8_t kTftpStaleWindow = 128;

TftpClient::TftpClient(DatagramEngine &net) : net_(net) {}

void TftpClient::read_request(const std::string &filename,
                              uint16_t local_port) {
  expected_block_ = 1;
  bytes_received_ = 0;
  server_port_ = 0;
  local_port_ = local_port;
  net_.set_tftp_port(local_port);

  std::vector<uint8_t> rrq(2);
  store_be16(rrq.data(), (uint16_t)TftpOpcode::RRQ);
  rrq.insert(rrq.end(), filename.begin(), filename.end());
  rrq.push_back(0);
  rrq.insert(rrq.end(), kTransferMode, kTransferMode + sizeof(kTransferMode));

  Logger::instance().log(LogLevel::INFO, "TFTP read request for '%s' from port %u",
                         filename.c_str(), local_port);
  state_ = State::RequestSent;
  net_.send_to_server(local_port, kPortTftpServer, rrq, FrameClass::Priority);
}

void TftpClient::send_ack(const Datagram &to, uint16_t block) {
  std::vector<uint8_t> ack(4);
  store_be16(ack.data(), (uint16_t)TftpOpcode::ACK);
  store_be16(ack.data() + 2, block);
  net_.send_reply(to, ack, FrameClass::Priority);
}

void TftpClient::send_error(const Datagram &to, uint16_t code,
                            const char *msg) {
  std::vector<uint8_t> err(4);
  store_be16(err.data(), (uint16_t)TftpOpcode::ERROR);
  store_be16(err.data() + 2, code);
  err.insert(err.end(), msg, msg + std::strlen(msg) + 1);
  net_.send_reply(to, err, FrameClass::Optional);
}

void TftpClient::on_datagram(const Datagram &d) {
  if (state_ == State::Idle || state_ == State::Failed)
    return;
  if (d.payload.size() < sizeof(TftpHeader))
    return;

  if (state_ != State::RequestSent && d.src_port != server_port_) {
    Logger::instance().log(LogLevel::DEBUG,
                           "TFTP packet from foreign port %u ignored",
                           d.src_port);
    send_error(d, kTftpErrUnknownTransferId, "unknown transfer ID");
    return;
  }

  uint16_t opcode = load_be16(d.payload.data());
  uint16_t block = load_be16(d.payload.data() + 2);

  if (opcode != (uint16_t)TftpOpcode::DATA) {
    state_ = State::Failed;
    if (opcode == (uint16_t)TftpOpcode::ERROR) {
      std::string msg(d.payload.begin() + 4, d.payload.end());
      msg = msg.c_str(); // stop at the terminating NUL
      Logger::instance().log(LogLevel::ERROR, "TFTP error %u: %s", block,
                             msg.c_str());
      throw BootError(FatalCode::FileNotFound, "TFTP error: " + msg);
    }
    throw BootError(FatalCode::FileNotFound, "unexpected TFTP opcode");
  }

  uint8_t received = (uint8_t)(block & 0xFF);
  uint8_t expected = (uint8_t)(expected_block_ & 0xFF);

  if (state_ == State::Complete) {
    // our final ACK was lost; nothing more is forwarded
    if (received == (uint8_t)(expected - 1))
      send_ack(d, block);
    return;
  }

  if (received == expected) {
    if (state_ == State::RequestSent) {
      server_port_ = d.src_port;
      state_ = State::Transferring;
    }
    send_ack(d, block);
    expected_block_++;

    size_t len = d.payload.size() - sizeof(TftpHeader);
    bool last = len < kTftpBlockSize;
    bytes_received_ += len;
    if (last) {
      state_ = State::Complete;
      Logger::instance().log(LogLevel::INFO, "TFTP transfer complete, %zu bytes",
                             bytes_received_);
    }
    if (sink_)
      sink_(d.payload.data() + sizeof(TftpHeader), len, last);
    return;
  }

  // an earlier block means one of our ACKs was lost: ACK it again, but
  // only blocks ahead of the expected one are a gap. Before the first block
  // this does not latch the transfer ID.
  uint8_t behind = (uint8_t)(expected - received);
  if (behind < kTftpStaleWindow) {
    Logger::instance().log(LogLevel::DEBUG, "duplicate TFTP block %u", block);
    send_ack(d, block);
    return;
  }

  send_error(d, kTftpErrIllegalOperation, "");
  state_ = State::Failed;
  throw BootError(FatalCode::Internal, "unexpected TFTP block " +
                                           std::to_string(block));
}

} // namespace zxboot
