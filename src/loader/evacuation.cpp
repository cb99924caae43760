#include "evacuation.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <algorithm>

namespace zxboot {

EvacuationBuffer::EvacuationBuffer(FrameIo &io, Machine &machine,
                                   uint16_t region_start,
                                   uint16_t region_length, uint16_t staging)
    : io_(io), machine_(machine), start_(region_start),
      length_(region_length), staging_(staging) {}

void EvacuationBuffer::mirror() {
  std::array<uint8_t, kChunk> buf;
  for (size_t off = 0; off < length_; off += kChunk) {
    size_t n = std::min(kChunk, (size_t)length_ - off);
    for (size_t i = 0; i < n; i++)
      buf[i] = machine_.read_memory((uint16_t)(start_ + off + i));
    io_.write_bytes((uint16_t)(staging_ + off), buf.data(), n);
  }
  phase_ = EvacuationPhase::Decoding;
  Logger::instance().log(LogLevel::DEBUG,
                         "evacuating 0x%04x..0x%04x to buffer memory 0x%04x",
                         start_, start_ + length_ - 1, staging_);
}

void EvacuationBuffer::flush() {
  if (chunk_len_ == 0)
    return;
  io_.write_bytes((uint16_t)(staging_ + (chunk_addr_ - start_)), chunk_.data(),
                  chunk_len_);
  chunk_len_ = 0;
}

void EvacuationBuffer::store(uint16_t addr, uint8_t value) {
  if (phase_ == EvacuationPhase::Restoring ||
      phase_ == EvacuationPhase::Restored)
    throw BootError(FatalCode::Internal, "snapshot data after restore");
  if (!covers(addr))
    throw BootError(FatalCode::Internal, "address outside evacuation region");
  if (phase_ == EvacuationPhase::Idle)
    mirror();

  bool contiguous = chunk_len_ > 0 &&
                    addr == (uint16_t)(chunk_addr_ + chunk_len_) &&
                    chunk_len_ < kChunk;
  if (!contiguous) {
    flush();
    chunk_addr_ = addr;
  }
  chunk_[chunk_len_++] = value;
}

void EvacuationBuffer::restore() {
  if (phase_ == EvacuationPhase::Restoring ||
      phase_ == EvacuationPhase::Restored)
    throw BootError(FatalCode::Internal, "evacuated data restored twice");
  if (phase_ == EvacuationPhase::Idle) {
    // snapshot never touched the region
    phase_ = EvacuationPhase::Restored;
    return;
  }
  flush();
  phase_ = EvacuationPhase::Restoring;

  InetChecksum cs;
  std::array<uint8_t, kChunk> buf;
  for (size_t off = 0; off < length_; off += kChunk) {
    size_t n = std::min(kChunk, (size_t)length_ - off);
    io_.read_bytes((uint16_t)(staging_ + off), buf.data(), n, cs);
    for (size_t i = 0; i < n; i++)
      machine_.write_memory((uint16_t)(start_ + off + i), buf[i]);
  }
  restore_checksum_ = cs.sum();
  phase_ = EvacuationPhase::Restored;
}

} // namespace zxboot
