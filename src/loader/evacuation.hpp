#pragma once
#include <array>
#include <cstdint>
#include "frame_io.hpp"
#include "machine.hpp"

namespace zxboot {

// Loader working storage on the target (attributes/progress display, stack,
// static data). Snapshot bytes for this range are held in the controller's
// buffer memory until the context switch.
constexpr uint16_t kRuntimeDataStart  = 0x5800;
constexpr uint16_t kRuntimeDataLength = 0x0800;
constexpr uint16_t kStagingAddress    = 0x1800;

// Which copy of the region is authoritative:
//  Idle       home copy, nothing staged yet
//  Decoding   staging copy receives snapshot bytes, home copy is in use
//  Restoring  staging copy is being written back to home
//  Restored   home copy holds the snapshot's data
enum class EvacuationPhase : uint8_t { Idle, Decoding, Restoring, Restored };

class EvacuationBuffer {
public:
    EvacuationBuffer(FrameIo& io, Machine& machine,
                     uint16_t region_start = kRuntimeDataStart,
                     uint16_t region_length = kRuntimeDataLength,
                     uint16_t staging = kStagingAddress);

    bool covers(uint16_t addr) const {
        return addr >= start_ && (uint32_t)addr < (uint32_t)start_ + length_;
    }
    // Stores a decoded byte destined for 'addr' (which covers() must accept).
    // The first call mirrors the home copy into staging.
    void store(uint16_t addr, uint8_t value);
    // Writes out any combined bytes still held back, so the staging copy is
    // complete.
    void flush();
    // Copies the staged region back to its home addresses.
    void restore();

    EvacuationPhase phase() const { return phase_; }
    uint16_t restore_checksum() const { return restore_checksum_; }
private:
    static constexpr size_t kChunk = 64;

    void mirror();

    FrameIo& io_;
    Machine& machine_;
    uint16_t start_;
    uint16_t length_;
    uint16_t staging_;
    EvacuationPhase phase_{EvacuationPhase::Idle};
    std::array<uint8_t, kChunk> chunk_{};
    uint16_t chunk_addr_{0};
    size_t   chunk_len_{0};
    uint16_t restore_checksum_{0};
};

} // namespace zxboot
