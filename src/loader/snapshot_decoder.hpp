#pragma once
#include <array>
#include <cstdint>
#include <functional>
#include "evacuation.hpp"
#include "machine.hpp"
#include "snapshot_header.hpp"

namespace zxboot {

// Version 1 bodies hold 48K starting at the screen.
constexpr uint16_t kZ80V1BodySize = 0xC000;

enum class DecodePhase : uint8_t {
    Header,
    PageHeader1,    // encoded length, low byte
    PageHeader2,    // encoded length, high byte
    PageHeader3,    // page id
    Verbatim,
    Compressed,
    EscapeSeen,     // one 0xED consumed
    RepeatCount,    // 0xED 0xED consumed
    RepeatValue,
    Done
};

// Everything the decoder needs to resume after a segment boundary.
struct DecoderState {
    DecodePhase phase{DecodePhase::Header};
    std::array<uint8_t, kZ80HeaderMaxSize> header_bytes{};
    size_t   header_fill{0};
    size_t   header_need{kZ80HeaderV1Size};
    SnapshotHeader header;

    uint32_t bytes_remaining{0};    // encoded bytes left in this page/region
    uint8_t  pending_escapes{0};    // 0xED bytes seen but not yet resolved
    uint8_t  repeat_count{0};
    uint16_t page_length{0};        // raw encoded length from the page header
    uint16_t write_pos{0};          // next destination address
    uint32_t output_remaining{0};   // bytes the current page/region may produce
    bool     discard{false};        // page has no memory on this machine
    unsigned pages_loaded{0};
    unsigned kb_loaded{0};
    unsigned kb_expected{0};

    bool done() const { return phase == DecodePhase::Done; }
    bool header_complete() const { return phase != DecodePhase::Header; }
};

// Streaming .z80 decoder. Decoded bytes go to the machine, except those for
// the evacuation region, which go to the staging buffer.
class SnapshotDecoder {
public:
    using HeaderCallback = std::function<void(const SnapshotHeader&)>;
    using DoneCallback = std::function<void(const SnapshotHeader&)>;

    SnapshotDecoder(Machine& machine, EvacuationBuffer& evacuation);

    void set_header_callback(HeaderCallback cb) { on_header_ = std::move(cb); }
    void set_done_callback(DoneCallback cb) { on_done_ = std::move(cb); }

    // Consumes 'len' bytes starting from 'state' and returns the new state.
    // Throws BootError(Incompatible) for snapshots that cannot be loaded.
    DecoderState feed(DecoderState state, const uint8_t* data, size_t len);
    // Same, on the decoder's own state.
    void feed(const uint8_t* data, size_t len);
    // Called at end of stream. A paged snapshot that stops on a page
    // boundary is accepted as complete; anything else is truncated.
    void finish();

    const DecoderState& state() const { return state_; }
    const SnapshotHeader& header() const { return state_.header; }
    bool done() const { return state_.done(); }
private:
    void header_byte(DecoderState& s, uint8_t b);
    void begin_body(DecoderState& s);
    void begin_page(DecoderState& s, uint8_t page_id);
    void end_page(DecoderState& s);
    void emit(DecoderState& s, uint8_t value);
    void complete(DecoderState& s);

    Machine& machine_;
    EvacuationBuffer& evacuation_;
    DecoderState state_;
    HeaderCallback on_header_;
    DoneCallback on_done_;
};

} // namespace zxboot
