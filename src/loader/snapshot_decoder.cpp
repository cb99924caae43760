#include "snapshot_decoder.hpp"
#include "error.hpp"
#include "logging.hpp"
#include <string>

namespace zxboot {

namespace {

constexpr uint8_t kFirstPageId = 3;
constexpr uint8_t kLastPageId = 10;
constexpr uint8_t kScreenPageId = 8;    // always at 0x4000
constexpr uint8_t kPage48kMiddle = 4;   // 0x8000 on 48K machines
constexpr uint16_t kKilobyteMask = 0x03FF;

bool in_page_body(DecodePhase p) {
  return p == DecodePhase::Verbatim || p == DecodePhase::Compressed ||
         p == DecodePhase::EscapeSeen || p == DecodePhase::RepeatCount ||
         p == DecodePhase::RepeatValue;
}

} // namespace

SnapshotDecoder::SnapshotDecoder(Machine &machine, EvacuationBuffer &evacuation)
    : machine_(machine), evacuation_(evacuation) {}

void SnapshotDecoder::feed(const uint8_t *data, size_t len) {
  bool had_header = state_.header_complete();
  bool was_done = state_.done();
  state_ = feed(state_, data, len);
  if (!had_header && state_.header_complete() && on_header_)
    on_header_(state_.header);
  if (!was_done && state_.done() && on_done_)
    on_done_(state_.header);
}

void SnapshotDecoder::finish() {
  if (state_.done())
    return;
  if (state_.header.paged() && state_.phase == DecodePhase::PageHeader1 &&
      state_.pages_loaded > 0) {
    Logger::instance().log(LogLevel::WARN,
                           "snapshot ended after %u pages, %u KB loaded",
                           state_.pages_loaded, state_.kb_loaded);
    complete(state_);
    if (on_done_)
      on_done_(state_.header);
    return;
  }
  throw BootError(FatalCode::Incompatible, "snapshot truncated");
}

DecoderState SnapshotDecoder::feed(DecoderState s, const uint8_t *data,
                                   size_t len) {
  for (size_t i = 0; i < len && s.phase != DecodePhase::Done; i++) {
    uint8_t b = data[i];
    bool body = in_page_body(s.phase);

    switch (s.phase) {
    case DecodePhase::Header:
      header_byte(s, b);
      break;
    case DecodePhase::PageHeader1:
      s.page_length = b;
      s.phase = DecodePhase::PageHeader2;
      break;
    case DecodePhase::PageHeader2:
      s.page_length = (uint16_t)(s.page_length | (b << 8));
      s.phase = DecodePhase::PageHeader3;
      break;
    case DecodePhase::PageHeader3:
      begin_page(s, b);
      break;
    case DecodePhase::Verbatim:
      s.bytes_remaining--;
      emit(s, b);
      break;
    case DecodePhase::Compressed:
      s.bytes_remaining--;
      if (b == kZ80Escape) {
        s.pending_escapes = 1;
        s.phase = DecodePhase::EscapeSeen;
      } else {
        emit(s, b);
      }
      break;
    case DecodePhase::EscapeSeen:
      s.bytes_remaining--;
      if (b == kZ80Escape) {
        s.pending_escapes = 2;
        s.phase = DecodePhase::RepeatCount;
      } else {
        // a lone 0xED is literal, and so is the byte after it
        s.pending_escapes = 0;
        s.phase = DecodePhase::Compressed;
        emit(s, kZ80Escape);
        if (s.phase != DecodePhase::Done)
          emit(s, b);
      }
      break;
    case DecodePhase::RepeatCount:
      s.bytes_remaining--;
      s.repeat_count = b;
      s.phase = DecodePhase::RepeatValue;
      break;
    case DecodePhase::RepeatValue:
      s.bytes_remaining--;
      s.pending_escapes = 0;
      s.phase = DecodePhase::Compressed;
      for (; s.repeat_count > 0 && s.phase != DecodePhase::Done;
           s.repeat_count--)
        emit(s, b);
      s.repeat_count = 0;
      break;
    case DecodePhase::Done:
      break;
    }

    if (body && s.phase != DecodePhase::Done && s.bytes_remaining == 0)
      end_page(s);
  }
  return s;
}

void SnapshotDecoder::header_byte(DecoderState &s, uint8_t b) {
  s.header_bytes[s.header_fill++] = b;
  if (s.header_fill < s.header_need)
    return;

  if (s.header_need == kZ80HeaderV1Size) {
    if (!z80_header_is_v1(s.header_bytes.data())) {
      s.header_need = kZ80HeaderPrefixSize;
      return;
    }
  } else if (s.header_need == kZ80HeaderPrefixSize) {
    s.header_need = z80_header_length(s.header_bytes.data());
    return;
  }

  s.header = parse_z80_header(s.header_bytes.data(), s.header_fill);
  begin_body(s);
}

void SnapshotDecoder::begin_body(DecoderState &s) {
  const SnapshotHeader &h = s.header;
  s.kb_expected = h.expected_kilobytes();
  Logger::instance().log(
      LogLevel::INFO, "snapshot: v%d header, %u KB machine, PC=0x%04x",
      h.layout == HeaderLayout::V1 ? 1 : (h.layout == HeaderLayout::V2 ? 2 : 3),
      s.kb_expected, h.pc);

  if (h.paged()) {
    s.phase = DecodePhase::PageHeader1;
    return;
  }
  // one region covering 0x4000..0xFFFF, ended by output size
  s.write_pos = kScreenBase;
  s.output_remaining = kZ80V1BodySize;
  s.bytes_remaining = UINT32_MAX;
  s.phase = h.compressed ? DecodePhase::Compressed : DecodePhase::Verbatim;
}

void SnapshotDecoder::begin_page(DecoderState &s, uint8_t page_id) {
  if (page_id < kFirstPageId || page_id > kLastPageId)
    throw BootError(FatalCode::Incompatible,
                    "unsupported page id " + std::to_string(page_id));

  uint16_t base = kPagedBase;
  s.discard = false;
  if (page_id == kScreenPageId) {
    base = kScreenBase;
  } else if (s.header.hardware == HardwareClass::Spectrum16K) {
    s.discard = true;
  } else if (s.header.hardware == HardwareClass::Spectrum128K) {
    machine_.select_bank((uint8_t)(page_id - kFirstPageId));
  } else if (page_id == kPage48kMiddle) {
    base = kPage1Base;
  }

  s.write_pos = base;
  s.output_remaining = kPageSize;
  if (s.page_length == kZ80PageVerbatim) {
    s.bytes_remaining = kPageSize;
    s.phase = DecodePhase::Verbatim;
  } else {
    s.bytes_remaining = s.page_length;
    s.phase = DecodePhase::Compressed;
  }
  if (s.discard)
    Logger::instance().log(LogLevel::WARN,
                           "page %u skipped, 16K machine has no RAM for it",
                           page_id);
  else
    Logger::instance().log(LogLevel::DEBUG,
                           "page %u at 0x%04x, %s, %u encoded bytes", page_id,
                           base,
                           s.phase == DecodePhase::Verbatim ? "verbatim"
                                                            : "compressed",
                           (unsigned)s.bytes_remaining);
  if (s.bytes_remaining == 0)
    end_page(s);
}

void SnapshotDecoder::end_page(DecoderState &s) {
  if (s.phase == DecodePhase::RepeatCount ||
      s.phase == DecodePhase::RepeatValue)
    throw BootError(FatalCode::Incompatible, "repeat run cut by end of page");
  if (s.phase == DecodePhase::EscapeSeen) {
    s.phase = DecodePhase::Compressed;
    s.pending_escapes = 0;
    emit(s, kZ80Escape);
    if (s.phase == DecodePhase::Done)
      return;
  }
  evacuation_.flush();
  if (s.discard) {
    s.discard = false;
    s.phase = DecodePhase::PageHeader1;
    return;
  }

  s.pages_loaded++;
  if (s.output_remaining != 0)
    Logger::instance().log(LogLevel::WARN, "page decoded to %u bytes",
                           (unsigned)(kPageSize - s.output_remaining));
  if (s.pages_loaded >= s.header.expected_pages()) {
    complete(s);
    return;
  }
  s.phase = DecodePhase::PageHeader1;
}

void SnapshotDecoder::emit(DecoderState &s, uint8_t value) {
  if (s.output_remaining == 0)
    throw BootError(FatalCode::Incompatible, "page data exceeds 16K");
  if (s.discard) {
    s.write_pos++;
    s.output_remaining--;
    return;
  }

  if (evacuation_.covers(s.write_pos))
    evacuation_.store(s.write_pos, value);
  else
    machine_.write_memory(s.write_pos, value);
  s.write_pos++;
  s.output_remaining--;

  if ((s.write_pos & kKilobyteMask) == 0) {
    s.kb_loaded++;
    machine_.show_progress(s.kb_loaded, s.kb_expected);
    if (s.kb_loaded >= s.kb_expected) {
      if (s.header.paged())
        s.pages_loaded++;
      complete(s);
    }
  }
}

void SnapshotDecoder::complete(DecoderState &s) {
  evacuation_.flush();
  s.phase = DecodePhase::Done;
  Logger::instance().log(LogLevel::INFO, "snapshot decoded: %u KB, %u pages",
                         s.kb_loaded, s.pages_loaded);
}

} // namespace zxboot
