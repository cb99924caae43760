#include "snapshot_header.hpp"
#include "error.hpp"
#include "util.hpp"

namespace zxboot {

namespace {

// byte offsets in the .z80 header
enum : size_t {
  OFF_A = 0,
  OFF_F = 1,
  OFF_BC = 2,
  OFF_HL = 4,
  OFF_PC = 6,
  OFF_SP = 8,
  OFF_I = 10,
  OFF_R = 11,
  OFF_FLAGS = 12,
  OFF_DE = 13,
  OFF_BC_P = 15,
  OFF_DE_P = 17,
  OFF_HL_P = 19,
  OFF_A_P = 21,
  OFF_F_P = 22,
  OFF_IY = 23,
  OFF_IX = 25,
  OFF_IFF1 = 27,
  OFF_IFF2 = 28,
  OFF_IM = 29,
  OFF_EXT_LENGTH = 30,
  OFF_EXT_PC = 32,
  OFF_HW_TYPE = 34,
  OFF_7FFD = 35,
  OFF_HW_MOD = 37,
  OFF_FFFD = 38,
  OFF_AY_REGS = 39
};

constexpr uint8_t kFlagR7 = 0x01;
constexpr uint8_t kFlagSamRom = 0x10;
constexpr uint8_t kFlagCompressed = 0x20;
constexpr uint8_t kHwModified = 0x80;

constexpr uint16_t kExtLengthV2 = 23;
constexpr uint16_t kExtLengthV3 = 54;
constexpr uint16_t kExtLengthV3Long = 55;

void incompatible(const char *why) {
  throw BootError(FatalCode::Incompatible, why);
}

HardwareClass classify(HeaderLayout layout, uint8_t hw_type, uint8_t hw_mod) {
  bool is48 = false;
  bool is128 = false;
  if (layout == HeaderLayout::V2) {
    is48 = hw_type == 0 || hw_type == 1;
    is128 = hw_type == 3 || hw_type == 4;
  } else {
    is48 = hw_type == 0 || hw_type == 1 || hw_type == 3;
    is128 = (hw_type >= 4 && hw_type <= 8) || hw_type == 12 || hw_type == 13;
  }
  if (is128)
    return HardwareClass::Spectrum128K;
  if (!is48)
    incompatible("unsupported hardware type");
  return (hw_mod & kHwModified) ? HardwareClass::Spectrum16K
                                : HardwareClass::Spectrum48K;
}

} // namespace

unsigned SnapshotHeader::expected_pages() const {
  switch (hardware) {
  case HardwareClass::Spectrum16K:
    return 1;
  case HardwareClass::Spectrum128K:
    return 8;
  default:
    return 3;
  }
}

unsigned SnapshotHeader::expected_kilobytes() const {
  return expected_pages() * (kPageSize / 1024);
}

bool z80_header_is_v1(const uint8_t *data) {
  return load_le16(data + OFF_PC) != 0;
}

size_t z80_header_length(const uint8_t *prefix) {
  if (z80_header_is_v1(prefix))
    return kZ80HeaderV1Size;
  uint16_t ext = load_le16(prefix + OFF_EXT_LENGTH);
  if (ext != kExtLengthV2 && ext != kExtLengthV3 && ext != kExtLengthV3Long)
    incompatible("unknown extended header length");
  return kZ80HeaderPrefixSize + ext;
}

SnapshotHeader parse_z80_header(const uint8_t *data, size_t len) {
  SnapshotHeader h;
  if (len < kZ80HeaderV1Size)
    incompatible("short snapshot header");

  h.main.a = data[OFF_A];
  h.main.f = data[OFF_F];
  h.main.bc = load_le16(data + OFF_BC);
  h.main.de = load_le16(data + OFF_DE);
  h.main.hl = load_le16(data + OFF_HL);
  h.alternate.a = data[OFF_A_P];
  h.alternate.f = data[OFF_F_P];
  h.alternate.bc = load_le16(data + OFF_BC_P);
  h.alternate.de = load_le16(data + OFF_DE_P);
  h.alternate.hl = load_le16(data + OFF_HL_P);
  h.ix = load_le16(data + OFF_IX);
  h.iy = load_le16(data + OFF_IY);
  h.sp = load_le16(data + OFF_SP);
  h.i = data[OFF_I];
  h.iff1 = data[OFF_IFF1] != 0;
  h.iff2 = data[OFF_IFF2] != 0;
  h.interrupt_mode = data[OFF_IM] & 0x03;

  // for compatibility, 0xFF in the flags byte means 1
  uint8_t flags = data[OFF_FLAGS];
  if (flags == 0xFF)
    flags = 0x01;
  h.r = (uint8_t)((data[OFF_R] & 0x7F) | ((flags & kFlagR7) << 7));
  h.border = (uint8_t)((flags >> 1) & 0x07);

  uint16_t pc = load_le16(data + OFF_PC);
  if (pc != 0) {
    if (flags & kFlagSamRom)
      incompatible("SamRom snapshot");
    h.layout = HeaderLayout::V1;
    h.length = kZ80HeaderV1Size;
    h.pc = pc;
    h.compressed = (flags & kFlagCompressed) != 0;
    h.hardware = HardwareClass::Spectrum48K;
    h.memcfg = kMemcfgRomLo | kMemcfgLock;
    return h;
  }

  if (len < kZ80HeaderPrefixSize)
    incompatible("short snapshot header");
  h.length = z80_header_length(data);
  if (len < h.length)
    incompatible("short snapshot header");
  h.layout = load_le16(data + OFF_EXT_LENGTH) == kExtLengthV2
                 ? HeaderLayout::V2
                 : HeaderLayout::V3;
  h.pc = load_le16(data + OFF_EXT_PC);
  h.hardware = classify(h.layout, data[OFF_HW_TYPE], data[OFF_HW_MOD]);

  if (h.hardware == HardwareClass::Spectrum128K) {
    h.memcfg = data[OFF_7FFD];
    h.ay_select = data[OFF_FFFD];
    for (size_t reg = 0; reg < h.ay_registers.size(); reg++)
      h.ay_registers[reg] = data[OFF_AY_REGS + reg];
  } else {
    h.memcfg = kMemcfgRomLo | kMemcfgLock;
  }
  return h;
}

} // namespace zxboot
