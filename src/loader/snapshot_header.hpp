#pragma once
#include <array>
#include <cstdint>
#include <cstddef>
#include "machine.hpp"

namespace zxboot {

// Version 1 header length; also the offset of the extended-length word.
constexpr size_t kZ80HeaderV1Size = 30;
// Bytes needed before the full header length is known.
constexpr size_t kZ80HeaderPrefixSize = 32;
// Largest header accepted (version 3 with the optional 0x7FFD copy).
constexpr size_t kZ80HeaderMaxSize = 32 + 55;

constexpr uint16_t kZ80PageVerbatim = 0xFFFF;
constexpr uint8_t  kZ80Escape = 0xED;

enum class HardwareClass : uint8_t { Spectrum16K, Spectrum48K, Spectrum128K };

enum class HeaderLayout : uint8_t {
    V1,     // implicit length, single 48K region
    V2,     // 23 extra bytes, paged body
    V3      // 54/55 extra bytes, paged body
};

// A parsed .z80 header. Both on-wire layouts normalize into this record;
// the shared flags byte is split into 'border' and bit 7 of 'r'.
struct SnapshotHeader {
    HeaderLayout  layout{HeaderLayout::V1};
    size_t        length{kZ80HeaderV1Size};
    RegisterSet   main;
    RegisterSet   alternate;
    uint16_t      ix{0};
    uint16_t      iy{0};
    uint16_t      sp{0};
    uint16_t      pc{0};        // final PC for both layouts
    uint8_t       i{0};
    uint8_t       r{0};         // all 8 bits
    uint8_t       border{0};
    bool          iff1{false};
    bool          iff2{false};
    uint8_t       interrupt_mode{0};
    bool          compressed{false};   // V1 body only
    HardwareClass hardware{HardwareClass::Spectrum48K};
    uint8_t       memcfg{0};           // value for port 0x7FFD
    uint8_t       ay_select{0};        // value for port 0xFFFD
    std::array<uint8_t, 16> ay_registers{};

    bool paged() const { return layout != HeaderLayout::V1; }
    bool has_sound_chip() const { return hardware == HardwareClass::Spectrum128K; }
    // number of 16K pages the body carries for this hardware class
    unsigned expected_pages() const;
    unsigned expected_kilobytes() const;
};

// True if the first kZ80HeaderV1Size bytes are a complete version 1 header.
bool z80_header_is_v1(const uint8_t* data);

// Total header length implied by the first kZ80HeaderPrefixSize bytes.
// Throws BootError(Incompatible) for unknown extended lengths.
size_t z80_header_length(const uint8_t* prefix);

// Parses a complete header of z80_header_length() bytes.
// Throws BootError(Incompatible) for snapshots this loader cannot run.
SnapshotHeader parse_z80_header(const uint8_t* data, size_t len);

} // namespace zxboot
