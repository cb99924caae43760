#include "../src/loader/snapshot_header.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace zxboot;
using namespace zxboot::test;

namespace {

SnapshotHeader parse(const std::vector<uint8_t>& h) {
    return parse_z80_header(h.data(), h.size());
}

void expect_incompatible(const std::vector<uint8_t>& h) {
    try {
        parse(h);
        FAIL() << "expected Incompatible";
    } catch (const BootError& e) {
        EXPECT_EQ(e.code(), FatalCode::Incompatible);
    }
}

} // namespace

TEST(SnapshotHeaderTests, ParsesVersion1Registers) {
    Z80Registers z;
    auto raw = make_z80_v1_header(z, true);
    EXPECT_TRUE(z80_header_is_v1(raw.data()));
    raw.resize(32);
    EXPECT_EQ(z80_header_length(raw.data()), kZ80HeaderV1Size);

    SnapshotHeader h = parse(make_z80_v1_header(z, true));
    EXPECT_EQ(h.layout, HeaderLayout::V1);
    EXPECT_FALSE(h.paged());
    EXPECT_TRUE(h.compressed);
    EXPECT_EQ(h.main.a, z.a);
    EXPECT_EQ(h.main.f, z.f);
    EXPECT_EQ(h.main.bc, z.bc);
    EXPECT_EQ(h.main.de, z.de);
    EXPECT_EQ(h.main.hl, z.hl);
    EXPECT_EQ(h.alternate.a, z.a_);
    EXPECT_EQ(h.alternate.f, z.f_);
    EXPECT_EQ(h.alternate.bc, z.bc_);
    EXPECT_EQ(h.alternate.de, z.de_);
    EXPECT_EQ(h.alternate.hl, z.hl_);
    EXPECT_EQ(h.ix, z.ix);
    EXPECT_EQ(h.iy, z.iy);
    EXPECT_EQ(h.sp, z.sp);
    EXPECT_EQ(h.pc, z.pc);
    EXPECT_EQ(h.i, z.i);
    EXPECT_TRUE(h.iff1);
    EXPECT_EQ(h.interrupt_mode, 1);
    EXPECT_EQ(h.hardware, HardwareClass::Spectrum48K);
    EXPECT_EQ(h.expected_kilobytes(), 48u);
}

TEST(SnapshotHeaderTests, SplitsFlagsIntoRefreshAndBorder) {
    Z80Registers z;
    z.r = 0xC5;
    z.border = 5;
    SnapshotHeader h = parse(make_z80_v1_header(z, false));
    EXPECT_EQ(h.r, 0xC5);
    EXPECT_EQ(h.border, 5);
    EXPECT_FALSE(h.compressed);

    z.r = 0x45;
    h = parse(make_z80_v1_header(z, false));
    EXPECT_EQ(h.r, 0x45);
}

TEST(SnapshotHeaderTests, FlagsAllOnesReadsAsOne) {
    auto raw = make_z80_v1_header(Z80Registers{}, true);
    raw[12] = 0xFF;
    SnapshotHeader h = parse(raw);
    EXPECT_EQ(h.r & 0x80, 0x80);
    EXPECT_EQ(h.border, 0);
    EXPECT_FALSE(h.compressed);
}

TEST(SnapshotHeaderTests, RejectsSamRom) {
    auto raw = make_z80_v1_header(Z80Registers{}, false);
    raw[12] |= 0x10;
    expect_incompatible(raw);
}

TEST(SnapshotHeaderTests, ExtendedHeaderTakesPcFromExtension) {
    Z80Registers z;
    z.pc = 0x6d2a;
    auto raw = make_z80_ext_header(z, 0, 54);
    EXPECT_FALSE(z80_header_is_v1(raw.data()));
    EXPECT_EQ(z80_header_length(raw.data()), 86u);
    SnapshotHeader h = parse(raw);
    EXPECT_EQ(h.layout, HeaderLayout::V3);
    EXPECT_TRUE(h.paged());
    EXPECT_EQ(h.pc, 0x6d2a);
    EXPECT_EQ(h.length, 86u);
    EXPECT_EQ(h.sp, z.sp);
}

TEST(SnapshotHeaderTests, AcceptsAllExtendedLengths) {
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 0, 23)).layout, HeaderLayout::V2);
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 0, 54)).length, 86u);
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 0, 55)).length, 87u);
}

TEST(SnapshotHeaderTests, RejectsUnknownExtendedLength) {
    auto raw = make_z80_ext_header(Z80Registers{}, 0, 40);
    expect_incompatible(raw);
}

TEST(SnapshotHeaderTests, ClassifiesVersion2Hardware) {
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 0, 23)).hardware, HardwareClass::Spectrum48K);
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 1, 23)).hardware, HardwareClass::Spectrum48K);
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 3, 23)).hardware, HardwareClass::Spectrum128K);
    EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, 4, 23)).hardware, HardwareClass::Spectrum128K);
    expect_incompatible(make_z80_ext_header(Z80Registers{}, 2, 23));
    expect_incompatible(make_z80_ext_header(Z80Registers{}, 5, 23));
}

TEST(SnapshotHeaderTests, ClassifiesVersion3Hardware) {
    for (uint8_t t : {0, 1, 3})
        EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, t)).hardware,
                  HardwareClass::Spectrum48K) << (int)t;
    for (uint8_t t : {4, 5, 6, 7, 8, 12, 13})
        EXPECT_EQ(parse(make_z80_ext_header(Z80Registers{}, t)).hardware,
                  HardwareClass::Spectrum128K) << (int)t;
    for (uint8_t t : {2, 9, 10, 11, 14, 128})
        expect_incompatible(make_z80_ext_header(Z80Registers{}, t));
}

TEST(SnapshotHeaderTests, ModifiedFlagMeans16K) {
    SnapshotHeader h = parse(make_z80_ext_header(Z80Registers{}, 0, 54, 0, 0x80));
    EXPECT_EQ(h.hardware, HardwareClass::Spectrum16K);
    EXPECT_EQ(h.expected_pages(), 1u);
    EXPECT_EQ(h.expected_kilobytes(), 16u);
}

TEST(SnapshotHeaderTests, Keeps128KPagingAndSoundState) {
    std::array<uint8_t, 16> ay{};
    for (size_t n = 0; n < ay.size(); n++)
        ay[n] = (uint8_t)(0xA0 + n);
    SnapshotHeader h = parse(make_z80_ext_header(Z80Registers{}, 4, 54, 0x17, 0, 0x0e, ay));
    EXPECT_EQ(h.hardware, HardwareClass::Spectrum128K);
    EXPECT_TRUE(h.has_sound_chip());
    EXPECT_EQ(h.memcfg, 0x17);
    EXPECT_EQ(h.ay_select, 0x0e);
    EXPECT_EQ(h.ay_registers, ay);
    EXPECT_EQ(h.expected_pages(), 8u);
    EXPECT_EQ(h.expected_kilobytes(), 128u);
}

TEST(SnapshotHeaderTests, Fixes48KPagingValue) {
    SnapshotHeader h = parse(make_z80_ext_header(Z80Registers{}, 3, 54, 0x07));
    EXPECT_EQ(h.hardware, HardwareClass::Spectrum48K);
    EXPECT_EQ(h.memcfg, kMemcfgRomLo | kMemcfgLock);
    EXPECT_FALSE(h.has_sound_chip());
}

TEST(SnapshotHeaderTests, ShortInputIsRejected) {
    auto raw = make_z80_ext_header(Z80Registers{}, 0, 54);
    raw.resize(60);
    expect_incompatible(raw);
}
