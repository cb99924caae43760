#pragma once
#include <cstdint>
#include "error.hpp"

namespace zxboot {

// Memory map of the target
constexpr uint16_t kPageSize      = 0x4000;
constexpr uint16_t kScreenBase    = 0x4000;
constexpr uint16_t kAttrBase      = 0x5800;
constexpr uint16_t kPage1Base     = 0x8000;
constexpr uint16_t kPagedBase     = 0xC000;

// I/O ports
constexpr uint16_t kPortUla        = 0x00FE;   // border colour, bits 0-2
constexpr uint16_t kPortMemcfg     = 0x7FFD;
constexpr uint16_t kPortMemcfgPlus = 0x1FFD;
constexpr uint16_t kPortAySelect   = 0xFFFD;
constexpr uint16_t kPortAyData     = 0xBFFD;

// 0x7FFD bits
constexpr uint8_t kMemcfgRomLo = 0x10;
constexpr uint8_t kMemcfgLock  = 0x20;
// 0x1FFD bits
constexpr uint8_t kMemcfgPlusRomHi = 0x04;

struct RegisterSet {
    uint8_t  a{0};
    uint8_t  f{0};
    uint16_t bc{0};
    uint16_t de{0};
    uint16_t hl{0};
};

// The target machine as seen by the loader: paged memory, I/O ports, the
// CPU's register file and the boot UI.
class Machine {
public:
    virtual ~Machine() = default;

    virtual void write_memory(uint16_t addr, uint8_t value) = 0;
    virtual uint8_t read_memory(uint16_t addr) const = 0;
    // bank (0..7) to appear at 0xC000 while loading
    virtual void select_bank(uint8_t bank) = 0;
    virtual void out_port(uint16_t port, uint8_t value) = 0;

    virtual void disable_interrupts() = 0;
    virtual void set_interrupt_vector(uint8_t i) = 0;
    virtual void set_alternate_registers(const RegisterSet& regs) = 0;
    virtual void set_index_registers(uint16_t ix, uint16_t iy) = 0;
    virtual void set_interrupt_mode(uint8_t mode) = 0;
    virtual void set_main_registers(const RegisterSet& regs, uint16_t sp,
                                    uint8_t r) = 0;
    virtual void jump(uint16_t pc, bool enable_interrupts) = 0;

    virtual void show_progress(unsigned kb_loaded, unsigned kb_expected) = 0;
    virtual void halt(FatalCode code) = 0;
};

} // namespace zxboot
