#pragma once
#include <array>
#include <string>
#include <vector>
#include "machine.hpp"

namespace zxboot {

// A 128K Spectrum reduced to what the loader touches: eight RAM banks
// behind the 0x7FFD/0x1FFD paging ports, the ULA border, the sound
// chip's register file and the CPU registers set by the context switch.
class EmulatedSpectrum : public Machine {
public:
    static constexpr unsigned kBanks = 8;
    // progress bar on the bottom attribute row
    static constexpr uint16_t kProgressRow = kAttrBase + 23 * 32;

    struct Cpu {
        RegisterSet main;
        RegisterSet alternate;
        uint16_t ix{0};
        uint16_t iy{0};
        uint16_t sp{0};
        uint16_t pc{0};
        uint8_t  i{0};
        uint8_t  r{0};
        uint8_t  im{0};
        bool     interrupts_enabled{true};
        bool     running{false};    // jump() was reached
    };

    EmulatedSpectrum();

    void write_memory(uint16_t addr, uint8_t value) override;
    uint8_t read_memory(uint16_t addr) const override;
    void select_bank(uint8_t bank) override;
    void out_port(uint16_t port, uint8_t value) override;

    void disable_interrupts() override;
    void set_interrupt_vector(uint8_t i) override;
    void set_alternate_registers(const RegisterSet& regs) override;
    void set_index_registers(uint16_t ix, uint16_t iy) override;
    void set_interrupt_mode(uint8_t mode) override;
    void set_main_registers(const RegisterSet& regs, uint16_t sp,
                            uint8_t r) override;
    void jump(uint16_t pc, bool enable_interrupts) override;

    void show_progress(unsigned kb_loaded, unsigned kb_expected) override;
    void halt(FatalCode code) override;

    const Cpu& cpu() const { return cpu_; }
    bool halted() const { return halted_; }
    uint8_t border() const { return border_; }
    uint8_t paged_bank() const { return paged_bank_; }
    uint8_t memcfg() const { return memcfg_; }
    uint8_t memcfg_plus() const { return memcfg_plus_; }
    uint8_t ay_select() const { return ay_select_; }
    const std::array<uint8_t, 16>& ay_registers() const { return ay_registers_; }
    const std::vector<uint8_t>& bank(unsigned n) const { return banks_.at(n); }

    std::string register_summary() const;
    // Writes banks 0..7 in order (128 KB). Returns false on I/O failure.
    bool dump(const std::string& path) const;
private:
    uint8_t bank_at(uint16_t addr) const;

    std::array<std::vector<uint8_t>, kBanks> banks_;
    Cpu cpu_;
    uint8_t paged_bank_{0};
    uint8_t memcfg_{0};
    uint8_t memcfg_plus_{0};
    bool    paging_locked_{false};
    uint8_t border_{7};
    uint8_t ay_select_{0};
    std::array<uint8_t, 16> ay_registers_{};
    bool    halted_{false};
};

} // namespace zxboot
