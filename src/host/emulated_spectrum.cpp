#include "emulated_spectrum.hpp"
#include "logging.hpp"
#include <cstdio>
#include <fstream>

namespace zxboot {

namespace {
constexpr uint8_t kFixedBankScreen = 5;   // 0x4000
constexpr uint8_t kFixedBankMiddle = 2;   // 0x8000
constexpr uint8_t kBankMask = 0x07;
constexpr uint8_t kProgressDone = 0x20;   // green paper
constexpr uint8_t kProgressTodo = 0x38;   // white paper
} // namespace

EmulatedSpectrum::EmulatedSpectrum() {
  for (auto &b : banks_)
    b.assign(kPageSize, 0);
}

uint8_t EmulatedSpectrum::bank_at(uint16_t addr) const {
  if (addr < kPage1Base)
    return kFixedBankScreen;
  if (addr < kPagedBase)
    return kFixedBankMiddle;
  return paged_bank_;
}

void EmulatedSpectrum::write_memory(uint16_t addr, uint8_t value) {
  if (addr < kScreenBase) {
    Logger::instance().log(LogLevel::TRACE, "write to ROM at 0x%04x ignored",
                           addr);
    return;
  }
  banks_[bank_at(addr)][addr & (kPageSize - 1)] = value;
}

uint8_t EmulatedSpectrum::read_memory(uint16_t addr) const {
  if (addr < kScreenBase)
    return 0xFF;
  return banks_[bank_at(addr)][addr & (kPageSize - 1)];
}

void EmulatedSpectrum::select_bank(uint8_t bank) {
  paged_bank_ = bank & kBankMask;
}

void EmulatedSpectrum::out_port(uint16_t port, uint8_t value) {
  switch (port) {
  case kPortUla:
    border_ = value & 0x07;
    break;
  case kPortMemcfg:
    if (paging_locked_) {
      Logger::instance().log(LogLevel::WARN, "0x7FFD write while locked");
      break;
    }
    memcfg_ = value;
    paged_bank_ = value & kBankMask;
    paging_locked_ = (value & kMemcfgLock) != 0;
    break;
  case kPortMemcfgPlus:
    memcfg_plus_ = value;
    break;
  case kPortAySelect:
    ay_select_ = value;
    break;
  case kPortAyData:
    ay_registers_[ay_select_ & 0x0F] = value;
    break;
  default:
    Logger::instance().log(LogLevel::DEBUG, "unhandled OUT (0x%04x), 0x%02x",
                           port, value);
    break;
  }
}

void EmulatedSpectrum::disable_interrupts() { cpu_.interrupts_enabled = false; }
void EmulatedSpectrum::set_interrupt_vector(uint8_t i) { cpu_.i = i; }
void EmulatedSpectrum::set_alternate_registers(const RegisterSet &regs) {
  cpu_.alternate = regs;
}
void EmulatedSpectrum::set_index_registers(uint16_t ix, uint16_t iy) {
  cpu_.ix = ix;
  cpu_.iy = iy;
}
void EmulatedSpectrum::set_interrupt_mode(uint8_t mode) { cpu_.im = mode; }

void EmulatedSpectrum::set_main_registers(const RegisterSet &regs, uint16_t sp,
                                          uint8_t r) {
  cpu_.main = regs;
  cpu_.sp = sp;
  cpu_.r = r;
}

void EmulatedSpectrum::jump(uint16_t pc, bool enable_interrupts) {
  cpu_.pc = pc;
  cpu_.interrupts_enabled = enable_interrupts;
  cpu_.running = true;
}

void EmulatedSpectrum::show_progress(unsigned kb_loaded, unsigned kb_expected) {
  if (kb_expected == 0)
    return;
  unsigned filled = kb_loaded * 32 / kb_expected;
  for (unsigned col = 0; col < 32; col++)
    write_memory((uint16_t)(kProgressRow + col),
                 col < filled ? kProgressDone : kProgressTodo);
  if (kb_loaded % 16 == 0 || kb_loaded == kb_expected)
    Logger::instance().log(LogLevel::INFO, "loaded %u of %u KB", kb_loaded,
                           kb_expected);
}

void EmulatedSpectrum::halt(FatalCode code) {
  halted_ = true;
  cpu_.running = false;
  Logger::instance().log(LogLevel::ERROR, "target halted, border %u (%s)",
                         (unsigned)code, fatal_code_name(code));
}

std::string EmulatedSpectrum::register_summary() const {
  char buf[256];
  std::snprintf(
      buf, sizeof(buf),
      "PC=%04x SP=%04x AF=%02x%02x BC=%04x DE=%04x HL=%04x "
      "AF'=%02x%02x BC'=%04x DE'=%04x HL'=%04x IX=%04x IY=%04x "
      "I=%02x R=%02x IM%u %s 7FFD=%02x 1FFD=%02x border=%u",
      cpu_.pc, cpu_.sp, cpu_.main.a, cpu_.main.f, cpu_.main.bc, cpu_.main.de,
      cpu_.main.hl, cpu_.alternate.a, cpu_.alternate.f, cpu_.alternate.bc,
      cpu_.alternate.de, cpu_.alternate.hl, cpu_.ix, cpu_.iy, cpu_.i, cpu_.r,
      cpu_.im, cpu_.interrupts_enabled ? "EI" : "DI", memcfg_, memcfg_plus_,
      border_);
  return buf;
}

bool EmulatedSpectrum::dump(const std::string &path) const {
  std::ofstream out(path, std::ios::binary);
  if (!out)
    return false;
  for (const auto &b : banks_)
    out.write(reinterpret_cast<const char *>(b.data()), (std::streamsize)b.size());
  return (bool)out;
}

} // namespace zxboot
