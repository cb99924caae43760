#include "context_switch.hpp"
#include "error.hpp"
#include "logging.hpp"

namespace zxboot {

ContextSwitch::ContextSwitch(Machine &machine, EvacuationBuffer &evacuation)
    : machine_(machine), evacuation_(evacuation) {}

void ContextSwitch::prepare(const SnapshotHeader &header) {
  header_ = header;
  scratch_.main = header.main;
  scratch_.sp = header.sp;
  scratch_.r = header.r;
  scratch_.pc = header.pc;
  scratch_.iff1 = header.iff1;
  prepared_ = true;
}

void ContextSwitch::program_paging() {
  uint8_t memcfg = kMemcfgRomLo | kMemcfgLock;
  uint8_t plus = kMemcfgPlusRomHi;
  if (header_.hardware == HardwareClass::Spectrum128K) {
    memcfg = header_.memcfg;
    plus = (memcfg & kMemcfgRomLo) ? kMemcfgPlusRomHi : 0;
  }
  // 0x1FFD first: 0x7FFD may set the lock bit
  machine_.out_port(kPortMemcfgPlus, plus);
  machine_.out_port(kPortMemcfg, memcfg);
}

void ContextSwitch::restore_sound_chip() {
  for (int reg = (int)header_.ay_registers.size() - 1; reg >= 0; reg--) {
    machine_.out_port(kPortAySelect, (uint8_t)reg);
    machine_.out_port(kPortAyData, header_.ay_registers[reg]);
  }
  machine_.out_port(kPortAySelect, header_.ay_select);
}

void ContextSwitch::execute() {
  if (!prepared_)
    throw BootError(FatalCode::Internal, "context switch not prepared");
  if (executed_)
    throw BootError(FatalCode::Internal, "context switch already executed");
  executed_ = true;

  Logger::instance().log(LogLevel::INFO,
                         "switching to snapshot: PC=0x%04x SP=0x%04x IM%u %s",
                         scratch_.pc, scratch_.sp, header_.interrupt_mode,
                         scratch_.iff1 ? "EI" : "DI");

  machine_.disable_interrupts();
  program_paging();
  if (header_.has_sound_chip())
    restore_sound_chip();
  machine_.set_interrupt_vector(header_.i);
  machine_.out_port(kPortUla, header_.border);
  machine_.set_alternate_registers(header_.alternate);
  machine_.set_index_registers(header_.ix, header_.iy);

  uint8_t im = 2;
  if (header_.interrupt_mode == 0)
    im = 0;
  else if (header_.interrupt_mode == 1)
    im = 1;
  machine_.set_interrupt_mode(im);

  evacuation_.restore();
  machine_.set_main_registers(scratch_.main, scratch_.sp, scratch_.r);
  machine_.jump(scratch_.pc, scratch_.iff1);
}

} // namespace zxboot
