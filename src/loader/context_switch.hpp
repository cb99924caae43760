#pragma once
#include "evacuation.hpp"
#include "machine.hpp"
#include "snapshot_header.hpp"

namespace zxboot {

// Final transfer of control into a decoded snapshot. prepare() copies what
// the last steps need into a scratch area while the header is still
// reachable; execute() runs at most once.
class ContextSwitch {
public:
    ContextSwitch(Machine& machine, EvacuationBuffer& evacuation);

    void prepare(const SnapshotHeader& header);
    // Throws BootError(Internal) if not prepared or already executed.
    void execute();

    bool prepared() const { return prepared_; }
    bool executed() const { return executed_; }
private:
    // Restored after the evacuation region is back in place.
    struct Scratch {
        RegisterSet main;
        uint16_t    sp{0};
        uint8_t     r{0};
        uint16_t    pc{0};
        bool        iff1{false};
    };

    void program_paging();
    void restore_sound_chip();

    Machine& machine_;
    EvacuationBuffer& evacuation_;
    SnapshotHeader header_;
    Scratch scratch_;
    bool prepared_{false};
    bool executed_{false};
};

} // namespace zxboot
