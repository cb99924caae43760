#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace zxboot {

// Fatal conditions. The value is the border colour shown while halted.
enum class FatalCode : uint8_t {
    NoResponse        = 2,  // red
    InvalidBootServer = 3,  // magenta
    Incompatible      = 5,  // cyan
    FileNotFound      = 6,  // yellow
    Internal          = 7   // white
};

const char* fatal_code_name(FatalCode code);

class BootError : public std::runtime_error {
public:
    BootError(FatalCode code, const std::string& what)
        : std::runtime_error(what), code_(code) {}
    FatalCode code() const { return code_; }
private:
    FatalCode code_;
};

} // namespace zxboot
