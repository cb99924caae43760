#include "error.hpp"

namespace zxboot {

const char *fatal_code_name(FatalCode code) {
  switch (code) {
  case FatalCode::NoResponse:
    return "no response";
  case FatalCode::InvalidBootServer:
    return "invalid boot server";
  case FatalCode::Incompatible:
    return "incompatible snapshot";
  case FatalCode::FileNotFound:
    return "file not found";
  default:
    return "internal error";
  }
}

} // namespace zxboot
