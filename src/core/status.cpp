// File: src/core/status.cpp
#include "solar/core/status.hpp"

namespace solar {

const char* to_string(Status::Code code) noexcept {
  using C = Status::Code;
  switch (code) {
    case C::kOk: return "ok";
    case C::kInvalidArgument: return "invalid_argument";
    case C::kOutOfRange: return "out_of_range";
    case C::kParseError: return "parse_error";
    case C::kNotFound: return "not_found";
    case C::kFailedPrecondition: return "failed_precondition";
    case C::kIoError: return "io_error";
    case C::kUnavailable: return "unavailable";
    case C::kUnsupported: return "unsupported";
    case C::kInternal: return "internal";
  }
  return "unknown";
}

}  // namespace solar
