// File: src/core/status.cpp
#include "nm/core/status.hpp"

namespace nm {

const char* status_code_name(Status::Code code) noexcept {
  switch (code) {
    case Status::Code::kOk:
      return "ok";
    case Status::Code::kInvalidArgument:
      return "invalid_argument";
    case Status::Code::kOutOfRange:
      return "out_of_range";
    case Status::Code::kNotFound:
      return "not_found";
    case Status::Code::kIoError:
      return "io_error";
    case Status::Code::kParseError:
      return "parse_error";
    case Status::Code::kCorruptData:
      return "corrupt_data";
    case Status::Code::kUnsupported:
      return "unsupported";
    case Status::Code::kInternal:
      return "internal";
  }
  return "internal";
}

}  // namespace nm
