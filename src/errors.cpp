#include "polydiff/errors.hpp"

namespace polydiff {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Alignment:
    return "alignment";
  case ErrorKind::Range:
    return "range";
  case ErrorKind::Load:
    return "load";
  case ErrorKind::Save:
    return "save";
  case ErrorKind::Fetch:
    return "fetch";
  case ErrorKind::Cancelled:
    return "cancelled";
  }
  return "unknown";
}

} // namespace polydiff
