#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace polydiff {

enum class ErrorKind : std::uint8_t { Alignment, Range, Load, Save, Fetch, Cancelled };

auto error_kind_name(ErrorKind kind) -> const char *;

// Base of every error the library raises. Document converts these into
// CommandError values at its command boundary.
class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what) : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

// Anchors contradict each other or reference lines that do not exist.
// The caller keeps its previous table.
class AlignmentError : public Error {
public:
  explicit AlignmentError(const std::string &what) : Error(ErrorKind::Alignment, what) {}
};

// A selection or merge references rows without the content it needs.
class RangeError : public Error {
public:
  explicit RangeError(const std::string &what) : Error(ErrorKind::Range, what) {}
};

class LoadError : public Error {
public:
  explicit LoadError(const std::string &what) : Error(ErrorKind::Load, what) {}
};

class SaveError : public Error {
public:
  explicit SaveError(const std::string &what) : Error(ErrorKind::Save, what) {}
};

class FetchError : public Error {
public:
  explicit FetchError(const std::string &what) : Error(ErrorKind::Fetch, what) {}
};

// Raised when a stop was requested while computing an alignment.
class CancelledError : public Error {
public:
  CancelledError() : Error(ErrorKind::Cancelled, "alignment cancelled") {}
};

} // namespace polydiff
