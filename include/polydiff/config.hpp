#pragma once
#include "polydiff/equality.hpp"

#include <cstddef>
#include <filesystem>

namespace polydiff {

struct Options {
  EqualityPolicy policy;
  std::size_t reference_pane = 0;

  bool operator==(const Options &) const = default;
};

// Read <dir>/.polydiff (defaults for anything missing). Unknown keys are
// ignored; a malformed value throws std::runtime_error naming the key.
Options load_options(const std::filesystem::path& dir);

// Overwrite <dir>/.polydiff with every option
void save_options(const std::filesystem::path& dir, const Options& options);

} // namespace polydiff
