#pragma once
#include "polydiff/alignment.hpp"
#include "polydiff/equality.hpp"
#include "polydiff/line.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace polydiff {

enum class RowKind : std::uint8_t {
  Same,     // every pane has a line and all are equal
  Changed,  // all panes present but unequal
  Inserted, // reference pane has a gap
  Deleted   // reference pane has a line, some other pane a gap
};

struct DifferenceBlock {
  std::size_t first_row = 0;
  std::size_t row_count = 0;
  RowKind kind = RowKind::Changed; // common kind of its rows, Changed when mixed

  [[nodiscard]] auto last_row() const -> std::size_t { return first_row + row_count - 1; }
  [[nodiscard]] auto rows() const -> RowSpan { return RowSpan{.first = first_row, .count = row_count}; }

  bool operator==(const DifferenceBlock &) const = default;
};

auto classify_row(const AlignmentRow &row, std::span<const Pane> panes,
                  const EqualityPolicy &policy, std::size_t reference) -> RowKind;

// Maximal runs of non-Same rows, in row order.
auto classify(const AlignmentTable &table, std::span<const Pane> panes,
              const EqualityPolicy &policy, std::size_t reference)
    -> std::vector<DifferenceBlock>;

enum class Direction : std::uint8_t { First, Previous, Next, Last };

struct Navigation {
  std::optional<std::size_t> block; // index into the block list
  bool wrapped = false;             // continued from the opposite end
};

auto navigate(const std::vector<DifferenceBlock> &blocks, std::optional<std::size_t> current,
              Direction direction) -> Navigation;

auto block_at_row(const std::vector<DifferenceBlock> &blocks, std::size_t row)
    -> std::optional<std::size_t>;

auto row_kind_name(RowKind kind) -> const char *;

} // namespace polydiff
