#include "polydiff/edit.hpp"

#include "polydiff/errors.hpp"

#include <algorithm>
#include <utility>

namespace polydiff {

EditOperation inverse(const EditOperation &op) {
  if (const auto *r = std::get_if<LineReplace>(&op)) {
    return LineReplace{
        .pane = r->pane, .first = r->first, .removed = r->inserted, .inserted = r->removed};
  }
  const auto &a = std::get<AnchorChange>(op);
  return AnchorChange{.before = a.after, .after = a.before};
}

LineReplace trimmed(LineReplace replace) {
  auto &rm = replace.removed;
  auto &in = replace.inserted;
  std::size_t prefix = 0;
  while (prefix < rm.size() && prefix < in.size() && rm[prefix].text == in[prefix].text)
    ++prefix;
  std::size_t suffix = 0;
  while (suffix < rm.size() - prefix && suffix < in.size() - prefix &&
         rm[rm.size() - 1 - suffix].text == in[in.size() - 1 - suffix].text)
    ++suffix;

  rm.erase(rm.end() - static_cast<std::ptrdiff_t>(suffix), rm.end());
  in.erase(in.end() - static_cast<std::ptrdiff_t>(suffix), in.end());
  rm.erase(rm.begin(), rm.begin() + static_cast<std::ptrdiff_t>(prefix));
  in.erase(in.begin(), in.begin() + static_cast<std::ptrdiff_t>(prefix));
  replace.first += prefix;
  return replace;
}

void apply_replace(LineSequence &lines, const LineReplace &replace) {
  const std::size_t first = replace.first;
  const std::size_t count = replace.removed.size();
  if (first > lines.size() || count > lines.size() - first) {
    throw RangeError("replace: lines " + std::to_string(first) + "+" + std::to_string(count) +
                     " outside pane of " + std::to_string(lines.size()) + " lines");
  }
  if (!std::equal(replace.removed.begin(), replace.removed.end(),
                  lines.begin() + static_cast<std::ptrdiff_t>(first))) {
    throw RangeError("replace: pane content does not match the recorded lines");
  }
  const auto at = lines.erase(lines.begin() + static_cast<std::ptrdiff_t>(first),
                              lines.begin() + static_cast<std::ptrdiff_t>(first + count));
  lines.insert(at, replace.inserted.begin(), replace.inserted.end());
}

std::vector<Anchor> shift_anchors(const std::vector<Anchor> &anchors, const LineReplace &replace) {
  const std::size_t p = replace.pane;
  const std::size_t f = replace.first;
  const std::size_t old_end = f + replace.removed.size();
  const std::size_t new_end = f + replace.inserted.size();

  std::vector<Anchor> out;
  out.reserve(anchors.size());
  for (const Anchor &a : anchors) {
    Anchor moved = a;
    if (a.count[p] > 0) {
      if (a.begin[p] < old_end && a.end(p) > f)
        continue; // its lines are replaced
      if (a.begin[p] >= old_end)
        moved.begin[p] = a.begin[p] - old_end + new_end;
    } else if (a.begin[p] >= old_end) {
      moved.begin[p] = a.begin[p] - old_end + new_end;
    } else if (a.begin[p] > f) {
      moved.begin[p] = f;
    }
    out.push_back(std::move(moved));
  }
  return out;
}

} // namespace polydiff
