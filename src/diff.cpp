#include "polydiff/diff.hpp"

#include "polydiff/consts.hpp"
#include "polydiff/errors.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace polydiff::diff {

namespace {

// Linear-space Myers: split each problem at the middle snake of a forward
// and a backward search, marking every line outside the common subsequence.
class Comparer {
public:
  Comparer(std::span<const std::uint32_t> a, std::span<const std::uint32_t> b,
           const std::stop_token &stop)
      : changed_a(a.size(), false), changed_b(b.size(), false), a_(a), b_(b), stop_(stop),
        offset_(static_cast<int>(b.size()) + 1), fd_(a.size() + b.size() + 3),
        bd_(a.size() + b.size() + 3) {}

  void compare(int xoff, int xlim, int yoff, int ylim) {
    while (xoff < xlim && yoff < ylim && a_[xoff] == b_[yoff]) { ++xoff; ++yoff; }
    while (xlim > xoff && ylim > yoff && a_[xlim - 1] == b_[ylim - 1]) { --xlim; --ylim; }

    if (xoff == xlim) {
      while (yoff < ylim)
        changed_b[yoff++] = true;
    } else if (yoff == ylim) {
      while (xoff < xlim)
        changed_a[xoff++] = true;
    } else {
      const auto [xmid, ymid] = middle(xoff, xlim, yoff, ylim);
      compare(xoff, xmid, yoff, ymid);
      compare(xmid, xlim, ymid, ylim);
    }
  }

  std::vector<bool> changed_a;
  std::vector<bool> changed_b;

private:
  int &fd(int d) { return fd_[static_cast<std::size_t>(d + offset_)]; }
  int &bd(int d) { return bd_[static_cast<std::size_t>(d + offset_)]; }

  // Point (x, y) on an optimal path through [xoff, xlim) x [yoff, ylim).
  // Diagonal d holds the points with x - y == d.
  std::pair<int, int> middle(int xoff, int xlim, int yoff, int ylim) {
    const int dmin = xoff - ylim;
    const int dmax = xlim - yoff;
    const int fmid = xoff - yoff;
    const int bmid = xlim - ylim;
    int fmin = fmid, fmax = fmid;
    int bmin = bmid, bmax = bmid;
    const bool odd = ((fmid - bmid) & 1) != 0;

    fd(fmid) = xoff;
    bd(bmid) = xlim;
    for (;;) {
      if (stop_.stop_requested()) {
        throw CancelledError();
      }

      // forward search, one more edit on every diagonal
      if (fmin > dmin) fd(--fmin - 1) = -1; else ++fmin;
      if (fmax < dmax) fd(++fmax + 1) = -1; else --fmax;
      for (int d = fmax; d >= fmin; d -= 2) {
        const int tlo = fd(d - 1);
        const int thi = fd(d + 1);
        int x = tlo >= thi ? tlo + 1 : thi;
        int y = x - d;
        while (x < xlim && y < ylim && a_[x] == b_[y]) { ++x; ++y; }
        fd(d) = x;
        if (odd && bmin <= d && d <= bmax && bd(d) <= x)
          return {x, y};
      }

      // backward search
      if (bmin > dmin) bd(--bmin - 1) = std::numeric_limits<int>::max(); else ++bmin;
      if (bmax < dmax) bd(++bmax + 1) = std::numeric_limits<int>::max(); else --bmax;
      for (int d = bmax; d >= bmin; d -= 2) {
        const int tlo = bd(d - 1);
        const int thi = bd(d + 1);
        int x = tlo < thi ? tlo : thi - 1;
        int y = x - d;
        while (x > xoff && y > yoff && a_[x - 1] == b_[y - 1]) { --x; --y; }
        bd(d) = x;
        if (!odd && fmin <= d && d <= fmax && x <= fd(d))
          return {x, y};
      }
    }
  }

  std::span<const std::uint32_t> a_;
  std::span<const std::uint32_t> b_;
  const std::stop_token &stop_;
  int offset_;
  std::vector<int> fd_;
  std::vector<int> bd_;
};

// Lines of `from` whose key occurs somewhere in `other`. The rest can never
// be part of a common subsequence and are marked changed up front.
std::vector<std::size_t> matchable(std::span<const std::uint32_t> from,
                                   std::span<const std::uint32_t> other,
                                   std::vector<bool> &changed) {
  const std::unordered_set<std::uint32_t> present(other.begin(), other.end());
  std::vector<std::size_t> kept;
  kept.reserve(from.size());
  for (std::size_t i = 0; i < from.size(); ++i) {
    if (present.contains(from[i]))
      kept.push_back(i);
    else
      changed[i] = true;
  }
  return kept;
}

// Shortest edit script of the trimmed middle part; appends ops to `ops`.
// Within a run of changes deletions come before insertions.
void shortest_edit(std::span<const std::uint32_t> a, std::span<const std::uint32_t> b,
                   std::vector<Op> &ops, const std::stop_token &stop) {
  if (stop.stop_requested()) {
    throw CancelledError();
  }
  std::vector<bool> changed_a(a.size(), false);
  std::vector<bool> changed_b(b.size(), false);
  const auto real_a = matchable(a, b, changed_a);
  const auto real_b = matchable(b, a, changed_b);

  if (!real_a.empty() && !real_b.empty()) {
    std::vector<std::uint32_t> xa, xb;
    xa.reserve(real_a.size());
    xb.reserve(real_b.size());
    for (const std::size_t i : real_a)
      xa.push_back(a[i]);
    for (const std::size_t j : real_b)
      xb.push_back(b[j]);

    Comparer cmp(xa, xb, stop);
    cmp.compare(0, static_cast<int>(xa.size()), 0, static_cast<int>(xb.size()));
    for (std::size_t i = 0; i < real_a.size(); ++i)
      changed_a[real_a[i]] = cmp.changed_a[i];
    for (std::size_t j = 0; j < real_b.size(); ++j)
      changed_b[real_b[j]] = cmp.changed_b[j];
  }

  std::size_t i = 0;
  std::size_t j = 0;
  while (i < a.size() || j < b.size()) {
    if (i < a.size() && changed_a[i]) {
      ops.push_back(Op::Delete);
      ++i;
    } else if (j < b.size() && changed_b[j]) {
      ops.push_back(Op::Insert);
      ++j;
    } else {
      ops.push_back(Op::Keep);
      ++i;
      ++j;
    }
  }
}

struct Step {
  Op op;
  std::size_t a; // index into a before this step
  std::size_t b; // index into b before this step
};

} // namespace

std::vector<Op> myers(std::span<const std::uint32_t> a, std::span<const std::uint32_t> b,
                      const std::stop_token &stop) {
  std::size_t prefix = 0;
  while (prefix < a.size() && prefix < b.size() && a[prefix] == b[prefix])
    ++prefix;
  std::size_t suffix = 0;
  while (suffix < a.size() - prefix && suffix < b.size() - prefix &&
         a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix])
    ++suffix;

  std::vector<Op> ops;
  ops.reserve(a.size() + b.size());
  ops.insert(ops.end(), prefix, Op::Keep);
  shortest_edit(a.subspan(prefix, a.size() - prefix - suffix),
                b.subspan(prefix, b.size() - prefix - suffix), ops, stop);
  ops.insert(ops.end(), suffix, Op::Keep);
  return ops;
}

std::string unified_diff(const LineSequence &a, const LineSequence &b, std::string_view path_a,
                         std::string_view path_b, const EqualityPolicy &policy) {
  LineKeys keys(policy);
  std::vector<std::uint32_t> ka, kb;
  ka.reserve(a.size());
  kb.reserve(b.size());
  for (const auto &l : a)
    ka.push_back(keys.key(l.text));
  for (const auto &l : b)
    kb.push_back(keys.key(l.text));

  std::vector<Step> steps;
  std::size_t ia = 0;
  std::size_t ib = 0;
  for (const Op op : myers(ka, kb)) {
    steps.push_back(Step{.op = op, .a = ia, .b = ib});
    if (op != Op::Insert)
      ++ia;
    if (op != Op::Delete)
      ++ib;
  }

  if (std::ranges::all_of(steps, [](const Step &s) { return s.op == Op::Keep; }))
    return {}; // no hunks, no headers

  std::ostringstream out;
  out << "--- " << path_a << "\n";
  out << "+++ " << path_b << "\n";

  const std::size_t ctx = consts::kUnifiedContext;
  std::size_t i = 0;
  while (i < steps.size()) {
    while (i < steps.size() && steps[i].op == Op::Keep)
      ++i;
    if (i == steps.size())
      break;

    // grow the hunk while the next change is within 2*ctx unchanged lines
    const std::size_t start = i >= ctx ? i - ctx : 0;
    std::size_t end = i;
    std::size_t j = i;
    while (j < steps.size()) {
      if (steps[j].op != Op::Keep) {
        end = ++j;
        continue;
      }
      std::size_t run = j;
      while (run < steps.size() && steps[run].op == Op::Keep)
        ++run;
      if (run == steps.size() || run - j > 2 * ctx)
        break;
      j = run;
    }
    const std::size_t stop = std::min(steps.size(), end + ctx);

    std::size_t count_a = 0;
    std::size_t count_b = 0;
    for (std::size_t s = start; s < stop; ++s) {
      if (steps[s].op != Op::Insert)
        ++count_a;
      if (steps[s].op != Op::Delete)
        ++count_b;
    }
    const std::size_t first_a = steps[start].a + (count_a ? 1 : 0);
    const std::size_t first_b = steps[start].b + (count_b ? 1 : 0);
    out << "@@ -" << first_a << "," << count_a << " +" << first_b << "," << count_b << " @@\n";
    for (std::size_t s = start; s < stop; ++s) {
      switch (steps[s].op) {
      case Op::Keep:
        out << ' ' << a[steps[s].a].text << "\n";
        break;
      case Op::Delete:
        out << '-' << a[steps[s].a].text << "\n";
        break;
      case Op::Insert:
        out << '+' << b[steps[s].b].text << "\n";
        break;
      }
    }
    i = stop;
  }
  return out.str();
}

} // namespace polydiff::diff
