#include "polydiff/line.hpp"

namespace polydiff {

LineSequence split_lines(std::string_view text) {
  LineSequence out;
  std::string cur;
  for (const char c : text) {
    if (c == consts::kLF) {
      out.push_back(Line{.text = std::move(cur), .origin = out.size(), .modified = false});
      cur.clear();
    } else {
      cur.push_back(c);
    }
  }
  if (!cur.empty()) {
    out.push_back(Line{.text = std::move(cur), .origin = out.size(), .modified = false});
  }
  return out;
}

LineSequence make_lines(const std::vector<std::string> &texts) {
  LineSequence out;
  out.reserve(texts.size());
  for (const auto &t : texts) {
    out.push_back(Line{.text = t, .origin = out.size(), .modified = false});
  }
  return out;
}

std::string join_lines(const LineSequence &lines) {
  std::string out;
  for (const auto &l : lines) {
    out += l.text;
    out.push_back(consts::kLF);
  }
  return out;
}

std::vector<std::string> line_texts(const LineSequence &lines) {
  std::vector<std::string> out;
  out.reserve(lines.size());
  for (const auto &l : lines)
    out.push_back(l.text);
  return out;
}

LineSequence edited_lines(const std::vector<std::string> &texts) {
  LineSequence out;
  out.reserve(texts.size());
  for (const auto &t : texts) {
    out.push_back(Line{.text = t, .origin = consts::kNoOrigin, .modified = true});
  }
  return out;
}

} // namespace polydiff
