#include "polydiff/file_io.hpp"

#include "polydiff/errors.hpp"
#include "polydiff/fs.hpp"
#include "polydiff/hash.hpp"

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>

namespace polydiff {

auto FileLoader::load(const std::string &source) -> LoadedContent {
  try {
    const auto bytes = fs::read_file(source);
    const std::string text(bytes.begin(), bytes.end());
    return LoadedContent{.lines = split_lines(text), .identity = content_identity(bytes)};
  } catch (const std::runtime_error &e) {
    throw LoadError(e.what());
  }
}

auto FileLoader::identity(const std::string &source) -> std::string {
  try {
    return content_identity(fs::read_file(source));
  } catch (const std::runtime_error &e) {
    throw LoadError(e.what());
  }
}

auto FilePersistence::save(const Pane &pane) -> std::string {
  const std::filesystem::path target = output_.empty() ? std::filesystem::path(pane.id) : output_;
  if (target.empty()) {
    throw SaveError("save: pane has no file name");
  }
  const std::string text = join_lines(pane.lines);
  try {
    fs::write_text_atomic(target, text);
  } catch (const std::runtime_error &e) {
    throw SaveError(e.what());
  }
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  return content_identity(std::span(data, text.size()));
}

} // namespace polydiff
