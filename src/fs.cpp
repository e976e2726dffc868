#include "polydiff/fs.hpp"

#include <fstream>
#include <stdexcept>

namespace polydiff::fs {

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) {
  if (!p.has_parent_path())
    return;
  std::error_code ec;
  std::filesystem::create_directories(p.parent_path(), ec);
  if (ec)
    throw std::runtime_error("mkdir -p failed: " + ec.message());
}

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) {
    throw std::runtime_error("open for read failed: " + p.string());
  }
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0)
    throw std::runtime_error("not a regular file: " + p.string());
  auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw std::runtime_error("read failed: " + p.string());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp";
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw std::runtime_error("open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs)
      throw std::runtime_error("flush temp failed: " + tmp.string());
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    // some filesystems refuse to rename over an existing file
    std::filesystem::remove(p, ec);
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      std::filesystem::remove(tmp, ec);
      throw std::runtime_error("atomic replace failed: " + p.string());
    }
  }
}

void write_text_atomic(const std::filesystem::path &p, const std::string &text) {
  const auto *data = reinterpret_cast<const std::uint8_t *>(text.data());
  write_file_atomic(p, std::span(data, text.size()));
}

} // namespace polydiff::fs
