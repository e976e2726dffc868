#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace polydiff::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Writes to "<p>.tmp" and renames over p.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, const std::string& text);

} // namespace polydiff::fs
