#pragma once
#include "polydiff/collaborators.hpp"

#include <filesystem>
#include <string>
#include <utility>

namespace polydiff {

// Loads panes from files. Identity is the SHA-1 hex of the file bytes.
class FileLoader : public Loader {
public:
  auto load(const std::string &source) -> LoadedContent override;
  auto identity(const std::string &source) -> std::string override;
};

// Writes a pane back to the file named by its id, or to `output` when one
// is given.
class FilePersistence : public Persistence {
public:
  FilePersistence() = default;
  explicit FilePersistence(std::filesystem::path output) : output_(std::move(output)) {}

  auto save(const Pane &pane) -> std::string override;

private:
  std::filesystem::path output_;
};

} // namespace polydiff
