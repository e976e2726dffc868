#pragma once
#include "polydiff/line.hpp"

#include <string>
#include <vector>

namespace polydiff {

// Services outside the engine that supply or consume pane content. Their
// failures are reported by throwing LoadError / FetchError / SaveError.

struct LoadedContent {
  LineSequence lines;
  std::string identity; // opaque; compared later to detect external changes
};

class Loader {
public:
  virtual ~Loader() = default;

  virtual auto load(const std::string &source) -> LoadedContent = 0;

  // Current identity of `source` without loading it.
  virtual auto identity(const std::string &source) -> std::string = 0;
};

struct Revision {
  std::string id;
  std::string summary;
};

class VcsCollaborator {
public:
  virtual ~VcsCollaborator() = default;

  virtual auto list_revisions(const std::string &path) -> std::vector<Revision> = 0;
  virtual auto fetch(const std::string &path, const std::string &revision) -> LineSequence = 0;
};

class Persistence {
public:
  virtual ~Persistence() = default;

  // Writes the pane's content; returns only once it is stored, with the
  // identity the stored content now has.
  virtual auto save(const Pane &pane) -> std::string = 0;
};

} // namespace polydiff
