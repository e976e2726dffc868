#pragma once
#include "polydiff/edit.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace polydiff {

// Undo/redo history of one document. Transactions are replayed through a
// callback; the stack never touches document state itself.
class UndoStack {
public:
  // Called once per operation, in replay order.
  using Replay = std::function<void(const EditOperation &)>;

  // Record an already applied transaction. Clears the redo side. While a
  // group is open the operations join the group instead.
  void push(Transaction transaction);

  // Replays the inverses of the last transaction in reverse order and
  // moves it to the redo side. Returns false (and does nothing) if empty.
  bool undo(const Replay &replay);

  // Replays the last undone transaction forward.
  bool redo(const Replay &replay);

  // Operations pushed until end_group() form one transaction.
  void begin_group(std::string label);
  // Closes the group; returns true if it recorded anything.
  bool end_group();
  [[nodiscard]] bool grouping() const { return group_.has_value(); }

  [[nodiscard]] bool can_undo() const { return !undo_.empty(); }
  [[nodiscard]] bool can_redo() const { return !redo_.empty(); }
  [[nodiscard]] auto undo_size() const -> std::size_t { return undo_.size(); }
  [[nodiscard]] auto redo_size() const -> std::size_t { return redo_.size(); }
  [[nodiscard]] const std::vector<Transaction> &applied() const { return undo_; }

  void clear();

private:
  std::vector<Transaction> undo_, redo_;
  std::optional<Transaction> group_;
};

} // namespace polydiff
