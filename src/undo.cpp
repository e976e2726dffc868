#include "polydiff/undo.hpp"

#include <utility>

namespace polydiff {

void UndoStack::push(Transaction transaction) {
  if (transaction.operations.empty())
    return;

  if (group_) {
    for (auto &op : transaction.operations)
      group_->operations.push_back(std::move(op));
    return;
  }

  // Clear the redo stack
  redo_.clear();
  undo_.push_back(std::move(transaction));
}

bool UndoStack::undo(const Replay &replay) {
  if (undo_.empty())
    return false;

  Transaction t = std::move(undo_.back());
  undo_.pop_back();
  for (auto it = t.operations.rbegin(); it != t.operations.rend(); ++it)
    replay(inverse(*it));
  redo_.push_back(std::move(t));
  return true;
}

bool UndoStack::redo(const Replay &replay) {
  if (redo_.empty())
    return false;

  Transaction t = std::move(redo_.back());
  redo_.pop_back();
  for (const auto &op : t.operations)
    replay(op);
  undo_.push_back(std::move(t));
  return true;
}

void UndoStack::begin_group(std::string label) {
  if (group_)
    return; // nested groups fold into the outer one
  group_ = Transaction{.label = std::move(label), .operations = {}};
}

bool UndoStack::end_group() {
  if (!group_)
    return false;
  Transaction t = std::move(*group_);
  group_.reset();
  const bool recorded = !t.operations.empty();
  push(std::move(t));
  return recorded;
}

void UndoStack::clear() {
  undo_.clear();
  redo_.clear();
  group_.reset();
}

} // namespace polydiff
