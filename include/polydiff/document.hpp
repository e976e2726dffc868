#pragma once
#include "polydiff/alignment.hpp"
#include "polydiff/collaborators.hpp"
#include "polydiff/difference.hpp"
#include "polydiff/edit.hpp"
#include "polydiff/equality.hpp"
#include "polydiff/errors.hpp"
#include "polydiff/line.hpp"
#include "polydiff/undo.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <variant>
#include <vector>

namespace polydiff {

enum class DocumentState : std::uint8_t { Clean, Editing, Dirty };

// Commands accepted by Document::execute. Rows are grid rows of the
// current table; lines are indices into one pane.
namespace command {

// Replace `line_count` lines of `pane` starting at `first_line`.
struct Edit {
  std::size_t pane = 0;
  std::size_t first_line = 0;
  std::size_t line_count = 0;
  std::vector<std::string> content;
};

// Force the line of pane_a at row_a and the line of pane_b at row_b onto
// one row.
struct Pin {
  std::size_t pane_a = 0;
  std::size_t row_a = 0;
  std::size_t pane_b = 0;
  std::size_t row_b = 0;
};

// Remove the anchors whose rows include `row`.
struct Unpin {
  std::size_t row = 0;
};

// Align pane's lines in rows [first_row, last_row] against themselves only.
struct Isolate {
  std::size_t pane = 0;
  std::size_t first_row = 0;
  std::size_t last_row = 0;
};

struct RealignAll {};

struct Navigate {
  Direction direction = Direction::Next;
};

struct SelectBlock {
  std::size_t row = 0;
};

// Copy the current block from src into dst.
struct CopySelection {
  std::size_t src = 0;
  std::size_t dst = 0;
};

struct CopyInto {
  std::size_t src = 0;
  std::size_t dst = 0;
  std::size_t first_row = 0;
  std::size_t last_row = 0;
};

// Leftmost pane first, rightmost pane second, into `result`.
struct MergeFromLeftThenRight {
  std::size_t result = 0;
};

struct MergeFromRightThenLeft {
  std::size_t result = 0;
};

struct Undo {};
struct Redo {};
struct DismissAllEdits {};

struct SetEquality {
  EqualityPolicy policy;
};

struct SetReference {
  std::size_t pane = 0;
};

} // namespace command

using Command =
    std::variant<command::Edit, command::Pin, command::Unpin, command::Isolate,
                 command::RealignAll, command::Navigate, command::SelectBlock,
                 command::CopySelection, command::CopyInto, command::MergeFromLeftThenRight,
                 command::MergeFromRightThenLeft, command::Undo, command::Redo,
                 command::DismissAllEdits, command::SetEquality, command::SetReference>;

// What the presentation layer needs to refresh after a command.
struct ViewUpdate {
  RowSpan rows; // rows to redraw
  std::size_t total_rows = 0;
  std::optional<std::size_t> current_block;
  bool wrapped = false;
  DocumentState state = DocumentState::Clean;
  bool can_undo = false;
  bool can_redo = false;
};

struct CommandError {
  ErrorKind kind = ErrorKind::Range;
  std::string message;
};

class CommandResult {
public:
  CommandResult(ViewUpdate view) : value_(std::move(view)) {}
  CommandResult(CommandError error) : value_(std::move(error)) {}

  [[nodiscard]] bool ok() const { return std::holds_alternative<ViewUpdate>(value_); }
  [[nodiscard]] const ViewUpdate &view() const { return std::get<ViewUpdate>(value_); }
  [[nodiscard]] const CommandError &error() const { return std::get<CommandError>(value_); }

private:
  std::variant<ViewUpdate, CommandError> value_;
};

// Self-contained input of a full realignment, for hosts that run it away
// from the command loop. Document::publish drops the result when the
// document changed in the meantime.
struct RealignRequest {
  std::uint64_t revision = 0;
  std::vector<Pane> panes;
  std::vector<Anchor> anchors;
  EqualityPolicy policy;
};

// One comparison: owns its panes, alignment, difference blocks and
// history. Documents share nothing with each other.
class Document {
public:
  // Throws RangeError when `panes` is empty or `reference` is out of range.
  explicit Document(std::vector<Pane> panes, EqualityPolicy policy = {}, std::size_t reference = 0);

  // Loads every source through `loader`; LoadError propagates unchanged.
  static auto open(Loader &loader, const std::vector<std::string> &sources,
                   EqualityPolicy policy = {}) -> Document;

  // Runs one command. Errors come back as CommandError; on error the
  // document is unchanged.
  auto execute(const Command &cmd) -> CommandResult;

  // Commands between begin_edit and commit_edit undo as one step.
  void begin_edit(std::string label);
  auto commit_edit() -> CommandResult;

  // Hands the pane to `persistence`; the pane counts as saved only once
  // that returns.
  auto save(std::size_t pane, Persistence &persistence) -> CommandResult;

  // Replaces a pane with a revision fetched from version control. Clears
  // history and anchors.
  auto load_revision(std::size_t pane, VcsCollaborator &vcs, const std::string &path,
                     const std::string &revision) -> CommandResult;

  // True when the pane's source no longer has its load-time identity.
  // LoadError from `loader` propagates.
  [[nodiscard]] bool changed_externally(std::size_t pane, Loader &loader) const;

  [[nodiscard]] auto begin_realign() const -> RealignRequest;
  bool publish(const RealignRequest &request, AlignmentTable table);

  [[nodiscard]] const std::vector<Pane> &panes() const { return panes_; }
  [[nodiscard]] const AlignmentTable &table() const { return table_; }
  [[nodiscard]] const std::vector<DifferenceBlock> &blocks() const { return blocks_; }
  [[nodiscard]] const std::vector<Anchor> &anchors() const { return anchors_; }
  [[nodiscard]] std::optional<std::size_t> current_block() const { return current_; }
  [[nodiscard]] const EqualityPolicy &policy() const { return policy_; }
  [[nodiscard]] std::size_t reference() const { return reference_; }
  [[nodiscard]] const UndoStack &history() const { return history_; }
  [[nodiscard]] std::uint64_t revision() const { return revision_; }
  [[nodiscard]] auto state() const -> DocumentState;

private:
  auto handle(const command::Edit &cmd) -> ViewUpdate;
  auto handle(const command::Pin &cmd) -> ViewUpdate;
  auto handle(const command::Unpin &cmd) -> ViewUpdate;
  auto handle(const command::Isolate &cmd) -> ViewUpdate;
  auto handle(const command::RealignAll &cmd) -> ViewUpdate;
  auto handle(const command::Navigate &cmd) -> ViewUpdate;
  auto handle(const command::SelectBlock &cmd) -> ViewUpdate;
  auto handle(const command::CopySelection &cmd) -> ViewUpdate;
  auto handle(const command::CopyInto &cmd) -> ViewUpdate;
  auto handle(const command::MergeFromLeftThenRight &cmd) -> ViewUpdate;
  auto handle(const command::MergeFromRightThenLeft &cmd) -> ViewUpdate;
  auto handle(const command::Undo &cmd) -> ViewUpdate;
  auto handle(const command::Redo &cmd) -> ViewUpdate;
  auto handle(const command::DismissAllEdits &cmd) -> ViewUpdate;
  auto handle(const command::SetEquality &cmd) -> ViewUpdate;
  auto handle(const command::SetReference &cmd) -> ViewUpdate;

  // Applies a content change with incremental realignment and records it.
  auto commit_replace(LineReplace replace, const std::string &label) -> ViewUpdate;
  // Replaces the anchor list with full realignment and records it.
  auto commit_anchors(std::vector<Anchor> anchors, const std::string &label) -> ViewUpdate;

  void replay(const EditOperation &op);
  void realign_full();
  void refresh_blocks(std::optional<std::size_t> keep_row);
  void refresh_modified(std::size_t pane);
  void check_pane(std::size_t pane) const;
  void check_row(std::size_t row) const;

  [[nodiscard]] auto current_row() const -> std::optional<std::size_t>;
  [[nodiscard]] auto view(RowSpan rows, bool wrapped = false) const -> ViewUpdate;
  [[nodiscard]] auto whole_table() const -> RowSpan;

  std::vector<Pane> panes_;
  std::vector<LineSequence> original_;   // load-time content
  std::vector<std::string> saved_digest_; // content digest at load or last save
  std::vector<Anchor> anchors_;
  EqualityPolicy policy_;
  std::size_t reference_ = 0;
  AlignmentTable table_;
  std::vector<DifferenceBlock> blocks_;
  std::optional<std::size_t> current_;
  UndoStack history_;
  std::uint64_t revision_ = 0;
};

} // namespace polydiff
