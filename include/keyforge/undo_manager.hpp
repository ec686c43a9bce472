#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace keyforge
{

// One undoable edit: `undo_fn` restores the state before the edit,
// `redo_fn` re-applies it.
struct UndoAction
{
    std::string           description;  // e.g. "Move key"
    std::function<void()> undo_fn;
    std::function<void()> redo_fn;
};

// Undo/redo history for key edits. Owned by the host and attached to an
// AnimationEngine with set_undo_manager(). Single-threaded, like the engine.
// Holds at most MAX_STACK_SIZE entries; the oldest entry is dropped first.
class UndoManager
{
   public:
    static constexpr size_t MAX_STACK_SIZE = 100;

    UndoManager()  = default;
    ~UndoManager() = default;

    UndoManager(const UndoManager&)            = delete;
    UndoManager& operator=(const UndoManager&) = delete;

    // Push an action and clear the redo stack. Ignored while an undo or redo
    // is being replayed.
    void push(UndoAction action);

    bool undo();
    bool redo();

    bool can_undo() const { return !undo_stack_.empty(); }
    bool can_redo() const { return !redo_stack_.empty(); }

    std::string undo_description() const;
    std::string redo_description() const;

    size_t undo_count() const { return undo_stack_.size(); }
    size_t redo_count() const { return redo_stack_.size(); }

    void clear();

    // Pushes between begin_group() and end_group() collapse into one action
    // (e.g. a multi-track drag).
    void begin_group(const std::string& description);
    void end_group();
    bool in_group() const { return grouping_; }

    bool is_replaying() const { return replaying_; }

   private:
    std::vector<UndoAction> undo_stack_;
    std::vector<UndoAction> redo_stack_;

    bool                    grouping_ = false;
    std::string             group_description_;
    std::vector<UndoAction> group_actions_;

    bool replaying_ = false;

    void push_collapsed(UndoAction action);
};

}  // namespace keyforge
