#include <keyforge/logger.hpp>
#include <keyforge/undo_manager.hpp>

namespace keyforge
{

namespace
{

// Restores a bool on scope exit, even when the replayed function throws.
class ReplayScope
{
   public:
    explicit ReplayScope(bool& flag) : flag_(flag), previous_(flag) { flag_ = true; }
    ~ReplayScope() { flag_ = previous_; }

    ReplayScope(const ReplayScope&)            = delete;
    ReplayScope& operator=(const ReplayScope&) = delete;

   private:
    bool& flag_;
    bool  previous_;
};

}  // anonymous namespace

// ─── Push ────────────────────────────────────────────────────────────────────

void UndoManager::push(UndoAction action)
{
    if (replaying_)
        return;

    if (grouping_)
    {
        group_actions_.push_back(std::move(action));
        return;
    }
    push_collapsed(std::move(action));
}

void UndoManager::push_collapsed(UndoAction action)
{
    redo_stack_.clear();
    undo_stack_.push_back(std::move(action));

    if (undo_stack_.size() > MAX_STACK_SIZE)
        undo_stack_.erase(undo_stack_.begin());
}

// ─── Undo / Redo ─────────────────────────────────────────────────────────────

bool UndoManager::undo()
{
    if (undo_stack_.empty())
        return false;

    auto action = std::move(undo_stack_.back());
    undo_stack_.pop_back();
    KEYFORGE_LOG_DEBUG("anim.edit", "undo: {}", action.description);
    {
        ReplayScope scope(replaying_);
        if (action.undo_fn)
            action.undo_fn();
    }
    redo_stack_.push_back(std::move(action));
    return true;
}

bool UndoManager::redo()
{
    if (redo_stack_.empty())
        return false;

    auto action = std::move(redo_stack_.back());
    redo_stack_.pop_back();
    KEYFORGE_LOG_DEBUG("anim.edit", "redo: {}", action.description);
    {
        ReplayScope scope(replaying_);
        if (action.redo_fn)
            action.redo_fn();
    }
    undo_stack_.push_back(std::move(action));
    return true;
}

std::string UndoManager::undo_description() const
{
    return undo_stack_.empty() ? "" : undo_stack_.back().description;
}

std::string UndoManager::redo_description() const
{
    return redo_stack_.empty() ? "" : redo_stack_.back().description;
}

void UndoManager::clear()
{
    undo_stack_.clear();
    redo_stack_.clear();
    grouping_ = false;
    group_actions_.clear();
}

// ─── Grouping ────────────────────────────────────────────────────────────────

void UndoManager::begin_group(const std::string& description)
{
    grouping_          = true;
    group_description_ = description;
    group_actions_.clear();
}

void UndoManager::end_group()
{
    if (!grouping_)
        return;
    grouping_ = false;

    if (group_actions_.empty())
        return;

    auto actions = std::move(group_actions_);
    group_actions_.clear();

    UndoAction combined;
    combined.description = std::move(group_description_);
    combined.undo_fn     = [actions]()
    {
        for (auto it = actions.rbegin(); it != actions.rend(); ++it)
        {
            if (it->undo_fn)
                it->undo_fn();
        }
    };
    combined.redo_fn = [actions]()
    {
        for (const auto& a : actions)
        {
            if (a.redo_fn)
                a.redo_fn();
        }
    };
    push_collapsed(std::move(combined));
}

}  // namespace keyforge
