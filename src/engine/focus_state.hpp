#pragma once

#include "core/types.hpp"

#include <optional>
#include <vector>

namespace arbor::engine {

/**
 * FocusState - Which block the editing surface should edit, and where the
 * caret goes after a structural operation.
 *
 * target_cursor_offset is a one-shot request: the editing surface takes it
 * once after remounting the focused block, which clears it. While it is
 * pending, the engine's copy of the focused block wins over any draft.
 */
class FocusState {
public:
    [[nodiscard]] const std::optional<BlockId>& focused_block_id() const noexcept { return focused_; }
    [[nodiscard]] const std::optional<size_t>& target_cursor_offset() const noexcept { return cursor_; }
    [[nodiscard]] bool has_pending_cursor() const noexcept { return cursor_.has_value(); }
    [[nodiscard]] bool is_focused(const BlockId& id) const { return focused_ && *focused_ == id; }

    /**
     * Returns true when anything changed.
     */
    bool focus(const BlockId& id, std::optional<size_t> cursor_offset = std::nullopt);
    bool clear();

    [[nodiscard]] std::optional<size_t> take_target_cursor();

    /**
     * Follow a block whose id changed (temporary id confirmed).
     */
    bool rename(const BlockId& from, const BlockId& to);

    /**
     * Drop focus and selection entries for deleted blocks. Returns true
     * when the focused block was among them.
     */
    bool forget(const std::vector<BlockId>& deleted);

    // Multi-block selection, used by batch operations.
    [[nodiscard]] const std::vector<BlockId>& selection() const noexcept { return selection_; }
    void select(std::vector<BlockId> ids);
    void toggle_selected(const BlockId& id);
    void clear_selection() { selection_.clear(); }

private:
    std::optional<BlockId> focused_;
    std::optional<size_t> cursor_;
    std::vector<BlockId> selection_;
};

} // namespace arbor::engine
