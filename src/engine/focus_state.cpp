#include "engine/focus_state.hpp"

#include <algorithm>

namespace arbor::engine {

bool FocusState::focus(const BlockId& id, std::optional<size_t> cursor_offset) {
    if (focused_ == id && cursor_ == cursor_offset) {
        return false;
    }
    focused_ = id;
    cursor_ = cursor_offset;
    return true;
}

bool FocusState::clear() {
    if (!focused_ && !cursor_) {
        return false;
    }
    focused_.reset();
    cursor_.reset();
    return true;
}

std::optional<size_t> FocusState::take_target_cursor() {
    auto out = cursor_;
    cursor_.reset();
    return out;
}

bool FocusState::rename(const BlockId& from, const BlockId& to) {
    std::replace(selection_.begin(), selection_.end(), from, to);
    if (!is_focused(from)) {
        return false;
    }
    focused_ = to;
    return true;
}

bool FocusState::forget(const std::vector<BlockId>& deleted) {
    std::erase_if(selection_, [&](const BlockId& id) {
        return std::find(deleted.begin(), deleted.end(), id) != deleted.end();
    });

    if (focused_ && std::find(deleted.begin(), deleted.end(), *focused_) != deleted.end()) {
        focused_.reset();
        cursor_.reset();
        return true;
    }
    return false;
}

void FocusState::select(std::vector<BlockId> ids) {
    selection_ = std::move(ids);
}

void FocusState::toggle_selected(const BlockId& id) {
    auto it = std::find(selection_.begin(), selection_.end(), id);
    if (it == selection_.end()) {
        selection_.push_back(id);
    } else {
        selection_.erase(it);
    }
}

} // namespace arbor::engine
