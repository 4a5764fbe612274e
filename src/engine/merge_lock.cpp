#include "engine/merge_lock.hpp"

namespace arbor::engine {

MergeLock::Guard::Guard(Guard&& other) noexcept
    : state_(std::move(other.state_)), ids_(std::move(other.ids_)) {
    other.ids_.clear();
}

MergeLock::Guard& MergeLock::Guard::operator=(Guard&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        ids_ = std::move(other.ids_);
        other.ids_.clear();
    }
    return *this;
}

void MergeLock::Guard::release() {
    if (ids_.empty()) {
        return;
    }
    if (auto state = state_.lock()) {
        for (const auto& id : ids_) {
            state->held.erase(id);
        }
    }
    ids_.clear();
    state_.reset();
}

std::optional<MergeLock::Guard> MergeLock::try_acquire(const BlockId& source,
                                                       const BlockId& target) {
    if (is_locked(source) || is_locked(target)) {
        return std::nullopt;
    }
    std::set<BlockId> ids{source, target};
    state_->held.insert(ids.begin(), ids.end());
    return Guard(state_, std::move(ids));
}

bool MergeLock::is_locked(const BlockId& id) const {
    return state_->held.contains(id);
}

} // namespace arbor::engine
