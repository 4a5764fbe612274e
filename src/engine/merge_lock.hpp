#pragma once

#include "core/types.hpp"

#include <memory>
#include <optional>
#include <set>

namespace arbor::engine {

/**
 * MergeLock - Marks the two blocks of a merge in progress.
 *
 * While a pair is held, content commits addressed to either id are
 * suppressed so a stale debounced write cannot clobber the merge result,
 * and a second merge on the same block is a no-op.
 *
 * Acquisition hands out a Guard; the lock is released when the guard is
 * released or destroyed, whichever comes first. Guards may outlive the
 * lock itself.
 */
class MergeLock {
    struct State {
        std::set<BlockId> held;
    };

public:
    class Guard {
    public:
        Guard() = default;
        ~Guard() { release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&& other) noexcept;

        [[nodiscard]] bool owns_lock() const noexcept { return !ids_.empty(); }

        /**
         * Release the held ids. Safe to call more than once.
         */
        void release();

    private:
        friend class MergeLock;
        Guard(std::weak_ptr<State> state, std::set<BlockId> ids)
            : state_(std::move(state)), ids_(std::move(ids)) {}

        std::weak_ptr<State> state_;
        std::set<BlockId> ids_;
    };

    MergeLock() : state_(std::make_shared<State>()) {}

    /**
     * Lock source and target together. Returns nullopt when either id is
     * already held.
     */
    [[nodiscard]] std::optional<Guard> try_acquire(const BlockId& source, const BlockId& target);

    [[nodiscard]] bool is_locked(const BlockId& id) const;
    [[nodiscard]] bool any_held() const { return !state_->held.empty(); }

private:
    std::shared_ptr<State> state_;
};

} // namespace arbor::engine
