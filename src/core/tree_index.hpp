#pragma once

#include "core/block_types.hpp"
#include "core/result.hpp"

#include <optional>
#include <unordered_map>
#include <vector>

namespace arbor::blocks {

/**
 * Key of a sibling group: the parent block id, or nullopt for root level.
 */
using ParentKey = std::optional<BlockId>;

/**
 * Where a new block goes: under parent_id, directly after after_block_id
 * (or first when after_block_id is empty).
 */
struct InsertTarget {
    ParentKey parent_id;
    std::optional<BlockId> after_block_id;

    bool operator==(const InsertTarget&) const = default;
};

/**
 * One line of the visible projection of a page.
 */
struct VisibleRow {
    BlockId id;
    int depth = 0;
    bool has_children = false;

    bool operator==(const VisibleRow&) const = default;
};

/**
 * Weight for a block placed between two neighbours, either of which may be
 * missing. Tied neighbours (legal, broken by id) place the block after prev.
 */
[[nodiscard]] FractionalIndex weight_between(const FractionalIndex* prev,
                                             const FractionalIndex* next);

/**
 * Weight that places a block right after `after` among ordered siblings
 * (first when after is empty, last when after is not among them). The block
 * being placed must not be in the list.
 */
[[nodiscard]] FractionalIndex weight_after(const std::vector<const Block*>& siblings,
                                           const std::optional<BlockId>& after);

/**
 * TreeIndex - In-memory index of one page's blocks.
 *
 * blocks_by_id holds the records; children_by_parent is derived from it by
 * grouping on parent_id and sorting each group with sibling_less. Empty groups
 * are not stored. Only the engine mutates an index; everything else sees it
 * through a const reference.
 */
class TreeIndex {
public:
    using BlockMap = std::unordered_map<BlockId, Block>;
    using ChildMap = std::unordered_map<ParentKey, std::vector<BlockId>>;

    TreeIndex() = default;

    /**
     * Replace the whole index with the given flat block list.
     */
    void build(std::vector<Block> blocks);

    /**
     * Recompute only the named sibling groups from blocks_by_id.
     */
    void rebuild_for_parents(const std::vector<ParentKey>& keys);

    /**
     * Incrementally apply canonical records and deletions, re-sorting only
     * the groups they touch. Fails with an invariant error when the result
     * would leave a dangling parent reference; the index is still updated and
     * the caller is expected to reload.
     */
    [[nodiscard]] Result<void> apply(const std::vector<Block>& upserts,
                                     const std::vector<BlockId>& removals);

    void clear();

    // ------------------------------------------------------------------
    // Queries
    // ------------------------------------------------------------------

    [[nodiscard]] const Block* find(const BlockId& id) const;
    [[nodiscard]] bool contains(const BlockId& id) const { return find(id) != nullptr; }
    [[nodiscard]] size_t size() const noexcept { return blocks_by_id_.size(); }
    [[nodiscard]] bool empty() const noexcept { return blocks_by_id_.empty(); }

    [[nodiscard]] const BlockMap& blocks_by_id() const noexcept { return blocks_by_id_; }
    [[nodiscard]] const ChildMap& children_by_parent() const noexcept { return children_by_parent_; }

    /**
     * Ordered child ids of a parent (empty when it has none).
     */
    [[nodiscard]] const std::vector<BlockId>& children_of(const ParentKey& parent) const;
    [[nodiscard]] bool has_children(const BlockId& id) const;

    [[nodiscard]] std::optional<BlockId> first_root() const;
    [[nodiscard]] std::optional<BlockId> previous_sibling(const BlockId& id) const;
    [[nodiscard]] std::optional<BlockId> next_sibling(const BlockId& id) const;

    /**
     * Block rendered immediately above id: the deepest last expanded
     * descendant of the previous sibling, else the parent.
     */
    [[nodiscard]] std::optional<BlockId> previous_visible(const BlockId& id) const;

    /**
     * Block rendered immediately below id: the first child when expanded,
     * else the next sibling of the nearest ancestor that has one.
     */
    [[nodiscard]] std::optional<BlockId> next_visible(const BlockId& id) const;

    /**
     * Insert-below rule: first child of reference when it has children,
     * otherwise its next sibling.
     */
    [[nodiscard]] std::optional<InsertTarget> insert_below_target(const BlockId& reference) const;

    /**
     * Weight that places a block under parent right after `after` (or first),
     * ignoring the block being moved itself.
     */
    [[nodiscard]] FractionalIndex placement_weight(const ParentKey& parent,
                                                   const std::optional<BlockId>& after,
                                                   const std::optional<BlockId>& moving = std::nullopt) const;

    /**
     * id followed by all of its descendants, depth first.
     */
    [[nodiscard]] std::vector<BlockId> subtree(const BlockId& id) const;
    [[nodiscard]] bool is_ancestor(const BlockId& ancestor, const BlockId& id) const;
    [[nodiscard]] int depth_of(const BlockId& id) const;

    /**
     * Depth-first records of the whole page, ignoring collapse state.
     */
    [[nodiscard]] std::vector<Block> flatten() const;

    /**
     * Depth-first rows of the visible outline; collapsed subtrees are skipped.
     */
    [[nodiscard]] std::vector<VisibleRow> visible_rows() const;

    /**
     * Check every structural invariant. Expensive (linear), meant for tests
     * and debug verification after reconciliation.
     */
    [[nodiscard]] Result<void> verify() const;

private:
    void sort_group(std::vector<BlockId>& group) const;
    void detach(const BlockId& id, const ParentKey& parent);

    BlockMap blocks_by_id_;
    ChildMap children_by_parent_;
};

} // namespace arbor::blocks
