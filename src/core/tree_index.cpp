#include "core/tree_index.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>

namespace arbor::blocks {

namespace {

const std::vector<BlockId>& empty_group() {
    static const std::vector<BlockId> empty;
    return empty;
}

std::string describe(const ParentKey& key) {
    return key ? *key : std::string("<root>");
}

} // namespace

FractionalIndex weight_between(const FractionalIndex* prev, const FractionalIndex* next) {
    if (prev && next && !(*prev < *next)) {
        return prev->after();
    }
    return FractionalIndex::between(prev ? *prev : FractionalIndex{},
                                    next ? *next : FractionalIndex{});
}

FractionalIndex weight_after(const std::vector<const Block*>& siblings,
                             const std::optional<BlockId>& after) {
    if (!after) {
        return weight_between(nullptr, siblings.empty() ? nullptr : &siblings.front()->order_weight);
    }

    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [&](const Block* b) { return b->id == *after; });
    if (it == siblings.end()) {
        return weight_between(siblings.empty() ? nullptr : &siblings.back()->order_weight, nullptr);
    }
    auto next = std::next(it);
    return weight_between(&(*it)->order_weight,
                          next == siblings.end() ? nullptr : &(*next)->order_weight);
}

// ============================================================================
// Building
// ============================================================================

void TreeIndex::build(std::vector<Block> blocks) {
    clear();
    blocks_by_id_.reserve(blocks.size());
    for (auto& block : blocks) {
        auto id = block.id;
        blocks_by_id_.insert_or_assign(std::move(id), std::move(block));
    }
    for (const auto& [id, block] : blocks_by_id_) {
        children_by_parent_[block.parent_id].push_back(id);
    }
    for (auto& [key, group] : children_by_parent_) {
        sort_group(group);
    }
}

void TreeIndex::rebuild_for_parents(const std::vector<ParentKey>& keys) {
    std::set<ParentKey> wanted(keys.begin(), keys.end());
    for (const auto& key : wanted) {
        children_by_parent_.erase(key);
    }

    for (const auto& [id, block] : blocks_by_id_) {
        if (wanted.count(block.parent_id) > 0) {
            children_by_parent_[block.parent_id].push_back(id);
        }
    }

    for (const auto& key : wanted) {
        auto it = children_by_parent_.find(key);
        if (it != children_by_parent_.end()) {
            sort_group(it->second);
        }
    }
}

Result<void> TreeIndex::apply(const std::vector<Block>& upserts,
                              const std::vector<BlockId>& removals) {
    std::set<ParentKey> affected;

    for (const auto& id : removals) {
        auto it = blocks_by_id_.find(id);
        if (it == blocks_by_id_.end()) continue;
        affected.insert(it->second.parent_id);
        detach(id, it->second.parent_id);
        blocks_by_id_.erase(it);
    }

    for (const auto& block : upserts) {
        auto it = blocks_by_id_.find(block.id);
        if (it == blocks_by_id_.end()) {
            children_by_parent_[block.parent_id].push_back(block.id);
            blocks_by_id_.emplace(block.id, block);
        } else {
            if (it->second.parent_id != block.parent_id) {
                detach(block.id, it->second.parent_id);
                affected.insert(it->second.parent_id);
                children_by_parent_[block.parent_id].push_back(block.id);
            }
            it->second = block;
        }
        affected.insert(block.parent_id);
    }

    for (const auto& key : affected) {
        auto it = children_by_parent_.find(key);
        if (it == children_by_parent_.end()) continue;
        if (it->second.empty()) {
            children_by_parent_.erase(it);
        } else {
            sort_group(it->second);
        }
    }

    for (const auto& block : upserts) {
        if (block.parent_id && !blocks_by_id_.count(*block.parent_id)) {
            return Result<void>::err(Error::invariant(
                "block " + block.id + " references missing parent " + *block.parent_id));
        }
    }
    for (const auto& id : removals) {
        auto orphans = children_by_parent_.find(ParentKey{id});
        if (orphans != children_by_parent_.end() && !orphans->second.empty()) {
            return Result<void>::err(Error::invariant(
                "deleted block " + id + " still has children"));
        }
    }

    return Result<void>::ok();
}

void TreeIndex::clear() {
    blocks_by_id_.clear();
    children_by_parent_.clear();
}

void TreeIndex::sort_group(std::vector<BlockId>& group) const {
    std::sort(group.begin(), group.end(), [this](const BlockId& a, const BlockId& b) {
        return sibling_less(blocks_by_id_.at(a), blocks_by_id_.at(b));
    });
}

void TreeIndex::detach(const BlockId& id, const ParentKey& parent) {
    auto it = children_by_parent_.find(parent);
    if (it == children_by_parent_.end()) return;
    auto& group = it->second;
    group.erase(std::remove(group.begin(), group.end(), id), group.end());
}

// ============================================================================
// Queries
// ============================================================================

const Block* TreeIndex::find(const BlockId& id) const {
    auto it = blocks_by_id_.find(id);
    return it == blocks_by_id_.end() ? nullptr : &it->second;
}

const std::vector<BlockId>& TreeIndex::children_of(const ParentKey& parent) const {
    auto it = children_by_parent_.find(parent);
    return it == children_by_parent_.end() ? empty_group() : it->second;
}

bool TreeIndex::has_children(const BlockId& id) const {
    return !children_of(ParentKey{id}).empty();
}

std::optional<BlockId> TreeIndex::first_root() const {
    const auto& roots = children_of(std::nullopt);
    if (roots.empty()) return std::nullopt;
    return roots.front();
}

std::optional<BlockId> TreeIndex::previous_sibling(const BlockId& id) const {
    const auto* block = find(id);
    if (!block) return std::nullopt;
    const auto& siblings = children_of(block->parent_id);
    auto it = std::find(siblings.begin(), siblings.end(), id);
    if (it == siblings.end() || it == siblings.begin()) return std::nullopt;
    return *std::prev(it);
}

std::optional<BlockId> TreeIndex::next_sibling(const BlockId& id) const {
    const auto* block = find(id);
    if (!block) return std::nullopt;
    const auto& siblings = children_of(block->parent_id);
    auto it = std::find(siblings.begin(), siblings.end(), id);
    if (it == siblings.end() || std::next(it) == siblings.end()) return std::nullopt;
    return *std::next(it);
}

std::optional<BlockId> TreeIndex::previous_visible(const BlockId& id) const {
    const auto* block = find(id);
    if (!block) return std::nullopt;

    auto prev = previous_sibling(id);
    if (!prev) {
        return block->parent_id;
    }

    BlockId current = *prev;
    while (true) {
        const auto& current_block = blocks_by_id_.at(current);
        const auto& children = children_of(ParentKey{current});
        if (current_block.is_collapsed || children.empty()) break;
        current = children.back();
    }
    return current;
}

std::optional<BlockId> TreeIndex::next_visible(const BlockId& id) const {
    const auto* block = find(id);
    if (!block) return std::nullopt;

    const auto& children = children_of(ParentKey{id});
    if (!block->is_collapsed && !children.empty()) {
        return children.front();
    }

    BlockId current = id;
    while (true) {
        if (auto next = next_sibling(current)) {
            return next;
        }
        const auto& parent = blocks_by_id_.at(current).parent_id;
        if (!parent) return std::nullopt;
        current = *parent;
    }
}

std::optional<InsertTarget> TreeIndex::insert_below_target(const BlockId& reference) const {
    const auto* block = find(reference);
    if (!block) return std::nullopt;

    if (has_children(reference)) {
        return InsertTarget{.parent_id = reference, .after_block_id = std::nullopt};
    }
    return InsertTarget{.parent_id = block->parent_id, .after_block_id = reference};
}

FractionalIndex TreeIndex::placement_weight(const ParentKey& parent,
                                            const std::optional<BlockId>& after,
                                            const std::optional<BlockId>& moving) const {
    std::vector<const Block*> siblings;
    for (const auto& child : children_of(parent)) {
        if (moving && child == *moving) continue;
        siblings.push_back(&blocks_by_id_.at(child));
    }
    return weight_after(siblings, after);
}

std::vector<BlockId> TreeIndex::subtree(const BlockId& id) const {
    std::vector<BlockId> out;
    if (!contains(id)) return out;

    std::vector<BlockId> stack{id};
    while (!stack.empty()) {
        auto current = std::move(stack.back());
        stack.pop_back();
        const auto& children = children_of(ParentKey{current});
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.push_back(*it);
        }
        out.push_back(std::move(current));
    }
    return out;
}

bool TreeIndex::is_ancestor(const BlockId& ancestor, const BlockId& id) const {
    const auto* block = find(id);
    size_t steps = 0;
    while (block && block->parent_id && steps++ <= blocks_by_id_.size()) {
        if (*block->parent_id == ancestor) return true;
        block = find(*block->parent_id);
    }
    return false;
}

int TreeIndex::depth_of(const BlockId& id) const {
    int depth = 0;
    const auto* block = find(id);
    while (block && block->parent_id && depth <= static_cast<int>(blocks_by_id_.size())) {
        ++depth;
        block = find(*block->parent_id);
    }
    return depth;
}

std::vector<Block> TreeIndex::flatten() const {
    std::vector<Block> out;
    out.reserve(blocks_by_id_.size());
    for (const auto& root : children_of(std::nullopt)) {
        for (const auto& id : subtree(root)) {
            out.push_back(blocks_by_id_.at(id));
        }
    }
    return out;
}

std::vector<VisibleRow> TreeIndex::visible_rows() const {
    std::vector<VisibleRow> rows;
    std::vector<std::pair<BlockId, int>> stack;

    const auto& roots = children_of(std::nullopt);
    for (auto it = roots.rbegin(); it != roots.rend(); ++it) {
        stack.emplace_back(*it, 0);
    }

    while (!stack.empty()) {
        auto [id, depth] = stack.back();
        stack.pop_back();

        const auto& block = blocks_by_id_.at(id);
        const auto& children = children_of(ParentKey{id});
        rows.push_back(VisibleRow{.id = id, .depth = depth, .has_children = !children.empty()});

        if (block.is_collapsed) continue;
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(*it, depth + 1);
        }
    }
    return rows;
}

Result<void> TreeIndex::verify() const {
    std::unordered_set<BlockId> seen;

    for (const auto& [key, group] : children_by_parent_) {
        if (group.empty()) {
            return Result<void>::err(Error::invariant("empty group stored for " + describe(key)));
        }
        if (key && !blocks_by_id_.count(*key)) {
            return Result<void>::err(Error::invariant("children stored under missing parent " + *key));
        }
        for (size_t i = 0; i < group.size(); ++i) {
            auto it = blocks_by_id_.find(group[i]);
            if (it == blocks_by_id_.end()) {
                return Result<void>::err(Error::invariant("dangling child id " + group[i]));
            }
            if (it->second.parent_id != key) {
                return Result<void>::err(Error::invariant(
                    "block " + group[i] + " listed under " + describe(key) +
                    " but parented to " + describe(it->second.parent_id)));
            }
            if (!seen.insert(group[i]).second) {
                return Result<void>::err(Error::invariant("block " + group[i] + " listed twice"));
            }
            if (i > 0 && !sibling_less(blocks_by_id_.at(group[i - 1]), it->second)) {
                return Result<void>::err(Error::invariant(
                    "siblings out of order under " + describe(key)));
            }
        }
    }

    if (seen.size() != blocks_by_id_.size()) {
        return Result<void>::err(Error::invariant("some blocks are missing from their parent group"));
    }

    for (const auto& [id, block] : blocks_by_id_) {
        if (block.id != id) {
            return Result<void>::err(Error::invariant("record keyed as " + id + " has id " + block.id));
        }
        // A parent chain longer than the page has a cycle.
        const auto* current = &block;
        size_t steps = 0;
        while (current->parent_id) {
            if (++steps > blocks_by_id_.size()) {
                return Result<void>::err(Error::invariant("parent cycle through " + id));
            }
            current = find(*current->parent_id);
            if (!current) {
                return Result<void>::err(Error::invariant("orphaned block " + id));
            }
        }
    }

    return Result<void>::ok();
}

} // namespace arbor::blocks
