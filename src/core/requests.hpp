#pragma once

#include "core/block_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace arbor::blocks {

/**
 * Requests understood by the persistence gateway. Optional fields that are
 * empty mean "leave unchanged" (updates) or "none" (placement).
 */

struct CreateBlockRequest {
    PageId page_id;
    std::optional<BlockId> parent_id;
    std::optional<BlockId> after_block_id;  // empty: first child of parent_id
    std::string content;
    BlockType block_type = BlockType::Bullet;
};

struct CreateBlocksBatchRequest {
    PageId page_id;
    std::optional<BlockId> parent_id;
    std::optional<BlockId> after_block_id;
    std::vector<std::string> contents;  // each block lands after the previous one
};

struct UpdateBlockRequest {
    BlockId id;
    std::optional<std::string> content;
    std::optional<Metadata> metadata;    // replaces the whole map
    std::optional<bool> is_collapsed;
    std::optional<BlockType> block_type;
    std::optional<std::string> language; // empty string clears it

    [[nodiscard]] bool has_changes() const {
        return content || metadata || is_collapsed || block_type || language;
    }
};

struct MoveBlockRequest {
    BlockId id;
    std::optional<BlockId> new_parent_id;
    std::optional<BlockId> after_block_id;  // empty: first child of new_parent_id
};

} // namespace arbor::blocks
