#pragma once

#include "core/types.hpp"
#include "core/fractional_index.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace arbor::blocks {

/**
 * BlockType - How the editing surface renders a block's text.
 */
enum class BlockType {
    Bullet,
    Code,
    Fence
};

[[nodiscard]] constexpr std::string_view type_name(BlockType type) {
    switch (type) {
        case BlockType::Bullet: return "bullet";
        case BlockType::Code: return "code";
        case BlockType::Fence: return "fence";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<BlockType> parse_type(std::string_view name) {
    if (name == "bullet") return BlockType::Bullet;
    if (name == "code") return BlockType::Code;
    if (name == "fence") return BlockType::Fence;
    return std::nullopt;
}

using Metadata = std::map<std::string, std::string>;

/**
 * Block - One node of a page outline.
 *
 * parent_id is empty for root-level blocks. order_weight sorts the block
 * among its siblings; blocks sharing a weight fall back to id order.
 */
struct Block {
    BlockId id;
    PageId page_id;
    std::optional<BlockId> parent_id;
    std::string content;
    FractionalIndex order_weight;
    bool is_collapsed = false;
    BlockType block_type = BlockType::Bullet;
    std::optional<std::string> language;
    Metadata metadata;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Block&) const = default;
};

/**
 * Payload of the "blocks changed" broadcast that follows every successful
 * mutation. Listeners must tolerate receiving the same record twice.
 */
struct BlocksChanged {
    std::vector<Block> updated_or_created;
    std::vector<BlockId> deleted_ids;

    [[nodiscard]] bool empty() const {
        return updated_or_created.empty() && deleted_ids.empty();
    }
};

/**
 * Sibling order: ascending weight, then id.
 */
[[nodiscard]] inline bool sibling_less(const Block& a, const Block& b) {
    if (a.order_weight != b.order_weight) {
        return a.order_weight < b.order_weight;
    }
    return a.id < b.id;
}

// ============================================================================
// Pure transformation functions
// ============================================================================

[[nodiscard]] inline Block with_content(Block block, std::string content) {
    block.content = std::move(content);
    block.updated_at = Timestamp::now();
    return block;
}

[[nodiscard]] inline Block with_placement(Block block,
                                          std::optional<BlockId> parent_id,
                                          FractionalIndex order_weight) {
    block.parent_id = std::move(parent_id);
    block.order_weight = std::move(order_weight);
    block.updated_at = Timestamp::now();
    return block;
}

[[nodiscard]] inline Block with_collapsed(Block block, bool collapsed) {
    block.is_collapsed = collapsed;
    block.updated_at = Timestamp::now();
    return block;
}

// ============================================================================
// Content helpers
// ============================================================================

/**
 * Largest offset <= offset that does not fall inside a UTF-8 sequence,
 * clamped to the content length. Cursor offsets are byte offsets.
 */
[[nodiscard]] inline size_t char_boundary(std::string_view content, size_t offset) {
    if (offset >= content.size()) return content.size();
    while (offset > 0 &&
           (static_cast<unsigned char>(content[offset]) & 0xC0) == 0x80) {
        --offset;
    }
    return offset;
}

/**
 * Split content at a cursor offset into the part that stays and the part
 * that moves to a new block.
 */
[[nodiscard]] inline std::pair<std::string, std::string> split_content(
    std::string_view content,
    size_t offset
) {
    auto at = char_boundary(content, offset);
    return {std::string(content.substr(0, at)), std::string(content.substr(at))};
}

} // namespace arbor::blocks
