#pragma once

#include "storage/database.hpp"
#include "core/block_types.hpp"
#include "core/page.hpp"
#include "core/requests.hpp"
#include "core/result.hpp"

#include <optional>
#include <vector>

namespace arbor::storage {

/**
 * BlockStore - Authoritative block storage on SQLite.
 *
 * Implements the persistence side of every block operation synchronously:
 * each call validates its input against the stored tree, runs in a single
 * transaction and returns the canonical records. Missing or inconsistent
 * ids are validation errors; SQLite failures are persistence errors.
 */
class BlockStore {
public:
    explicit BlockStore(Database& db) : db_(db) {}

    // Pages
    [[nodiscard]] Result<Page> create_page(std::string title);
    [[nodiscard]] Result<std::vector<Page>> list_pages();
    [[nodiscard]] Result<Page> get_page(const PageId& id);

    // Blocks
    [[nodiscard]] Result<std::vector<blocks::Block>> load_page_blocks(const PageId& page_id);
    [[nodiscard]] Result<blocks::Block> get_block(const BlockId& id);

    [[nodiscard]] Result<blocks::Block> create_block(const blocks::CreateBlockRequest& request);
    [[nodiscard]] Result<std::vector<blocks::Block>> create_blocks_batch(
        const blocks::CreateBlocksBatchRequest& request);
    [[nodiscard]] Result<blocks::Block> update_block(const blocks::UpdateBlockRequest& request);

    /**
     * Delete a block and its whole subtree. Returns every destroyed id.
     * Refuses to remove the last remaining blocks of a page.
     */
    [[nodiscard]] Result<std::vector<BlockId>> delete_block(const BlockId& id);

    [[nodiscard]] Result<blocks::Block> move_block(const blocks::MoveBlockRequest& request);

    /**
     * Reparent under the previous sibling, as its last child.
     */
    [[nodiscard]] Result<blocks::Block> indent_block(const BlockId& id);

    /**
     * Reparent to the grandparent, right after the former parent.
     */
    [[nodiscard]] Result<blocks::Block> outdent_block(const BlockId& id);

    /**
     * Append source's content to target, move source's children after
     * target's last child and delete source. Returns target followed by the
     * moved children.
     */
    [[nodiscard]] Result<std::vector<blocks::Block>> merge_blocks(const BlockId& source_id,
                                                                  const BlockId& target_id);

    [[nodiscard]] Result<blocks::Block> toggle_collapse(const BlockId& id);

private:
    [[nodiscard]] Result<std::vector<blocks::Block>> query_blocks(std::string_view sql,
                                                                  const std::vector<std::string>& params);
    [[nodiscard]] Result<std::vector<blocks::Block>> siblings_of(const PageId& page_id,
                                                                 const std::optional<BlockId>& parent_id);
    [[nodiscard]] Result<std::vector<BlockId>> subtree_ids(const BlockId& id);
    [[nodiscard]] Result<int> count_page_blocks(const PageId& page_id);

    [[nodiscard]] Result<blocks::Block> insert_block(const blocks::CreateBlockRequest& request);
    [[nodiscard]] Result<void> write_placement(const BlockId& id,
                                               const std::optional<BlockId>& parent_id,
                                               const FractionalIndex& weight);
    [[nodiscard]] Result<void> write_metadata(const BlockId& id, const blocks::Metadata& metadata);
    [[nodiscard]] Result<void> attach_metadata(std::vector<blocks::Block>& blocks);

    /**
     * Weight for placing `moving` under parent_id right after `after`.
     */
    [[nodiscard]] Result<FractionalIndex> placement(const PageId& page_id,
                                                    const std::optional<BlockId>& parent_id,
                                                    const std::optional<BlockId>& after,
                                                    const std::optional<BlockId>& moving);

    static blocks::Block row_to_block(Statement& stmt);

    Database& db_;
};

} // namespace arbor::storage
