#pragma once

#include "engine/block_engine.hpp"

#include <vector>

namespace arbor::engine {

/**
 * Operations on a multi-block selection.
 *
 * Each runs the engine's single-block operation for one id at a time, in an
 * order that keeps the outline stable, and stops at the first failure.
 * Ids that disappeared in the meantime (deleted together with an ancestor)
 * are skipped.
 */

/**
 * Delete in document order, then clear the selection.
 */
void delete_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done = {});

/**
 * Indent in document order, so a selected run of siblings keeps its order
 * under the new parent.
 */
void indent_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done = {});

/**
 * Outdent in reverse document order; each block lands right after its
 * former parent.
 */
void outdent_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done = {});

/**
 * Toggle only the blocks that have children.
 */
void toggle_collapse_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done = {});

void change_block_type(BlockEngine& engine,
                       std::vector<BlockId> ids,
                       blocks::BlockType type,
                       Callback<void> done = {});

// Predicates for enabling selection commands.
[[nodiscard]] bool can_indent(const blocks::TreeIndex& index, const std::vector<BlockId>& ids);
[[nodiscard]] bool can_outdent(const blocks::TreeIndex& index, const std::vector<BlockId>& ids);
[[nodiscard]] bool can_collapse(const blocks::TreeIndex& index, const std::vector<BlockId>& ids);
[[nodiscard]] size_t collapsible_count(const blocks::TreeIndex& index, const std::vector<BlockId>& ids);

/**
 * Known ids sorted by their position in the depth-first outline.
 */
[[nodiscard]] std::vector<BlockId> document_order(const blocks::TreeIndex& index,
                                                  const std::vector<BlockId>& ids);

} // namespace arbor::engine
