#pragma once

#include "core/block_types.hpp"
#include "core/requests.hpp"
#include "core/result.hpp"

#include <functional>
#include <vector>

namespace arbor::gateway {

/**
 * Continuation invoked exactly once with the outcome of a gateway call.
 */
template<typename T>
using Callback = std::function<void(Result<T>)>;

/**
 * BlockGateway - Asynchronous client of the authoritative block store.
 *
 * Every call returns immediately and later invokes its callback on the
 * caller's event loop. Each call is atomic: it either fully applies and
 * returns canonical records, or fails without effect. Responses are the
 * only truth for the ids they mention.
 */
class BlockGateway {
public:
    virtual ~BlockGateway() = default;

    virtual void load_page_blocks(const PageId& page_id,
                                  Callback<std::vector<blocks::Block>> done) = 0;

    virtual void create_block(blocks::CreateBlockRequest request,
                              Callback<blocks::Block> done) = 0;

    virtual void create_blocks_batch(blocks::CreateBlocksBatchRequest request,
                                     Callback<std::vector<blocks::Block>> done) = 0;

    virtual void update_block(blocks::UpdateBlockRequest request,
                              Callback<blocks::Block> done) = 0;

    /**
     * Responds with every destroyed id (the block and its descendants).
     */
    virtual void delete_block(const BlockId& id,
                              Callback<std::vector<BlockId>> done) = 0;

    virtual void move_block(blocks::MoveBlockRequest request,
                            Callback<blocks::Block> done) = 0;

    virtual void indent_block(const BlockId& id, Callback<blocks::Block> done) = 0;
    virtual void outdent_block(const BlockId& id, Callback<blocks::Block> done) = 0;

    /**
     * Responds with the target and the children moved under it; the source
     * no longer exists afterwards.
     */
    virtual void merge_blocks(const BlockId& source_id,
                              const BlockId& target_id,
                              Callback<std::vector<blocks::Block>> done) = 0;

    virtual void toggle_collapse(const BlockId& id, Callback<blocks::Block> done) = 0;
};

} // namespace arbor::gateway
