#pragma once

#include "gateway/block_gateway.hpp"
#include "storage/block_store.hpp"

#include <functional>

class QObject;

namespace arbor::gateway {

using Task = std::function<void()>;

/**
 * Decides when a store operation runs. The gateway hands every operation
 * (store call plus callback) to the dispatcher as one task.
 */
using Dispatcher = std::function<void(Task)>;

/**
 * Runs tasks on the next event loop iteration of context's thread, so the
 * caller always sees the callback after its own call returned. Tasks still
 * pending when context is destroyed are dropped.
 */
[[nodiscard]] Dispatcher queued_dispatcher(QObject* context);

/**
 * LocalGateway - BlockGateway backed by a BlockStore in this process.
 */
class LocalGateway final : public BlockGateway {
public:
    LocalGateway(storage::BlockStore& store, Dispatcher dispatcher);

    void load_page_blocks(const PageId& page_id,
                          Callback<std::vector<blocks::Block>> done) override;
    void create_block(blocks::CreateBlockRequest request, Callback<blocks::Block> done) override;
    void create_blocks_batch(blocks::CreateBlocksBatchRequest request,
                             Callback<std::vector<blocks::Block>> done) override;
    void update_block(blocks::UpdateBlockRequest request, Callback<blocks::Block> done) override;
    void delete_block(const BlockId& id, Callback<std::vector<BlockId>> done) override;
    void move_block(blocks::MoveBlockRequest request, Callback<blocks::Block> done) override;
    void indent_block(const BlockId& id, Callback<blocks::Block> done) override;
    void outdent_block(const BlockId& id, Callback<blocks::Block> done) override;
    void merge_blocks(const BlockId& source_id,
                      const BlockId& target_id,
                      Callback<std::vector<blocks::Block>> done) override;
    void toggle_collapse(const BlockId& id, Callback<blocks::Block> done) override;

private:
    template<typename T, typename Work>
    void submit(const char* operation, Work work, Callback<T> done);

    storage::BlockStore& store_;
    Dispatcher dispatcher_;
};

} // namespace arbor::gateway
