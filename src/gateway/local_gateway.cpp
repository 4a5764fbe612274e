#include "gateway/local_gateway.hpp"
#include "app/logging.hpp"

#include <QMetaObject>
#include <QObject>
#include <QPointer>

namespace arbor::gateway {

Dispatcher queued_dispatcher(QObject* context) {
    QPointer<QObject> guard(context);
    return [guard](Task task) {
        if (!guard) {
            qCWarning(arborGatewayLog) << "dispatcher context gone, dropping task";
            return;
        }
        if (!QMetaObject::invokeMethod(guard.data(), std::move(task), Qt::QueuedConnection)) {
            qCWarning(arborGatewayLog) << "failed to queue gateway task";
        }
    };
}

LocalGateway::LocalGateway(storage::BlockStore& store, Dispatcher dispatcher)
    : store_(store)
    , dispatcher_(std::move(dispatcher)) {}

template<typename T, typename Work>
void LocalGateway::submit(const char* operation, Work work, Callback<T> done) {
    dispatcher_([operation, work = std::move(work), done = std::move(done)]() mutable {
        auto result = work();
        if (result.is_err()) {
            const auto& error = result.unwrap_err();
            qCWarning(arborGatewayLog) << operation << "failed:"
                                       << QString::fromStdString(error.message)
                                       << "kind" << QString::fromUtf8(kind_name(error.kind).data());
        } else {
            qCDebug(arborGatewayLog) << operation << "ok";
        }
        if (done) {
            done(std::move(result));
        }
    });
}

void LocalGateway::load_page_blocks(const PageId& page_id,
                                    Callback<std::vector<blocks::Block>> done) {
    submit<std::vector<blocks::Block>>("load_page_blocks",
        [this, page_id] { return store_.load_page_blocks(page_id); }, std::move(done));
}

void LocalGateway::create_block(blocks::CreateBlockRequest request, Callback<blocks::Block> done) {
    submit<blocks::Block>("create_block",
        [this, request = std::move(request)] { return store_.create_block(request); },
        std::move(done));
}

void LocalGateway::create_blocks_batch(blocks::CreateBlocksBatchRequest request,
                                       Callback<std::vector<blocks::Block>> done) {
    submit<std::vector<blocks::Block>>("create_blocks_batch",
        [this, request = std::move(request)] { return store_.create_blocks_batch(request); },
        std::move(done));
}

void LocalGateway::update_block(blocks::UpdateBlockRequest request, Callback<blocks::Block> done) {
    submit<blocks::Block>("update_block",
        [this, request = std::move(request)] { return store_.update_block(request); },
        std::move(done));
}

void LocalGateway::delete_block(const BlockId& id, Callback<std::vector<BlockId>> done) {
    submit<std::vector<BlockId>>("delete_block",
        [this, id] { return store_.delete_block(id); }, std::move(done));
}

void LocalGateway::move_block(blocks::MoveBlockRequest request, Callback<blocks::Block> done) {
    submit<blocks::Block>("move_block",
        [this, request = std::move(request)] { return store_.move_block(request); },
        std::move(done));
}

void LocalGateway::indent_block(const BlockId& id, Callback<blocks::Block> done) {
    submit<blocks::Block>("indent_block",
        [this, id] { return store_.indent_block(id); }, std::move(done));
}

void LocalGateway::outdent_block(const BlockId& id, Callback<blocks::Block> done) {
    submit<blocks::Block>("outdent_block",
        [this, id] { return store_.outdent_block(id); }, std::move(done));
}

void LocalGateway::merge_blocks(const BlockId& source_id,
                                const BlockId& target_id,
                                Callback<std::vector<blocks::Block>> done) {
    submit<std::vector<blocks::Block>>("merge_blocks",
        [this, source_id, target_id] { return store_.merge_blocks(source_id, target_id); },
        std::move(done));
}

void LocalGateway::toggle_collapse(const BlockId& id, Callback<blocks::Block> done) {
    submit<blocks::Block>("toggle_collapse",
        [this, id] { return store_.toggle_collapse(id); }, std::move(done));
}

} // namespace arbor::gateway
