#include "engine/block_engine.hpp"

#include "app/logging.hpp"
#include "engine/page_cache.hpp"

#include <QPointer>

#include <algorithm>
#include <chrono>

namespace arbor::engine {

using blocks::Block;
using blocks::BlocksChanged;

namespace {

template<typename T>
void reply(const Callback<T>& done, Result<T> result) {
    if (done) {
        done(std::move(result));
    }
}

void reply_ok(const Callback<void>& done) {
    if (done) {
        done(Result<void>::ok());
    }
}

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

} // namespace

BlockEngine::BlockEngine(gateway::BlockGateway& gateway,
                         PageId page_id,
                         EngineOptions options,
                         PageCache* cache,
                         QObject* parent)
    : QObject(parent)
    , gateway_(gateway)
    , page_id_(std::move(page_id))
    , options_(options)
    , cache_(cache) {
    qRegisterMetaType<arbor::blocks::BlocksChanged>();
}

BlockEngine::~BlockEngine() = default;

const Block* BlockEngine::block(const BlockId& id) const {
    return index_.find(resolve_id(id));
}

SyncStatus BlockEngine::status(const BlockId& id) const {
    const auto rid = resolve_id(id);
    if (is_temp_id(rid) && index_.contains(rid)) {
        return SyncStatus::Optimistic;
    }
    if (auto it = in_flight_.find(rid); it != in_flight_.end() && it->second > 0) {
        return SyncStatus::Syncing;
    }
    return SyncStatus::Synced;
}

bool BlockEngine::is_merge_locked(const BlockId& id) const {
    return merge_lock_.is_locked(resolve_id(id));
}

BlockId BlockEngine::resolve_id(const BlockId& id) const {
    if (auto it = temp_to_real_.find(id); it != temp_to_real_.end()) {
        return it->second;
    }
    return id;
}

// ============================================================================
// Loading
// ============================================================================

void BlockEngine::open(Callback<void> done) {
    // An empty page gets its first block at once; open completes when the
    // store has confirmed it.
    auto ensure_first_block = [this](Callback<void> then) {
        if (!index_.empty()) {
            reply_ok(then);
            return;
        }
        create_first_block({}, [then](Result<BlockId> created) {
            reply(then, created.is_ok() ? Result<void>::ok() : Result<void>::err(created.unwrap_err()));
        });
    };

    if (cache_) {
        if (auto cached = cache_->get(page_id_)) {
            if (install(*cached).is_ok()) {
                qCDebug(arborEngineLog) << "Opened page" << page_id_.c_str() << "from cache";
                ensure_first_block(std::move(done));
                return;
            }
            cache_->invalidate(page_id_);
        }
    }

    QPointer<BlockEngine> self(this);
    reload([self, done, ensure_first_block](Result<void> result) {
        if (!self) return;
        if (result.is_err() || !self->loaded_) {
            reply(done, std::move(result));
            return;
        }
        ensure_first_block(done);
    });
}

void BlockEngine::reload(Callback<void> done) {
    const auto generation = ++load_generation_;
    const auto started = std::chrono::steady_clock::now();

    QPointer<BlockEngine> self(this);
    gateway_.load_page_blocks(page_id_,
        [self, generation, started, done](Result<std::vector<Block>> result) {
            if (!self) return;
            if (generation != self->load_generation_) {
                qCDebug(arborEngineLog) << "Dropping superseded load of page" << self->page_id_.c_str();
                reply_ok(done);
                return;
            }

            Result<void> outcome = result.is_ok() ? self->install(result.unwrap())
                                                  : Result<void>::err(result.unwrap_err());
            if (outcome.is_err()) {
                const auto& error = outcome.unwrap_err();
                qCWarning(arborEngineLog) << "Loading page" << self->page_id_.c_str()
                                          << "failed:" << error.message.c_str();
                emit self->operationFailed(QStringLiteral("reload"), qstr(error.message));
                reply(done, std::move(outcome));
                return;
            }

            const auto load_time = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            qCInfo(arborEngineLog) << "Loaded page" << self->page_id_.c_str() << "with"
                                   << self->index_.size() << "blocks in" << load_time.count() << "ms";
            if (self->cache_) {
                self->cache_->put(self->page_id_, std::move(result).unwrap(), load_time);
            }
            reply_ok(done);
        });
}

Result<void> BlockEngine::install(const std::vector<Block>& records) {
    for (const auto& record : records) {
        if (auto valid = validate_record(record); valid.is_err()) {
            return valid;
        }
    }

    index_.build(records);
    loaded_ = true;

    if (options_.verify_invariants) {
        index_.verify().inspect_err([this](const Error& error) {
            qCCritical(arborEngineLog) << "Loaded page" << page_id_.c_str()
                                       << "violates an invariant:" << error.message.c_str();
            emit operationFailed(QStringLiteral("verify"), qstr(error.message));
        });
    }

    std::vector<BlockId> gone;
    if (const auto& focused = focus_.focused_block_id(); focused && !index_.contains(*focused)) {
        gone.push_back(*focused);
    }
    for (const auto& id : focus_.selection()) {
        if (!index_.contains(id)) gone.push_back(id);
    }
    if (focus_.forget(gone)) {
        emit focusChanged();
    }

    emit treeChanged();
    emit pageReloaded();
    return Result<void>::ok();
}

// ============================================================================
// Reconciliation
// ============================================================================

Result<const Block*> BlockEngine::require(const BlockId& id, bool persisted) const {
    const auto* found = index_.find(id);
    if (!found) {
        return Result<const Block*>::err(Error::validation("unknown block " + id));
    }
    if (persisted && is_temp_id(id)) {
        return Result<const Block*>::err(Error::validation("block " + id + " is not saved yet"));
    }
    return Result<const Block*>::ok(found);
}

Result<void> BlockEngine::validate_record(const Block& block) const {
    if (block.id.empty()) {
        return Result<void>::err(Error::persistence("gateway returned a block without an id"));
    }
    if (block.page_id != page_id_) {
        return Result<void>::err(Error::persistence(
            "gateway returned block " + block.id + " of page " + block.page_id));
    }
    if (block.parent_id && *block.parent_id == block.id) {
        return Result<void>::err(Error::persistence("block " + block.id + " is its own parent"));
    }
    return Result<void>::ok();
}

Result<blocks::InsertTarget> BlockEngine::target_below(const std::optional<BlockId>& after) const {
    blocks::InsertTarget target;
    if (after) {
        auto reference = require(resolve_id(*after), true);
        if (reference.is_err()) {
            return Result<blocks::InsertTarget>::err(reference.unwrap_err());
        }
        target = *index_.insert_below_target(reference.unwrap()->id);
    } else {
        const auto& roots = index_.children_of(std::nullopt);
        if (!roots.empty()) {
            target.after_block_id = roots.back();
        }
    }

    if ((target.parent_id && is_temp_id(*target.parent_id)) ||
        (target.after_block_id && is_temp_id(*target.after_block_id))) {
        return Result<blocks::InsertTarget>::err(
            Error::validation("cannot place a block next to one that is not saved yet"));
    }
    return Result<blocks::InsertTarget>::ok(std::move(target));
}

void BlockEngine::apply_local(const std::vector<Block>& upserts, const std::vector<BlockId>& removals) {
    auto applied = index_.apply(upserts, removals);
    emit treeChanged();
    if (applied.is_err()) {
        fail_and_reload("apply", applied.unwrap_err());
    }
}

void BlockEngine::rollback(const Snapshot& snapshot) {
    qCDebug(arborEngineLog) << "Rolling back" << snapshot.previous.size() << "records";
    apply_local(snapshot.previous, snapshot.created);
}

Result<void> BlockEngine::apply_change(BlocksChanged change) {
    for (const auto& record : change.updated_or_created) {
        if (auto valid = validate_record(record); valid.is_err()) {
            return valid;
        }
    }

    auto applied = index_.apply(change.updated_or_created, change.deleted_ids);
    if (applied.is_ok() && options_.verify_invariants) {
        applied = index_.verify();
    }

    for (const auto& id : change.deleted_ids) {
        pending_content_.erase(id);
    }
    if (focus_.forget(change.deleted_ids)) {
        emit focusChanged();
    }
    if (cache_) {
        cache_->invalidate(page_id_);
    }

    emit treeChanged();
    emit blocksChanged(change);
    return applied;
}

void BlockEngine::fail_and_reload(const char* operation, const Error& error) {
    qCWarning(arborEngineLog) << operation << "failed (" << kind_name(error.kind).data() << "):"
                              << error.message.c_str() << "- reloading page" << page_id_.c_str();
    emit operationFailed(QString::fromLatin1(operation), qstr(error.message));
    reload();
}

void BlockEngine::begin_sync(const BlockId& id) {
    ++in_flight_[id];
}

void BlockEngine::end_sync(const BlockId& id) {
    auto it = in_flight_.find(id);
    if (it != in_flight_.end() && --it->second <= 0) {
        in_flight_.erase(it);
    }
}

// ============================================================================
// Creation
// ============================================================================

void BlockEngine::create_first_block(std::string content, Callback<BlockId> done) {
    const auto temp_id = make_temp_id();
    const auto now = Timestamp::now();

    Block block{
        .id = temp_id,
        .page_id = page_id_,
        .parent_id = std::nullopt,
        .content = content,
        .order_weight = FractionalIndex::first(),
        .created_at = now,
        .updated_at = now,
    };

    // Visible and focusable before the first suspension point.
    apply_local({block}, {});
    if (focus_.focus(temp_id, 0)) {
        emit focusChanged();
    }
    qCDebug(arborEngineLog) << "Created first block of page" << page_id_.c_str()
                            << "as" << temp_id.c_str();

    QPointer<BlockEngine> self(this);
    gateway_.create_block(
        blocks::CreateBlockRequest{.page_id = page_id_, .content = std::move(content)},
        [self, temp_id, done](Result<Block> result) {
            if (!self) return;
            reply(done, self->confirm_temp_block(temp_id, std::move(result)));
        });
}

Result<BlockId> BlockEngine::confirm_temp_block(const BlockId& temp_id, Result<Block> result) {
    if (result.is_ok()) {
        if (auto valid = validate_record(result.unwrap()); valid.is_err()) {
            result = Result<Block>::err(valid.unwrap_err());
        }
    }

    if (result.is_err()) {
        pending_content_.erase(temp_id);
        apply_local({}, {temp_id});
        if (focus_.forget({temp_id})) {
            emit focusChanged();
        }
        fail_and_reload("create_block", result.unwrap_err());
        return Result<BlockId>::err(result.unwrap_err());
    }

    auto block = std::move(result).unwrap();
    const auto real_id = block.id;
    temp_to_real_[temp_id] = real_id;

    // Listeners bound to the temporary id follow the rename before they
    // see it deleted.
    if (focus_.rename(temp_id, real_id)) {
        emit focusChanged();
    }

    auto applied = apply_change(BlocksChanged{{std::move(block)}, {temp_id}});
    if (applied.is_err()) {
        fail_and_reload("create_block", applied.unwrap_err());
        return Result<BlockId>::err(applied.unwrap_err());
    }
    qCDebug(arborEngineLog) << "Confirmed" << temp_id.c_str() << "as" << real_id.c_str();

    if (auto it = pending_content_.find(temp_id); it != pending_content_.end()) {
        auto content = std::move(it->second);
        pending_content_.erase(it);
        update_content(real_id, std::move(content));
    }
    return Result<BlockId>::ok(real_id);
}

void BlockEngine::create_block(const std::optional<BlockId>& after,
                               std::string content,
                               Callback<BlockId> done) {
    if (index_.empty()) {
        create_first_block(std::move(content), std::move(done));
        return;
    }

    auto target = target_below(after);
    if (target.is_err()) {
        reply(done, Result<BlockId>::err(target.unwrap_err()));
        return;
    }

    blocks::CreateBlockRequest request{
        .page_id = page_id_,
        .parent_id = target.unwrap().parent_id,
        .after_block_id = target.unwrap().after_block_id,
        .content = std::move(content),
    };

    QPointer<BlockEngine> self(this);
    gateway_.create_block(std::move(request), [self, done](Result<Block> result) {
        if (!self) return;
        const auto id = result.is_ok() ? result.unwrap().id : BlockId{};
        Result<void> outcome = result.is_ok()
            ? self->apply_change(BlocksChanged{{std::move(result).unwrap()}, {}})
            : Result<void>::err(result.unwrap_err());
        if (outcome.is_err()) {
            self->fail_and_reload("create_block", outcome.unwrap_err());
            reply(done, Result<BlockId>::err(outcome.unwrap_err()));
            return;
        }
        if (self->focus_.focus(id, 0)) {
            emit self->focusChanged();
        }
        reply(done, Result<BlockId>::ok(id));
    });
}

void BlockEngine::create_blocks(const std::optional<BlockId>& after,
                                std::vector<std::string> contents,
                                Callback<std::vector<BlockId>> done) {
    if (contents.empty()) {
        reply(done, Result<std::vector<BlockId>>::ok({}));
        return;
    }

    auto target = target_below(after);
    if (target.is_err()) {
        reply(done, Result<std::vector<BlockId>>::err(target.unwrap_err()));
        return;
    }

    blocks::CreateBlocksBatchRequest request{
        .page_id = page_id_,
        .parent_id = target.unwrap().parent_id,
        .after_block_id = target.unwrap().after_block_id,
        .contents = std::move(contents),
    };

    QPointer<BlockEngine> self(this);
    gateway_.create_blocks_batch(std::move(request), [self, done](Result<std::vector<Block>> result) {
        if (!self) return;
        std::vector<BlockId> ids;
        if (result.is_ok()) {
            for (const auto& record : result.unwrap()) ids.push_back(record.id);
        }
        Result<void> outcome = result.is_ok()
            ? self->apply_change(BlocksChanged{std::move(result).unwrap(), {}})
            : Result<void>::err(result.unwrap_err());
        if (outcome.is_err()) {
            self->fail_and_reload("create_blocks", outcome.unwrap_err());
            reply(done, Result<std::vector<BlockId>>::err(outcome.unwrap_err()));
            return;
        }
        reply(done, Result<std::vector<BlockId>>::ok(std::move(ids)));
    });
}

// ============================================================================
// Single-record updates
// ============================================================================

Callback<Block> BlockEngine::begin_single(const char* operation,
                                          const Block& updated,
                                          Callback<void> done) {
    Snapshot snapshot{.previous = {*index_.find(updated.id)}, .created = {}};
    apply_local({updated}, {});
    begin_sync(updated.id);

    QPointer<BlockEngine> self(this);
    return [self, operation, snapshot = std::move(snapshot), done = std::move(done)](Result<Block> result) {
        if (!self) return;
        self->finish_single(operation, snapshot, std::move(result), done);
    };
}

void BlockEngine::finish_single(const char* operation,
                                const Snapshot& snapshot,
                                Result<Block> result,
                                const Callback<void>& done) {
    end_sync(snapshot.previous.front().id);

    Result<void> outcome = result.is_ok()
        ? apply_change(BlocksChanged{{std::move(result).unwrap()}, {}})
        : Result<void>::err(result.unwrap_err());
    if (outcome.is_ok()) {
        reply_ok(done);
        return;
    }

    rollback(snapshot);
    fail_and_reload(operation, outcome.unwrap_err());
    reply(done, std::move(outcome));
}

void BlockEngine::update_content(const BlockId& id, std::string content, Callback<void> done) {
    const auto rid = resolve_id(id);
    if (merge_lock_.is_locked(rid)) {
        qCDebug(arborEngineLog) << "Commit to" << rid.c_str() << "suppressed by merge lock";
        reply_ok(done);
        return;
    }

    auto found = require(rid, false);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }
    const auto& current = *found.unwrap();
    if (current.content == content) {
        reply_ok(done);
        return;
    }

    if (is_temp_id(rid)) {
        pending_content_[rid] = content;
        apply_local({blocks::with_content(current, std::move(content))}, {});
        reply_ok(done);
        return;
    }

    auto callback = begin_single("update_content", blocks::with_content(current, content), std::move(done));
    gateway_.update_block(blocks::UpdateBlockRequest{.id = rid, .content = std::move(content)},
                          std::move(callback));
}

void BlockEngine::update_metadata(const BlockId& id, blocks::Metadata metadata, Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, true);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    auto updated = *found.unwrap();
    updated.metadata = metadata;
    updated.updated_at = Timestamp::now();

    auto callback = begin_single("update_metadata", updated, std::move(done));
    gateway_.update_block(blocks::UpdateBlockRequest{.id = rid, .metadata = std::move(metadata)},
                          std::move(callback));
}

void BlockEngine::set_block_type(const BlockId& id,
                                 blocks::BlockType type,
                                 std::optional<std::string> language,
                                 Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, true);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    auto updated = *found.unwrap();
    updated.block_type = type;
    updated.language = language && !language->empty() ? language : std::nullopt;
    updated.updated_at = Timestamp::now();

    auto callback = begin_single("set_block_type", updated, std::move(done));
    gateway_.update_block(blocks::UpdateBlockRequest{
                              .id = rid,
                              .block_type = type,
                              .language = language.value_or(std::string{}),
                          },
                          std::move(callback));
}

void BlockEngine::toggle_collapse(const BlockId& id, Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, true);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    const auto& current = *found.unwrap();
    auto callback = begin_single("toggle_collapse",
                                 blocks::with_collapsed(current, !current.is_collapsed),
                                 std::move(done));
    gateway_.toggle_collapse(rid, std::move(callback));
}

// ============================================================================
// Structure
// ============================================================================

void BlockEngine::indent(const BlockId& id, Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, false);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    const auto sibling = index_.previous_sibling(rid);
    if (!sibling) {
        qCDebug(arborEngineLog) << "Indent of" << rid.c_str() << "ignored: no previous sibling";
        reply_ok(done);
        return;
    }
    if (is_temp_id(rid) || is_temp_id(*sibling)) {
        reply(done, Result<void>::err(Error::validation("block " + rid + " is not saved yet")));
        return;
    }

    const auto& children = index_.children_of(*sibling);
    const auto last_child = children.empty() ? std::nullopt : std::optional<BlockId>(children.back());
    auto weight = index_.placement_weight(*sibling, last_child, rid);

    auto callback = begin_single("indent",
                                 blocks::with_placement(*found.unwrap(), *sibling, std::move(weight)),
                                 std::move(done));
    gateway_.indent_block(rid, std::move(callback));
}

void BlockEngine::outdent(const BlockId& id, Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, false);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    const auto& current = *found.unwrap();
    if (!current.parent_id) {
        qCDebug(arborEngineLog) << "Outdent of" << rid.c_str() << "ignored: already at root";
        reply_ok(done);
        return;
    }
    if (is_temp_id(rid)) {
        reply(done, Result<void>::err(Error::validation("block " + rid + " is not saved yet")));
        return;
    }

    const auto* parent = index_.find(*current.parent_id);
    if (!parent) {
        auto error = Error::invariant("block " + rid + " references missing parent " + *current.parent_id);
        fail_and_reload("outdent", error);
        reply(done, Result<void>::err(std::move(error)));
        return;
    }

    auto weight = index_.placement_weight(parent->parent_id, parent->id, rid);
    auto callback = begin_single("outdent",
                                 blocks::with_placement(current, parent->parent_id, std::move(weight)),
                                 std::move(done));
    gateway_.outdent_block(rid, std::move(callback));
}

void BlockEngine::move(const BlockId& id,
                       const std::optional<BlockId>& new_parent,
                       const std::optional<BlockId>& after,
                       Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, true);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    const std::optional<BlockId> parent = new_parent ? std::optional(resolve_id(*new_parent)) : std::nullopt;
    const std::optional<BlockId> anchor = after ? std::optional(resolve_id(*after)) : std::nullopt;

    if (parent) {
        auto parent_block = require(*parent, true);
        if (parent_block.is_err()) {
            reply(done, Result<void>::err(parent_block.unwrap_err()));
            return;
        }
        if (*parent == rid || index_.is_ancestor(rid, *parent)) {
            reply(done, Result<void>::err(
                Error::validation("cannot move block " + rid + " into its own subtree")));
            return;
        }
    }
    if (anchor) {
        const auto* anchor_block = index_.find(*anchor);
        if (!anchor_block || *anchor == rid || anchor_block->parent_id != parent) {
            reply(done, Result<void>::err(
                Error::validation("block " + *anchor + " is not a sibling under the new parent")));
            return;
        }
    }

    auto weight = index_.placement_weight(parent, anchor, rid);
    auto callback = begin_single("move",
                                 blocks::with_placement(*found.unwrap(), parent, std::move(weight)),
                                 std::move(done));
    gateway_.move_block(blocks::MoveBlockRequest{.id = rid, .new_parent_id = parent, .after_block_id = anchor},
                        std::move(callback));
}

void BlockEngine::delete_block(const BlockId& id, Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, false);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    if (index_.size() <= 1) {
        qCDebug(arborEngineLog) << "Delete of" << rid.c_str() << "ignored: last block of the page";
        reply_ok(done);
        return;
    }
    if (is_temp_id(rid)) {
        reply(done, Result<void>::err(Error::validation("block " + rid + " is not saved yet")));
        return;
    }

    const auto doomed = index_.subtree(rid);
    if (doomed.size() >= index_.size()) {
        reply(done, Result<void>::err(Error::validation("cannot delete every block of a page")));
        return;
    }
    auto is_doomed = [&doomed](const BlockId& candidate) {
        return std::find(doomed.begin(), doomed.end(), candidate) != doomed.end();
    };

    const auto& focused = focus_.focused_block_id();
    if (focused && is_doomed(*focused)) {
        auto next = index_.previous_visible(rid);
        if (!next) {
            next = index_.next_visible(rid);
            while (next && is_doomed(*next)) {
                next = index_.next_visible(*next);
            }
        }
        if (next) {
            focus_.focus(*next, index_.find(*next)->content.size());
        } else {
            focus_.clear();
        }
        emit focusChanged();
    }

    Snapshot snapshot;
    for (const auto& doomed_id : doomed) {
        snapshot.previous.push_back(*index_.find(doomed_id));
    }
    apply_local({}, doomed);
    begin_sync(rid);

    QPointer<BlockEngine> self(this);
    gateway_.delete_block(rid, [self, rid, snapshot, done](Result<std::vector<BlockId>> result) {
        if (!self) return;
        self->end_sync(rid);
        Result<void> outcome = result.is_ok()
            ? self->apply_change(BlocksChanged{{}, std::move(result).unwrap()})
            : Result<void>::err(result.unwrap_err());
        if (outcome.is_err()) {
            self->rollback(snapshot);
            self->fail_and_reload("delete_block", outcome.unwrap_err());
            reply(done, std::move(outcome));
            return;
        }
        reply_ok(done);
    });
}

void BlockEngine::split_at_cursor(const BlockId& id,
                                  size_t offset,
                                  const std::optional<std::string>& draft,
                                  Callback<BlockId> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, true);
    if (found.is_err()) {
        reply(done, Result<BlockId>::err(found.unwrap_err()));
        return;
    }
    if (merge_lock_.is_locked(rid)) {
        reply(done, Result<BlockId>::err(Error::validation("block " + rid + " is being merged")));
        return;
    }

    const auto& current = *found.unwrap();
    auto halves = blocks::split_content(draft ? *draft : current.content, offset);
    const auto target = *index_.insert_below_target(rid);

    // The kept half must be stored before the new block exists, otherwise a
    // failure between the two calls duplicates the moved text.
    apply_local({blocks::with_content(current, halves.first)}, {});
    begin_sync(rid);

    QPointer<BlockEngine> self(this);
    gateway_.update_block(
        blocks::UpdateBlockRequest{.id = rid, .content = std::move(halves.first)},
        [self, rid, target, tail = std::move(halves.second), done](Result<Block> result) {
            if (!self) return;
            self->end_sync(rid);
            Result<void> outcome = result.is_ok()
                ? self->apply_change(BlocksChanged{{std::move(result).unwrap()}, {}})
                : Result<void>::err(result.unwrap_err());
            if (outcome.is_err()) {
                self->fail_and_reload("split_at_cursor", outcome.unwrap_err());
                reply(done, Result<BlockId>::err(outcome.unwrap_err()));
                return;
            }

            blocks::CreateBlockRequest request{
                .page_id = self->page_id_,
                .parent_id = target.parent_id,
                .after_block_id = target.after_block_id,
                .content = tail,
            };
            self->gateway_.create_block(std::move(request), [self, done](Result<Block> created) {
                if (!self) return;
                const auto new_id = created.is_ok() ? created.unwrap().id : BlockId{};
                Result<void> applied = created.is_ok()
                    ? self->apply_change(BlocksChanged{{std::move(created).unwrap()}, {}})
                    : Result<void>::err(created.unwrap_err());
                if (applied.is_err()) {
                    self->fail_and_reload("split_at_cursor", applied.unwrap_err());
                    reply(done, Result<BlockId>::err(applied.unwrap_err()));
                    return;
                }
                if (self->focus_.focus(new_id, 0)) {
                    emit self->focusChanged();
                }
                reply(done, Result<BlockId>::ok(new_id));
            });
        });
}

void BlockEngine::merge_with_previous(const BlockId& id,
                                      const std::optional<std::string>& draft,
                                      Callback<void> done) {
    const auto rid = resolve_id(id);
    auto found = require(rid, false);
    if (found.is_err()) {
        reply(done, Result<void>::err(found.unwrap_err()));
        return;
    }

    const auto& current = *found.unwrap();
    const auto previous = index_.previous_visible(rid);
    if (!previous) {
        qCDebug(arborEngineLog) << "Merge of" << rid.c_str() << "ignored: nothing above it";
        reply_ok(done);
        return;
    }

    const auto* target = index_.find(*previous);
    const auto effective = draft ? *draft : current.content;

    if (effective.empty() && !index_.has_children(rid)) {
        const auto target_id = target->id;
        const auto cursor = target->content.size();
        const bool was_focused = focus_.is_focused(rid);
        QPointer<BlockEngine> self(this);
        delete_block(rid, [self, rid, target_id, cursor, was_focused, done](Result<void> result) {
            if (!self) return;
            if (result.is_err()) {
                // The rollback restored the block; hand the caret back to it.
                if (was_focused && self->index_.contains(rid) && self->focus_.focus(rid, 0)) {
                    emit self->focusChanged();
                }
                reply(done, std::move(result));
                return;
            }
            if (self->index_.contains(target_id) && self->focus_.focus(target_id, cursor)) {
                emit self->focusChanged();
            }
            reply_ok(done);
        });
        return;
    }

    if (is_temp_id(rid) || is_temp_id(target->id)) {
        reply(done, Result<void>::err(Error::validation("block " + rid + " is not saved yet")));
        return;
    }

    auto acquired = merge_lock_.try_acquire(rid, target->id);
    if (!acquired) {
        qCDebug(arborEngineLog) << "Merge of" << rid.c_str() << "ignored: merge already in progress";
        reply_ok(done);
        return;
    }
    auto guard = std::make_shared<MergeLock::Guard>(std::move(*acquired));

    const auto target_id = target->id;
    const auto cursor = target->content.size();
    begin_sync(rid);
    begin_sync(target_id);

    if (effective == current.content) {
        run_merge(rid, target_id, cursor, std::move(guard), std::move(done));
        return;
    }

    // Flush the draft first; regular commits are suppressed by the lock.
    apply_local({blocks::with_content(current, effective)}, {});
    QPointer<BlockEngine> self(this);
    gateway_.update_block(
        blocks::UpdateBlockRequest{.id = rid, .content = effective},
        [self, rid, target_id, cursor, guard, done](Result<Block> result) {
            if (!self) return;
            Result<void> outcome = result.is_ok()
                ? self->apply_change(BlocksChanged{{std::move(result).unwrap()}, {}})
                : Result<void>::err(result.unwrap_err());
            if (outcome.is_err()) {
                self->fail_merge(rid, target_id, guard, outcome.unwrap_err(), done);
                return;
            }
            self->run_merge(rid, target_id, cursor, guard, done);
        });
}

void BlockEngine::run_merge(const BlockId& id,
                            const BlockId& target_id,
                            size_t cursor,
                            GuardHandle guard,
                            Callback<void> done) {
    QPointer<BlockEngine> self(this);
    gateway_.merge_blocks(id, target_id,
        [self, id, target_id, cursor, guard = std::move(guard), done = std::move(done)](
            Result<std::vector<Block>> result) {
            if (!self) return;
            Result<void> outcome = result.is_ok()
                ? self->apply_change(BlocksChanged{std::move(result).unwrap(), {id}})
                : Result<void>::err(result.unwrap_err());
            if (outcome.is_err()) {
                self->fail_merge(id, target_id, guard, outcome.unwrap_err(), done);
                return;
            }

            self->end_sync(id);
            self->end_sync(target_id);
            if (self->focus_.focus(target_id, cursor)) {
                emit self->focusChanged();
            }
            guard->release();
            reply_ok(done);
        });
}

void BlockEngine::fail_merge(const BlockId& id,
                             const BlockId& target_id,
                             const GuardHandle& guard,
                             const Error& error,
                             const Callback<void>& done) {
    end_sync(id);
    end_sync(target_id);
    guard->release();

    // Drop the binding so the editing surface rebinds to reloaded state.
    if (focus_.clear()) {
        emit focusChanged();
    }

    qCWarning(arborEngineLog) << "merge_with_previous failed:" << error.message.c_str()
                              << "- reloading page" << page_id_.c_str();
    emit operationFailed(QStringLiteral("merge_with_previous"), qstr(error.message));

    QPointer<BlockEngine> self(this);
    reload([self, id, target_id](Result<void>) {
        if (!self) return;
        self->restore_focus_after_merge(id, target_id);
    });
    reply(done, Result<void>::err(error));
}

void BlockEngine::restore_focus_after_merge(const BlockId& id, const BlockId& target_id) {
    std::optional<BlockId> next;
    if (index_.contains(id)) {
        next = id;
    } else if (index_.contains(target_id)) {
        next = target_id;
    } else {
        next = index_.first_root();
    }
    if (next && focus_.focus(*next)) {
        emit focusChanged();
    }
}

// ============================================================================
// Navigation and focus
// ============================================================================

std::optional<BlockId> BlockEngine::previous_visible(const BlockId& id) const {
    return index_.previous_visible(resolve_id(id));
}

std::optional<BlockId> BlockEngine::next_visible(const BlockId& id) const {
    return index_.next_visible(resolve_id(id));
}

void BlockEngine::set_focus(const BlockId& id, std::optional<size_t> cursor_offset) {
    const auto rid = resolve_id(id);
    if (!index_.contains(rid)) {
        qCDebug(arborEngineLog) << "Ignoring focus request for unknown block" << rid.c_str();
        return;
    }
    if (focus_.focus(rid, cursor_offset)) {
        emit focusChanged();
    }
}

void BlockEngine::clear_focus() {
    if (focus_.clear()) {
        emit focusChanged();
    }
}

std::optional<size_t> BlockEngine::take_target_cursor() {
    return focus_.take_target_cursor();
}

void BlockEngine::set_selection(std::vector<BlockId> ids) {
    std::vector<BlockId> resolved;
    for (const auto& id : ids) {
        auto rid = resolve_id(id);
        if (index_.contains(rid)) resolved.push_back(std::move(rid));
    }
    focus_.select(std::move(resolved));
    emit selectionChanged();
}

void BlockEngine::toggle_selected(const BlockId& id) {
    const auto rid = resolve_id(id);
    if (!index_.contains(rid)) return;
    focus_.toggle_selected(rid);
    emit selectionChanged();
}

void BlockEngine::clear_selection() {
    if (focus_.selection().empty()) return;
    focus_.clear_selection();
    emit selectionChanged();
}

} // namespace arbor::engine
