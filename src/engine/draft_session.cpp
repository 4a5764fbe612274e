#include "engine/draft_session.hpp"

#include "app/logging.hpp"

#include <QPointer>

#include <algorithm>

namespace arbor::engine {

DraftSession::DraftSession(BlockEngine& engine, QObject* parent)
    : DraftSession(engine, engine.options().commit_debounce, parent) {}

DraftSession::DraftSession(BlockEngine& engine,
                           std::chrono::milliseconds idle_commit,
                           QObject* parent)
    : QObject(parent)
    , engine_(engine) {
    idle_timer_.setSingleShot(true);
    idle_timer_.setInterval(idle_commit);
    connect(&idle_timer_, &QTimer::timeout, this, [this] { commit(); });

    connect(&engine_, &BlockEngine::focusChanged, this, &DraftSession::on_focus_changed);
    connect(&engine_, &BlockEngine::blocksChanged, this, &DraftSession::on_blocks_changed);
    connect(&engine_, &BlockEngine::pageReloaded, this, &DraftSession::on_page_reloaded);

    bind(engine_.focus().focused_block_id());
}

DraftSession::~DraftSession() = default;

bool DraftSession::commit_in_flight() const {
    return block_id_ && in_flight_.contains(*block_id_);
}

void DraftSession::edit(std::string text) {
    if (!block_id_) {
        qCDebug(arborDraftLog) << "Ignoring edit without a focused block";
        return;
    }
    text_ = std::move(text);
    if (is_dirty()) {
        idle_timer_.start();
    } else {
        idle_timer_.stop();
    }
}

void DraftSession::commit(Callback<void> done) {
    idle_timer_.stop();
    if (!is_dirty()) {
        if (done) done(Result<void>::ok());
        return;
    }
    if (engine_.is_merge_locked(*block_id_)) {
        qCDebug(arborDraftLog) << "Commit of" << block_id_->c_str() << "skipped during merge";
        if (done) done(Result<void>::ok());
        return;
    }
    commit_block(*block_id_, text_, std::move(done));
}

void DraftSession::blur(Callback<void> done) {
    commit(std::move(done));
    engine_.clear_focus();
}

void DraftSession::split(size_t offset, Callback<BlockId> done) {
    if (!block_id_) {
        if (done) done(Result<BlockId>::err(Error::validation("no block is being edited")));
        return;
    }

    const auto id = *block_id_;
    const auto draft = text_;
    idle_timer_.stop();
    supersede_queued(id);

    // The engine stores the kept half itself. Focus moves to the new block
    // before the split completes, so the kept half must be clean by then.
    const auto offset_at = blocks::char_boundary(draft, offset);
    const auto kept = draft.substr(0, offset_at);
    text_ = kept;
    committed_ = kept;

    QPointer<DraftSession> self(this);
    engine_.split_at_cursor(id, offset_at, draft,
        [self, id, kept, draft, done = std::move(done)](Result<BlockId> result) {
            if (self && result.is_err()) {
                self->restore_draft(id, kept, draft);
            }
            if (done) done(std::move(result));
        });
}

void DraftSession::merge_with_previous(Callback<void> done) {
    if (!block_id_) {
        if (done) done(Result<void>::ok());
        return;
    }

    const auto id = *block_id_;
    const auto draft = text_;
    idle_timer_.stop();
    if (engine_.previous_visible(id)) {
        // The engine flushes the draft as part of the merge.
        supersede_queued(id);
        committed_ = draft;
    }

    QPointer<DraftSession> self(this);
    engine_.merge_with_previous(id, draft,
        [self, id, draft, done = std::move(done)](Result<void> result) {
            if (self && result.is_err()) {
                self->restore_draft(id, draft, draft);
            }
            if (done) done(std::move(result));
        });
}

void DraftSession::restore_draft(const BlockId& id, const std::string& expected, std::string draft) {
    if (!block_id_ || engine_.resolve_id(*block_id_) != engine_.resolve_id(id) || text_ != expected) {
        return;
    }
    const auto* record = engine_.block(*block_id_);
    if (!record) {
        return;
    }

    qCDebug(arborDraftLog) << "Restoring the draft of" << block_id_->c_str();
    const bool changed = text_ != draft;
    text_ = std::move(draft);
    committed_ = record->content;
    if (is_dirty()) {
        idle_timer_.start();
    }
    if (changed) {
        emit textChanged();
    }
}

void DraftSession::indent(Callback<void> done) {
    commit_and(&BlockEngine::indent, std::move(done));
}

void DraftSession::outdent(Callback<void> done) {
    commit_and(&BlockEngine::outdent, std::move(done));
}

void DraftSession::commit_and(void (BlockEngine::*operation)(const BlockId&, Callback<void>),
                              Callback<void> done) {
    if (!block_id_) {
        if (done) done(Result<void>::ok());
        return;
    }

    const auto id = *block_id_;
    QPointer<DraftSession> self(this);
    commit([self, id, operation, done](Result<void> result) {
        if (!self) return;
        if (result.is_err()) {
            if (done) done(std::move(result));
            return;
        }
        (self->engine_.*operation)(id, done);
    });
}

// ============================================================================
// Commit sequencing
// ============================================================================

void DraftSession::commit_block(const BlockId& id, std::string text, Callback<void> done) {
    if (in_flight_.contains(id)) {
        auto& queued = queued_[id];
        queued.text = std::move(text);
        queued.waiters.push_back(std::move(done));
        return;
    }
    std::vector<Callback<void>> waiters;
    waiters.push_back(std::move(done));
    start_commit(id, std::move(text), std::move(waiters));
}

void DraftSession::start_commit(const BlockId& id,
                                std::string text,
                                std::vector<Callback<void>> waiters) {
    in_flight_.insert(id);
    qCDebug(arborDraftLog) << "Committing" << text.size() << "bytes to" << id.c_str();

    QPointer<DraftSession> self(this);
    const auto value = text;
    engine_.update_content(id, std::move(text),
        [self, id, value, waiters = std::move(waiters)](Result<void> result) {
            if (!self) return;
            self->in_flight_.erase(id);

            if (result.is_ok()) {
                if (self->block_id_ &&
                    self->engine_.resolve_id(id) == self->engine_.resolve_id(*self->block_id_)) {
                    self->committed_ = value;
                }
            } else {
                qCWarning(arborDraftLog) << "Commit to" << id.c_str() << "failed:"
                                         << result.unwrap_err().message.c_str();
            }

            for (const auto& waiter : waiters) {
                if (waiter) waiter(result);
            }
            if (!self) return;

            auto it = self->queued_.find(id);
            if (it == self->queued_.end()) return;
            auto next = std::move(it->second);
            self->queued_.erase(it);
            self->start_commit(id, std::move(next.text), std::move(next.waiters));
        });
}

void DraftSession::supersede_queued(const BlockId& id) {
    auto it = queued_.find(id);
    if (it == queued_.end()) return;
    auto waiters = std::move(it->second.waiters);
    queued_.erase(it);
    for (const auto& waiter : waiters) {
        if (waiter) waiter(Result<void>::ok());
    }
}

// ============================================================================
// Engine notifications
// ============================================================================

void DraftSession::on_focus_changed() {
    const auto focused = engine_.focus().focused_block_id();
    if (focused == block_id_) {
        return;
    }

    // A confirmed temporary id keeps its draft.
    if (block_id_ && focused && engine_.resolve_id(*block_id_) == *focused) {
        qCDebug(arborDraftLog) << "Draft follows" << block_id_->c_str() << "to" << focused->c_str();
        block_id_ = focused;
        emit bindingChanged();
        return;
    }

    if (block_id_ && is_dirty() && engine_.block(*block_id_)) {
        qCDebug(arborDraftLog) << "Committing" << block_id_->c_str() << "on focus change";
        commit_block(*block_id_, text_, {});
    }
    bind(focused);
}

void DraftSession::on_blocks_changed(const blocks::BlocksChanged& change) {
    if (!block_id_) {
        return;
    }

    const auto& deleted = change.deleted_ids;
    if (std::find(deleted.begin(), deleted.end(), *block_id_) != deleted.end()) {
        qCDebug(arborDraftLog) << "Bound block" << block_id_->c_str() << "was deleted";
        bind(std::nullopt);
        return;
    }

    for (const auto& record : change.updated_or_created) {
        if (record.id != *block_id_) continue;

        if (engine_.focus().has_pending_cursor()) {
            idle_timer_.stop();
            text_ = record.content;
            committed_ = record.content;
            emit textChanged();
        } else {
            committed_ = record.content;
        }
    }
}

void DraftSession::on_page_reloaded() {
    if (!block_id_) {
        return;
    }
    // A vanished block is handled by the focus change that comes with it.
    const auto* record = engine_.block(*block_id_);
    if (!record) {
        return;
    }

    const bool dirty = is_dirty();
    committed_ = record->content;
    if (dirty || text_ == committed_) {
        return;
    }
    idle_timer_.stop();
    text_ = committed_;
    emit textChanged();
}

void DraftSession::bind(const std::optional<BlockId>& id) {
    idle_timer_.stop();
    block_id_ = id;

    const auto* record = id ? engine_.block(*id) : nullptr;
    text_ = record ? record->content : std::string{};
    committed_ = text_;

    emit bindingChanged();
    emit textChanged();
}

} // namespace arbor::engine
