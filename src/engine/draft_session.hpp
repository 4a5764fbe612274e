#pragma once

#include "engine/block_engine.hpp"

#include <QObject>
#include <QTimer>

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace arbor::engine {

/**
 * DraftSession - The editing surface's side of the focused block.
 *
 * While a block is focused its text lives here as a draft that may run ahead
 * of the engine. The draft is written back (committed) on blur, before
 * structural operations, and after an idle timeout. Commits of one block are
 * strictly sequenced: a commit requested while another is in flight waits
 * for it and then writes the latest text.
 *
 * The session follows the engine's focus. Change notifications for the
 * bound block only replace the draft when the engine has a cursor request
 * pending, i.e. right after a structural operation moved the caret. A page
 * reload replaces a clean draft with the reloaded record.
 */
class DraftSession : public QObject {
    Q_OBJECT

public:
    /**
     * Commits after the engine's configured idle interval.
     */
    explicit DraftSession(BlockEngine& engine, QObject* parent = nullptr);
    DraftSession(BlockEngine& engine, std::chrono::milliseconds idle_commit, QObject* parent = nullptr);
    ~DraftSession() override;

    [[nodiscard]] std::chrono::milliseconds idle_commit() const { return idle_timer_.intervalAsDuration(); }

    [[nodiscard]] const std::optional<BlockId>& block_id() const noexcept { return block_id_; }
    [[nodiscard]] const std::string& text() const noexcept { return text_; }
    [[nodiscard]] bool is_bound() const noexcept { return block_id_.has_value(); }
    [[nodiscard]] bool is_dirty() const { return block_id_ && text_ != committed_; }
    [[nodiscard]] bool commit_in_flight() const;

    /**
     * Keystroke: replace the draft and restart the idle timer.
     */
    void edit(std::string text);

    /**
     * Write the draft to the engine now. Completes once this text is stored.
     */
    void commit(Callback<void> done = {});

    /**
     * Commit and release focus.
     */
    void blur(Callback<void> done = {});

    /**
     * Split the bound block at a byte offset of the draft. The draft shows
     * the kept half right away and gets its full text back if the split is
     * refused or fails.
     */
    void split(size_t offset, Callback<BlockId> done = {});
    void merge_with_previous(Callback<void> done = {});
    void indent(Callback<void> done = {});
    void outdent(Callback<void> done = {});

signals:
    /**
     * The draft was replaced from the engine's copy; the surface must redraw.
     */
    void textChanged();
    void bindingChanged();

private:
    struct QueuedCommit {
        std::string text;
        std::vector<Callback<void>> waiters;
    };

    void on_focus_changed();
    void on_blocks_changed(const blocks::BlocksChanged& change);
    void on_page_reloaded();

    void bind(const std::optional<BlockId>& id);
    void commit_block(const BlockId& id, std::string text, Callback<void> done);
    void start_commit(const BlockId& id, std::string text, std::vector<Callback<void>> waiters);

    /**
     * Drop a queued commit that a structural operation makes obsolete; its
     * waiters complete successfully.
     */
    void supersede_queued(const BlockId& id);

    /**
     * Undo the optimistic draft update of a structural operation that did
     * not go through, unless the draft moved on in the meantime.
     */
    void restore_draft(const BlockId& id, const std::string& expected, std::string draft);

    void commit_and(void (BlockEngine::*operation)(const BlockId&, Callback<void>),
                    Callback<void> done);

    BlockEngine& engine_;
    QTimer idle_timer_;

    std::optional<BlockId> block_id_;
    std::string text_;
    std::string committed_;

    std::set<BlockId> in_flight_;
    std::map<BlockId, QueuedCommit> queued_;
};

} // namespace arbor::engine
