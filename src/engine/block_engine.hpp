#pragma once

#include "core/tree_index.hpp"
#include "engine/focus_state.hpp"
#include "engine/merge_lock.hpp"
#include "gateway/block_gateway.hpp"

#include <QObject>
#include <QString>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor::engine {

class PageCache;

using gateway::Callback;

/**
 * SyncStatus - How far a block's local record is from the store's.
 */
enum class SyncStatus {
    Synced,      // matches the last canonical record
    Optimistic,  // created locally, id not yet confirmed
    Syncing      // a gateway call for it is in flight
};

struct EngineOptions {
    /**
     * Run TreeIndex::verify() after every reconciliation; a violation
     * triggers a full reload.
     */
    bool verify_invariants = false;

    /**
     * Idle interval after which an editing session commits its draft.
     */
    std::chrono::milliseconds commit_debounce{300};
};

/**
 * BlockEngine - Owns the tree of one open page and every mutation of it.
 *
 * Operations first apply what can be computed locally, then call the
 * gateway and reconcile with its canonical records. A failed single-record
 * operation is rolled back and the page is reloaded; a failed multi-record
 * operation (split, merge, batch create) only reloads.
 *
 * One engine per open page. All calls happen on the thread owning the
 * engine; continuations arrive through the gateway's dispatcher and are
 * dropped if the engine is destroyed first.
 *
 * Every operation takes an optional continuation. Validation errors are
 * reported through it synchronously and leave the state untouched.
 */
class BlockEngine : public QObject {
    Q_OBJECT

public:
    BlockEngine(gateway::BlockGateway& gateway,
                PageId page_id,
                EngineOptions options = {},
                PageCache* cache = nullptr,
                QObject* parent = nullptr);
    ~BlockEngine() override;

    [[nodiscard]] const PageId& page_id() const noexcept { return page_id_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }
    [[nodiscard]] const blocks::TreeIndex& index() const noexcept { return index_; }
    [[nodiscard]] const FocusState& focus() const noexcept { return focus_; }
    [[nodiscard]] bool is_loaded() const noexcept { return loaded_; }

    [[nodiscard]] const blocks::Block* block(const BlockId& id) const;
    [[nodiscard]] SyncStatus status(const BlockId& id) const;
    [[nodiscard]] bool is_merge_locked(const BlockId& id) const;

    /**
     * Current id of a block: the confirmed id for a temporary id that has
     * been swapped, otherwise id itself.
     */
    [[nodiscard]] BlockId resolve_id(const BlockId& id) const;

    // ------------------------------------------------------------------
    // Loading
    // ------------------------------------------------------------------

    /**
     * Load the page, from the page cache when it holds a fresh copy. An
     * empty page gets a first block right away.
     */
    void open(Callback<void> done = {});

    /**
     * Replace the whole tree with the store's current state.
     */
    void reload(Callback<void> done = {});

    // ------------------------------------------------------------------
    // Mutations
    // ------------------------------------------------------------------

    /**
     * Create a block below `after` using the insert-below rule, or at the end
     * of the root level without `after`. On an empty page the block is shown
     * at once under a temporary id that is swapped when the store confirms.
     * Focuses the new block at offset 0.
     */
    void create_block(const std::optional<BlockId>& after,
                      std::string content,
                      Callback<BlockId> done = {});

    /**
     * Batch import: the first block goes below `after` (insert-below rule),
     * each next one after the previous. Atomic at the gateway.
     */
    void create_blocks(const std::optional<BlockId>& after,
                       std::vector<std::string> contents,
                       Callback<std::vector<BlockId>> done = {});

    /**
     * Content commit. Suppressed while the block holds the merge lock; queued
     * until confirmation while the block has a temporary id.
     */
    void update_content(const BlockId& id, std::string content, Callback<void> done = {});
    void update_metadata(const BlockId& id, blocks::Metadata metadata, Callback<void> done = {});
    void set_block_type(const BlockId& id,
                        blocks::BlockType type,
                        std::optional<std::string> language = std::nullopt,
                        Callback<void> done = {});

    /**
     * Delete a block and its descendants. A no-op when the page has a single
     * block; refused when the subtree spans the whole page.
     */
    void delete_block(const BlockId& id, Callback<void> done = {});

    /**
     * Split at a byte offset of `draft` (or the stored content): the block
     * keeps the text before the offset, a new block placed by the
     * insert-below rule gets the rest. The kept half is persisted before the
     * new block is created.
     */
    void split_at_cursor(const BlockId& id,
                         size_t offset,
                         const std::optional<std::string>& draft = std::nullopt,
                         Callback<BlockId> done = {});

    /**
     * Append the block's text to the previous visible block, moving its
     * children there. An empty block without children is deleted instead.
     */
    void merge_with_previous(const BlockId& id,
                             const std::optional<std::string>& draft = std::nullopt,
                             Callback<void> done = {});

    void indent(const BlockId& id, Callback<void> done = {});
    void outdent(const BlockId& id, Callback<void> done = {});

    /**
     * Reparent and reorder: under new_parent (root when empty), right after
     * `after` (first when empty), which must be a child of new_parent.
     */
    void move(const BlockId& id,
              const std::optional<BlockId>& new_parent,
              const std::optional<BlockId>& after,
              Callback<void> done = {});

    void toggle_collapse(const BlockId& id, Callback<void> done = {});

    // ------------------------------------------------------------------
    // Navigation and focus
    // ------------------------------------------------------------------

    [[nodiscard]] std::optional<BlockId> previous_visible(const BlockId& id) const;
    [[nodiscard]] std::optional<BlockId> next_visible(const BlockId& id) const;

    void set_focus(const BlockId& id, std::optional<size_t> cursor_offset = std::nullopt);
    void clear_focus();

    /**
     * Consume the caret offset requested by the last structural operation.
     */
    [[nodiscard]] std::optional<size_t> take_target_cursor();

    void set_selection(std::vector<BlockId> ids);
    void toggle_selected(const BlockId& id);
    void clear_selection();

signals:
    /**
     * Canonical records confirmed by the store, after any successful
     * mutation. May repeat records already delivered.
     */
    void blocksChanged(const arbor::blocks::BlocksChanged& change);

    /**
     * The tree changed in any way, including optimistic edits and rollbacks.
     */
    void treeChanged();

    void pageReloaded();
    void focusChanged();
    void selectionChanged();
    void operationFailed(const QString& operation, const QString& message);

private:
    /**
     * Records replaced by an optimistic edit, enough to undo it.
     */
    struct Snapshot {
        std::vector<blocks::Block> previous;
        std::vector<BlockId> created;
    };

    using GuardHandle = std::shared_ptr<MergeLock::Guard>;

    /**
     * The block, or a validation error when it is unknown or (with
     * persisted) still carries a temporary id.
     */
    [[nodiscard]] Result<const blocks::Block*> require(const BlockId& id, bool persisted) const;
    [[nodiscard]] Result<void> validate_record(const blocks::Block& block) const;
    [[nodiscard]] Result<blocks::InsertTarget> target_below(const std::optional<BlockId>& after) const;

    [[nodiscard]] Result<void> install(const std::vector<blocks::Block>& records);
    void apply_local(const std::vector<blocks::Block>& upserts, const std::vector<BlockId>& removals);
    void rollback(const Snapshot& snapshot);

    /**
     * Reconcile canonical records into the index and broadcast them.
     * Malformed records are rejected before anything is applied.
     */
    [[nodiscard]] Result<void> apply_change(blocks::BlocksChanged change);
    void fail_and_reload(const char* operation, const Error& error);

    void create_first_block(std::string content, Callback<BlockId> done);
    [[nodiscard]] Result<BlockId> confirm_temp_block(const BlockId& temp_id,
                                                     Result<blocks::Block> result);

    /**
     * Optimistically apply `updated` in place of the current record; the
     * returned callback reconciles with the gateway response.
     */
    [[nodiscard]] Callback<blocks::Block> begin_single(const char* operation,
                                                       const blocks::Block& updated,
                                                       Callback<void> done);
    void finish_single(const char* operation,
                       const Snapshot& snapshot,
                       Result<blocks::Block> result,
                       const Callback<void>& done);

    void run_merge(const BlockId& id,
                   const BlockId& target_id,
                   size_t cursor,
                   GuardHandle guard,
                   Callback<void> done);
    void fail_merge(const BlockId& id,
                    const BlockId& target_id,
                    const GuardHandle& guard,
                    const Error& error,
                    const Callback<void>& done);
    void restore_focus_after_merge(const BlockId& id, const BlockId& target_id);

    void begin_sync(const BlockId& id);
    void end_sync(const BlockId& id);

    gateway::BlockGateway& gateway_;
    PageId page_id_;
    EngineOptions options_;
    PageCache* cache_;

    blocks::TreeIndex index_;
    FocusState focus_;
    MergeLock merge_lock_;
    bool loaded_ = false;
    uint64_t load_generation_ = 0;

    std::unordered_map<BlockId, BlockId> temp_to_real_;
    std::unordered_map<BlockId, std::string> pending_content_;
    std::unordered_map<BlockId, int> in_flight_;
};

} // namespace arbor::engine

Q_DECLARE_METATYPE(arbor::blocks::BlocksChanged)
