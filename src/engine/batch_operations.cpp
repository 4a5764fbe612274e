#include "engine/batch_operations.hpp"

#include "app/logging.hpp"

#include <QPointer>

#include <algorithm>
#include <functional>
#include <memory>
#include <unordered_map>

namespace arbor::engine {

namespace {

using Step = std::function<void(BlockEngine&, const BlockId&, Callback<void>)>;

struct Run {
    QPointer<BlockEngine> engine;
    std::vector<BlockId> ids;
    size_t next = 0;
    Step step;
    Callback<void> done;
};

void finish(const std::shared_ptr<Run>& run, Result<void> result) {
    if (run->done) {
        auto done = std::move(run->done);
        run->done = nullptr;
        done(std::move(result));
    }
}

void advance(const std::shared_ptr<Run>& run) {
    while (run->next < run->ids.size()) {
        if (!run->engine) {
            return;
        }
        const auto id = run->ids[run->next++];
        if (!run->engine->block(id)) {
            qCDebug(arborEngineLog) << "Batch skips" << id.c_str() << "which no longer exists";
            continue;
        }
        run->step(*run->engine, id, [run](Result<void> result) {
            if (result.is_err()) {
                qCWarning(arborEngineLog) << "Batch stopped after" << run->next << "of"
                                          << run->ids.size() << "blocks:"
                                          << result.unwrap_err().message.c_str();
                finish(run, std::move(result));
                return;
            }
            advance(run);
        });
        return;
    }
    finish(run, Result<void>::ok());
}

void run_sequence(BlockEngine& engine, std::vector<BlockId> ids, Step step, Callback<void> done) {
    auto run = std::make_shared<Run>();
    run->engine = &engine;
    run->ids = std::move(ids);
    run->step = std::move(step);
    run->done = std::move(done);
    advance(run);
}

} // namespace

std::vector<BlockId> document_order(const blocks::TreeIndex& index, const std::vector<BlockId>& ids) {
    std::unordered_map<BlockId, size_t> position;
    size_t at = 0;
    for (const auto& block : index.flatten()) {
        position.emplace(block.id, at++);
    }

    std::vector<BlockId> out;
    for (const auto& id : ids) {
        if (position.contains(id) && std::find(out.begin(), out.end(), id) == out.end()) {
            out.push_back(id);
        }
    }
    std::sort(out.begin(), out.end(), [&position](const BlockId& a, const BlockId& b) {
        return position.at(a) < position.at(b);
    });
    return out;
}

void delete_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done) {
    QPointer<BlockEngine> guard(&engine);
    run_sequence(engine, document_order(engine.index(), ids),
        [](BlockEngine& e, const BlockId& id, Callback<void> next) {
            e.delete_block(id, std::move(next));
        },
        [guard, done = std::move(done)](Result<void> result) {
            if (guard && result.is_ok()) {
                guard->clear_selection();
            }
            if (done) done(std::move(result));
        });
}

void indent_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done) {
    run_sequence(engine, document_order(engine.index(), ids),
        [](BlockEngine& e, const BlockId& id, Callback<void> next) {
            e.indent(id, std::move(next));
        },
        std::move(done));
}

void outdent_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done) {
    auto ordered = document_order(engine.index(), ids);
    std::reverse(ordered.begin(), ordered.end());
    run_sequence(engine, std::move(ordered),
        [](BlockEngine& e, const BlockId& id, Callback<void> next) {
            e.outdent(id, std::move(next));
        },
        std::move(done));
}

void toggle_collapse_blocks(BlockEngine& engine, std::vector<BlockId> ids, Callback<void> done) {
    std::vector<BlockId> collapsible;
    for (const auto& id : document_order(engine.index(), ids)) {
        if (engine.index().has_children(id)) collapsible.push_back(id);
    }
    run_sequence(engine, std::move(collapsible),
        [](BlockEngine& e, const BlockId& id, Callback<void> next) {
            e.toggle_collapse(id, std::move(next));
        },
        std::move(done));
}

void change_block_type(BlockEngine& engine,
                       std::vector<BlockId> ids,
                       blocks::BlockType type,
                       Callback<void> done) {
    run_sequence(engine, document_order(engine.index(), ids),
        [type](BlockEngine& e, const BlockId& id, Callback<void> next) {
            const auto* block = e.block(id);
            auto language = block ? block->language : std::nullopt;
            e.set_block_type(id, type, std::move(language), std::move(next));
        },
        std::move(done));
}

bool can_indent(const blocks::TreeIndex& index, const std::vector<BlockId>& ids) {
    return !ids.empty() && std::all_of(ids.begin(), ids.end(), [&index](const BlockId& id) {
        return index.contains(id);
    });
}

bool can_outdent(const blocks::TreeIndex& index, const std::vector<BlockId>& ids) {
    return std::any_of(ids.begin(), ids.end(), [&index](const BlockId& id) {
        const auto* block = index.find(id);
        return block && block->parent_id.has_value();
    });
}

bool can_collapse(const blocks::TreeIndex& index, const std::vector<BlockId>& ids) {
    return collapsible_count(index, ids) > 0;
}

size_t collapsible_count(const blocks::TreeIndex& index, const std::vector<BlockId>& ids) {
    return static_cast<size_t>(std::count_if(ids.begin(), ids.end(), [&index](const BlockId& id) {
        return index.has_children(id);
    }));
}

} // namespace arbor::engine
