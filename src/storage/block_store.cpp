#include "storage/block_store.hpp"
#include "core/tree_index.hpp"

#include <algorithm>
#include <stdexcept>
#include <variant>

namespace arbor::storage {

using blocks::Block;

namespace {

using Param = std::variant<std::nullptr_t, std::string, int64_t>;

constexpr std::string_view BLOCK_COLUMNS =
    "id, page_id, parent_id, content, order_weight, is_collapsed, block_type, language, "
    "created_at, updated_at";

Param optional_param(const std::optional<std::string>& value) {
    if (value) return Param{*value};
    return Param{nullptr};
}

Result<void> bind_params(Statement& stmt, const std::vector<Param>& params) {
    for (size_t i = 0; i < params.size(); ++i) {
        const int index = static_cast<int>(i) + 1;
        auto bound = std::visit([&](const auto& value) -> Result<void> {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return stmt.bind_null(index);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return stmt.bind_text(index, value);
            } else {
                return stmt.bind_int64(index, value);
            }
        }, params[i]);
        if (bound.is_err()) {
            return bound;
        }
    }
    return Result<void>::ok();
}

Result<void> run(Database& db, std::string_view sql, const std::vector<Param>& params) {
    auto stmt_result = db.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = bind_params(stmt, params);
    if (bound.is_err()) {
        return bound;
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void>::err(step_result.unwrap_err());
    }
    return Result<void>::ok();
}

Error not_found(std::string_view what, const std::string& id) {
    return Error::validation(std::string(what) + " not found: " + id);
}

Page row_to_page(Statement& stmt) {
    return Page{
        .id = stmt.column_text(0),
        .title = stmt.column_text(1),
        .created_at = Timestamp(stmt.column_int64(2)),
        .updated_at = Timestamp(stmt.column_int64(3))
    };
}

} // namespace

// ============================================================================
// Row mapping and queries
// ============================================================================

Block BlockStore::row_to_block(Statement& stmt) {
    return Block{
        .id = stmt.column_text(0),
        .page_id = stmt.column_text(1),
        .parent_id = stmt.column_optional_text(2),
        .content = stmt.column_text(3),
        .order_weight = FractionalIndex(stmt.column_text(4)),
        .is_collapsed = stmt.column_int(5) != 0,
        .block_type = blocks::parse_type(stmt.column_text(6)).value_or(blocks::BlockType::Bullet),
        .language = stmt.column_optional_text(7),
        .metadata = {},
        .created_at = Timestamp(stmt.column_int64(8)),
        .updated_at = Timestamp(stmt.column_int64(9))
    };
}

Result<std::vector<Block>> BlockStore::query_blocks(std::string_view sql,
                                                    const std::vector<std::string>& params) {
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::vector<Block>>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    std::vector<Param> bound_params(params.begin(), params.end());
    auto bound = bind_params(stmt, bound_params);
    if (bound.is_err()) {
        return Result<std::vector<Block>>::err(bound.unwrap_err());
    }

    std::vector<Block> out;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Block>>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        try {
            out.push_back(row_to_block(stmt));
        } catch (const std::invalid_argument& e) {
            return Result<std::vector<Block>>::err(Error::persistence(
                "corrupt order_weight for block " + stmt.column_text(0) + ": " + e.what()));
        }
    }

    auto with_meta = attach_metadata(out);
    if (with_meta.is_err()) {
        return Result<std::vector<Block>>::err(with_meta.unwrap_err());
    }
    return Result<std::vector<Block>>::ok(std::move(out));
}

Result<void> BlockStore::attach_metadata(std::vector<Block>& blocks) {
    if (blocks.empty()) {
        return Result<void>::ok();
    }

    auto stmt_result = db_.prepare("SELECT key, value FROM block_metadata WHERE block_id = ? ORDER BY key;");
    if (stmt_result.is_err()) {
        return Result<void>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    for (auto& block : blocks) {
        auto reset = stmt.reset();
        if (reset.is_err()) return reset;
        auto bound = stmt.bind_text(1, block.id);
        if (bound.is_err()) return bound;

        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            block.metadata.emplace(stmt.column_text(0), stmt.column_text(1));
        }
    }
    return Result<void>::ok();
}

Result<Block> BlockStore::get_block(const BlockId& id) {
    auto rows = query_blocks(
        std::string("SELECT ") + std::string(BLOCK_COLUMNS) + " FROM blocks WHERE id = ?;", {id});
    if (rows.is_err()) {
        return Result<Block>::err(rows.unwrap_err());
    }
    auto& found = rows.unwrap();
    if (found.empty()) {
        return Result<Block>::err(not_found("block", id));
    }
    return Result<Block>::ok(std::move(found.front()));
}

Result<std::vector<Block>> BlockStore::siblings_of(const PageId& page_id,
                                                   const std::optional<BlockId>& parent_id) {
    auto sql = std::string("SELECT ") + std::string(BLOCK_COLUMNS) +
               " FROM blocks WHERE page_id = ? AND parent_id IS ? ORDER BY order_weight, id;";
    auto stmt_result = db_.prepare(sql);
    if (stmt_result.is_err()) {
        return Result<std::vector<Block>>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = bind_params(stmt, {Param{page_id}, optional_param(parent_id)});
    if (bound.is_err()) {
        return Result<std::vector<Block>>::err(bound.unwrap_err());
    }

    std::vector<Block> out;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<Block>>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        try {
            out.push_back(row_to_block(stmt));
        } catch (const std::invalid_argument& e) {
            return Result<std::vector<Block>>::err(Error::persistence(
                "corrupt order_weight for block " + stmt.column_text(0) + ": " + e.what()));
        }
    }
    // Byte order of the weight column matches FractionalIndex order; ties by id.
    std::sort(out.begin(), out.end(), blocks::sibling_less);
    return Result<std::vector<Block>>::ok(std::move(out));
}

Result<std::vector<BlockId>> BlockStore::subtree_ids(const BlockId& id) {
    auto stmt_result = db_.prepare(R"SQL(
        WITH RECURSIVE subtree(id) AS (
            SELECT id FROM blocks WHERE id = ?
            UNION ALL
            SELECT b.id FROM blocks b JOIN subtree s ON b.parent_id = s.id
        )
        SELECT id FROM subtree;
    )SQL");
    if (stmt_result.is_err()) {
        return Result<std::vector<BlockId>>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id);
    if (bound.is_err()) {
        return Result<std::vector<BlockId>>::err(bound.unwrap_err());
    }

    std::vector<BlockId> ids;
    while (true) {
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<std::vector<BlockId>>::err(step_result.unwrap_err());
        }
        if (!step_result.unwrap()) break;
        ids.push_back(stmt.column_text(0));
    }
    return Result<std::vector<BlockId>>::ok(std::move(ids));
}

Result<int> BlockStore::count_page_blocks(const PageId& page_id) {
    auto stmt_result = db_.prepare("SELECT COUNT(*) FROM blocks WHERE page_id = ?;");
    if (stmt_result.is_err()) {
        return Result<int>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, page_id);
    if (bound.is_err()) {
        return Result<int>::err(bound.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int>::err(step_result.unwrap_err());
    }
    return Result<int>::ok(stmt.column_int(0));
}

Result<FractionalIndex> BlockStore::placement(const PageId& page_id,
                                              const std::optional<BlockId>& parent_id,
                                              const std::optional<BlockId>& after,
                                              const std::optional<BlockId>& moving) {
    auto siblings = siblings_of(page_id, parent_id);
    if (siblings.is_err()) {
        return Result<FractionalIndex>::err(siblings.unwrap_err());
    }

    std::vector<const Block*> ordered;
    for (const auto& sibling : siblings.unwrap()) {
        if (moving && sibling.id == *moving) continue;
        ordered.push_back(&sibling);
    }
    return Result<FractionalIndex>::ok(blocks::weight_after(ordered, after));
}

Result<void> BlockStore::write_placement(const BlockId& id,
                                         const std::optional<BlockId>& parent_id,
                                         const FractionalIndex& weight) {
    return run(db_,
               "UPDATE blocks SET parent_id = ?, order_weight = ?, updated_at = ? WHERE id = ?;",
               {optional_param(parent_id), Param{weight.value()},
                Param{Timestamp::now().millis()}, Param{id}});
}

Result<void> BlockStore::write_metadata(const BlockId& id, const blocks::Metadata& metadata) {
    auto cleared = run(db_, "DELETE FROM block_metadata WHERE block_id = ?;", {Param{id}});
    if (cleared.is_err()) {
        return cleared;
    }
    for (const auto& [key, value] : metadata) {
        auto inserted = run(db_,
                            "INSERT INTO block_metadata (block_id, key, value) VALUES (?, ?, ?);",
                            {Param{id}, Param{key}, Param{value}});
        if (inserted.is_err()) {
            return inserted;
        }
    }
    return Result<void>::ok();
}

// ============================================================================
// Pages
// ============================================================================

Result<Page> BlockStore::create_page(std::string title) {
    auto page = arbor::create_page(std::move(title));
    auto inserted = run(db_,
                        "INSERT INTO pages (id, title, created_at, updated_at) VALUES (?, ?, ?, ?);",
                        {Param{page.id}, Param{page.title},
                         Param{page.created_at.millis()}, Param{page.updated_at.millis()}});
    if (inserted.is_err()) {
        return Result<Page>::err(inserted.unwrap_err());
    }
    return Result<Page>::ok(std::move(page));
}

Result<std::vector<Page>> BlockStore::list_pages() {
    std::vector<Page> pages;
    auto queried = db_.query("SELECT id, title, created_at, updated_at FROM pages "
                             "ORDER BY created_at, id;",
                             [&](Statement& stmt) { pages.push_back(row_to_page(stmt)); });
    if (queried.is_err()) {
        return Result<std::vector<Page>>::err(queried.unwrap_err());
    }
    return Result<std::vector<Page>>::ok(std::move(pages));
}

Result<Page> BlockStore::get_page(const PageId& id) {
    auto stmt_result = db_.prepare("SELECT id, title, created_at, updated_at FROM pages WHERE id = ?;");
    if (stmt_result.is_err()) {
        return Result<Page>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();
    auto bound = stmt.bind_text(1, id);
    if (bound.is_err()) {
        return Result<Page>::err(bound.unwrap_err());
    }
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<Page>::err(step_result.unwrap_err());
    }
    if (!step_result.unwrap()) {
        return Result<Page>::err(not_found("page", id));
    }
    return Result<Page>::ok(row_to_page(stmt));
}

// ============================================================================
// Blocks
// ============================================================================

Result<std::vector<Block>> BlockStore::load_page_blocks(const PageId& page_id) {
    auto page = get_page(page_id);
    if (page.is_err()) {
        return Result<std::vector<Block>>::err(page.unwrap_err());
    }
    return query_blocks(std::string("SELECT ") + std::string(BLOCK_COLUMNS) +
                            " FROM blocks WHERE page_id = ? ORDER BY parent_id, order_weight, id;",
                        {page_id});
}

Result<Block> BlockStore::insert_block(const blocks::CreateBlockRequest& request) {
    auto page = get_page(request.page_id);
    if (page.is_err()) {
        return Result<Block>::err(page.unwrap_err());
    }

    if (request.parent_id) {
        auto parent = get_block(*request.parent_id);
        if (parent.is_err()) {
            return parent;
        }
        if (parent.unwrap().page_id != request.page_id) {
            return Result<Block>::err(Error::validation(
                "parent " + *request.parent_id + " belongs to another page"));
        }
    }

    if (request.after_block_id) {
        auto after = get_block(*request.after_block_id);
        if (after.is_err()) {
            return after;
        }
        if (after.unwrap().parent_id != request.parent_id ||
            after.unwrap().page_id != request.page_id) {
            return Result<Block>::err(Error::validation(
                "block " + *request.after_block_id + " is not a sibling under the requested parent"));
        }
    }

    auto weight = placement(request.page_id, request.parent_id, request.after_block_id, std::nullopt);
    if (weight.is_err()) {
        return Result<Block>::err(weight.unwrap_err());
    }

    auto now = Timestamp::now();
    auto block = Block{
        .id = Uuid::generate().to_string(),
        .page_id = request.page_id,
        .parent_id = request.parent_id,
        .content = request.content,
        .order_weight = std::move(weight).unwrap(),
        .is_collapsed = false,
        .block_type = request.block_type,
        .language = std::nullopt,
        .metadata = {},
        .created_at = now,
        .updated_at = now
    };

    auto inserted = run(db_, R"SQL(
        INSERT INTO blocks (id, page_id, parent_id, content, order_weight, is_collapsed,
                            block_type, language, created_at, updated_at)
        VALUES (?, ?, ?, ?, ?, 0, ?, NULL, ?, ?);
    )SQL", {
        Param{block.id},
        Param{block.page_id},
        optional_param(block.parent_id),
        Param{block.content},
        Param{block.order_weight.value()},
        Param{std::string(blocks::type_name(block.block_type))},
        Param{block.created_at.millis()},
        Param{block.updated_at.millis()}
    });
    if (inserted.is_err()) {
        return Result<Block>::err(inserted.unwrap_err());
    }
    return Result<Block>::ok(std::move(block));
}

Result<Block> BlockStore::create_block(const blocks::CreateBlockRequest& request) {
    return db_.transaction([&]() { return insert_block(request); });
}

Result<std::vector<Block>> BlockStore::create_blocks_batch(
    const blocks::CreateBlocksBatchRequest& request) {
    if (request.contents.empty()) {
        return Result<std::vector<Block>>::err(Error::validation("batch create needs at least one block"));
    }

    return db_.transaction([&]() -> Result<std::vector<Block>> {
        std::vector<Block> created;
        created.reserve(request.contents.size());
        auto after = request.after_block_id;

        for (const auto& content : request.contents) {
            auto block = insert_block(blocks::CreateBlockRequest{
                .page_id = request.page_id,
                .parent_id = request.parent_id,
                .after_block_id = after,
                .content = content,
                .block_type = blocks::BlockType::Bullet
            });
            if (block.is_err()) {
                return Result<std::vector<Block>>::err(block.unwrap_err());
            }
            after = block.unwrap().id;
            created.push_back(std::move(block).unwrap());
        }
        return Result<std::vector<Block>>::ok(std::move(created));
    });
}

Result<Block> BlockStore::update_block(const blocks::UpdateBlockRequest& request) {
    return db_.transaction([&]() -> Result<Block> {
        auto existing = get_block(request.id);
        if (existing.is_err()) {
            return existing;
        }
        auto block = std::move(existing).unwrap();

        if (request.content) block.content = *request.content;
        if (request.is_collapsed) block.is_collapsed = *request.is_collapsed;
        if (request.block_type) block.block_type = *request.block_type;
        if (request.language) {
            block.language = request.language->empty() ? std::nullopt : request.language;
        }

        auto updated = run(db_, R"SQL(
            UPDATE blocks
            SET content = ?, is_collapsed = ?, block_type = ?, language = ?, updated_at = ?
            WHERE id = ?;
        )SQL", {
            Param{block.content},
            Param{static_cast<int64_t>(block.is_collapsed ? 1 : 0)},
            Param{std::string(blocks::type_name(block.block_type))},
            optional_param(block.language),
            Param{Timestamp::now().millis()},
            Param{block.id}
        });
        if (updated.is_err()) {
            return Result<Block>::err(updated.unwrap_err());
        }

        if (request.metadata) {
            auto written = write_metadata(block.id, *request.metadata);
            if (written.is_err()) {
                return Result<Block>::err(written.unwrap_err());
            }
        }

        return get_block(block.id);
    });
}

Result<std::vector<BlockId>> BlockStore::delete_block(const BlockId& id) {
    return db_.transaction([&]() -> Result<std::vector<BlockId>> {
        auto block = get_block(id);
        if (block.is_err()) {
            return Result<std::vector<BlockId>>::err(block.unwrap_err());
        }

        auto ids = subtree_ids(id);
        if (ids.is_err()) {
            return ids;
        }
        auto total = count_page_blocks(block.unwrap().page_id);
        if (total.is_err()) {
            return Result<std::vector<BlockId>>::err(total.unwrap_err());
        }
        if (static_cast<int>(ids.unwrap().size()) >= total.unwrap()) {
            return Result<std::vector<BlockId>>::err(
                Error::validation("cannot delete the last block of a page"));
        }

        auto deleted = run(db_, R"SQL(
            WITH RECURSIVE subtree(id) AS (
                SELECT id FROM blocks WHERE id = ?
                UNION ALL
                SELECT b.id FROM blocks b JOIN subtree s ON b.parent_id = s.id
            )
            DELETE FROM blocks WHERE id IN (SELECT id FROM subtree);
        )SQL", {Param{id}});
        if (deleted.is_err()) {
            return Result<std::vector<BlockId>>::err(deleted.unwrap_err());
        }
        return ids;
    });
}

Result<Block> BlockStore::move_block(const blocks::MoveBlockRequest& request) {
    return db_.transaction([&]() -> Result<Block> {
        auto existing = get_block(request.id);
        if (existing.is_err()) {
            return existing;
        }
        const auto block = std::move(existing).unwrap();

        if (request.new_parent_id) {
            auto parent = get_block(*request.new_parent_id);
            if (parent.is_err()) {
                return parent;
            }
            if (parent.unwrap().page_id != block.page_id) {
                return Result<Block>::err(Error::validation("cannot move a block to another page"));
            }
            auto subtree = subtree_ids(block.id);
            if (subtree.is_err()) {
                return Result<Block>::err(subtree.unwrap_err());
            }
            const auto& ids = subtree.unwrap();
            if (std::find(ids.begin(), ids.end(), *request.new_parent_id) != ids.end()) {
                return Result<Block>::err(Error::validation("cannot move a block into its own subtree"));
            }
        }

        if (request.after_block_id) {
            if (*request.after_block_id == block.id) {
                return Result<Block>::err(Error::validation("cannot place a block after itself"));
            }
            auto after = get_block(*request.after_block_id);
            if (after.is_err()) {
                return after;
            }
            if (after.unwrap().parent_id != request.new_parent_id ||
                after.unwrap().page_id != block.page_id) {
                return Result<Block>::err(Error::validation(
                    "block " + *request.after_block_id + " is not a child of the new parent"));
            }
        }

        auto weight = placement(block.page_id, request.new_parent_id, request.after_block_id, block.id);
        if (weight.is_err()) {
            return Result<Block>::err(weight.unwrap_err());
        }
        auto written = write_placement(block.id, request.new_parent_id, weight.unwrap());
        if (written.is_err()) {
            return Result<Block>::err(written.unwrap_err());
        }
        return get_block(block.id);
    });
}

Result<Block> BlockStore::indent_block(const BlockId& id) {
    return db_.transaction([&]() -> Result<Block> {
        auto existing = get_block(id);
        if (existing.is_err()) {
            return existing;
        }
        const auto block = std::move(existing).unwrap();

        auto siblings = siblings_of(block.page_id, block.parent_id);
        if (siblings.is_err()) {
            return Result<Block>::err(siblings.unwrap_err());
        }
        const auto& ordered = siblings.unwrap();
        auto it = std::find_if(ordered.begin(), ordered.end(),
                               [&](const Block& b) { return b.id == id; });
        if (it == ordered.begin() || it == ordered.end()) {
            return Result<Block>::err(Error::validation("block has no previous sibling to indent under"));
        }
        const auto& new_parent = *std::prev(it);

        auto children = siblings_of(block.page_id, new_parent.id);
        if (children.is_err()) {
            return Result<Block>::err(children.unwrap_err());
        }
        const auto& kids = children.unwrap();
        auto weight = blocks::weight_between(kids.empty() ? nullptr : &kids.back().order_weight, nullptr);

        auto written = write_placement(block.id, new_parent.id, weight);
        if (written.is_err()) {
            return Result<Block>::err(written.unwrap_err());
        }
        return get_block(block.id);
    });
}

Result<Block> BlockStore::outdent_block(const BlockId& id) {
    return db_.transaction([&]() -> Result<Block> {
        auto existing = get_block(id);
        if (existing.is_err()) {
            return existing;
        }
        const auto block = std::move(existing).unwrap();
        if (!block.parent_id) {
            return Result<Block>::err(Error::validation("block is already at the root level"));
        }

        auto parent = get_block(*block.parent_id);
        if (parent.is_err()) {
            return parent;
        }
        const auto& former_parent = parent.unwrap();

        auto weight = placement(block.page_id, former_parent.parent_id, former_parent.id, block.id);
        if (weight.is_err()) {
            return Result<Block>::err(weight.unwrap_err());
        }
        auto written = write_placement(block.id, former_parent.parent_id, weight.unwrap());
        if (written.is_err()) {
            return Result<Block>::err(written.unwrap_err());
        }
        return get_block(block.id);
    });
}

Result<std::vector<Block>> BlockStore::merge_blocks(const BlockId& source_id,
                                                    const BlockId& target_id) {
    using Out = Result<std::vector<Block>>;
    if (source_id == target_id) {
        return Out::err(Error::validation("cannot merge a block into itself"));
    }

    return db_.transaction([&]() -> Out {
        auto source_result = get_block(source_id);
        if (source_result.is_err()) {
            return Out::err(source_result.unwrap_err());
        }
        auto target_result = get_block(target_id);
        if (target_result.is_err()) {
            return Out::err(target_result.unwrap_err());
        }
        const auto source = std::move(source_result).unwrap();
        const auto target = std::move(target_result).unwrap();

        if (source.page_id != target.page_id) {
            return Out::err(Error::validation("cannot merge blocks from different pages"));
        }
        auto subtree = subtree_ids(source.id);
        if (subtree.is_err()) {
            return Out::err(subtree.unwrap_err());
        }
        const auto& source_subtree = subtree.unwrap();
        if (std::find(source_subtree.begin(), source_subtree.end(), target.id) != source_subtree.end()) {
            return Out::err(Error::validation("cannot merge a block into its own descendant"));
        }

        auto moving = siblings_of(source.page_id, source.id);
        if (moving.is_err()) {
            return Out::err(moving.unwrap_err());
        }
        auto existing_children = siblings_of(target.page_id, target.id);
        if (existing_children.is_err()) {
            return Out::err(existing_children.unwrap_err());
        }

        std::optional<FractionalIndex> last;
        for (const auto& child : existing_children.unwrap()) {
            if (child.id != source.id) last = child.order_weight;
        }

        std::vector<BlockId> moved_ids;
        for (const auto& child : moving.unwrap()) {
            auto weight = blocks::weight_between(last ? &*last : nullptr, nullptr);
            auto written = write_placement(child.id, target.id, weight);
            if (written.is_err()) {
                return Out::err(written.unwrap_err());
            }
            last = std::move(weight);
            moved_ids.push_back(child.id);
        }

        auto merged = run(db_, "UPDATE blocks SET content = ?, updated_at = ? WHERE id = ?;",
                          {Param{target.content + source.content},
                           Param{Timestamp::now().millis()}, Param{target.id}});
        if (merged.is_err()) {
            return Out::err(merged.unwrap_err());
        }

        auto removed = run(db_, "DELETE FROM blocks WHERE id = ?;", {Param{source.id}});
        if (removed.is_err()) {
            return Out::err(removed.unwrap_err());
        }

        std::vector<Block> changed;
        auto refreshed_target = get_block(target.id);
        if (refreshed_target.is_err()) {
            return Out::err(refreshed_target.unwrap_err());
        }
        changed.push_back(std::move(refreshed_target).unwrap());
        for (const auto& id : moved_ids) {
            auto child = get_block(id);
            if (child.is_err()) {
                return Out::err(child.unwrap_err());
            }
            changed.push_back(std::move(child).unwrap());
        }
        return Out::ok(std::move(changed));
    });
}

Result<Block> BlockStore::toggle_collapse(const BlockId& id) {
    return db_.transaction([&]() -> Result<Block> {
        auto existing = get_block(id);
        if (existing.is_err()) {
            return existing;
        }
        auto toggled = run(db_, "UPDATE blocks SET is_collapsed = ?, updated_at = ? WHERE id = ?;",
                           {Param{static_cast<int64_t>(existing.unwrap().is_collapsed ? 0 : 1)},
                            Param{Timestamp::now().millis()}, Param{id}});
        if (toggled.is_err()) {
            return Result<Block>::err(toggled.unwrap_err());
        }
        return get_block(id);
    });
}

} // namespace arbor::storage
