#include <catch2/catch_test_macros.hpp>
#include "engine/block_engine.hpp"
#include "engine/page_cache.hpp"
#include "support/capture.hpp"
#include "support/engine_harness.hpp"

#include <QSignalSpy>

#include <string>
#include <vector>

using namespace arbor;
using namespace arbor::engine;
using arbor::testing::Capture;
using arbor::testing::EngineHarness;

namespace {

using Calls = std::vector<std::string>;
using Ids = std::vector<BlockId>;

} // namespace

TEST_CASE("Creating a block below a leaf", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<BlockId> created;
    h.engine.create_block(a, "C", created.callback());
    REQUIRE_FALSE(created.done());

    h.settle();
    REQUIRE(created.ok());
    const auto c = created.result().unwrap();

    REQUIRE(h.roots() == Ids{a, c});
    REQUIRE(h.at(c).content == "C");
    REQUIRE(h.engine.focus().is_focused(c));
    REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(0));
    REQUIRE(h.gateway.calls() == Calls{"create_block"});
    REQUIRE(h.stored_tree().children_of(std::nullopt) == Ids{a, c});
}

TEST_CASE("Creating a block below an expanded parent makes it the first child", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto b = h.append("B", a);
    h.append("next");
    REQUIRE(h.open().is_ok());

    Capture<BlockId> created;
    h.engine.create_block(a, "new", created.callback());
    h.settle();

    const auto fresh = created.result().unwrap();
    REQUIRE(h.children(a) == Ids{fresh, b});
    REQUIRE(h.stored_tree().children_of(a) == Ids{fresh, b});

    SECTION("A collapsed parent gets a sibling instead") {
        Capture<void> collapsed;
        h.engine.toggle_collapse(a, collapsed.callback());
        h.settle();
        REQUIRE(collapsed.ok());

        Capture<BlockId> sibling;
        h.engine.create_block(a, "sibling", sibling.callback());
        h.settle();

        REQUIRE(h.roots().at(1) == sibling.result().unwrap());
        REQUIRE(h.children(a).size() == 2);
    }
}

TEST_CASE("Creating without a reference appends to the root level", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    h.append("A1", a);
    REQUIRE(h.open().is_ok());

    Capture<BlockId> created;
    h.engine.create_block(std::nullopt, "last", created.callback());
    h.settle();

    REQUIRE(h.roots() == Ids{a, created.result().unwrap()});
}

TEST_CASE("Batch creation keeps the given order", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto z = h.append("Z");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<std::vector<BlockId>> created;
    h.engine.create_blocks(a, {"one", "two", "three"}, created.callback());
    h.settle();

    REQUIRE(created.ok());
    const auto& ids = created.result().unwrap();
    REQUIRE(ids.size() == 3);
    REQUIRE(h.roots() == Ids{a, ids[0], ids[1], ids[2], z});
    REQUIRE(h.at(ids[2]).content == "three");
    REQUIRE(h.gateway.calls() == Calls{"create_blocks_batch"});

    SECTION("An empty batch does nothing") {
        Capture<std::vector<BlockId>> none;
        h.engine.create_blocks(a, {}, none.callback());
        REQUIRE(none.ok());
        REQUIRE(none.result().unwrap().empty());
        REQUIRE(h.gateway.count("create_blocks_batch") == 1);
    }
}

TEST_CASE("Splitting at the cursor", "[engine]") {
    EngineHarness h;
    const auto x = h.append("Hello World");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<BlockId> split;
    h.engine.split_at_cursor(x, 5, std::nullopt, split.callback());

    // The kept half shows at once; the new block waits for the store.
    REQUIRE(h.at(x).content == "Hello");
    REQUIRE(h.engine.index().size() == 1);
    REQUIRE(h.gateway.calls() == Calls{"update_block"});

    h.settle();
    REQUIRE(split.ok());
    const auto y = split.result().unwrap();

    REQUIRE(h.gateway.calls() == Calls{"update_block", "create_block"});
    REQUIRE(h.at(x).content == "Hello");
    REQUIRE(h.at(y).content == " World");
    REQUIRE(h.roots() == Ids{x, y});
    REQUIRE(h.engine.focus().is_focused(y));
    REQUIRE(h.engine.take_target_cursor() == std::optional<size_t>(0));
    REQUIRE_FALSE(h.engine.focus().has_pending_cursor());

    auto stored = h.stored_tree();
    REQUIRE(stored.find(x)->content == "Hello");
    REQUIRE(stored.find(y)->content == " World");
}

TEST_CASE("Splitting uses the draft and lands the tail as first child", "[engine]") {
    EngineHarness h;
    const auto p = h.append("parent");
    const auto c = h.append("child", p);
    REQUIRE(h.open().is_ok());

    Capture<BlockId> split;
    h.engine.split_at_cursor(p, 3, std::string("parent edited"), split.callback());
    h.settle();

    const auto tail = split.result().unwrap();
    REQUIRE(h.at(p).content == "par");
    REQUIRE(h.at(tail).content == "ent edited");
    REQUIRE(h.children(p) == Ids{tail, c});
}

TEST_CASE("A failed split keeps the stored first half", "[engine]") {
    EngineHarness h;
    const auto x = h.append("Hello World");
    REQUIRE(h.open().is_ok());
    h.gateway.fail_next("create_block");

    Capture<BlockId> split;
    h.engine.split_at_cursor(x, 5, std::nullopt, split.callback());
    h.settle();

    REQUIRE(split.failed());
    REQUIRE(h.engine.index().size() == 1);
    REQUIRE(h.at(x).content == "Hello");
    REQUIRE(h.gateway.count("load_page_blocks") == 2);
}

TEST_CASE("Merging with the previous block", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("Bar");
    const auto q1 = h.append("Q1", q);
    const auto q2 = h.append("Q2", q);
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());

    REQUIRE(h.engine.is_merge_locked(p));
    REQUIRE(h.engine.is_merge_locked(q));
    REQUIRE(h.engine.status(q) == SyncStatus::Syncing);

    h.settle();
    REQUIRE(merged.ok());

    REQUIRE(h.gateway.calls() == Calls{"merge_blocks"});
    REQUIRE(h.at(p).content == "FooBar");
    REQUIRE_FALSE(h.engine.index().contains(q));
    REQUIRE(h.children(p) == Ids{q1, q2});
    REQUIRE(h.roots() == Ids{p});
    REQUIRE(h.engine.focus().is_focused(p));
    REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(3));
    REQUIRE_FALSE(h.engine.is_merge_locked(p));
    REQUIRE(h.engine.status(p) == SyncStatus::Synced);

    auto stored = h.stored_tree();
    REQUIRE(stored.find(p)->content == "FooBar");
    REQUIRE(stored.children_of(p) == Ids{q1, q2});
}

TEST_CASE("Merging flushes the draft first", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("Bar");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::string("Baz"), merged.callback());
    h.settle();

    REQUIRE(merged.ok());
    REQUIRE(h.gateway.calls() == Calls{"update_block", "merge_blocks"});
    REQUIRE(h.at(p).content == "FooBaz");
}

TEST_CASE("Merge lock", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("Bar");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());

    SECTION("Content commits to either block are suppressed") {
        Capture<void> stale;
        h.engine.update_content(p, "stale", stale.callback());
        REQUIRE(stale.ok());

        h.settle();
        REQUIRE(h.gateway.count("update_block") == 0);
        REQUIRE(h.at(p).content == "FooBar");
    }

    SECTION("A second merge of the same block is a no-op") {
        Capture<void> again;
        h.engine.merge_with_previous(q, std::nullopt, again.callback());
        REQUIRE(again.ok());

        h.settle();
        REQUIRE(merged.ok());
        REQUIRE(h.gateway.count("merge_blocks") == 1);
    }

    SECTION("Splitting a locked block is refused") {
        Capture<BlockId> split;
        h.engine.split_at_cursor(p, 1, std::nullopt, split.callback());
        REQUIRE(split.failed());
        REQUIRE(split.error().kind == ErrorKind::Validation);
        h.settle();
    }

    SECTION("The lock is gone once the merge completes") {
        h.settle();
        Capture<void> edit;
        h.engine.update_content(p, "FooBar!", edit.callback());
        h.settle();
        REQUIRE(edit.ok());
        REQUIRE(h.gateway.count("update_block") == 1);
    }
}

TEST_CASE("Merging an empty leaf deletes it", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());
    h.settle();

    REQUIRE(merged.ok());
    REQUIRE(h.gateway.calls() == Calls{"delete_block"});
    REQUIRE(h.roots() == Ids{p});
    REQUIRE(h.engine.focus().is_focused(p));
    REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(3));
}

TEST_CASE("A failed delete of an empty leaf keeps its focus", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("");
    REQUIRE(h.open().is_ok());
    h.engine.set_focus(q);
    h.gateway.fail_next("delete_block");

    QSignalSpy failures(&h.engine, &BlockEngine::operationFailed);

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());
    h.settle();

    REQUIRE(merged.failed());
    REQUIRE(failures.count() == 1);
    REQUIRE(h.roots() == Ids{p, q});
    REQUIRE(h.engine.focus().is_focused(q));
    REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(0));
}

TEST_CASE("Merging the first block does nothing", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    h.append("Bar");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> merged;
    h.engine.merge_with_previous(p, std::nullopt, merged.callback());

    REQUIRE(merged.ok());
    REQUIRE(h.dispatcher.pending() == 0);
    REQUIRE(h.gateway.calls().empty());
}

TEST_CASE("A failed merge reloads and restores focus", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("Bar");
    REQUIRE(h.open().is_ok());
    h.gateway.fail_next("merge_blocks");

    QSignalSpy failures(&h.engine, &BlockEngine::operationFailed);

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());
    h.settle();

    REQUIRE(merged.failed());
    REQUIRE(merged.error().kind == ErrorKind::Persistence);
    REQUIRE(failures.count() == 1);
    REQUIRE(failures.at(0).at(0).toString() == QStringLiteral("merge_with_previous"));

    REQUIRE(h.at(p).content == "Foo");
    REQUIRE(h.at(q).content == "Bar");
    REQUIRE(h.engine.focus().is_focused(q));
    REQUIRE_FALSE(h.engine.is_merge_locked(p));
    REQUIRE_FALSE(h.engine.is_merge_locked(q));
}

TEST_CASE("A merge whose response is lost recovers from the store", "[engine]") {
    EngineHarness h;
    const auto p = h.append("Foo");
    const auto q = h.append("Bar");
    REQUIRE(h.open().is_ok());
    h.gateway.lose_next_response("merge_blocks");

    Capture<void> merged;
    h.engine.merge_with_previous(q, std::nullopt, merged.callback());
    h.settle();

    REQUIRE(merged.failed());
    REQUIRE(h.at(p).content == "FooBar");
    REQUIRE_FALSE(h.engine.index().contains(q));
    REQUIRE(h.engine.focus().is_focused(p));
}

TEST_CASE("Indent and outdent", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto a1 = h.append("A1", a);
    const auto b = h.append("B");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    SECTION("Indenting the first block is a no-op") {
        Capture<void> done;
        h.engine.indent(a, done.callback());

        REQUIRE(done.ok());
        REQUIRE(h.gateway.calls().empty());
        REQUIRE(h.dispatcher.pending() == 0);
    }

    SECTION("Indent appends under the previous sibling") {
        Capture<void> done;
        h.engine.indent(b, done.callback());
        REQUIRE(h.children(a) == Ids{a1, b});

        h.settle();
        REQUIRE(done.ok());
        REQUIRE(h.gateway.calls() == Calls{"indent_block"});
        REQUIRE(h.children(a) == Ids{a1, b});
        REQUIRE(h.stored_tree().children_of(a) == Ids{a1, b});
    }

    SECTION("Outdenting a root block is a no-op") {
        Capture<void> done;
        h.engine.outdent(b, done.callback());
        REQUIRE(done.ok());
        REQUIRE(h.gateway.calls().empty());
    }

    SECTION("Outdent lands right after the former parent") {
        Capture<void> done;
        h.engine.outdent(a1, done.callback());
        REQUIRE(h.roots() == Ids{a, a1, b});

        h.settle();
        REQUIRE(done.ok());
        REQUIRE(h.roots() == Ids{a, a1, b});
        REQUIRE(h.stored_tree().children_of(std::nullopt) == Ids{a, a1, b});
    }
}

TEST_CASE("Moving blocks", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto a1 = h.append("A1", a);
    const auto b = h.append("B");
    const auto c = h.append("C");
    REQUIRE(h.open().is_ok());

    SECTION("To the front of the root level") {
        Capture<void> done;
        h.engine.move(c, std::nullopt, std::nullopt, done.callback());
        h.settle();

        REQUIRE(done.ok());
        REQUIRE(h.roots() == Ids{c, a, b});
        REQUIRE(h.stored_tree().children_of(std::nullopt) == Ids{c, a, b});
    }

    SECTION("Under another parent after a child") {
        Capture<void> done;
        h.engine.move(c, a, a1, done.callback());
        h.settle();

        REQUIRE(done.ok());
        REQUIRE(h.children(a) == Ids{a1, c});
    }

    SECTION("Into its own subtree") {
        Capture<void> done;
        h.engine.move(a, a1, std::nullopt, done.callback());

        REQUIRE(done.failed());
        REQUIRE(done.error().kind == ErrorKind::Validation);
        REQUIRE(h.dispatcher.pending() == 0);
    }

    SECTION("After a block under another parent") {
        Capture<void> done;
        h.engine.move(c, std::nullopt, a1, done.callback());
        REQUIRE(done.failed());
        REQUIRE(done.error().kind == ErrorKind::Validation);
    }
}

TEST_CASE("Deleting blocks", "[engine]") {
    SECTION("The only block of a page stays") {
        EngineHarness h;
        const auto only = h.append("only");
        REQUIRE(h.open().is_ok());
        h.gateway.clear_calls();

        Capture<void> done;
        h.engine.delete_block(only, done.callback());

        REQUIRE(done.ok());
        REQUIRE(h.gateway.calls().empty());
        REQUIRE(h.engine.index().contains(only));
    }

    SECTION("A subtree spanning the whole page is refused") {
        EngineHarness h;
        const auto a = h.append("A");
        h.append("A1", a);
        REQUIRE(h.open().is_ok());
        h.gateway.clear_calls();

        Capture<void> done;
        h.engine.delete_block(a, done.callback());

        REQUIRE(done.failed());
        REQUIRE(done.error().kind == ErrorKind::Validation);
        REQUIRE(h.gateway.calls().empty());
        REQUIRE(h.engine.index().size() == 2);
    }

    SECTION("Descendants go too and focus moves up") {
        EngineHarness h;
        const auto z = h.append("Zed");
        const auto a = h.append("A");
        const auto a1 = h.append("A1", a);
        const auto b = h.append("B");
        REQUIRE(h.open().is_ok());
        h.engine.set_focus(a1, 1);

        Capture<void> done;
        h.engine.delete_block(a, done.callback());

        REQUIRE_FALSE(h.engine.index().contains(a));
        REQUIRE_FALSE(h.engine.index().contains(a1));
        REQUIRE(h.engine.focus().is_focused(z));
        REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(3));

        h.settle();
        REQUIRE(done.ok());
        REQUIRE(h.roots() == Ids{z, b});
        REQUIRE(h.stored_tree().size() == 2);
    }

    SECTION("Deleting the first block focuses the next survivor") {
        EngineHarness h;
        const auto a = h.append("A");
        h.append("A1", a);
        const auto b = h.append("B");
        REQUIRE(h.open().is_ok());
        h.engine.set_focus(a);

        h.engine.delete_block(a);
        REQUIRE(h.engine.focus().is_focused(b));
        REQUIRE(h.engine.focus().target_cursor_offset() == std::optional<size_t>(1));
        h.settle();
    }

    SECTION("A failure restores the subtree") {
        EngineHarness h;
        const auto a = h.append("A");
        const auto a1 = h.append("A1", a);
        const auto b = h.append("B");
        REQUIRE(h.open().is_ok());
        h.gateway.fail_next("delete_block");

        Capture<void> done;
        h.engine.delete_block(a, done.callback());
        REQUIRE(h.roots() == Ids{b});

        h.settle();
        REQUIRE(done.failed());
        REQUIRE(h.roots() == Ids{a, b});
        REQUIRE(h.children(a) == Ids{a1});
    }
}

TEST_CASE("Single-record updates roll back on failure", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    h.append("A1", a);
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    QSignalSpy failures(&h.engine, &BlockEngine::operationFailed);
    h.gateway.fail_next("toggle_collapse");

    Capture<void> done;
    h.engine.toggle_collapse(a, done.callback());
    REQUIRE(h.at(a).is_collapsed);
    REQUIRE(h.engine.status(a) == SyncStatus::Syncing);

    h.settle();
    REQUIRE(done.failed());
    REQUIRE_FALSE(h.at(a).is_collapsed);
    REQUIRE(h.engine.status(a) == SyncStatus::Synced);
    REQUIRE(failures.count() == 1);
    REQUIRE(h.gateway.calls() == Calls{"toggle_collapse", "load_page_blocks"});
}

TEST_CASE("A lost response is repaired by the reload", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    REQUIRE(h.open().is_ok());
    h.gateway.lose_next_response("update_block");

    Capture<void> done;
    h.engine.update_content(a, "written anyway", done.callback());
    h.settle();

    REQUIRE(done.failed());
    REQUIRE(h.at(a).content == "written anyway");
}

TEST_CASE("Content, metadata and type updates", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    SECTION("Unchanged content is not sent") {
        Capture<void> done;
        h.engine.update_content(a, "A", done.callback());
        REQUIRE(done.ok());
        REQUIRE(h.gateway.calls().empty());
    }

    SECTION("Metadata") {
        Capture<void> done;
        h.engine.update_metadata(a, blocks::Metadata{{"status", "done"}}, done.callback());
        h.settle();

        REQUIRE(done.ok());
        REQUIRE(h.at(a).metadata.at("status") == "done");
        REQUIRE(h.store.get_block(a).unwrap().metadata.at("status") == "done");
    }

    SECTION("Code block with a language, then back to a bullet") {
        Capture<void> code;
        h.engine.set_block_type(a, blocks::BlockType::Code, std::string("python"), code.callback());
        h.settle();
        REQUIRE(code.ok());
        REQUIRE(h.at(a).block_type == blocks::BlockType::Code);
        REQUIRE(h.at(a).language == std::optional<std::string>("python"));

        Capture<void> bullet;
        h.engine.set_block_type(a, blocks::BlockType::Bullet, std::nullopt, bullet.callback());
        h.settle();
        REQUIRE(bullet.ok());
        REQUIRE_FALSE(h.at(a).language.has_value());
        REQUIRE_FALSE(h.store.get_block(a).unwrap().language.has_value());
    }

    SECTION("Unknown ids are validation errors") {
        Capture<void> done;
        h.engine.update_content("missing", "x", done.callback());
        REQUIRE(done.failed());
        REQUIRE(done.error().kind == ErrorKind::Validation);
    }
}

TEST_CASE("An empty page gets a first block", "[engine]") {
    EngineHarness h;
    Capture<void> opened;
    h.engine.open(opened.callback());

    // Page load completes; the first block is shown under a temporary id.
    REQUIRE(h.dispatcher.run_one());
    REQUIRE_FALSE(opened.done());
    REQUIRE(h.engine.index().size() == 1);

    const auto temp = *h.engine.index().first_root();
    REQUIRE(is_temp_id(temp));
    REQUIRE(h.engine.status(temp) == SyncStatus::Optimistic);
    REQUIRE(h.engine.focus().is_focused(temp));

    SECTION("Confirmation swaps the id") {
        h.settle();
        REQUIRE(opened.ok());

        const auto real = h.engine.resolve_id(temp);
        REQUIRE(real != temp);
        REQUIRE_FALSE(is_temp_id(real));
        REQUIRE(h.roots() == Ids{real});
        REQUIRE(h.engine.focus().is_focused(real));
        REQUIRE(h.engine.block(temp) == h.engine.block(real));
        REQUIRE(h.stored_tree().size() == 1);
    }

    SECTION("Edits before confirmation are sent after it") {
        Capture<void> typed;
        h.engine.update_content(temp, "typed early", typed.callback());
        REQUIRE(typed.ok());
        REQUIRE(h.engine.block(temp)->content == "typed early");
        REQUIRE(h.gateway.count("update_block") == 0);

        h.settle();
        const auto real = h.engine.resolve_id(temp);
        REQUIRE(h.gateway.count("update_block") == 1);
        REQUIRE(h.at(real).content == "typed early");
        REQUIRE(h.store.get_block(real).unwrap().content == "typed early");
    }

    SECTION("Structure changes wait for the real id") {
        Capture<BlockId> split;
        h.engine.split_at_cursor(temp, 0, std::nullopt, split.callback());
        REQUIRE(split.failed());
        REQUIRE(split.error().kind == ErrorKind::Validation);
        h.settle();
    }
}

TEST_CASE("A failed first block confirmation fails the open", "[engine]") {
    EngineHarness h;
    h.gateway.fail_next("create_block");

    Capture<void> opened;
    h.engine.open(opened.callback());
    h.settle();

    REQUIRE(opened.failed());
    REQUIRE(h.engine.index().empty());
    REQUIRE_FALSE(h.engine.focus().focused_block_id().has_value());
}

TEST_CASE("Temporary id confirmation signals the rename first", "[engine]") {
    EngineHarness h;
    std::vector<std::string> order;
    QObject::connect(&h.engine, &BlockEngine::focusChanged, [&] { order.emplace_back("focus"); });
    QObject::connect(&h.engine, &BlockEngine::blocksChanged,
                     [&](const blocks::BlocksChanged&) { order.emplace_back("blocks"); });

    h.engine.open();
    REQUIRE(h.dispatcher.run_one());
    order.clear();

    h.settle();
    REQUIRE(order.size() >= 2);
    REQUIRE(order[0] == "focus");
    REQUIRE(order[1] == "blocks");
}

TEST_CASE("Engine signals", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto b = h.append("B");

    QSignalSpy reloaded(&h.engine, &BlockEngine::pageReloaded);
    QSignalSpy tree(&h.engine, &BlockEngine::treeChanged);
    QSignalSpy changed(&h.engine, &BlockEngine::blocksChanged);
    QSignalSpy focus(&h.engine, &BlockEngine::focusChanged);
    QSignalSpy selection(&h.engine, &BlockEngine::selectionChanged);

    REQUIRE(h.open().is_ok());
    REQUIRE(reloaded.count() == 1);
    REQUIRE(tree.count() == 1);
    REQUIRE(changed.count() == 0);

    h.engine.delete_block(b);
    REQUIRE(tree.count() == 2);
    h.settle();
    REQUIRE(changed.count() == 1);

    const auto change = changed.at(0).at(0).value<blocks::BlocksChanged>();
    REQUIRE(change.updated_or_created.empty());
    REQUIRE(change.deleted_ids == Ids{b});

    h.engine.set_focus(a, 0);
    REQUIRE(focus.count() == 1);
    h.engine.set_focus("missing");
    REQUIRE(focus.count() == 1);

    h.engine.set_selection({a, "missing"});
    REQUIRE(selection.count() == 1);
    REQUIRE(h.engine.focus().selection() == Ids{a});
    h.engine.clear_selection();
    REQUIRE(selection.count() == 2);
    REQUIRE(h.engine.focus().selection().empty());
}

TEST_CASE("Opening through the page cache", "[engine][cache]") {
    PageCache cache;
    EngineHarness h({.verify_invariants = true}, &cache);
    const auto a = h.append("A");

    REQUIRE(h.open().is_ok());
    REQUIRE(cache.contains(h.page.id));
    REQUIRE(h.gateway.count("load_page_blocks") == 1);

    SECTION("A second engine opens from the cache") {
        BlockEngine second(h.gateway, h.page.id, {}, &cache);
        Capture<void> opened;
        second.open(opened.callback());

        REQUIRE(opened.ok());
        REQUIRE(second.index().contains(a));
        REQUIRE(h.gateway.count("load_page_blocks") == 1);
        REQUIRE(cache.stats().hits == 1);
    }

    SECTION("Mutations invalidate the page") {
        h.engine.update_content(a, "changed");
        h.settle();
        REQUIRE_FALSE(cache.contains(h.page.id));
    }
}

TEST_CASE("Superseded loads are dropped", "[engine]") {
    EngineHarness h;
    const auto a = h.append("A");

    Capture<void> first;
    Capture<void> second;
    h.engine.reload(first.callback());
    h.engine.reload(second.callback());
    h.settle();

    REQUIRE(first.ok());
    REQUIRE(second.ok());
    REQUIRE(h.engine.index().contains(a));
}

TEST_CASE("Continuations are dropped after the engine is gone", "[engine]") {
    testing::StoreHarness store;
    store.append("A");
    testing::ManualDispatcher dispatcher;
    gateway::LocalGateway local(store.store, dispatcher.dispatcher());

    Capture<void> opened;
    {
        BlockEngine engine(local, store.page.id);
        engine.open(opened.callback());
    }
    dispatcher.pump();
    REQUIRE_FALSE(opened.done());
}
