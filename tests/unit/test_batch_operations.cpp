#include <catch2/catch_test_macros.hpp>
#include "engine/batch_operations.hpp"
#include "support/capture.hpp"
#include "support/engine_harness.hpp"

using namespace arbor;
using namespace arbor::engine;
using arbor::testing::Capture;
using arbor::testing::EngineHarness;

namespace {

using Ids = std::vector<BlockId>;

} // namespace

TEST_CASE("Selections in document order", "[batch]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto a1 = h.append("A1", a);
    const auto b = h.append("B");
    REQUIRE(h.open().is_ok());

    REQUIRE(document_order(h.engine.index(), {b, a1, "missing", a, b}) == Ids{a, a1, b});

    SECTION("Predicates") {
        REQUIRE(can_indent(h.engine.index(), {a, b}));
        REQUIRE_FALSE(can_indent(h.engine.index(), {}));
        REQUIRE_FALSE(can_indent(h.engine.index(), {a, "missing"}));

        REQUIRE(can_outdent(h.engine.index(), {b, a1}));
        REQUIRE_FALSE(can_outdent(h.engine.index(), {a, b}));

        REQUIRE(can_collapse(h.engine.index(), {a, b}));
        REQUIRE_FALSE(can_collapse(h.engine.index(), {a1, b}));
        REQUIRE(collapsible_count(h.engine.index(), {a, a1, b}) == 1);
    }
}

TEST_CASE("Batch delete skips blocks removed with an ancestor", "[batch]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto a1 = h.append("A1", a);
    const auto b = h.append("B");
    const auto c = h.append("C");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();
    h.engine.set_selection({b, a1, a});

    Capture<void> done;
    delete_blocks(h.engine, {b, a1, a}, done.callback());
    h.settle();

    REQUIRE(done.ok());
    REQUIRE(h.gateway.count("delete_block") == 2);
    REQUIRE(h.roots() == Ids{c});
    REQUIRE(h.engine.focus().selection().empty());
}

TEST_CASE("Batch indent and outdent keep sibling order", "[batch]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto b = h.append("B");
    const auto c = h.append("C");
    REQUIRE(h.open().is_ok());

    Capture<void> indented;
    indent_blocks(h.engine, {c, b}, indented.callback());
    h.settle();

    REQUIRE(indented.ok());
    REQUIRE(h.children(a) == Ids{b, c});

    Capture<void> outdented;
    outdent_blocks(h.engine, {b, c}, outdented.callback());
    h.settle();

    REQUIRE(outdented.ok());
    REQUIRE(h.roots() == Ids{a, b, c});
    REQUIRE(h.stored_tree().children_of(std::nullopt) == Ids{a, b, c});
}

TEST_CASE("Batch operations stop at the first failure", "[batch]") {
    EngineHarness h;
    const auto a = h.append("A");
    const auto b = h.append("B");
    const auto c = h.append("C");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();
    h.gateway.fail_next("indent_block");

    Capture<void> done;
    indent_blocks(h.engine, {b, c}, done.callback());
    h.settle();

    REQUIRE(done.failed());
    REQUIRE(h.gateway.count("indent_block") == 1);
    REQUIRE(h.roots() == Ids{a, b, c});
}

TEST_CASE("Batch collapse and type change", "[batch]") {
    EngineHarness h;
    const auto a = h.append("A");
    h.append("A1", a);
    const auto b = h.append("B");
    REQUIRE(h.open().is_ok());
    h.gateway.clear_calls();

    Capture<void> collapsed;
    toggle_collapse_blocks(h.engine, {a, b}, collapsed.callback());
    h.settle();

    REQUIRE(collapsed.ok());
    REQUIRE(h.gateway.count("toggle_collapse") == 1);
    REQUIRE(h.at(a).is_collapsed);
    REQUIRE_FALSE(h.at(b).is_collapsed);

    Capture<void> typed;
    change_block_type(h.engine, {a, b}, blocks::BlockType::Fence, typed.callback());
    h.settle();

    REQUIRE(typed.ok());
    REQUIRE(h.at(a).block_type == blocks::BlockType::Fence);
    REQUIRE(h.store.get_block(b).unwrap().block_type == blocks::BlockType::Fence);
}
