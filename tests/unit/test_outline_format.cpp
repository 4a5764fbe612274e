#include <catch2/catch_test_macros.hpp>

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QString>

#include "cli/outline_format.hpp"
#include "support/engine_harness.hpp"

using namespace arbor;
using arbor::testing::StoreHarness;

TEST_CASE("CLI: outline shows the visible tree", "[cli][outline]") {
    StoreHarness h;
    const auto a = h.append("Groceries");
    h.append("Milk", a);
    const auto eggs = h.append("Eggs", a);
    h.append("Free range", eggs);
    h.append("Call mom");

    SECTION("Expanded") {
        const auto output = cli::format_outline(h.stored_tree());
        const auto expected = QStringLiteral(
            "- Groceries\n"
            "  - Milk\n"
            "  - Eggs\n"
            "    - Free range\n"
            "- Call mom\n");
        REQUIRE(output == expected);
    }

    SECTION("Collapsed blocks hide their children") {
        REQUIRE(h.store.toggle_collapse(eggs).is_ok());
        const auto output = cli::format_outline(h.stored_tree());
        const auto expected = QStringLiteral(
            "- Groceries\n"
            "  - Milk\n"
            "  + Eggs\n"
            "- Call mom\n");
        REQUIRE(output == expected);
    }

    SECTION("With ids") {
        const auto output = cli::format_outline(h.stored_tree(), cli::OutlineFormatOptions{.includeIds = true});
        REQUIRE(output.startsWith(QStringLiteral("- Groceries (") + QString::fromStdString(a) + QStringLiteral(")\n")));
    }
}

TEST_CASE("CLI: multi-line content stays under its bullet", "[cli][outline]") {
    StoreHarness h;
    const auto a = h.append("parent");
    h.append("line one\nline two", a);

    const auto expected = QStringLiteral(
        "- parent\n"
        "  - line one\n"
        "    line two\n");
    REQUIRE(cli::format_outline(h.stored_tree()) == expected);
}

TEST_CASE("CLI: empty page prints nothing", "[cli][outline]") {
    blocks::TreeIndex empty;
    REQUIRE(cli::format_outline(empty).isEmpty());
}

TEST_CASE("CLI: outline can output JSON", "[cli][outline][json]") {
    StoreHarness h;
    const auto a = h.append("Groceries");
    const auto milk = h.append("Milk", a);
    REQUIRE(h.store.toggle_collapse(a).is_ok());
    REQUIRE(h.store.update_block(blocks::UpdateBlockRequest{
        .id = milk, .block_type = blocks::BlockType::Code, .language = "sql"}).is_ok());

    const auto output = cli::format_outline_json(h.stored_tree(), h.page.id,
                                                 cli::OutlineFormatOptions{.includeIds = true});

    const auto parsed = QJsonDocument::fromJson(output.toUtf8());
    REQUIRE(parsed.isObject());

    const auto root = parsed.object();
    REQUIRE(root.value(QStringLiteral("pageId")).toString() == QString::fromStdString(h.page.id));

    const auto blocks = root.value(QStringLiteral("blocks")).toArray();
    REQUIRE(blocks.size() == 1);
    const auto groceries = blocks.at(0).toObject();
    REQUIRE(groceries.value(QStringLiteral("id")).toString() == QString::fromStdString(a));
    REQUIRE(groceries.value(QStringLiteral("content")).toString() == QStringLiteral("Groceries"));
    REQUIRE(groceries.value(QStringLiteral("type")).toString() == QStringLiteral("bullet"));
    REQUIRE(groceries.value(QStringLiteral("collapsed")).toBool());

    // Collapsed subtrees are still exported.
    const auto children = groceries.value(QStringLiteral("children")).toArray();
    REQUIRE(children.size() == 1);
    const auto child = children.at(0).toObject();
    REQUIRE(child.value(QStringLiteral("type")).toString() == QStringLiteral("code"));
    REQUIRE(child.value(QStringLiteral("language")).toString() == QStringLiteral("sql"));
    REQUIRE(child.value(QStringLiteral("children")).toArray().isEmpty());
}

TEST_CASE("CLI: page list", "[cli][pages]") {
    StoreHarness h;
    REQUIRE(h.store.create_page("Journal").is_ok());
    const auto pages = h.store.list_pages().unwrap();

    const auto text = cli::format_page_list(pages);
    REQUIRE(text.contains(QStringLiteral("Test page\n")));
    REQUIRE(text.contains(QStringLiteral("Journal\n")));

    const auto parsed = QJsonDocument::fromJson(
        cli::format_page_list_json(pages, cli::OutlineFormatOptions{.includeIds = true}).toUtf8());
    const auto list = parsed.object().value(QStringLiteral("pages")).toArray();
    REQUIRE(list.size() == 2);
    for (const auto& entry : list) {
        REQUIRE_FALSE(entry.toObject().value(QStringLiteral("pageId")).toString().isEmpty());
        REQUIRE(entry.toObject().value(QStringLiteral("updatedAt")).toString().endsWith(QLatin1Char('Z')));
    }

    REQUIRE(cli::format_page_list({}).isEmpty());
}
