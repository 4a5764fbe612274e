#include "cli/outline_format.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QStringList>

namespace arbor::cli {

namespace {

[[nodiscard]] QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

[[nodiscard]] QString render_id_suffix(const std::string& id, bool includeIds) {
    return includeIds ? (QStringLiteral(" (") + qstr(id) + QStringLiteral(")")) : QString{};
}

[[nodiscard]] QString render_block_line(const blocks::Block& block,
                                        const blocks::VisibleRow& row,
                                        bool includeIds) {
    const auto indent = QString(row.depth * 2, QLatin1Char(' '));
    const auto marker = (block.is_collapsed && row.has_children) ? QStringLiteral("+ ")
                                                                 : QStringLiteral("- ");
    // Multi-line content stays under its bullet.
    auto content = qstr(block.content);
    content.replace(QLatin1Char('\n'), QLatin1Char('\n') + indent + QStringLiteral("  "));
    return indent + marker + content + render_id_suffix(block.id, includeIds);
}

[[nodiscard]] QJsonObject block_to_json(const blocks::Block& block, bool includeIds) {
    QJsonObject obj;
    if (includeIds) {
        obj.insert(QStringLiteral("id"), qstr(block.id));
    }
    obj.insert(QStringLiteral("content"), qstr(block.content));
    obj.insert(QStringLiteral("type"), QString::fromLatin1(blocks::type_name(block.block_type).data()));
    if (block.language) {
        obj.insert(QStringLiteral("language"), qstr(*block.language));
    }
    obj.insert(QStringLiteral("collapsed"), block.is_collapsed);
    obj.insert(QStringLiteral("children"), QJsonArray{});
    return obj;
}

[[nodiscard]] QJsonArray render_subtree_json(const blocks::TreeIndex& index,
                                             const blocks::ParentKey& parent,
                                             bool includeIds) {
    QJsonArray out;
    for (const auto& id : index.children_of(parent)) {
        const auto* block = index.find(id);
        if (!block) continue;
        auto obj = block_to_json(*block, includeIds);
        obj.insert(QStringLiteral("children"), render_subtree_json(index, id, includeIds));
        out.append(obj);
    }
    return out;
}

} // namespace

QString format_outline(const blocks::TreeIndex& index, const OutlineFormatOptions& options) {
    QStringList out;
    for (const auto& row : index.visible_rows()) {
        const auto* block = index.find(row.id);
        if (!block) continue;
        out.append(render_block_line(*block, row, options.includeIds));
    }

    if (out.isEmpty()) {
        return {};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_outline_json(const blocks::TreeIndex& index,
                            const PageId& page_id,
                            const OutlineFormatOptions& options) {
    QJsonObject root;
    if (options.includeIds) {
        root.insert(QStringLiteral("pageId"), qstr(page_id));
    }
    root.insert(QStringLiteral("blocks"), render_subtree_json(index, std::nullopt, options.includeIds));
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

QString format_page_list(const std::vector<Page>& pages, const OutlineFormatOptions& options) {
    QStringList out;
    for (const auto& page : pages) {
        out.append(qstr(page.title) + render_id_suffix(page.id, options.includeIds));
    }

    if (out.isEmpty()) {
        return {};
    }
    return out.join(QLatin1Char('\n')) + QLatin1Char('\n');
}

QString format_page_list_json(const std::vector<Page>& pages, const OutlineFormatOptions& options) {
    QJsonArray pagesJson;
    for (const auto& page : pages) {
        QJsonObject obj;
        if (options.includeIds) {
            obj.insert(QStringLiteral("pageId"), qstr(page.id));
        }
        obj.insert(QStringLiteral("title"), qstr(page.title));
        obj.insert(QStringLiteral("updatedAt"), qstr(page.updated_at.to_iso_string()));
        pagesJson.append(obj);
    }

    QJsonObject root;
    root.insert(QStringLiteral("pages"), pagesJson);
    return QString::fromUtf8(QJsonDocument(root).toJson(QJsonDocument::Compact)) + QLatin1Char('\n');
}

} // namespace arbor::cli
