#pragma once

#include "core/page.hpp"
#include "core/tree_index.hpp"

#include <QString>

#include <vector>

namespace arbor::cli {

struct OutlineFormatOptions {
    bool includeIds = false;
};

// Visible outline, two spaces per level. Blocks with hidden children are
// marked "+" instead of "-".
[[nodiscard]] QString format_outline(const blocks::TreeIndex& index,
                                     const OutlineFormatOptions& options = {});

// JSON output (collapsed subtrees included):
// {
//   "pageId"?,
//   "blocks": [{ "id"?, "content", "type", "language"?, "collapsed", "children": [ ... ] }]
// }
[[nodiscard]] QString format_outline_json(const blocks::TreeIndex& index,
                                          const PageId& page_id,
                                          const OutlineFormatOptions& options = {});

[[nodiscard]] QString format_page_list(const std::vector<Page>& pages,
                                       const OutlineFormatOptions& options = {});

// { "pages": [{ "pageId"?, "title", "updatedAt" }] }
[[nodiscard]] QString format_page_list_json(const std::vector<Page>& pages,
                                            const OutlineFormatOptions& options = {});

} // namespace arbor::cli
