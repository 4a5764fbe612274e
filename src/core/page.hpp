#pragma once

#include "core/types.hpp"
#include <string>

namespace arbor {

/**
 * Page - A titled outline. Its blocks are loaded and edited through the
 * block engine; the page itself only carries identity and a title.
 */
struct Page {
    PageId id;
    std::string title;
    Timestamp created_at;
    Timestamp updated_at;

    bool operator==(const Page&) const = default;
};

/**
 * Create a new page with a freshly minted id.
 */
[[nodiscard]] inline Page create_page(std::string title) {
    auto now = Timestamp::now();
    return Page{
        .id = Uuid::generate().to_string(),
        .title = std::move(title),
        .created_at = now,
        .updated_at = now
    };
}

} // namespace arbor
