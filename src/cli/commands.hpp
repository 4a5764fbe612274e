#pragma once

#include <QString>
#include <QStringList>

#include <optional>

#include "core/result.hpp"
#include "engine/block_engine.hpp"

namespace arbor::cli {

enum class Command {
    Pages,
    NewPage,
    Show,
    Add,
    Split,
    Merge,
    Indent,
    Outdent,
    Delete,
    Collapse,
    Move
};

[[nodiscard]] std::optional<Command> parse_command(const QString& name);

// Commands that open a page and go through the block engine.
[[nodiscard]] bool is_block_command(Command command);

struct CommandOptions {
    Command command = Command::Show;
    QString pageId;
    QString blockId;   // --id
    QString afterId;   // --after
    QString parentId;  // --parent
    int offset = 0;    // --offset
    QStringList text;  // remaining positional arguments
};

// Checks that the options a command needs are present.
[[nodiscard]] Result<void> validate_options(const CommandOptions& options);

// Runs a block command on an opened engine. done fires once the engine has
// reconciled the result with the store.
void run_block_command(engine::BlockEngine& engine,
                       const CommandOptions& options,
                       engine::Callback<void> done);

} // namespace arbor::cli
