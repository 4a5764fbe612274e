#include "cli/commands.hpp"

#include <string>
#include <vector>

namespace arbor::cli {

namespace {

[[nodiscard]] std::string trimmed(const QString& s) {
    return s.trimmed().toStdString();
}

[[nodiscard]] std::optional<BlockId> optional_id(const QString& s) {
    const auto id = trimmed(s);
    if (id.empty()) {
        return std::nullopt;
    }
    return id;
}

[[nodiscard]] bool needs_block_id(Command command) {
    switch (command) {
        case Command::Split:
        case Command::Merge:
        case Command::Indent:
        case Command::Outdent:
        case Command::Delete:
        case Command::Collapse:
        case Command::Move:
            return true;
        default:
            return false;
    }
}

[[nodiscard]] engine::Callback<BlockId> drop_id(engine::Callback<void> done) {
    return [done = std::move(done)](Result<BlockId> result) {
        if (!done) return;
        done(result.is_ok() ? Result<void>::ok() : Result<void>::err(result.unwrap_err()));
    };
}

} // namespace

std::optional<Command> parse_command(const QString& name) {
    if (name == QStringLiteral("pages")) return Command::Pages;
    if (name == QStringLiteral("new-page")) return Command::NewPage;
    if (name == QStringLiteral("show")) return Command::Show;
    if (name == QStringLiteral("add")) return Command::Add;
    if (name == QStringLiteral("split")) return Command::Split;
    if (name == QStringLiteral("merge")) return Command::Merge;
    if (name == QStringLiteral("indent")) return Command::Indent;
    if (name == QStringLiteral("outdent")) return Command::Outdent;
    if (name == QStringLiteral("delete")) return Command::Delete;
    if (name == QStringLiteral("collapse")) return Command::Collapse;
    if (name == QStringLiteral("move")) return Command::Move;
    return std::nullopt;
}

bool is_block_command(Command command) {
    return command != Command::Pages && command != Command::NewPage;
}

Result<void> validate_options(const CommandOptions& options) {
    if (options.command == Command::NewPage && options.text.join(QLatin1Char(' ')).trimmed().isEmpty()) {
        return Result<void>::err(Error::validation("Page title is required"));
    }
    if (!is_block_command(options.command)) {
        return Result<void>::ok();
    }
    if (options.pageId.trimmed().isEmpty()) {
        return Result<void>::err(Error::validation("--page is required"));
    }
    if (needs_block_id(options.command) && options.blockId.trimmed().isEmpty()) {
        return Result<void>::err(Error::validation("--id is required"));
    }
    if (options.command == Command::Add && options.text.isEmpty()) {
        return Result<void>::err(Error::validation("Block text is required"));
    }
    if (options.command == Command::Split && options.offset < 0) {
        return Result<void>::err(Error::validation("--offset must not be negative"));
    }
    return Result<void>::ok();
}

void run_block_command(engine::BlockEngine& engine,
                       const CommandOptions& options,
                       engine::Callback<void> done) {
    const auto id = trimmed(options.blockId);

    switch (options.command) {
        case Command::Show:
            if (done) done(Result<void>::ok());
            return;

        case Command::Add: {
            std::vector<std::string> contents;
            for (const auto& text : options.text) {
                contents.push_back(text.toStdString());
            }
            if (contents.size() == 1) {
                engine.create_block(optional_id(options.afterId), std::move(contents.front()),
                                    drop_id(std::move(done)));
                return;
            }
            engine.create_blocks(optional_id(options.afterId), std::move(contents),
                [done = std::move(done)](Result<std::vector<BlockId>> result) {
                    if (!done) return;
                    done(result.is_ok() ? Result<void>::ok() : Result<void>::err(result.unwrap_err()));
                });
            return;
        }

        case Command::Split:
            engine.split_at_cursor(id, static_cast<size_t>(options.offset), std::nullopt,
                                   drop_id(std::move(done)));
            return;

        case Command::Merge:
            engine.merge_with_previous(id, std::nullopt, std::move(done));
            return;

        case Command::Indent:
            engine.indent(id, std::move(done));
            return;

        case Command::Outdent:
            engine.outdent(id, std::move(done));
            return;

        case Command::Delete:
            engine.delete_block(id, std::move(done));
            return;

        case Command::Collapse:
            engine.toggle_collapse(id, std::move(done));
            return;

        case Command::Move:
            engine.move(id, optional_id(options.parentId), optional_id(options.afterId), std::move(done));
            return;

        case Command::Pages:
        case Command::NewPage:
            break;
    }

    if (done) {
        done(Result<void>::err(Error::validation("not a block command")));
    }
}

} // namespace arbor::cli
