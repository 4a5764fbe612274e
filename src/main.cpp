#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>

#include "app/config.hpp"
#include "app/logging.hpp"
#include "cli/commands.hpp"
#include "cli/outline_format.hpp"
#include "engine/block_engine.hpp"
#include "engine/page_cache.hpp"
#include "gateway/local_gateway.hpp"
#include "storage/block_store.hpp"
#include "storage/database.hpp"
#include "storage/migrations.hpp"

namespace {

int fail(const arbor::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("Arbor");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Arbor");
    app.setOrganizationDomain("arbor.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Arbor outline engine"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets ARBOR_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs in output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption pageOption(
        QStringList{QStringLiteral("page")},
        QStringLiteral("Page to operate on."),
        QStringLiteral("pageId"));
    parser.addOption(pageOption);

    const QCommandLineOption blockOption(
        QStringList{QStringLiteral("id")},
        QStringLiteral("Block to operate on."),
        QStringLiteral("blockId"));
    parser.addOption(blockOption);

    const QCommandLineOption afterOption(
        QStringList{QStringLiteral("after")},
        QStringLiteral("Reference block: 'add' inserts below it, 'move' places the block after it."),
        QStringLiteral("blockId"));
    parser.addOption(afterOption);

    const QCommandLineOption parentOption(
        QStringList{QStringLiteral("parent")},
        QStringLiteral("New parent for 'move' (root level when omitted)."),
        QStringLiteral("blockId"));
    parser.addOption(parentOption);

    const QCommandLineOption offsetOption(
        QStringList{QStringLiteral("offset")},
        QStringLiteral("Byte offset for 'split'."),
        QStringLiteral("offset"),
        QStringLiteral("0"));
    parser.addOption(offsetOption);

    const QCommandLineOption debugEngineOption(
        QStringList{QStringLiteral("debug-engine")},
        QStringLiteral("Enable engine debug logging (also sets ARBOR_DEBUG_ENGINE=1)."));
    parser.addOption(debugEngineOption);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("pages | new-page | show | add | split | merge | indent | outdent | delete | collapse | move"));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("ARBOR_DB_PATH", parser.value(dbPathOption).toUtf8());
    }

    const bool debugEngine = parser.isSet(debugEngineOption) ||
                             qEnvironmentVariableIntValue("ARBOR_DEBUG_ENGINE") == 1;
    if (debugEngine) {
        qputenv("ARBOR_DEBUG_ENGINE", "1");
        arbor::app::enable_debug_logging();
    }

    arbor::app::install_file_logging();
    qCDebug(arborEngineLog) << "Logging to" << arbor::app::default_log_file_path();

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    const auto command = arbor::cli::parse_command(positional.takeFirst());
    if (!command) {
        QTextStream(stderr) << "Unknown command\n";
        return 1;
    }

    bool offsetOk = false;
    arbor::cli::CommandOptions options{
        .command = *command,
        .pageId = parser.value(pageOption),
        .blockId = parser.value(blockOption),
        .afterId = parser.value(afterOption),
        .parentId = parser.value(parentOption),
        .offset = parser.value(offsetOption).toInt(&offsetOk),
        .text = positional,
    };
    if (!offsetOk) {
        QTextStream(stderr) << "--offset must be a number\n";
        return 1;
    }
    if (auto valid = arbor::cli::validate_options(options); valid.is_err()) {
        return fail(valid.unwrap_err());
    }

    auto opened = arbor::storage::Database::open(arbor::app::resolve_database_path().toStdString());
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }
    auto db = std::move(opened).unwrap();
    if (auto migrated = arbor::storage::initialize_database(db); migrated.is_err()) {
        return fail(migrated.unwrap_err());
    }
    arbor::storage::BlockStore store(db);

    const auto formatOptions = arbor::cli::OutlineFormatOptions{.includeIds = parser.isSet(includeIdsOption)};
    const bool json = parser.isSet(jsonOption);

    if (options.command == arbor::cli::Command::Pages) {
        auto pages = store.list_pages();
        if (pages.is_err()) {
            return fail(pages.unwrap_err());
        }
        QTextStream(stdout) << (json ? arbor::cli::format_page_list_json(pages.unwrap(), formatOptions)
                                     : arbor::cli::format_page_list(pages.unwrap(), formatOptions));
        return 0;
    }

    if (options.command == arbor::cli::Command::NewPage) {
        auto page = store.create_page(options.text.join(QLatin1Char(' ')).trimmed().toStdString());
        if (page.is_err()) {
            return fail(page.unwrap_err());
        }
        QTextStream(stdout) << QString::fromStdString(page.unwrap().id) << QLatin1Char('\n');
        return 0;
    }

    const auto pageId = options.pageId.trimmed().toStdString();
    if (auto page = store.get_page(pageId); page.is_err()) {
        return fail(page.unwrap_err());
    }

    const auto settings = arbor::app::load_engine_settings();
    arbor::engine::PageCache cache(static_cast<size_t>(settings.page_cache_capacity),
                                   settings.page_cache_ttl);
    arbor::gateway::LocalGateway gateway(store, arbor::gateway::queued_dispatcher(&app));
    arbor::engine::BlockEngine engine(gateway,
                                      pageId,
                                      arbor::engine::EngineOptions{
                                          .verify_invariants = settings.verify_invariants,
                                          .commit_debounce = settings.commit_debounce,
                                      },
                                      &cache);

    // Print the outline the store ended up with, even after a failed
    // operation (the engine reloads in that case).
    auto finish = [&](arbor::Result<void> result) {
        const int code = result.is_ok() ? 0 : fail(result.unwrap_err());
        engine.reload([&, code](arbor::Result<void> reloaded) {
            if (reloaded.is_err()) {
                app.exit(fail(reloaded.unwrap_err()));
                return;
            }
            QTextStream(stdout) << (json ? arbor::cli::format_outline_json(engine.index(), pageId, formatOptions)
                                         : arbor::cli::format_outline(engine.index(), formatOptions));
            app.exit(code);
        });
    };

    QTimer::singleShot(0, &app, [&] {
        engine.open([&](arbor::Result<void> result) {
            if (result.is_err()) {
                app.exit(fail(result.unwrap_err()));
                return;
            }
            arbor::cli::run_block_command(engine, options, finish);
        });
    });

    return app.exec();
}
