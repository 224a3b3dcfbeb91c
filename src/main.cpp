#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QTextStream>
#include <QTimer>

#include "cli/deck_list.hpp"
#include "network/rest_backend.hpp"
#include "storage/data_repository.hpp"
#include "storage/local_store.hpp"
#include "storage/migrations.hpp"
#include "sync/config.hpp"
#include "sync/logging.hpp"
#include "sync/sync_engine.hpp"

namespace {

using studysync::storage::LocalStore;

std::unique_ptr<LocalStore> open_store(const QString& dbPath) {
    auto store = LocalStore::open(dbPath.toStdString());
    if (store.is_err()) {
        QTextStream(stderr) << "Failed to open " << dbPath << ": "
                            << QString::fromStdString(store.unwrap_err().message) << Qt::endl;
        return nullptr;
    }
    return std::move(store).unwrap();
}

int print_error(const studysync::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.message) << Qt::endl;
    return 1;
}

int run_list(LocalStore& store, bool json, bool includeIds) {
    studysync::storage::DataRepository repo(store, studysync::Uuid{});
    auto loaded = repo.refresh();
    if (loaded.is_err()) {
        return print_error(loaded.unwrap_err());
    }

    const auto opts = studysync::cli::DeckListOptions{.includeIds = includeIds};
    const auto output = json
        ? studysync::cli::format_deck_tree_json(repo.decks(), repo.all_cards(), studysync::Timestamp::now(), opts)
        : studysync::cli::format_deck_tree(repo.decks(), repo.all_cards(), opts);
    QTextStream(stdout) << output;
    return 0;
}

int run_due(LocalStore& store) {
    studysync::storage::DataRepository repo(store, studysync::Uuid{});
    auto due = repo.due_count();
    if (due.is_err()) {
        return print_error(due.unwrap_err());
    }
    QTextStream(stdout) << due.unwrap() << Qt::endl;
    return 0;
}

int run_status(LocalStore& store) {
    studysync::cli::StatusReport report;

    auto batch = store.get_mutation_batch();
    if (batch.is_err()) {
        return print_error(batch.unwrap_err());
    }
    report.pending = batch.unwrap().operations();

    for (const auto& table : studysync::storage::synced_tables()) {
        auto checkpoint = store.checkpoint(table.name);
        if (checkpoint.is_err()) {
            return print_error(checkpoint.unwrap_err());
        }
        report.checkpoints[table.name] = checkpoint.unwrap();
    }

    QTextStream(stdout) << studysync::cli::format_status(report);
    return 0;
}

int run_sync(QCoreApplication& app, LocalStore& store) {
    const auto backendConfig = studysync::sync::BackendConfig::load();
    if (!backendConfig.is_configured()) {
        QTextStream(stderr) << "No sync backend configured (set STUDYSYNC_BACKEND_URL and STUDYSYNC_API_KEY)."
                            << Qt::endl;
        return 1;
    }

    studysync::network::RestBackend backend(backendConfig);
    QObject::connect(&backend, &studysync::network::RestBackend::refreshTokenChanged, &app,
                     [](const QString& token) {
                         auto config = studysync::sync::BackendConfig::load();
                         config.refresh_token = token;
                         config.save();
                     });

    studysync::sync::SyncEngine engine(store, backend, studysync::sync::SyncConfig::load());
    QObject::connect(&engine, &studysync::sync::SyncEngine::notification, &app,
                     [](const studysync::sync::Notification& n) {
                         QTextStream(stderr) << n.title << ": " << n.message << Qt::endl;
                     });

    int exitCode = 0;
    QObject::connect(&engine, &studysync::sync::SyncEngine::cycleFinished, &app,
                     [&](bool succeeded) {
                         exitCode = succeeded ? 0 : 1;
                         QTimer::singleShot(0, &app, [&app]() { app.quit(); });
                     });

    QTimer::singleShot(0, &engine, [&engine]() { engine.start(); });
    app.exec();

    auto& state = engine.state();
    QTextStream out(stdout);
    out << state.status() << Qt::endl;
    if (state.conflictsResolved() > 0) {
        out << "Conflicts resolved: " << state.conflictsResolved() << Qt::endl;
    }
    studysync::cli::StatusReport report;
    report.errors = engine.retries().errors();
    if (!report.errors.empty()) {
        out << studysync::cli::format_status(report);
    }

    engine.shutdown();
    return exitCode;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("StudySync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("StudySync");
    app.setOrganizationDomain("studysync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("StudySync local-first flashcard store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets STUDYSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption includeIdsOption(
        QStringList{QStringLiteral("ids")},
        QStringLiteral("Include IDs in CLI output."));
    parser.addOption(includeIdsOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets STUDYSYNC_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run: list, due, status or sync."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("STUDYSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugSyncOption)) {
        qputenv("STUDYSYNC_DEBUG_SYNC", "1");
    }
    if (studysync::sync::debug_logging_requested()) {
        studysync::sync::enable_debug_logging();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.first();

    studysync::sync::install_file_logging();
    qCInfo(studysyncSyncLog) << "logging to" << studysync::sync::default_log_file_path();

    const auto dbPath = studysync::sync::resolve_database_path();
    auto store = open_store(dbPath);
    if (!store) {
        return 1;
    }

    int rc = 0;
    if (command == QStringLiteral("list")) {
        rc = run_list(*store, parser.isSet(jsonOption), parser.isSet(includeIdsOption));
    } else if (command == QStringLiteral("due")) {
        rc = run_due(*store);
    } else if (command == QStringLiteral("status")) {
        rc = run_status(*store);
    } else if (command == QStringLiteral("sync")) {
        rc = run_sync(app, *store);
    } else {
        QTextStream(stderr) << "Unknown command: " << command << Qt::endl;
        rc = 2;
    }

    store->close();
    return rc;
}
