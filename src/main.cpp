#include <signal.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QHash>
#include <QTimer>
#include <boost/log/trivial.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/operations/Dispatcher.hpp"
#include "core/services/EventBus.hpp"
#include "core/workflows/WorkflowFactory.hpp"
#include "ui/OperationBoard.hpp"

static srt::Dispatcher* g_dispatcher = nullptr;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("semrel-tui");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs release assistant operations in the background "
                                     "and renders their progress.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("operations",
        "Operations to start: ai_analysis, release_notes, semantic_release.", "<operation...>");
    QCommandLineOption configOpt({"c", "config"}, "Configuration file.", "path",
                                 srt::YamlConfig::defaultPath());
    QCommandLineOption releaseVersionOpt("release-version", "Version label for release notes.",
                                         "version");
    QCommandLineOption diffOpt("diff-file", "Analyze this diff instead of the working tree.", "path");
    QCommandLineOption publishOpt("publish", "Run semantic-release without --dry-run.");
    QCommandLineOption logLevelOpt("log-level", "Override logging.level.", "level");
    parser.addOptions({configOpt, releaseVersionOpt, diffOpt, publishOpt, logLevelOpt});
    parser.process(app);

    srt::YamlConfig yamlConfig;
    yamlConfig.load(parser.value(configOpt));
    if (parser.isSet(logLevelOpt))
        yamlConfig.setLogLevel(parser.value(logLevelOpt));
    srt::initLogging(yamlConfig.logLevel());

    QList<srt::OperationKind> kinds;
    for (const QString& name : parser.positionalArguments()) {
        srt::OperationKind kind;
        if (!srt::operationKindFromName(name, &kind)) {
            qWarning().noquote() << "Unknown operation" << name;
            return 2;
        }
        if (!kinds.contains(kind))
            kinds.append(kind);
    }
    if (kinds.isEmpty())
        parser.showHelp(2);

    srt::OperationParams params;
    params.config = yamlConfig.snapshot();
    params.version = parser.value(releaseVersionOpt);
    params.dryRun = parser.isSet(publishOpt) ? false : params.config.releaseDryRun;
    if (parser.isSet(diffOpt)) {
        QFile diffFile(parser.value(diffOpt));
        if (!diffFile.open(QIODevice::ReadOnly | QIODevice::Text)) {
            qWarning().noquote() << "Cannot read" << diffFile.fileName();
            return 2;
        }
        params.diff = QString::fromUtf8(diffFile.readAll());
    }

    srt::EventBus bus(params.config.eventBufferCapacity);
    srt::WorkflowFactory factory;
    srt::Dispatcher dispatcher(&bus, &factory);
    srt::OperationBoard board(&dispatcher, params.config.tickMs,
                              qint64(params.config.historyMaxAgeSec) * 1000);

    QList<srt::OperationId> started;
    for (srt::OperationKind kind : kinds) {
        const srt::StartResult r = dispatcher.start(kind, params);
        if (!r.ok()) {
            qWarning().noquote() << "Could not start" << srt::operationKindName(kind);
            continue;
        }
        started.append(r.id);
    }
    if (started.isEmpty())
        return 1;

    // Final states are captured when each worker is reaped; the board may
    // sweep the registry entry right after.
    QHash<srt::OperationId, srt::OperationStatus> finished;
    QObject::connect(&dispatcher, &srt::Dispatcher::operationFinished, &app,
                     [&](const QString& id, srt::OperationKind) {
        if (started.contains(id))
            finished.insert(id, dispatcher.status(id));
    });

    // Print a row only when its text changed since the previous frame.
    QHash<srt::OperationId, QString> printed;
    QObject::connect(&board, &srt::OperationBoard::frameRendered, &app, [&]() {
        for (int i = 0; i < board.rowCount(); ++i) {
            const QModelIndex idx = board.index(i);
            const QString id = board.data(idx, srt::OperationBoard::OperationIdRole).toString();
            const QString line = board.data(idx, srt::OperationBoard::LineRole).toString();
            if (printed.value(id) != line) {
                printed.insert(id, line);
                qInfo().noquote() << line;
            }
        }

        if (finished.size() == started.size())
            app.quit();
    });

    g_dispatcher = &dispatcher;
    signal(SIGINT, [](int) {
        QMetaObject::invokeMethod(g_dispatcher, []() {
            for (const auto& op : g_dispatcher->listRunning())
                g_dispatcher->cancel(op.second);
        }, Qt::QueuedConnection);
    });

    board.start();
    app.exec();
    board.stop();

    int exitCode = 0;
    for (const auto& id : started) {
        const srt::OperationStatus s = finished.value(id);
        if (s.state != srt::OperationState::Completed)
            exitCode = 1;
        else if (s.kind == srt::OperationKind::ReleaseNotesGeneration)
            qInfo().noquote() << s.result.toMap().value("content").toString();
    }

    dispatcher.shutdown();
    g_dispatcher = nullptr;
    BOOST_LOG_TRIVIAL(info) << "[Main] Exiting with code " << exitCode;
    return exitCode;
}
