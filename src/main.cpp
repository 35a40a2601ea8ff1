#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTextStream>
#include <QTimer>
#include <QDebug>

#include "bridgesync_version.h"
#include "syncclient.h"
#include "syncsettings.h"
#include "net/httptransport.h"
#include "sync/syncstatestore.h"
#include "sync/syncorchestrator.h"
#include "sync/pullengine.h"
#include "sync/conflictresolver.h"
#include "query/recordqueryservice.h"

using namespace BridgeSync;

namespace {

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

QTextStream &err()
{
    static QTextStream stream(stderr);
    return stream;
}

int fail(const QString &message)
{
    err() << "bridgesync: " << message << Qt::endl;
    return 1;
}

QString timeText(const QDateTime &time)
{
    return time.isValid() ? time.toString(Qt::ISODate) : QString("never");
}

bool parsePayload(const QString &text, Payload *payload, QString *error)
{
    if (text.isEmpty()) {
        payload->clear();
        return true;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        *error = QString("Invalid JSON object: %1").arg(parseError.errorString());
        return false;
    }
    *payload = doc.object().toVariantMap();
    return true;
}

// ========== Commands ==========

int runSync(SyncClient &client)
{
    const SyncCycleResult result = client.orchestrator()->syncNow();
    out() << result.summary() << Qt::endl;

    for (const RejectedChange &rejected : result.push.failed) {
        out() << "  rejected " << rejected.entityType << " " << rejected.idempotencyKey
              << ": " << rejected.reason << Qt::endl;
    }
    for (const Conflict &conflict : result.push.conflicts) {
        out() << "  conflict " << conflict.conflictId << " on " << conflict.change.entityType
              << " #" << conflict.change.targetId << Qt::endl;
    }
    for (const ResolutionFailure &failure : result.resolution.failed) {
        out() << "  unresolved " << failure.conflictId << ": " << failure.error.toString() << Qt::endl;
    }
    if (result.finalState.success) {
        out() << "  server: last sync " << timeText(result.finalState.lastSyncAt) << ", "
              << result.finalState.pendingChanges << " pending" << Qt::endl;
    }
    return result.success ? 0 : 1;
}

int runCheck(SyncClient &client)
{
    const UpdatesInfo info = client.orchestrator()->pullEngine()->checkUpdates();
    if (!info.success) {
        return fail(info.error.toString());
    }
    out() << (info.hasUpdates ? "Updates available" : "Up to date")
          << " (pending events: " << info.pendingEvents
          << ", last event: " << info.lastEventId << ")" << Qt::endl;
    return 0;
}

int runPull(SyncClient &client)
{
    PullEngine *pull = client.orchestrator()->pullEngine();

    // Inspection only: nothing is acknowledged
    if (client.state()->isFirstSync()) {
        const PullResult result = pull->batchPull();
        if (!result.success) {
            return fail(result.error.toString());
        }
        out() << "Batch pull: " << result.totalRecords << " records, synced at "
              << timeText(result.syncedAt) << Qt::endl;
        for (auto it = result.data.constBegin(); it != result.data.constEnd(); ++it) {
            out() << "  " << it.key() << ": " << it.value().size() << Qt::endl;
        }
        return 0;
    }

    const SmartPullResult result = pull->smartPull();
    if (!result.success) {
        return fail(result.error.toString());
    }
    out() << "Smart pull: " << result.events.size() << " new events" << Qt::endl;
    for (const ChangeEvent &event : result.events) {
        out() << "  #" << event.id << " " << event.event << " " << event.entityType
              << " " << event.recordId << Qt::endl;
    }
    return 0;
}

int runStatus(SyncClient &client)
{
    const SyncCursor cursor = client.state()->cursor();
    out() << "User:            " << client.settings().userId() << Qt::endl;
    out() << "Device:          " << client.settings().deviceId() << Qt::endl;
    out() << "Last event id:   " << (cursor.hasEventId() ? QString::number(cursor.lastEventId)
                                                         : QString("none")) << Qt::endl;
    out() << "Last sync:       " << timeText(cursor.lastSyncAt) << Qt::endl;
    out() << "Pending changes: " << cursor.pendingChanges << Qt::endl;
    out() << "Open conflicts:  " << client.state()->conflictCount() << Qt::endl;

    const HealthStatus health = client.orchestrator()->pullEngine()->checkHealth();
    if (!health.success) {
        out() << "Server:          unreachable (" << health.error.toString() << ")" << Qt::endl;
        return 1;
    }
    out() << "Server:          " << health.status;
    if (!health.version.isEmpty()) {
        out() << " (" << health.version << ")";
    }
    out() << Qt::endl;

    const RemoteSyncState remote = client.orchestrator()->pullEngine()->fetchRemoteState();
    if (remote.success) {
        out() << "Server view:     last sync " << timeText(remote.lastSyncAt)
              << ", " << remote.pendingChanges << " pending" << Qt::endl;
    }

    const SmartSyncState smart = client.orchestrator()->pullEngine()->fetchSmartSyncState();
    if (smart.success) {
        out() << "Event log:       " << smart.status << ", last event "
              << (smart.lastEventId >= 0 ? QString::number(smart.lastEventId) : QString("none"))
              << ", " << smart.syncCount << " syncs" << Qt::endl;
    }
    return 0;
}

int runStats(SyncClient &client)
{
    const SyncStatistics stats = client.orchestrator()->pullEngine()->fetchStatistics();
    if (!stats.success) {
        return fail(stats.error.toString());
    }
    out() << "Devices:         " << stats.activeDevices << " active of "
          << stats.totalDevices << Qt::endl;
    out() << "Syncs:           " << stats.totalSyncs << Qt::endl;
    out() << "Events synced:   " << stats.totalEventsSynced << Qt::endl;
    out() << "Last sync:       " << timeText(stats.lastSyncTime) << Qt::endl;
    for (const Payload &device : stats.devices) {
        out() << "  " << device.value("device_id").toString() << " "
              << device.value("last_sync_at").toString() << Qt::endl;
    }
    return 0;
}

int runReset(SyncClient &client, const QStringList &args)
{
    SyncError error;
    if (args.value(1) == "events") {
        if (!client.orchestrator()->pullEngine()->resetSmartSyncState(&error)) {
            return fail(error.toString());
        }
        out() << "Event log restarted for device " << client.settings().deviceId() << Qt::endl;
        return 0;
    }

    if (!client.orchestrator()->pullEngine()->resetRemoteState(&error)) {
        return fail(error.toString());
    }
    out() << "Sync state reset for device " << client.settings().deviceId() << Qt::endl;
    return 0;
}

int runStage(SyncClient &client, const QStringList &args)
{
    if (args.size() < 4) {
        return fail("usage: stage <entity> <create|update|delete> <id> [json]");
    }

    ChangeOperation operation;
    if (!operationFromString(args.at(2), &operation)) {
        return fail(QString("Unknown operation: %1").arg(args.at(2)));
    }

    bool ok = false;
    const qint64 id = args.at(3).toLongLong(&ok);
    if (!ok) {
        return fail(QString("Invalid record id: %1").arg(args.at(3)));
    }

    Payload values;
    QString error;
    if (!parsePayload(args.value(4), &values, &error)) {
        return fail(error);
    }

    QString key;
    if (!client.stageChange(args.at(1), operation, id, values, &error, &key)) {
        return fail(error);
    }
    out() << "Staged " << key << Qt::endl;
    return 0;
}

int runConflicts(SyncClient &client)
{
    const QList<Conflict> conflicts = client.state()->conflicts();
    if (conflicts.isEmpty()) {
        out() << "No open conflicts" << Qt::endl;
        return 0;
    }

    for (const Conflict &conflict : conflicts) {
        out() << conflict.conflictId << "  " << conflict.change.entityType << " #"
              << conflict.change.targetId << "  " << conflictKindToString(conflict.kind)
              << "  detected " << timeText(conflict.detectedAt) << Qt::endl;
        out() << "  local:  " << QJsonDocument(QJsonObject::fromVariantMap(conflict.localPayload))
                                     .toJson(QJsonDocument::Compact) << Qt::endl;
        out() << "  remote: " << QJsonDocument(QJsonObject::fromVariantMap(conflict.remotePayload))
                                     .toJson(QJsonDocument::Compact) << Qt::endl;
    }
    return 0;
}

int runResolve(SyncClient &client, const QStringList &args)
{
    if (args.size() < 3) {
        return fail("usage: resolve <conflict-id> <keep_local|keep_remote|merged> [json]");
    }

    ResolutionRequest request;
    request.conflictId = args.at(1);
    const QString choice = args.at(2);
    if (choice == "keep_local") {
        request.choice = ResolutionChoice::KeepLocal;
    } else if (choice == "keep_remote") {
        request.choice = ResolutionChoice::KeepRemote;
    } else if (choice == "merged") {
        request.choice = ResolutionChoice::Merged;
        QString error;
        if (!parsePayload(args.value(3), &request.mergedPayload, &error)) {
            return fail(error);
        }
    } else {
        return fail(QString("Unknown resolution: %1").arg(choice));
    }

    const ResolutionResult result = client.orchestrator()->conflictResolver()->resolve({request});
    if (!result.allResolved()) {
        return fail(result.failed.first().error.toString());
    }
    out() << "Resolved " << request.conflictId << Qt::endl;
    return 0;
}

int runQuery(SyncClient &client, const QStringList &args)
{
    if (args.size() < 2) {
        return fail("usage: query <entity> [field,field,...] [limit]");
    }

    RecordQueryService::SearchOptions options;
    if (args.size() > 3) {
        options.limit = args.at(3).toInt();
    }
    const QStringList fields = args.value(2).split(',', Qt::SkipEmptyParts);

    const QueryResult result = client.records()->searchRead(args.at(1), fields, options);
    if (!result.success) {
        return fail(result.error.toString());
    }

    if (!result.invalidFields.isEmpty()) {
        out() << "Skipped invalid fields: " << result.invalidFields.join(", ")
              << " (level " << result.fallbackLevel << ")" << Qt::endl;
    }
    for (const Payload &record : result.records) {
        out() << QJsonDocument(QJsonObject::fromVariantMap(record)).toJson(QJsonDocument::Compact)
              << Qt::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("BridgeSync");
    app.setApplicationVersion(BRIDGESYNC_VERSION_STRING);
    app.setOrganizationName("BridgeSync");

    QCommandLineParser parser;
    parser.setApplicationDescription("Offline-first synchronization client");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption({"c", "config"}, "Configuration file.", "file",
                                    SyncSettings::defaultConfigPath());
    QCommandLineOption verboseOption({"v", "verbose"}, "Show debug output.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command",
        "sync | check | pull | status | stats | reset [events] | watch | stage | conflicts"
        " | resolve | query");
    parser.process(app);

    if (!parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }

    SyncSettings settings(parser.value(configOption));
    if (!settings.load()) {
        return fail(QString("Cannot read configuration %1").arg(settings.configFilePath()));
    }

    SyncClient client(settings);
    QString error;
    if (!client.initialize(&error)) {
        return fail(error);
    }

    const QString command = args.first();
    if (command == "sync") {
        return runSync(client);
    } else if (command == "check") {
        return runCheck(client);
    } else if (command == "pull") {
        return runPull(client);
    } else if (command == "status") {
        return runStatus(client);
    } else if (command == "stats") {
        return runStats(client);
    } else if (command == "reset") {
        return runReset(client, args);
    } else if (command == "stage") {
        return runStage(client, args);
    } else if (command == "conflicts") {
        return runConflicts(client);
    } else if (command == "resolve") {
        return runResolve(client, args);
    } else if (command == "query") {
        return runQuery(client, args);
    } else if (command == "watch") {
        QObject::connect(&client, &SyncClient::lifecycleEvent,
                         [](const QString &type, const QVariantMap &data) {
            out() << type << " " << QJsonDocument(QJsonObject::fromVariantMap(data))
                                        .toJson(QJsonDocument::Compact) << Qt::endl;
        });
        QObject::connect(&client, &SyncClient::backendUnreachable, &app, [&app]() {
            err() << "bridgesync: backend unreachable, giving up" << Qt::endl;
            app.exit(1);
        });
        QTimer::singleShot(0, &client, &SyncClient::startWatching);
        return app.exec();
    }

    return fail(QString("Unknown command: %1").arg(command));
}
