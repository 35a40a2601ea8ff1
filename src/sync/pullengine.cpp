#include "pullengine.h"
#include "syncstatestore.h"
#include "../net/synctransport.h"
#include "../net/endpoints.h"

#include <QJsonArray>
#include <QUrlQuery>
#include <QDebug>

#include <algorithm>

namespace BridgeSync {

PullEngine::PullEngine(SyncTransport *transport, SyncStateStore *state, QObject *parent)
    : QObject(parent)
    , m_transport(transport)
    , m_state(state)
{
}

QJsonValue PullEngine::userIdValue() const
{
    bool numeric = false;
    const qint64 id = m_state->userId().toLongLong(&numeric);
    if (numeric) {
        return QJsonValue(id);
    }
    return QJsonValue(m_state->userId());
}

QDateTime PullEngine::parseTime(const QVariant &value)
{
    const QString text = value.toString();
    if (text.isEmpty()) {
        return QDateTime();
    }
    QDateTime time = QDateTime::fromString(text, Qt::ISODateWithMs);
    if (!time.isValid()) {
        time = QDateTime::fromString(text, Qt::ISODate);
    }
    return time;
}

// ========== Batch pull ==========

PullResult PullEngine::batchPull(const QDateTime &since)
{
    PullResult result;

    QJsonObject request;
    request["device_id"] = m_state->deviceId();
    if (!m_models.isEmpty()) {
        request["models"] = QJsonArray::fromStringList(m_models);
    }
    if (since.isValid()) {
        request["since"] = since.toUTC().toString(Qt::ISODateWithMs);
    }
    if (m_batchSize > 0) {
        request["batch_size"] = m_batchSize;
    }

    qInfo() << "[PullEngine] Pulling updates from server...";
    const TransportReply reply = m_transport->post(Endpoints::Pull, request);
    if (!reply.ok) {
        result.error = reply.error;
        qWarning() << "[PullEngine] Pull failed:" << result.error.toString();
        return result;
    }

    const QVariantMap body = reply.body.toVariantMap();
    const QVariantMap data = body.value("data").toMap();
    int counted = 0;
    for (auto it = data.constBegin(); it != data.constEnd(); ++it) {
        QList<Payload> records;
        for (const QVariant &record : it.value().toList()) {
            records.append(record.toMap());
        }
        counted += records.size();
        result.data.insert(it.key(), records);
    }

    result.totalRecords = body.contains("total_records")
        ? body.value("total_records").toInt() : counted;
    result.syncedAt = parseTime(body.value("synced_at"));
    if (!result.syncedAt.isValid()) {
        result.syncedAt = QDateTime::currentDateTimeUtc();
    }
    result.success = true;

    qInfo() << "[PullEngine] Pull completed:" << result.totalRecords << "records from"
            << result.data.size() << "entity types";
    return result;
}

bool PullEngine::acknowledgeBatch(const PullResult &result, SyncError *error)
{
    if (!result.success) {
        return false;
    }

    QString storeError;
    if (!m_state->markInitialPullDone(result.syncedAt, &storeError)) {
        if (error) {
            *error = SyncError::make(ErrorKind::Local,
                "Could not record the applied batch: " + storeError, Endpoints::Pull);
        }
        return false;
    }
    return true;
}

// ========== Smart pull ==========

SmartPullResult PullEngine::smartPull()
{
    SmartPullResult result;
    const SyncCursor cursor = m_state->cursor();

    QJsonObject request;
    request["user_id"] = userIdValue();
    request["device_id"] = m_state->deviceId();
    if (!m_appType.isEmpty()) {
        request["app_type"] = m_appType;
    }
    if (!m_models.isEmpty()) {
        request["models"] = QJsonArray::fromStringList(m_models);
    }
    if (m_smartPullLimit > 0) {
        request["limit"] = m_smartPullLimit;
    }
    if (cursor.hasEventId()) {
        request["last_event_id"] = cursor.lastEventId;
    }

    qDebug() << "[PullEngine] Smart pull after event" << cursor.lastEventId;
    const TransportReply reply = m_transport->post(Endpoints::SmartPull, request);
    if (!reply.ok) {
        result.error = reply.error;
        qWarning() << "[PullEngine] Smart pull failed:" << result.error.toString();
        return result;
    }

    const QVariantMap body = reply.body.toVariantMap();
    int dropped = 0;
    for (const QVariant &entry : body.value("events").toList()) {
        const ChangeEvent event = ChangeEvent::fromVariantMap(entry.toMap());
        if (cursor.hasEventId() && event.id <= cursor.lastEventId) {
            qWarning() << "[PullEngine] Dropping already acknowledged event" << event.id;
            ++dropped;
            continue;
        }
        result.events.append(event);
    }
    std::sort(result.events.begin(), result.events.end(),
              [](const ChangeEvent &a, const ChangeEvent &b) { return a.id < b.id; });

    // Only events that survived the cursor filter count as updates
    result.hasUpdates = !result.events.isEmpty();
    result.newEventsCount = (dropped == 0 && body.contains("new_events_count"))
        ? qMax(body.value("new_events_count").toInt(), int(result.events.size()))
        : int(result.events.size());
    result.nextSyncToken = body.value("next_sync_token").toString();
    result.lastSyncTime = parseTime(body.value("last_sync_time"));
    result.success = true;

    if (!result.hasUpdates) {
        QString storeError;
        if (!m_state->markSynced(result.lastSyncTime.isValid()
                                 ? result.lastSyncTime : QDateTime::currentDateTimeUtc(),
                                 &storeError)) {
            qWarning() << "[PullEngine] Last sync time not saved:" << storeError;
        }
        qDebug() << "[PullEngine] No new events";
    } else {
        qInfo() << "[PullEngine] Smart pull returned" << result.events.size() << "events";
    }
    return result;
}

bool PullEngine::acknowledgeEvents(const QList<ChangeEvent> &events, SyncError *error)
{
    if (events.isEmpty()) {
        return true;
    }

    QJsonArray ids;
    qint64 highest = -1;
    for (const ChangeEvent &event : events) {
        ids.append(event.id);
        highest = std::max(highest, event.id);
    }

    QJsonObject request;
    request["event_ids"] = ids;

    const TransportReply reply = m_transport->post(Endpoints::Acknowledge, request);
    if (!reply.ok) {
        qWarning() << "[PullEngine] Acknowledge failed:" << reply.error.toString();
        if (error) {
            *error = reply.error;
        }
        return false;
    }

    if (reply.body.contains("success") && !reply.body.value("success").toBool()) {
        const SyncError rejected = SyncError::make(ErrorKind::Server,
            reply.body.value("message").toString("Acknowledgement rejected"),
            Endpoints::Acknowledge, reply.httpStatus);
        qWarning() << "[PullEngine]" << rejected.toString();
        if (error) {
            *error = rejected;
        }
        return false;
    }

    QString storeError;
    if (!m_state->advanceEventCursor(highest, &storeError) && !storeError.isEmpty()) {
        // The server saw the ack; the events come again and must be applied idempotently
        const SyncError notSaved = SyncError::make(ErrorKind::Local,
            "Could not persist the event cursor: " + storeError, Endpoints::Acknowledge);
        qWarning() << "[PullEngine]" << notSaved.toString();
        if (error) {
            *error = notSaved;
        }
        return false;
    }
    if (!m_state->markSynced(QDateTime::currentDateTimeUtc(), &storeError)) {
        qWarning() << "[PullEngine] Last sync time not saved:" << storeError;
    }
    qInfo() << "[PullEngine] Acknowledged" << events.size() << "events up to" << highest;
    return true;
}

// ========== State & health ==========

UpdatesInfo PullEngine::checkUpdates()
{
    UpdatesInfo info;

    QMap<QString, QString> query;
    query["user_id"] = m_state->userId();
    query["device_id"] = m_state->deviceId();
    if (!m_appType.isEmpty()) {
        query["app_type"] = m_appType;
    }

    const TransportReply reply = m_transport->get(Endpoints::CheckUpdates, query);
    if (!reply.ok) {
        info.error = reply.error;
        qWarning() << "[PullEngine] Update check failed:" << info.error.toString();
        return info;
    }

    info.success = true;
    info.hasUpdates = reply.body.value("has_updates").toBool();
    info.pendingEvents = reply.body.value("pending_events").toInt();
    const QJsonValue lastEventId = reply.body.value("last_event_id");
    info.lastEventId = lastEventId.isDouble() ? qint64(lastEventId.toDouble()) : -1;

    if (info.hasUpdates) {
        qInfo() << "[PullEngine] Updates available:" << info.pendingEvents << "pending events";
        QVariantMap data;
        data["pending_events"] = info.pendingEvents;
        data["last_event_id"] = info.lastEventId;
        emit lifecycleEvent(EventType::UpdatesAvailable, data);
    }
    return info;
}

RemoteSyncState PullEngine::fetchRemoteState()
{
    RemoteSyncState state;

    QMap<QString, QString> query;
    query["device_id"] = m_state->deviceId();

    const TransportReply reply = m_transport->get(Endpoints::SyncState, query);
    if (!reply.ok) {
        state.error = reply.error;
        return state;
    }

    const QVariantMap body = reply.body.toVariantMap();
    state.success = true;
    state.deviceId = body.value("device_id", m_state->deviceId()).toString();
    state.lastSyncAt = parseTime(body.value("last_sync_at"));
    state.pendingChanges = body.value("pending_changes").toInt();
    state.metadata = body.value("metadata").toMap();
    return state;
}

bool PullEngine::resetRemoteState(SyncError *error)
{
    qWarning() << "[PullEngine] Resetting sync state for device" << m_state->deviceId();

    QJsonObject request;
    request["device_id"] = m_state->deviceId();

    const TransportReply reply = m_transport->post(Endpoints::Reset, request);
    if (!reply.ok) {
        if (error) {
            *error = reply.error;
        }
        return false;
    }

    if (reply.body.contains("success") && !reply.body.value("success").toBool()) {
        if (error) {
            *error = SyncError::make(ErrorKind::Server, "Server refused the reset",
                                     Endpoints::Reset, reply.httpStatus);
        }
        return false;
    }

    QString storeError;
    if (!m_state->reset(&storeError)) {
        if (error) {
            *error = SyncError::make(ErrorKind::Local,
                "Server state was reset but the local state could not be: " + storeError,
                Endpoints::Reset);
        }
        return false;
    }
    return true;
}

// ========== Smart sync state ==========

SmartSyncState PullEngine::fetchSmartSyncState()
{
    SmartSyncState state;

    QMap<QString, QString> query;
    query["user_id"] = m_state->userId();
    query["device_id"] = m_state->deviceId();

    const TransportReply reply = m_transport->get(Endpoints::SmartSyncState, query);
    if (!reply.ok) {
        state.error = reply.error;
        return state;
    }

    const QVariantMap body = reply.body.toVariantMap();
    state.success = true;
    state.deviceId = body.value("device_id", m_state->deviceId()).toString();
    const QJsonValue lastEventId = reply.body.value("last_event_id");
    state.lastEventId = lastEventId.isDouble() ? qint64(lastEventId.toDouble()) : -1;
    state.lastSyncAt = parseTime(body.value("last_sync_at"));
    state.syncCount = body.value("sync_count").toInt();
    state.status = body.value("status", "unknown").toString();
    state.state = body.value("state").toMap();
    return state;
}

bool PullEngine::resetSmartSyncState(SyncError *error)
{
    qWarning() << "[PullEngine] Resetting smart sync state for device" << m_state->deviceId();

    QUrlQuery query;
    query.addQueryItem("user_id", m_state->userId());
    query.addQueryItem("device_id", m_state->deviceId());
    const QString path = QString(Endpoints::SmartSyncReset) + "?"
        + query.toString(QUrl::FullyEncoded);

    const TransportReply reply = m_transport->post(path, QJsonObject());
    if (!reply.ok) {
        if (error) {
            *error = reply.error;
        }
        return false;
    }

    if (reply.body.contains("success") && !reply.body.value("success").toBool()) {
        if (error) {
            *error = SyncError::make(ErrorKind::Server, "Server refused the smart sync reset",
                                     Endpoints::SmartSyncReset, reply.httpStatus);
        }
        return false;
    }

    // The event log starts over, so the local event cursor does too
    QString storeError;
    if (!m_state->resetEventCursor(&storeError)) {
        if (error) {
            *error = SyncError::make(ErrorKind::Local,
                "Could not reset the local event cursor: " + storeError,
                Endpoints::SmartSyncReset);
        }
        return false;
    }

    QVariantMap data;
    data["user_id"] = m_state->userId();
    data["device_id"] = m_state->deviceId();
    data["type"] = "smart_sync_v2";
    emit lifecycleEvent(EventType::SyncStateReset, data);
    return true;
}

SyncStatistics PullEngine::fetchStatistics()
{
    SyncStatistics stats;

    QMap<QString, QString> query;
    query["user_id"] = m_state->userId();
    query["device_id"] = m_state->deviceId();
    if (!m_appType.isEmpty()) {
        query["app_type"] = m_appType;
    }

    const TransportReply reply = m_transport->get(Endpoints::SyncStatistics, query);
    if (!reply.ok) {
        stats.error = reply.error;
        return stats;
    }

    if (!reply.body.value("stats").isObject()) {
        stats.error = SyncError::make(ErrorKind::Protocol, "Response carries no stats object",
                                      Endpoints::SyncStatistics, reply.httpStatus);
        return stats;
    }

    const QVariantMap body = reply.body.value("stats").toObject().toVariantMap();
    stats.success = true;
    stats.totalDevices = body.value("total_devices").toInt();
    stats.activeDevices = body.value("active_devices").toInt();
    stats.totalSyncs = body.value("total_syncs").toInt();
    stats.totalEventsSynced = body.value("total_events_synced").toInt();
    stats.lastSyncTime = parseTime(body.value("last_sync_time"));
    for (const QVariant &device : body.value("devices").toList()) {
        stats.devices.append(device.toMap());
    }
    return stats;
}

HealthStatus PullEngine::checkHealth()
{
    HealthStatus health;

    const TransportReply reply = m_transport->get(Endpoints::Health);
    if (!reply.ok) {
        health.error = reply.error;
        return health;
    }

    health.success = true;
    health.status = reply.body.value("status").toString("unknown");
    health.healthy = reply.body.contains("healthy")
        ? reply.body.value("healthy").toBool()
        : health.status == "healthy";
    health.version = reply.body.value("version").toString();
    return health;
}

} // namespace BridgeSync
