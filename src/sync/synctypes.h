#ifndef SYNCTYPES_H
#define SYNCTYPES_H

#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QList>
#include <QMap>
#include <QVariant>
#include <QVariantMap>

#include "syncerror.h"

/**
 * @file synctypes.h
 * @brief Common types and enums for the sync layer
 *
 * Payloads travel as QVariantMap (string/number/bool/list/map/null).
 * They are projected into the typed records below as soon as they
 * cross a component boundary.
 */

namespace BridgeSync {

using Payload = QVariantMap;

/**
 * @brief Kind of local mutation staged in the outbox
 */
enum class ChangeOperation {
    Create,
    Update,
    Delete
};

QString operationToString(ChangeOperation op);
bool operationFromString(const QString &text, ChangeOperation *op);

/**
 * @brief Server classification of a version mismatch
 */
enum class ConflictKind {
    BothModified,   ///< Local and remote edited the same record
    RemoteDeleted,  ///< Local edit on a record the server deleted
    Unknown
};

QString conflictKindToString(ConflictKind kind);
ConflictKind conflictKindFromString(const QString &text);

/**
 * @brief Caller decision for one conflict
 *
 * There is no default: every conflict needs an explicit choice.
 */
enum class ResolutionChoice {
    KeepLocal,
    KeepRemote,
    Merged          ///< Requires a merged payload
};

QString resolutionChoiceToString(ResolutionChoice choice);

/**
 * @brief Orchestrator cycle phases
 */
enum class SyncPhase {
    Idle,
    Pushing,
    Pulling,
    Resolving,
    Failed
};

QString syncPhaseToString(SyncPhase phase);

/**
 * @brief Lifecycle notification names
 */
namespace EventType {
constexpr const char *SyncStarted = "sync.started";
constexpr const char *SyncCompleted = "sync.completed";
constexpr const char *SyncFailed = "sync.failed";
constexpr const char *SyncCancelled = "sync.cancelled";
constexpr const char *ConflictDetected = "sync.conflict.detected";
constexpr const char *ConflictResolved = "sync.conflict.resolved";
constexpr const char *UpdatesAvailable = "updates.available";
constexpr const char *SyncStateReset = "sync.state_reset";
}

/**
 * @brief Synchronization position for one (user, device) pair
 */
struct SyncCursor {
    qint64 lastEventId = -1;    ///< -1 until the first event is acknowledged
    QDateTime lastSyncAt;
    bool initialPullDone = false;
    int pendingChanges = 0;

    bool hasEventId() const { return lastEventId >= 0; }
    bool isFirstSync() const { return !hasEventId() && !initialPullDone; }
};

/**
 * @brief One local mutation awaiting delivery
 *
 * Never mutated after staging. A superseding edit is a new change
 * with a new idempotency key.
 */
struct PendingChange {
    QString entityType;
    qint64 targetId = 0;        ///< Negative for records not created on the server yet
    ChangeOperation operation = ChangeOperation::Update;
    Payload values;
    QString idempotencyKey;
    QDateTime createdAt;

    bool isValid() const;

    /// Wire form sent inside a push batch (entity type is the batch key)
    QVariantMap toWire() const;

    /// Persistent form, including the entity type
    QVariantMap toVariantMap() const;
    static PendingChange fromVariantMap(const QVariantMap &map);

    static PendingChange create(const QString &entityType, qint64 targetId,
                                ChangeOperation operation, const Payload &values);
    static QString generateIdempotencyKey();
};

/**
 * @brief A pending change the server refused because of a version mismatch
 */
struct Conflict {
    QString conflictId;
    PendingChange change;
    Payload localPayload;
    Payload remotePayload;
    ConflictKind kind = ConflictKind::Unknown;
    QDateTime detectedAt;

    QVariantMap toVariantMap() const;
    static Conflict fromVariantMap(const QVariantMap &map);
};

/**
 * @brief A change the server rejected permanently
 */
struct RejectedChange {
    QString idempotencyKey;
    QString entityType;
    QString reason;
    Payload details;
};

struct PushResult {
    bool success = false;
    SyncError error;
    QStringList successful;             ///< Idempotency keys applied by the server
    QList<RejectedChange> failed;       ///< Removed from the outbox, never retried
    QList<Conflict> conflicts;          ///< Kept in the outbox until resolved
    int submitted = 0;

    bool hasConflicts() const { return !conflicts.isEmpty(); }
};

struct PullResult {
    bool success = false;
    SyncError error;
    QMap<QString, QList<Payload>> data;     ///< Entity type -> full payloads
    int totalRecords = 0;
    QDateTime syncedAt;
};

/**
 * @brief One entry of the server change log
 */
struct ChangeEvent {
    qint64 id = 0;
    QString entityType;
    qint64 recordId = 0;
    QString event;              ///< "create", "write", "unlink", ...
    QDateTime timestamp;
    Payload payload;

    static ChangeEvent fromVariantMap(const QVariantMap &map);
};

struct SmartPullResult {
    bool success = false;
    SyncError error;
    bool hasUpdates = false;
    int newEventsCount = 0;
    QList<ChangeEvent> events;
    QString nextSyncToken;
    QDateTime lastSyncTime;

    /// Highest event id in this batch, -1 when empty
    qint64 highestEventId() const;
};

struct UpdatesInfo {
    bool success = false;
    SyncError error;
    bool hasUpdates = false;
    int pendingEvents = 0;
    qint64 lastEventId = -1;
};

struct RemoteSyncState {
    bool success = false;
    SyncError error;
    QString deviceId;
    QDateTime lastSyncAt;
    int pendingChanges = 0;
    Payload metadata;
};

/**
 * @brief Server-side event cursor of the smart sync log
 */
struct SmartSyncState {
    bool success = false;
    SyncError error;
    QString deviceId;
    qint64 lastEventId = -1;
    QDateTime lastSyncAt;
    int syncCount = 0;
    QString status;
    Payload state;
};

/**
 * @brief Sync activity of one user across devices
 */
struct SyncStatistics {
    bool success = false;
    SyncError error;
    int totalDevices = 0;
    int activeDevices = 0;
    int totalSyncs = 0;
    int totalEventsSynced = 0;
    QDateTime lastSyncTime;
    QList<Payload> devices;
};

struct HealthStatus {
    bool success = false;
    SyncError error;
    bool healthy = false;
    QString status;
    QString version;
};

struct ResolutionRequest {
    QString conflictId;
    ResolutionChoice choice = ResolutionChoice::KeepLocal;
    Payload mergedPayload;      ///< Only used with ResolutionChoice::Merged
};

struct ResolutionFailure {
    QString conflictId;
    SyncError error;
};

struct ResolutionResult {
    QStringList resolved;
    QList<ResolutionFailure> failed;

    bool allResolved() const { return failed.isEmpty(); }
};

/**
 * @brief Result of a query issued through the field fallback
 */
struct QueryResult {
    bool success = false;
    SyncError error;
    QList<Payload> records;
    QStringList fieldsUsed;
    int fallbackLevel = 1;
    QStringList invalidFields;
};

/**
 * @brief Result of one orchestrated Push -> Pull -> Resolve cycle
 */
struct SyncCycleResult {
    bool success = false;
    bool cancelled = false;
    SyncError error;
    SyncPhase failedPhase = SyncPhase::Idle;
    PushResult push;
    PullResult batchPull;
    SmartPullResult smartPull;
    bool usedBatchPull = false;
    ResolutionResult resolution;
    RemoteSyncState finalState;     ///< Server view after the cycle, when it could be fetched
    QDateTime startTime;
    QDateTime endTime;

    qint64 durationMs() const {
        return startTime.msecsTo(endTime);
    }

    QString summary() const;
};

} // namespace BridgeSync

// Register types for Qt metatype system (needed for cross-thread signals)
Q_DECLARE_METATYPE(BridgeSync::SyncCycleResult)
Q_DECLARE_METATYPE(BridgeSync::SyncPhase)

#endif // SYNCTYPES_H
