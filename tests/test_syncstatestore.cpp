/**
 * @file test_syncstatestore.cpp
 * @brief Unit tests for SyncStateStore
 *
 * Tests the cursor, the outbox, conflict bookkeeping and persistence.
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include "sync/syncstatestore.h"
#include "store/jsonfilestore.h"
#include "flakystore.h"

using namespace BridgeSync;

namespace {

PendingChange makeChange(const QString &entity, qint64 id, const QString &key = QString())
{
    PendingChange change = PendingChange::create(entity, id, ChangeOperation::Update,
                                                 {{"name", QString("Record %1").arg(id)}});
    if (!key.isEmpty()) {
        change.idempotencyKey = key;
    }
    return change;
}

Conflict makeConflict(const QString &conflictId, const PendingChange &change)
{
    Conflict conflict;
    conflict.conflictId = conflictId;
    conflict.change = change;
    conflict.localPayload = change.values;
    conflict.remotePayload = {{"name", "Remote"}};
    conflict.kind = ConflictKind::BothModified;
    conflict.detectedAt = QDateTime::currentDateTimeUtc();
    return conflict;
}

}

class TestSyncStateStore : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void cleanup();

    // ========== Cursor Tests ==========
    void testIsFirstSyncInitial();
    void testAdvanceEventCursor();
    void testCursorNeverMovesBackwards();
    void testMarkSynced();
    void testInitialPullEndsFirstSync();
    void testCursorCountsPendingChanges();

    // ========== Outbox Tests ==========
    void testStageChange();
    void testStageRejectsInvalidChange();
    void testStageRejectsDuplicateKey();
    void testStageNotDurableIsNotStaged();
    void testPushableChangesGroupedByEntity();
    void testRemovePendingChanges();

    // ========== Conflict Tests ==========
    void testRecordConflict();
    void testRecordConflictRequiresPendingChange();
    void testRecordConflictReplacesPrevious();
    void testConflictedChangeNotPushable();
    void testRemoveConflictDropsChange();

    // ========== Persistence Tests ==========
    void testSaveAndLoad();
    void testLoadNonExistent();
    void testLoadCorruptFile();
    void testResetKeepsOutbox();
    void testInitialPullFlagPersisted();
    void testLegacyStateDerivesInitialPull();
    void testResetEventCursor();

    // ========== Signal Tests ==========
    void testStateChangedSignal();
    void testErrorSignalOnFailedWrite();
    void testFailedWritesRollBack();

private:
    QTemporaryDir *m_tempDir;
    JsonFileStore *m_files;
    SyncStateStore *m_state;
};

void TestSyncStateStore::initTestCase()
{
    qDebug() << "Starting SyncStateStore tests";
}

void TestSyncStateStore::cleanupTestCase()
{
    qDebug() << "SyncStateStore tests complete";
}

void TestSyncStateStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_files = new JsonFileStore(m_tempDir->path());
    m_state = new SyncStateStore("42", "device-1", m_files);
}

void TestSyncStateStore::cleanup()
{
    delete m_state;
    delete m_files;
    delete m_tempDir;
    m_state = nullptr;
    m_files = nullptr;
    m_tempDir = nullptr;
}

// ========== Cursor Tests ==========

void TestSyncStateStore::testIsFirstSyncInitial()
{
    QVERIFY(m_state->isFirstSync());
    QVERIFY(!m_state->cursor().hasEventId());
    QCOMPARE(m_state->storageKey(), QString("42/device-1/state"));
}

void TestSyncStateStore::testAdvanceEventCursor()
{
    QVERIFY(m_state->advanceEventCursor(10));
    QCOMPARE(m_state->cursor().lastEventId, qint64(10));
    QVERIFY(!m_state->isFirstSync());
}

void TestSyncStateStore::testCursorNeverMovesBackwards()
{
    QVERIFY(m_state->advanceEventCursor(10));
    QVERIFY(!m_state->advanceEventCursor(10));
    QVERIFY(!m_state->advanceEventCursor(7));
    QCOMPARE(m_state->cursor().lastEventId, qint64(10));

    QVERIFY(m_state->advanceEventCursor(11));
    QCOMPARE(m_state->cursor().lastEventId, qint64(11));
}

void TestSyncStateStore::testMarkSynced()
{
    QDateTime when = QDateTime::fromString("2020-03-01T10:00:00Z", Qt::ISODate);
    m_state->markSynced(when);

    QCOMPARE(m_state->cursor().lastSyncAt, when);
    // A push or an empty pull does not replace the initial batch pull
    QVERIFY(m_state->isFirstSync());

    // An invalid time means now
    QVERIFY(m_state->markSynced(QDateTime()));
    QVERIFY(m_state->cursor().lastSyncAt > when);
}

void TestSyncStateStore::testInitialPullEndsFirstSync()
{
    QDateTime when = QDateTime::fromString("2020-04-01T10:00:00Z", Qt::ISODate);
    QVERIFY(m_state->markInitialPullDone(when));

    QVERIFY(!m_state->isFirstSync());
    QVERIFY(m_state->cursor().initialPullDone);
    QVERIFY(!m_state->cursor().isFirstSync());
    QCOMPARE(m_state->cursor().lastSyncAt, when);
    QVERIFY(!m_state->cursor().hasEventId());
}

void TestSyncStateStore::testCursorCountsPendingChanges()
{
    QVERIFY(m_state->stageChange(makeChange("res.partner", 1)));
    QVERIFY(m_state->stageChange(makeChange("res.partner", 2)));
    QCOMPARE(m_state->cursor().pendingChanges, 2);
}

// ========== Outbox Tests ==========

void TestSyncStateStore::testStageChange()
{
    PendingChange change = makeChange("res.partner", 5, "key-1");
    QString error;
    QVERIFY(m_state->stageChange(change, &error));
    QVERIFY(error.isEmpty());

    QVERIFY(m_state->hasPendingChange("key-1"));
    PendingChange stored;
    QVERIFY(m_state->pendingChange("key-1", &stored));
    QCOMPARE(stored.entityType, QString("res.partner"));
    QCOMPARE(stored.targetId, qint64(5));
    QCOMPARE(stored.values.value("name").toString(), QString("Record 5"));
}

void TestSyncStateStore::testStageRejectsInvalidChange()
{
    PendingChange noEntity = makeChange(QString(), 1);
    QString error;
    QVERIFY(!m_state->stageChange(noEntity, &error));
    QVERIFY(!error.isEmpty());

    // A local-only record cannot be updated remotely
    PendingChange localUpdate = makeChange("res.partner", -3);
    QVERIFY(!m_state->stageChange(localUpdate));

    PendingChange localCreate = PendingChange::create("res.partner", -3, ChangeOperation::Create, {});
    QVERIFY(m_state->stageChange(localCreate));
    QCOMPARE(m_state->outboxSize(), 1);
}

void TestSyncStateStore::testStageRejectsDuplicateKey()
{
    QVERIFY(m_state->stageChange(makeChange("res.partner", 1, "same")));

    QString error;
    QVERIFY(!m_state->stageChange(makeChange("res.partner", 2, "same"), &error));
    QVERIFY(error.contains("same"));
    QCOMPARE(m_state->outboxSize(), 1);
}

void TestSyncStateStore::testStageNotDurableIsNotStaged()
{
    FlakyStore flaky;
    SyncStateStore state("42", "device-1", &flaky);
    flaky.failWrites = true;

    QString error;
    QVERIFY(!state.stageChange(makeChange("res.partner", 1), &error));
    QCOMPARE(error, QString("disk full"));
    QCOMPARE(state.outboxSize(), 0);
}

void TestSyncStateStore::testPushableChangesGroupedByEntity()
{
    QVERIFY(m_state->stageChange(makeChange("res.partner", 1, "a")));
    QVERIFY(m_state->stageChange(makeChange("sale.order", 7, "b")));
    QVERIFY(m_state->stageChange(makeChange("res.partner", 2, "c")));

    const QMap<QString, QList<PendingChange>> grouped = m_state->pushableChanges();
    QCOMPARE(grouped.size(), 2);
    QCOMPARE(grouped.value("res.partner").size(), 2);
    // Staging order is kept within an entity type
    QCOMPARE(grouped.value("res.partner").at(0).idempotencyKey, QString("a"));
    QCOMPARE(grouped.value("res.partner").at(1).idempotencyKey, QString("c"));
    QCOMPARE(grouped.value("sale.order").size(), 1);
}

void TestSyncStateStore::testRemovePendingChanges()
{
    QVERIFY(m_state->stageChange(makeChange("res.partner", 1, "a")));
    QVERIFY(m_state->stageChange(makeChange("res.partner", 2, "b")));

    QCOMPARE(m_state->removePendingChanges({"a", "unknown"}), 1);
    QVERIFY(!m_state->hasPendingChange("a"));
    QVERIFY(m_state->hasPendingChange("b"));
    QCOMPARE(m_state->removePendingChanges({"a"}), 0);
}

// ========== Conflict Tests ==========

void TestSyncStateStore::testRecordConflict()
{
    PendingChange change = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(change));
    QVERIFY(m_state->recordConflict(makeConflict("c1", change)));

    QVERIFY(m_state->hasConflict("c1"));
    QCOMPARE(m_state->conflictCount(), 1);

    Conflict stored;
    QVERIFY(m_state->conflict("c1", &stored));
    QCOMPARE(stored.change.idempotencyKey, QString("a"));
    QCOMPARE(stored.kind, ConflictKind::BothModified);
    QCOMPARE(stored.remotePayload.value("name").toString(), QString("Remote"));
}

void TestSyncStateStore::testRecordConflictRequiresPendingChange()
{
    PendingChange change = makeChange("res.partner", 1, "never-staged");
    QString error;
    QVERIFY(!m_state->recordConflict(makeConflict("c1", change), &error));
    QVERIFY(!error.isEmpty());
    QCOMPARE(m_state->conflictCount(), 0);
}

void TestSyncStateStore::testRecordConflictReplacesPrevious()
{
    PendingChange change = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(change));
    QVERIFY(m_state->recordConflict(makeConflict("c1", change)));
    QVERIFY(m_state->recordConflict(makeConflict("c2", change)));

    QCOMPARE(m_state->conflictCount(), 1);
    QVERIFY(!m_state->hasConflict("c1"));
    QVERIFY(m_state->hasConflict("c2"));
}

void TestSyncStateStore::testConflictedChangeNotPushable()
{
    PendingChange blocked = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(blocked));
    QVERIFY(m_state->stageChange(makeChange("res.partner", 2, "b")));
    QVERIFY(m_state->recordConflict(makeConflict("c1", blocked)));

    const QList<PendingChange> pushable = m_state->pushableChanges().value("res.partner");
    QCOMPARE(pushable.size(), 1);
    QCOMPARE(pushable.first().idempotencyKey, QString("b"));
    // Still staged, only held back
    QCOMPARE(m_state->outboxSize(), 2);
}

void TestSyncStateStore::testRemoveConflictDropsChange()
{
    PendingChange change = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(change));
    QVERIFY(m_state->recordConflict(makeConflict("c1", change)));

    QVERIFY(m_state->removeConflict("c1"));
    QVERIFY(!m_state->hasConflict("c1"));
    QVERIFY(!m_state->hasPendingChange("a"));
    QVERIFY(!m_state->removeConflict("c1"));
}

// ========== Persistence Tests ==========

void TestSyncStateStore::testSaveAndLoad()
{
    PendingChange first = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(first));
    QVERIFY(m_state->stageChange(makeChange("sale.order", 2, "b")));
    QVERIFY(m_state->recordConflict(makeConflict("c1", first)));
    m_state->advanceEventCursor(99);
    QDateTime when = QDateTime::fromString("2026-03-01T10:00:00.250Z", Qt::ISODateWithMs);
    m_state->markSynced(when);

    QVERIFY(QFile::exists(m_files->filePath(m_state->storageKey())));

    SyncStateStore reloaded("42", "device-1", m_files);
    QVERIFY(reloaded.load());

    QCOMPARE(reloaded.cursor().lastEventId, qint64(99));
    QCOMPARE(reloaded.cursor().lastSyncAt, when);
    QCOMPARE(reloaded.outboxSize(), 2);
    QCOMPARE(reloaded.pendingChanges().at(0).idempotencyKey, QString("a"));
    QCOMPARE(reloaded.pendingChanges().at(1).entityType, QString("sale.order"));
    QVERIFY(reloaded.hasConflict("c1"));
}

void TestSyncStateStore::testLoadNonExistent()
{
    SyncStateStore state("nobody", "nowhere", m_files);
    QVERIFY(state.load());
    QVERIFY(state.isFirstSync());
    QCOMPARE(state.outboxSize(), 0);
}

void TestSyncStateStore::testLoadCorruptFile()
{
    const QString path = m_files->filePath(m_state->storageKey());
    QVERIFY(QDir().mkpath(QFileInfo(path).absolutePath()));
    QFile file(path);
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("{ not json");
    file.close();

    QSignalSpy errors(m_state, &SyncStateStore::errorOccurred);
    QVERIFY(!m_state->load());
    QCOMPARE(errors.count(), 1);
}

void TestSyncStateStore::testResetKeepsOutbox()
{
    PendingChange change = makeChange("res.partner", 1, "a");
    QVERIFY(m_state->stageChange(change));
    QVERIFY(m_state->recordConflict(makeConflict("c1", change)));
    m_state->advanceEventCursor(50);
    m_state->markSynced(QDateTime::currentDateTimeUtc());

    m_state->reset();

    QVERIFY(m_state->isFirstSync());
    QCOMPARE(m_state->conflictCount(), 0);
    QCOMPARE(m_state->outboxSize(), 1);
    // Without the conflict the change is pushable again
    QCOMPARE(m_state->pushableChanges().value("res.partner").size(), 1);
}

void TestSyncStateStore::testInitialPullFlagPersisted()
{
    QVERIFY(m_state->markInitialPullDone(QDateTime::currentDateTimeUtc()));

    SyncStateStore reloaded("42", "device-1", m_files);
    QVERIFY(reloaded.load());
    QVERIFY(!reloaded.isFirstSync());

    QVERIFY(reloaded.reset());
    QVERIFY(reloaded.isFirstSync());
}

void TestSyncStateStore::testLegacyStateDerivesInitialPull()
{
    FlakyStore legacy;
    legacy.documents["42/device-1/state"] = QJsonObject{
        {"version", 1},
        {"cursor", QJsonObject{{"lastEventId", 17}, {"lastSyncAt", "2020-03-01T10:00:00.000Z"}}}
    };
    legacy.documents["42/device-2/state"] = QJsonObject{
        {"version", 1},
        {"cursor", QJsonObject{{"lastEventId", QJsonValue()},
                               {"lastSyncAt", "2020-03-01T10:00:00.000Z"}}}
    };

    SyncStateStore withEvents("42", "device-1", &legacy);
    QVERIFY(withEvents.load());
    QVERIFY(withEvents.cursor().initialPullDone);

    // Only a sync time, which a push alone could have written
    SyncStateStore pushedOnly("42", "device-2", &legacy);
    QVERIFY(pushedOnly.load());
    QVERIFY(pushedOnly.isFirstSync());
}

void TestSyncStateStore::testResetEventCursor()
{
    QVERIFY(m_state->markInitialPullDone(QDateTime::currentDateTimeUtc()));
    QVERIFY(m_state->advanceEventCursor(40));

    QVERIFY(m_state->resetEventCursor());
    QVERIFY(!m_state->cursor().hasEventId());
    // The initial pull stays done
    QVERIFY(!m_state->isFirstSync());
    QVERIFY(m_state->advanceEventCursor(1));
}

// ========== Signal Tests ==========

void TestSyncStateStore::testStateChangedSignal()
{
    QSignalSpy spy(m_state, &SyncStateStore::stateChanged);

    PendingChange change = makeChange("res.partner", 1, "a");
    m_state->stageChange(change);
    QCOMPARE(spy.count(), 1);

    m_state->recordConflict(makeConflict("c1", change));
    QCOMPARE(spy.count(), 2);

    m_state->advanceEventCursor(3);
    QCOMPARE(spy.count(), 3);

    // Ignored cursor move does not notify
    m_state->advanceEventCursor(2);
    QCOMPARE(spy.count(), 3);

    m_state->reset();
    QCOMPARE(spy.count(), 4);
}

void TestSyncStateStore::testErrorSignalOnFailedWrite()
{
    FlakyStore flaky;
    SyncStateStore state("42", "device-1", &flaky);
    QVERIFY(state.stageChange(makeChange("res.partner", 1, "a")));

    flaky.failWrites = true;
    QSignalSpy errors(&state, &SyncStateStore::errorOccurred);
    state.markSynced(QDateTime::currentDateTimeUtc());
    QCOMPARE(errors.count(), 1);
    QCOMPARE(errors.first().first().toString(), QString("disk full"));
}

void TestSyncStateStore::testFailedWritesRollBack()
{
    FlakyStore flaky;
    SyncStateStore state("42", "device-1", &flaky);
    PendingChange first = makeChange("res.partner", 1, "a");
    PendingChange second = makeChange("res.partner", 2, "b");
    QVERIFY(state.stageChange(first));
    QVERIFY(state.stageChange(second));
    QVERIFY(state.recordConflict(makeConflict("c1", first)));
    QVERIFY(state.advanceEventCursor(5));

    flaky.failWrites = true;
    QSignalSpy errors(&state, &SyncStateStore::errorOccurred);
    QSignalSpy changed(&state, &SyncStateStore::stateChanged);
    QString error;

    QVERIFY(!state.advanceEventCursor(9, &error));
    QCOMPARE(error, QString("disk full"));
    QCOMPARE(state.cursor().lastEventId, qint64(5));

    error.clear();
    QVERIFY(!state.markInitialPullDone(QDateTime::currentDateTimeUtc(), &error));
    QCOMPARE(error, QString("disk full"));
    QVERIFY(!state.cursor().initialPullDone);

    error.clear();
    QCOMPARE(state.removePendingChanges({"b"}, &error), -1);
    QCOMPARE(error, QString("disk full"));
    QVERIFY(state.hasPendingChange("b"));

    error.clear();
    QVERIFY(!state.recordConflict(makeConflict("c2", second), &error));
    QCOMPARE(error, QString("disk full"));
    QVERIFY(!state.hasConflict("c2"));

    error.clear();
    QVERIFY(!state.removeConflict("c1", &error));
    QCOMPARE(error, QString("disk full"));
    QVERIFY(state.hasConflict("c1"));
    QVERIFY(state.hasPendingChange("a"));

    error.clear();
    QVERIFY(!state.reset(&error));
    QCOMPARE(state.cursor().lastEventId, qint64(5));
    QCOMPARE(state.conflictCount(), 1);

    QCOMPARE(errors.count(), 6);
    QCOMPARE(changed.count(), 0);

    // What is on disk still matches memory once writes work again
    flaky.failWrites = false;
    SyncStateStore reloaded("42", "device-1", &flaky);
    QVERIFY(reloaded.load());
    QCOMPARE(reloaded.cursor().lastEventId, state.cursor().lastEventId);
    QCOMPARE(reloaded.outboxSize(), state.outboxSize());
    QCOMPARE(reloaded.conflictCount(), state.conflictCount());
}

QTEST_MAIN(TestSyncStateStore)
#include "test_syncstatestore.moc"
