/**
 * @file test_conflictresolver.cpp
 * @brief Unit tests for ConflictResolver
 */

#include <QtTest/QtTest>
#include <QDebug>
#include <QTemporaryDir>
#include <QSignalSpy>
#include <QJsonArray>
#include <QThread>
#include <atomic>
#include "faketransport.h"
#include "sync/conflictresolver.h"
#include "sync/syncstatestore.h"
#include "store/jsonfilestore.h"
#include "flakystore.h"
#include "net/endpoints.h"

using namespace BridgeSync;

namespace {

QString conflictIdOf(const FakeTransport::Request &request)
{
    return request.body.value("resolutions").toArray().first().toObject()
        .value("conflict_id").toString();
}

ResolutionRequest decision(const QString &conflictId, ResolutionChoice choice,
                           const Payload &merged = Payload())
{
    ResolutionRequest request;
    request.conflictId = conflictId;
    request.choice = choice;
    request.mergedPayload = merged;
    return request;
}

}

class TestConflictResolver : public QObject
{
    Q_OBJECT

private slots:
    void initTestCase();
    void init();
    void cleanup();

    void testBuildRequest();
    void testResolveRemovesConflictAndChange();
    void testFailuresAreIndependent();
    void testLocalValidationFailures();
    void testDuplicateRequest();
    void testServerDidNotConfirm();
    void testParallelismBounded();
    void testResolvedEvent();
    void testNoEventWhenNothingResolved();
    void testUnpersistedRemovalFails();

private:
    void addConflict(const QString &conflictId, qint64 recordId);

    QTemporaryDir *m_tempDir;
    JsonFileStore *m_files;
    SyncStateStore *m_state;
    FakeTransport *m_transport;
    ConflictResolver *m_resolver;
};

void TestConflictResolver::initTestCase()
{
    qDebug() << "Starting ConflictResolver tests";
}

void TestConflictResolver::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());

    m_files = new JsonFileStore(m_tempDir->path());
    m_state = new SyncStateStore("3", "phone", m_files);
    m_transport = new FakeTransport();
    m_resolver = new ConflictResolver(m_transport, m_state);
}

void TestConflictResolver::cleanup()
{
    delete m_resolver;
    delete m_transport;
    delete m_state;
    delete m_files;
    delete m_tempDir;
    m_resolver = nullptr;
    m_transport = nullptr;
    m_state = nullptr;
    m_files = nullptr;
    m_tempDir = nullptr;
}

void TestConflictResolver::addConflict(const QString &conflictId, qint64 recordId)
{
    PendingChange change = PendingChange::create("res.partner", recordId, ChangeOperation::Update,
                                                 {{"phone", "555-0100"}});
    change.idempotencyKey = "key-" + conflictId;
    QVERIFY(m_state->stageChange(change));

    Conflict conflict;
    conflict.conflictId = conflictId;
    conflict.change = change;
    conflict.localPayload = change.values;
    conflict.remotePayload = {{"phone", "555-0199"}};
    conflict.kind = ConflictKind::BothModified;
    QVERIFY(m_state->recordConflict(conflict));
}

void TestConflictResolver::testBuildRequest()
{
    Conflict conflict;
    conflict.conflictId = "c1";
    conflict.change = PendingChange::create("res.partner", 14, ChangeOperation::Update, {});
    conflict.change.idempotencyKey = "k-14";

    const QJsonObject keep = ConflictResolver::buildRequest(
        "phone", decision("c1", ResolutionChoice::KeepRemote), conflict);
    QCOMPARE(keep.value("device_id").toString(), QString("phone"));
    const QJsonObject entry = keep.value("resolutions").toArray().first().toObject();
    QCOMPARE(entry.value("conflict_id").toString(), QString("c1"));
    QCOMPARE(entry.value("resolution").toString(), QString("keep_remote"));
    QCOMPARE(entry.value("idempotency_key").toString(), QString("k-14"));
    QCOMPARE(entry.value("model").toString(), QString("res.partner"));
    QCOMPARE(entry.value("id").toInt(), 14);
    QVERIFY(!entry.contains("merged_data"));

    const QJsonObject merged = ConflictResolver::buildRequest(
        "phone", decision("c1", ResolutionChoice::Merged, {{"phone", "555-0150"}}), conflict);
    const QJsonObject mergedEntry = merged.value("resolutions").toArray().first().toObject();
    QCOMPARE(mergedEntry.value("resolution").toString(), QString("merged"));
    QCOMPARE(mergedEntry.value("merged_data").toObject().value("phone").toString(),
             QString("555-0150"));
}

void TestConflictResolver::testResolveRemovesConflictAndChange()
{
    addConflict("c1", 1);
    m_transport->enqueue(Endpoints::ResolveConflicts,
        FakeTransport::ok(QJsonObject{{"resolved", QJsonArray{"c1"}}}));

    const ResolutionResult result = m_resolver->resolve({decision("c1", ResolutionChoice::KeepLocal)});

    QVERIFY(result.allResolved());
    QCOMPARE(result.resolved, QStringList({"c1"}));
    QVERIFY(!m_state->hasConflict("c1"));
    QVERIFY(!m_state->hasPendingChange("key-c1"));
}

void TestConflictResolver::testFailuresAreIndependent()
{
    addConflict("good", 1);
    addConflict("rejected", 2);
    addConflict("offline", 3);

    m_transport->setHandler(Endpoints::ResolveConflicts, [](const FakeTransport::Request &request) {
        const QString id = conflictIdOf(request);
        if (id == "rejected") {
            return FakeTransport::ok(QJsonObject{{"failed", QJsonArray{
                QJsonObject{{"conflict_id", id}, {"reason", "Record archived"}}}}});
        }
        if (id == "offline") {
            return FakeTransport::failure(ErrorKind::Transient, "Connection refused");
        }
        return FakeTransport::ok(QJsonObject{{"resolved", QJsonArray{QJsonObject{{"conflict_id", id}}}}});
    });

    const ResolutionResult result = m_resolver->resolve({
        decision("good", ResolutionChoice::KeepLocal),
        decision("rejected", ResolutionChoice::KeepRemote),
        decision("offline", ResolutionChoice::KeepLocal)
    });

    QCOMPARE(result.resolved, QStringList({"good"}));
    QCOMPARE(result.failed.size(), 2);
    QVERIFY(!result.allResolved());

    for (const ResolutionFailure &failure : result.failed) {
        if (failure.conflictId == "rejected") {
            QCOMPARE(failure.error.kind, ErrorKind::Validation);
            QCOMPARE(failure.error.message, QString("Record archived"));
        } else {
            QCOMPARE(failure.conflictId, QString("offline"));
            QCOMPARE(failure.error.kind, ErrorKind::Transient);
        }
    }

    QVERIFY(!m_state->hasConflict("good"));
    QVERIFY(m_state->hasConflict("rejected"));
    QVERIFY(m_state->hasConflict("offline"));
    QCOMPARE(m_transport->count(Endpoints::ResolveConflicts), 3);
}

void TestConflictResolver::testLocalValidationFailures()
{
    addConflict("c1", 1);

    const ResolutionResult result = m_resolver->resolve({
        decision("missing", ResolutionChoice::KeepLocal),
        decision("c1", ResolutionChoice::Merged)
    });

    QVERIFY(result.resolved.isEmpty());
    QCOMPARE(result.failed.size(), 2);
    for (const ResolutionFailure &failure : result.failed) {
        QCOMPARE(failure.error.kind, ErrorKind::Validation);
    }
    // Nothing reached the server
    QCOMPARE(m_transport->count(Endpoints::ResolveConflicts), 0);
    QVERIFY(m_state->hasConflict("c1"));
}

void TestConflictResolver::testDuplicateRequest()
{
    addConflict("c1", 1);
    m_transport->setHandler(Endpoints::ResolveConflicts, [](const FakeTransport::Request &) {
        return FakeTransport::ok(QJsonObject());
    });

    const ResolutionResult result = m_resolver->resolve({
        decision("c1", ResolutionChoice::KeepLocal),
        decision("c1", ResolutionChoice::KeepRemote)
    });

    QCOMPARE(result.resolved, QStringList({"c1"}));
    QCOMPARE(result.failed.size(), 1);
    QVERIFY(result.failed.first().error.message.contains("Duplicate"));
    QCOMPARE(m_transport->count(Endpoints::ResolveConflicts), 1);
}

void TestConflictResolver::testServerDidNotConfirm()
{
    addConflict("c1", 1);
    m_transport->enqueue(Endpoints::ResolveConflicts,
        FakeTransport::ok(QJsonObject{{"resolved", QJsonArray{"someone-else"}}}));

    const ResolutionResult result = m_resolver->resolve({decision("c1", ResolutionChoice::KeepLocal)});

    QCOMPARE(result.failed.size(), 1);
    QCOMPARE(result.failed.first().error.kind, ErrorKind::Protocol);
    QVERIFY(m_state->hasConflict("c1"));
}

void TestConflictResolver::testParallelismBounded()
{
    QList<ResolutionRequest> requests;
    for (int i = 0; i < 6; ++i) {
        const QString id = QString("c%1").arg(i);
        addConflict(id, i + 1);
        requests << decision(id, ResolutionChoice::KeepLocal);
    }

    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    m_transport->setHandler(Endpoints::ResolveConflicts, [&](const FakeTransport::Request &) {
        const int now = ++running;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        QThread::msleep(30);
        --running;
        return FakeTransport::ok(QJsonObject());
    });

    m_resolver->setMaxParallel(2);
    QCOMPARE(m_resolver->maxParallel(), 2);

    const ResolutionResult result = m_resolver->resolve(requests);

    QCOMPARE(result.resolved.size(), 6);
    QVERIFY(peak.load() <= 2);
    QCOMPARE(m_state->conflictCount(), 0);
    QCOMPARE(m_state->outboxSize(), 0);
}

void TestConflictResolver::testResolvedEvent()
{
    addConflict("c1", 1);
    m_transport->enqueue(Endpoints::ResolveConflicts, FakeTransport::ok(QJsonObject()));

    QSignalSpy events(m_resolver, &ConflictResolver::lifecycleEvent);
    m_resolver->resolve({decision("c1", ResolutionChoice::KeepLocal),
                         decision("nope", ResolutionChoice::KeepLocal)});

    QCOMPARE(events.count(), 1);
    QCOMPARE(events.first().at(0).toString(), QString(EventType::ConflictResolved));
    const QVariantMap data = events.first().at(1).toMap();
    QCOMPARE(data.value("resolved_count").toInt(), 1);
    QCOMPARE(data.value("failed_count").toInt(), 1);
    QCOMPARE(data.value("failed").toStringList(), QStringList({"nope"}));
}

void TestConflictResolver::testNoEventWhenNothingResolved()
{
    addConflict("c1", 1);
    m_transport->enqueue(Endpoints::ResolveConflicts, FakeTransport::ok(QJsonObject{
        {"failed", QJsonArray{QJsonObject{{"conflict_id", "c1"}, {"reason", "stale"}}}}
    }));

    QSignalSpy events(m_resolver, &ConflictResolver::lifecycleEvent);
    const ResolutionResult result = m_resolver->resolve({decision("c1", ResolutionChoice::KeepLocal),
                                                         decision("nope", ResolutionChoice::KeepLocal)});

    QVERIFY(result.resolved.isEmpty());
    QCOMPARE(result.failed.size(), 2);
    QCOMPARE(events.count(), 0);
}

void TestConflictResolver::testUnpersistedRemovalFails()
{
    FlakyStore store;
    SyncStateStore state("3", "phone", &store);
    ConflictResolver resolver(m_transport, &state);

    PendingChange change = PendingChange::create("res.partner", 1, ChangeOperation::Update,
                                                 {{"phone", "555-0100"}});
    QVERIFY(state.stageChange(change));
    Conflict conflict;
    conflict.conflictId = "c1";
    conflict.change = change;
    conflict.kind = ConflictKind::BothModified;
    QVERIFY(state.recordConflict(conflict));

    m_transport->enqueue(Endpoints::ResolveConflicts, FakeTransport::ok(QJsonObject()));
    store.failWrites = true;

    QSignalSpy events(&resolver, &ConflictResolver::lifecycleEvent);
    const ResolutionResult result = resolver.resolve({decision("c1", ResolutionChoice::KeepRemote)});

    QVERIFY(result.resolved.isEmpty());
    QCOMPARE(result.failed.size(), 1);
    QCOMPARE(result.failed.first().error.kind, ErrorKind::Local);
    QVERIFY(state.hasConflict("c1"));
    QCOMPARE(events.count(), 0);
}

QTEST_MAIN(TestConflictResolver)
#include "test_conflictresolver.moc"
