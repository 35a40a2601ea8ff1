/**
 * @file test_jsonfilestore.cpp
 * @brief Unit tests for JsonFileStore
 */

#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonArray>
#include "store/jsonfilestore.h"

using namespace BridgeSync;

class TestJsonFileStore : public QObject
{
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testWriteAndRead();
    void testNestedKeysCreateDirectories();
    void testReadMissingKey();
    void testOverwrite();
    void testRemove();
    void testInvalidKeys_data();
    void testInvalidKeys();
    void testReadCorruptDocument();

private:
    QTemporaryDir *m_tempDir;
    JsonFileStore *m_store;
};

void TestJsonFileStore::init()
{
    m_tempDir = new QTemporaryDir();
    QVERIFY(m_tempDir->isValid());
    m_store = new JsonFileStore(m_tempDir->path());
}

void TestJsonFileStore::cleanup()
{
    delete m_store;
    delete m_tempDir;
    m_store = nullptr;
    m_tempDir = nullptr;
}

void TestJsonFileStore::testWriteAndRead()
{
    QJsonObject doc;
    doc["name"] = "state";
    doc["items"] = QJsonArray{1, 2, 3};

    QString error;
    QVERIFY(m_store->write("state", doc, &error));
    QVERIFY(error.isEmpty());
    QVERIFY(m_store->contains("state"));

    const QJsonObject read = m_store->read("state", &error);
    QVERIFY(error.isEmpty());
    QCOMPARE(read, doc);
}

void TestJsonFileStore::testNestedKeysCreateDirectories()
{
    QVERIFY(m_store->write("7/phone/state", QJsonObject{{"a", 1}}));
    QCOMPARE(m_store->filePath("7/phone/state"),
             QDir(m_tempDir->path()).filePath("7/phone/state.json"));
    QVERIFY(QFile::exists(m_store->filePath("7/phone/state")));
}

void TestJsonFileStore::testReadMissingKey()
{
    QString error;
    QVERIFY(!m_store->contains("missing"));
    QVERIFY(m_store->read("missing", &error).isEmpty());
    QVERIFY(error.isEmpty());
}

void TestJsonFileStore::testOverwrite()
{
    QVERIFY(m_store->write("k", QJsonObject{{"v", 1}}));
    QVERIFY(m_store->write("k", QJsonObject{{"v", 2}}));
    QCOMPARE(m_store->read("k").value("v").toInt(), 2);
}

void TestJsonFileStore::testRemove()
{
    QVERIFY(m_store->write("k", QJsonObject{{"v", 1}}));
    QVERIFY(m_store->remove("k"));
    QVERIFY(!m_store->contains("k"));
    // Removing a missing key is not an error
    QVERIFY(m_store->remove("k"));
}

void TestJsonFileStore::testInvalidKeys_data()
{
    QTest::addColumn<QString>("key");

    QTest::newRow("empty") << QString();
    QTest::newRow("absolute") << QString("/etc/passwd");
    QTest::newRow("parent") << QString("../outside");
    QTest::newRow("dot") << QString("a/./b");
    QTest::newRow("empty part") << QString("a//b");
}

void TestJsonFileStore::testInvalidKeys()
{
    QFETCH(QString, key);

    QString error;
    QVERIFY(!m_store->write(key, QJsonObject{{"v", 1}}, &error));
    QVERIFY(error.contains("Invalid key"));
    QVERIFY(!m_store->contains(key));
    QVERIFY(!m_store->remove(key));
}

void TestJsonFileStore::testReadCorruptDocument()
{
    QFile file(m_store->filePath("broken"));
    QVERIFY(file.open(QIODevice::WriteOnly));
    file.write("[1, 2");
    file.close();

    QString error;
    QVERIFY(m_store->read("broken", &error).isEmpty());
    QVERIFY(error.contains("Failed to parse"));
}

QTEST_MAIN(TestJsonFileStore)
#include "test_jsonfilestore.moc"
