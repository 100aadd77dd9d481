#include <QtTest>
#include <QTemporaryDir>
#include <yaml-cpp/yaml.h>
#include "core/services/YamlCredentialStore.hpp"

class TestCredentialStore : public QObject {
    Q_OBJECT
private slots:
    void testMissingFileIsEmpty();
    void testSetPersistsAcrossInstances();
    void testRemove();
    void testFileIsOwnerOnly();
    void testCreatesParentDirectory();
    void testCorruptFileIgnored();
    void testMemoryStore();
};

void TestCredentialStore::testMissingFileIsEmpty()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    tvr::YamlCredentialStore store(dir.filePath("credentials.yaml"));
    QVERIFY(!store.contains("webos_client_key"));
    QVERIFY(store.value("webos_client_key").isNull());
}

void TestCredentialStore::testSetPersistsAcrossInstances()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("credentials.yaml");
    {
        tvr::YamlCredentialStore store(path);
        store.setValue("webos_client_key", "abc123");
        QVERIFY(store.lastWriteSucceeded());
        QCOMPARE(store.value("webos_client_key"), QString("abc123"));
    }

    tvr::YamlCredentialStore reopened(path);
    QCOMPARE(reopened.value("webos_client_key"), QString("abc123"));

    YAML::Node root = YAML::LoadFile(path.toStdString());
    QCOMPARE(QString::fromStdString(root["webos_client_key"].as<std::string>()), QString("abc123"));
}

void TestCredentialStore::testRemove()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("credentials.yaml");
    tvr::YamlCredentialStore store(path);
    store.setValue("webos_client_key", "abc");
    store.setValue("other", "keep");
    store.remove("webos_client_key");
    store.remove("never-set");

    tvr::YamlCredentialStore reopened(path);
    QVERIFY(!reopened.contains("webos_client_key"));
    QCOMPARE(reopened.value("other"), QString("keep"));
}

void TestCredentialStore::testFileIsOwnerOnly()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("credentials.yaml");
    tvr::YamlCredentialStore store(path);
    store.setValue("webos_client_key", "secret");

    const QFileDevice::Permissions perms = QFile::permissions(path);
    QVERIFY(perms & QFileDevice::ReadOwner);
    QVERIFY(!(perms & QFileDevice::ReadGroup));
    QVERIFY(!(perms & QFileDevice::ReadOther));
}

void TestCredentialStore::testCreatesParentDirectory()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("nested/tvremote/credentials.yaml");
    tvr::YamlCredentialStore store(path);
    store.setValue("webos_client_key", "k");
    QVERIFY(store.lastWriteSucceeded());
    QVERIFY(QFile::exists(path));
}

void TestCredentialStore::testCorruptFileIgnored()
{
    QTemporaryDir dir;
    const QString path = dir.filePath("credentials.yaml");
    {
        QFile f(path);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("{ not: [valid");
    }

    tvr::YamlCredentialStore store(path);
    QVERIFY(!store.contains("webos_client_key"));

    // Writing replaces the corrupt file
    store.setValue("webos_client_key", "fresh");
    tvr::YamlCredentialStore reopened(path);
    QCOMPARE(reopened.value("webos_client_key"), QString("fresh"));
}

void TestCredentialStore::testMemoryStore()
{
    ssap::MemoryCredentialStore store;
    QVERIFY(store.value("k").isNull());
    store.setValue("k", "v");
    QVERIFY(store.contains("k"));
    QCOMPARE(store.value("k"), QString("v"));
    store.remove("k");
    QVERIFY(!store.contains("k"));
}

QTEST_MAIN(TestCredentialStore)
#include "test_credential_store.moc"
