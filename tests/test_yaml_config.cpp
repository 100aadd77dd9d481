#include <QtTest>
#include "core/YamlConfig.hpp"

class TestYamlConfig : public QObject {
    Q_OBJECT
private slots:
    void testLoadDefaults();
    void testLoadFromFile();
    void testLoadMalformedKeepsDefaults();
    void testSaveAndReload();
    void testSessionConfig();
    void testSessionConfigUnknownPairingType();
    void testScanOptions();
    void testCredentialsPathExpandsHome();
    void testValueByPath();
    void testValueByPathMissing();
    void testSetValueByPath();
    void testSetValueByPathRejectsUnknown();
};

void TestYamlConfig::testLoadDefaults()
{
    tvr::YamlConfig config;
    QCOMPARE(config.tvAddress(), QString());
    QCOMPARE(config.tvPort(), static_cast<uint16_t>(3001));
    QCOMPARE(config.tvSecure(), true);
    QCOMPARE(config.heartbeatEnabled(), true);
    QCOMPARE(config.heartbeatIntervalMs(), 10000);
    QCOMPARE(config.requestTimeoutMs(), 0);
    QCOMPARE(config.pairingType(), QString("PIN"));
    QCOMPARE(config.discoveryRangeStart(), 1);
    QCOMPARE(config.discoveryRangeEnd(), 20);
    QCOMPARE(config.discoveryPort(), static_cast<uint16_t>(3001));
    QCOMPARE(config.probeTimeoutMs(), 200);
    QCOMPARE(config.maxConcurrentProbes(), 50);
    QCOMPARE(config.credentialKey(), QString("webos_client_key"));
    QCOMPARE(config.logLevel(), QString("info"));
    QVERIFY(config.protocolLogPath().isEmpty());
}

void TestYamlConfig::testLoadFromFile()
{
    tvr::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    QCOMPARE(config.tvAddress(), QString("192.168.1.42"));
    QCOMPARE(config.tvSecure(), false);
    QCOMPARE(config.tvPort(), static_cast<uint16_t>(3000));
    QCOMPARE(config.heartbeatIntervalMs(), 5000);
    QCOMPARE(config.requestTimeoutMs(), 15000);
    QCOMPARE(config.discoveryRangeEnd(), 50);
    QCOMPARE(config.discoveryInterface(), QString("wlan0"));
    QCOMPARE(config.credentialsPath(), QString("/tmp/tvremote-test/credentials.yaml"));
    QCOMPARE(config.logLevel(), QString("debug"));

    // Untouched keys keep their defaults
    QCOMPARE(config.discoveryRangeStart(), 1);
    QCOMPARE(config.heartbeatEnabled(), true);
    QCOMPARE(config.credentialKey(), QString("webos_client_key"));
}

void TestYamlConfig::testLoadMalformedKeepsDefaults()
{
    QString tmpPath = QDir::tempPath() + "/tvr_test_bad_config.yaml";
    {
        QFile f(tmpPath);
        QVERIFY(f.open(QIODevice::WriteOnly));
        f.write("tv: [unterminated\n");
    }

    tvr::YamlConfig config;
    config.setTvAddress("10.0.0.7");
    QVERIFY_THROWS_EXCEPTION(YAML::Exception, config.load(tmpPath));
    QCOMPARE(config.tvAddress(), QString("10.0.0.7"));

    QFile::remove(tmpPath);
}

void TestYamlConfig::testSaveAndReload()
{
    tvr::YamlConfig config;
    config.setTvAddress("192.168.0.77");
    config.setDiscoveryRange(100, 120);
    config.setRequestTimeoutMs(3000);

    QString tmpPath = QDir::tempPath() + "/tvr_test_config.yaml";
    config.save(tmpPath);

    tvr::YamlConfig reloaded;
    reloaded.load(tmpPath);
    QCOMPARE(reloaded.tvAddress(), QString("192.168.0.77"));
    QCOMPARE(reloaded.discoveryRangeStart(), 100);
    QCOMPARE(reloaded.discoveryRangeEnd(), 120);
    QCOMPARE(reloaded.requestTimeoutMs(), 3000);

    QFile::remove(tmpPath);
}

void TestYamlConfig::testSessionConfig()
{
    tvr::YamlConfig config;
    config.load(QString(TEST_DATA_DIR) + "/test_config.yaml");

    const ssap::SessionConfig session = config.sessionConfig();
    QCOMPARE(session.secure, false);
    QCOMPARE(session.port, static_cast<uint16_t>(3000));
    QCOMPARE(session.pairingType, ssap::PairingType::Prompt);
    QCOMPARE(session.heartbeatInterval, 5000);
    QCOMPARE(session.requestTimeout, 15000);
    QCOMPARE(session.credentialKey, QString("webos_client_key"));
}

void TestYamlConfig::testSessionConfigUnknownPairingType()
{
    tvr::YamlConfig config;
    config.setPairingType("combined");
    config.setRequestTimeoutMs(-5);
    const ssap::SessionConfig session = config.sessionConfig();
    QCOMPARE(session.pairingType, ssap::PairingType::Pin);
    QCOMPARE(session.requestTimeout, 0);
}

void TestYamlConfig::testScanOptions()
{
    tvr::YamlConfig config;
    config.setDiscoveryInterface("eth0");
    config.setDiscoveryRange(2, 9);

    const ssap::ScanOptions options = config.scanOptions();
    QVERIFY(options.subnetPrefix.isEmpty());
    QCOMPARE(options.interfaceName, QString("eth0"));
    QCOMPARE(options.rangeStart, 2);
    QCOMPARE(options.rangeEnd, 9);
    QCOMPARE(options.port, static_cast<uint16_t>(3001));
    QCOMPARE(options.probeTimeout, 200);
    QCOMPARE(options.maxConcurrentProbes, 50);
}

void TestYamlConfig::testCredentialsPathExpandsHome()
{
    tvr::YamlConfig config;
    QCOMPARE(config.credentialsPath(), QDir::homePath() + "/.config/tvremote/credentials.yaml");

    config.setProtocolLogPath("~/ssap.tsv");
    QCOMPARE(config.protocolLogPath(), QDir::homePath() + "/ssap.tsv");
}

void TestYamlConfig::testValueByPath()
{
    tvr::YamlConfig config;
    QCOMPARE(config.valueByPath("tv.port").toInt(), 3001);
    QCOMPARE(config.valueByPath("tv.secure").toBool(), true);
    QCOMPARE(config.valueByPath("session.pairing_type").toString(), QString("PIN"));
    QCOMPARE(config.valueByPath("discovery.range_end").toInt(), 20);
}

void TestYamlConfig::testValueByPathMissing()
{
    tvr::YamlConfig config;
    QVERIFY(!config.valueByPath("nonexistent.key").isValid());
    QVERIFY(!config.valueByPath("tv.port.deeper").isValid());
    QVERIFY(!config.valueByPath("").isValid());
    // Maps are not scalars
    QVERIFY(!config.valueByPath("discovery").isValid());
}

void TestYamlConfig::testSetValueByPath()
{
    tvr::YamlConfig config;
    QVERIFY(config.setValueByPath("tv.address", QString("10.1.1.1")));
    QCOMPARE(config.tvAddress(), QString("10.1.1.1"));

    QVERIFY(config.setValueByPath("session.heartbeat_enabled", false));
    QCOMPARE(config.heartbeatEnabled(), false);

    QVERIFY(config.setValueByPath("discovery.probe_timeout_ms", 500));
    QCOMPARE(config.probeTimeoutMs(), 500);
}

void TestYamlConfig::testSetValueByPathRejectsUnknown()
{
    tvr::YamlConfig config;
    QVERIFY(!config.setValueByPath("tv.colour", QString("red")));
    QVERIFY(!config.setValueByPath("tv", 1));
    QVERIFY(!config.setValueByPath("", 1));
    QVERIFY(!config.valueByPath("tv.colour").isValid());
}

QTEST_MAIN(TestYamlConfig)
#include "test_yaml_config.moc"
