#include <QtTest/QtTest>
#include <ssap/Protocol/ProtocolLogger.hpp>
#include <ssap/Session/WebOSSession.hpp>
#include <ssap/Transport/ReplayTransport.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <string>

class TestProtocolLogger : public QObject {
    Q_OBJECT

private slots:
    void testFrameClassification()
    {
        QCOMPARE(ssap::ProtocolLogger::frameType(R"({"type":"register","id":"1"})"), std::string("register"));
        QCOMPARE(ssap::ProtocolLogger::frameTarget(R"({"type":"request","id":"1","uri":"ssap://audio/volumeUp"})"),
                 std::string("ssap://audio/volumeUp"));
        QCOMPARE(ssap::ProtocolLogger::frameTarget(R"({"type":"response","id":"abc"})"), std::string("abc"));

        QCOMPARE(ssap::ProtocolLogger::frameType("type:button\nname:UP\n\n"), std::string("button"));
        QCOMPARE(ssap::ProtocolLogger::frameTarget("type:button\nname:UP\n\n"), std::string("UP"));

        QCOMPARE(ssap::ProtocolLogger::frameType("garbage"), std::string("?"));
    }

    void testTsvOutput()
    {
        const std::string path = "/tmp/test_ssap_protocol_logger.tsv";

        ssap::ProtocolLogger logger;
        logger.open(path);
        QVERIFY(logger.isOpen());
        logger.log("Client->TV", "primary", R"({"type":"request","id":"7","uri":"ssap://audio/setMute","payload":{"mute":true}})");
        logger.close();
        QVERIFY(!logger.isOpen());

        std::ifstream f(path);
        QVERIFY(f.is_open());
        std::string header, line;
        std::getline(f, header);
        std::getline(f, line);

        QVERIFY(header.find("TIME") != std::string::npos);
        QVERIFY(header.find("TARGET") != std::string::npos);
        QVERIFY(line.find("Client->TV\tprimary\trequest\tssap://audio/setMute") != std::string::npos);

        std::remove(path.c_str());
    }

    void testJsonlEscapesKeyFrames()
    {
        const std::string path = "/tmp/test_ssap_protocol_logger.jsonl";

        ssap::ProtocolLogger logger;
        logger.setFormat(ssap::ProtocolLogger::OutputFormat::Jsonl);
        logger.open(path);
        logger.log("Client->TV", "input", "type:button\nname:HOME\n\n");
        logger.close();

        std::ifstream f(path);
        std::string line;
        QVERIFY(std::getline(f, line));
        QVERIFY(line.find("\"direction\":\"Client->TV\"") != std::string::npos);
        QVERIFY(line.find("\"channel\":\"input\"") != std::string::npos);
        QVERIFY(line.find("\"type\":\"button\"") != std::string::npos);
        QVERIFY(line.find("\"target\":\"HOME\"") != std::string::npos);
        QVERIFY(line.find("name:HOME\\n\\n") != std::string::npos);
        QVERIFY(!std::getline(f, line));

        std::remove(path.c_str());
    }

    void testAttachRecordsSessionTraffic()
    {
        const std::string path = "/tmp/test_ssap_protocol_logger_session.tsv";

        ssap::ReplayTransport primary, secondary;
        ssap::MemoryCredentialStore store;
        ssap::SessionConfig config;
        config.heartbeatEnabled = false;
        ssap::WebOSSession session(&primary, &secondary, &store, config);

        ssap::ProtocolLogger logger;
        logger.open(path);
        logger.attach(&session);

        session.connectToDevice("192.168.1.5");
        primary.simulateConnect();
        primary.feedText(R"({"type":"response","payload":{"pairingType":"PIN"}})");

        logger.detach();
        primary.feedText(R"({"type":"response","payload":{}})");
        logger.close();

        std::ifstream f(path);
        std::string header, sent, received, extra;
        std::getline(f, header);
        QVERIFY(std::getline(f, sent));
        QVERIFY(std::getline(f, received));
        QVERIFY(!std::getline(f, extra));

        QVERIFY(sent.find("Client->TV\tprimary\tregister") != std::string::npos);
        QVERIFY(received.find("TV->Client\tprimary\tresponse") != std::string::npos);

        std::remove(path.c_str());
    }

    void testPairingSecretsMaskedAndFilePrivate()
    {
        const std::string path = "/tmp/test_ssap_protocol_logger_secrets.jsonl";

        ssap::ProtocolLogger logger;
        logger.setFormat(ssap::ProtocolLogger::OutputFormat::Jsonl);
        logger.open(path);
        logger.log("Client->TV", "primary",
                   R"({"type":"register","id":"r1","payload":{"client-key":"SECRETKEY","pairingType":"PIN"}})");
        logger.log("Client->TV", "primary",
                   R"({"type":"request","id":"p1","uri":"ssap://pairing/setPin","payload":{"pin":"12345678"}})");
        logger.log("TV->Client", "primary",
                   R"({"type":"registered","id":"r1","payload":{"client-key":"SECRETKEY"}})");
        logger.close();

        const QFileInfo info(QString::fromStdString(path));
        QVERIFY(!(info.permissions() & QFileDevice::ReadOther));
        QVERIFY(!(info.permissions() & QFileDevice::ReadGroup));

        std::ifstream f(path);
        const std::string contents((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        QVERIFY(contents.find("SECRETKEY") == std::string::npos);
        QVERIFY(contents.find("12345678") == std::string::npos);
        QVERIFY(contents.find("ssap://pairing/setPin") != std::string::npos);
        QVERIFY(contents.find("PIN") != std::string::npos);

        // Frames without secrets pass through untouched
        const QString plain = R"({"type":"request","id":"7","uri":"ssap://audio/volumeUp"})";
        QCOMPARE(ssap::ProtocolLogger::redact(plain), plain);
        QCOMPARE(ssap::ProtocolLogger::redact("type:button\nname:UP\n\n"), QString("type:button\nname:UP\n\n"));

        std::remove(path.c_str());
    }

    void testLogWhenClosedIsIgnored()
    {
        ssap::ProtocolLogger logger;
        QVERIFY(!logger.isOpen());
        logger.log("Client->TV", "primary", "{}");
        QVERIFY(!logger.isOpen());
    }
};

QTEST_MAIN(TestProtocolLogger)
#include "test_protocol_logger.moc"
