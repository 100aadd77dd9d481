#include <QtTest/QtTest>
#include <QSignalSpy>
#include <ssap/Transport/ReplayTransport.hpp>

class TestReplayTransport : public QObject {
    Q_OBJECT
private slots:
    void testFeedText()
    {
        ssap::ReplayTransport transport;
        QSignalSpy textSpy(&transport, &ssap::ITransport::textReceived);

        transport.feedText(R"({"type":"response"})");

        QCOMPARE(textSpy.count(), 1);
        QCOMPARE(textSpy.at(0).at(0).toString(), QString(R"({"type":"response"})"));
    }

    void testWritesNeedConnection()
    {
        ssap::ReplayTransport transport;
        QVERIFY(!transport.sendText("dropped"));
        QVERIFY(!transport.ping());

        transport.simulateConnect();
        QVERIFY(transport.sendText("first"));
        QVERIFY(transport.sendText("second"));
        QVERIFY(transport.sendBinary("raw"));

        QCOMPARE(transport.writtenText().size(), 2);
        QCOMPARE(transport.writtenText().at(1), QString("second"));
        QCOMPARE(transport.writtenBinary().size(), 1);

        transport.clearWritten();
        QCOMPARE(transport.writtenText().size(), 0);
        QCOMPARE(transport.writtenBinary().size(), 0);
    }

    void testOpenCloseBookkeeping()
    {
        ssap::ReplayTransport transport;
        transport.open(QUrl("wss://10.0.0.1:3001"));
        QVERIFY(transport.isOpenRequested());
        QCOMPARE(transport.url(), QUrl("wss://10.0.0.1:3001"));
        QVERIFY(!transport.isConnected());

        transport.simulateConnect();
        transport.close();
        QVERIFY(!transport.isOpenRequested());
        QVERIFY(!transport.isConnected());
        QCOMPARE(transport.openCount(), 1);
        QCOMPARE(transport.closeCount(), 1);
    }

    void testSimulatedEvents()
    {
        ssap::ReplayTransport transport;
        QSignalSpy connectedSpy(&transport, &ssap::ITransport::connected);
        QSignalSpy disconnectedSpy(&transport, &ssap::ITransport::disconnected);
        QSignalSpy errorSpy(&transport, &ssap::ITransport::error);

        transport.simulateConnect();
        QVERIFY(transport.isConnected());
        transport.simulateError("boom");
        transport.simulateDisconnect();
        QVERIFY(!transport.isConnected());

        QCOMPARE(connectedSpy.count(), 1);
        QCOMPARE(disconnectedSpy.count(), 1);
        QCOMPARE(errorSpy.at(0).at(0).toString(), QString("boom"));
    }

    void testPingFailure()
    {
        ssap::ReplayTransport transport;
        transport.simulateConnect();
        QVERIFY(transport.ping());
        transport.setFailPings(true);
        QVERIFY(!transport.ping());
        QCOMPARE(transport.pingCount(), 1);
    }
};

QTEST_MAIN(TestReplayTransport)
#include "test_replay_transport.moc"
