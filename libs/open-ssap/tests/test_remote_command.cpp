#include <QtTest/QtTest>
#include <QSet>
#include <ssap/Protocol/RemoteCommand.hpp>

class TestRemoteCommand : public QObject {
    Q_OBJECT

private slots:
    void testEveryActionHasARoute()
    {
        const auto actions = ssap::CommandTable::allActions();
        QCOMPARE(actions.size(), 25);
        for (auto action : actions) {
            if (ssap::CommandTable::channel(action) == ssap::CommandChannel::Primary) {
                QVERIFY(ssap::CommandTable::uri(action).startsWith("ssap://"));
                QVERIFY(ssap::CommandTable::buttonName(action).isEmpty());
            } else {
                QVERIFY(ssap::CommandTable::uri(action).isEmpty());
                QVERIFY(!ssap::CommandTable::buttonName(action).isEmpty());
            }
        }
    }

    void testNavigationKeysUseInputChannel()
    {
        const QList<QPair<ssap::CommandAction, QString>> keys = {
            {ssap::CommandAction::Up, "UP"}, {ssap::CommandAction::Down, "DOWN"},
            {ssap::CommandAction::Left, "LEFT"}, {ssap::CommandAction::Right, "RIGHT"},
            {ssap::CommandAction::Enter, "ENTER"}, {ssap::CommandAction::Back, "BACK"},
            {ssap::CommandAction::Home, "HOME"}, {ssap::CommandAction::Menu, "MENU"},
            {ssap::CommandAction::Info, "INFO"},
        };
        for (const auto& key : keys) {
            QCOMPARE(ssap::CommandTable::channel(key.first), ssap::CommandChannel::Input);
            QCOMPARE(ssap::CommandTable::buttonName(key.first), key.second);
        }
    }

    void testPrimaryUris()
    {
        QCOMPARE(ssap::CommandTable::uri(ssap::CommandAction::PowerOff), QString("ssap://system/turnOff"));
        QCOMPARE(ssap::CommandTable::uri(ssap::CommandAction::VolumeDown), QString("ssap://audio/volumeDown"));
        QCOMPARE(ssap::CommandTable::uri(ssap::CommandAction::Mute), QString("ssap://audio/setMute"));
        QCOMPARE(ssap::CommandTable::uri(ssap::CommandAction::ChannelUp), QString("ssap://tv/channelUp"));
        QCOMPARE(ssap::CommandTable::uri(ssap::CommandAction::LaunchApp), QString("ssap://system.launcher/launch"));
    }

    void testPayloads()
    {
        QCOMPARE(ssap::CommandTable::payload(ssap::CommandAction::PowerOff)["standbyMode"].toString(),
                 QString("active"));
        QCOMPARE(ssap::CommandTable::payload(ssap::CommandAction::Mute)["mute"].toBool(), true);
        QCOMPARE(ssap::CommandTable::payload(ssap::CommandAction::Unmute)["mute"].toBool(true), false);
        QVERIFY(ssap::CommandTable::payload(ssap::CommandAction::VolumeUp).isEmpty());

        QCOMPARE(ssap::CommandTable::payload(ssap::RemoteCommand::launchApp("netflix"))["id"].toString(),
                 QString("netflix"));
        QCOMPARE(ssap::CommandTable::payload(ssap::RemoteCommand::selectInput("HDMI_2"))["inputId"].toString(),
                 QString("HDMI_2"));
    }

    void testVolumeIsClamped()
    {
        QCOMPARE(ssap::CommandTable::payload(ssap::RemoteCommand::setVolume(42))["volume"].toInt(), 42);
        QCOMPARE(ssap::CommandTable::payload(ssap::RemoteCommand::setVolume(150))["volume"].toInt(), 100);
        QCOMPARE(ssap::CommandTable::payload(ssap::RemoteCommand::setVolume(-3))["volume"].toInt(), 0);
    }

    void testNames()
    {
        QSet<QString> seen;
        for (auto action : ssap::CommandTable::allActions()) {
            const QString name = ssap::CommandTable::name(action);
            QVERIFY(!seen.contains(name));
            seen.insert(name);

            ssap::CommandAction parsed = ssap::CommandAction::PowerOff;
            QVERIFY(ssap::CommandTable::fromName(name, parsed));
            QCOMPARE(parsed, action);
        }

        ssap::CommandAction parsed = ssap::CommandAction::PowerOff;
        QVERIFY(ssap::CommandTable::fromName(" Volume-Up ", parsed));
        QCOMPARE(parsed, ssap::CommandAction::VolumeUp);
        QVERIFY(!ssap::CommandTable::fromName("volume_up", parsed));
        QCOMPARE(parsed, ssap::CommandAction::VolumeUp);
    }

    void testRequiresArgument()
    {
        QVERIFY(ssap::CommandTable::requiresArgument(ssap::CommandAction::LaunchApp));
        QVERIFY(ssap::CommandTable::requiresArgument(ssap::CommandAction::SelectInput));
        QVERIFY(ssap::CommandTable::requiresArgument(ssap::CommandAction::SetVolume));
        QVERIFY(!ssap::CommandTable::requiresArgument(ssap::CommandAction::ListInputs));
        QVERIFY(!ssap::CommandTable::requiresArgument(ssap::CommandAction::Home));
    }
};

QTEST_MAIN(TestRemoteCommand)
#include "test_remote_command.moc"
