#pragma once

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>

namespace ssap {

enum class CommandAction {
    PowerOff,
    VolumeUp,
    VolumeDown,
    Mute,
    Unmute,
    SetVolume,
    ChannelUp,
    ChannelDown,
    Play,
    Pause,
    Stop,
    Rewind,
    FastForward,
    Up,
    Down,
    Left,
    Right,
    Enter,
    Back,
    Home,
    Menu,
    Info,
    LaunchApp,
    ListInputs,
    SelectInput
};

/// Which socket a command travels on.
enum class CommandChannel {
    Primary,   // SSAP JSON request
    Input      // pointer socket button frame
};

struct RemoteCommand {
    CommandAction action = CommandAction::VolumeUp;
    QString argument;   // app id for LaunchApp, input id for SelectInput
    int level = 0;      // SetVolume only

    RemoteCommand() = default;
    RemoteCommand(CommandAction a) : action(a) {}

    static RemoteCommand launchApp(const QString& appId);
    static RemoteCommand selectInput(const QString& inputId);
    static RemoteCommand setVolume(int level);
};

/// Static command → wire mapping. Every CommandAction has exactly one entry.
class CommandTable {
public:
    static QList<CommandAction> allActions();

    static CommandChannel channel(CommandAction action);

    /// SSAP URI for primary-channel commands, empty for input-channel keys.
    static QString uri(CommandAction action);

    /// Button name on the pointer socket ("UP", "ENTER", ...), empty for
    /// primary-channel commands.
    static QString buttonName(CommandAction action);

    /// Request payload for a command; empty object when the command has none.
    static QJsonObject payload(const RemoteCommand& command);

    /// CLI-style names: "volume-up", "launch-app", ...
    static QString name(CommandAction action);
    static bool fromName(const QString& name, CommandAction& action);

    static bool requiresArgument(CommandAction action);
};

} // namespace ssap

Q_DECLARE_METATYPE(ssap::RemoteCommand)
