#include <ssap/Protocol/RemoteCommand.hpp>

namespace ssap {

namespace {

struct CommandEntry {
    CommandAction action;
    const char* name;
    CommandChannel channel;
    const char* target;   // URI or button name
};

// Keep in enum order; CommandTable::entry() indexes by value.
const CommandEntry kCommands[] = {
    {CommandAction::PowerOff,    "power",        CommandChannel::Primary, "ssap://system/turnOff"},
    {CommandAction::VolumeUp,    "volume-up",    CommandChannel::Primary, "ssap://audio/volumeUp"},
    {CommandAction::VolumeDown,  "volume-down",  CommandChannel::Primary, "ssap://audio/volumeDown"},
    {CommandAction::Mute,        "mute",         CommandChannel::Primary, "ssap://audio/setMute"},
    {CommandAction::Unmute,      "unmute",       CommandChannel::Primary, "ssap://audio/setMute"},
    {CommandAction::SetVolume,   "set-volume",   CommandChannel::Primary, "ssap://audio/setVolume"},
    {CommandAction::ChannelUp,   "channel-up",   CommandChannel::Primary, "ssap://tv/channelUp"},
    {CommandAction::ChannelDown, "channel-down", CommandChannel::Primary, "ssap://tv/channelDown"},
    {CommandAction::Play,        "play",         CommandChannel::Primary, "ssap://media.controls/play"},
    {CommandAction::Pause,       "pause",        CommandChannel::Primary, "ssap://media.controls/pause"},
    {CommandAction::Stop,        "stop",         CommandChannel::Primary, "ssap://media.controls/stop"},
    {CommandAction::Rewind,      "rewind",       CommandChannel::Primary, "ssap://media.controls/rewind"},
    {CommandAction::FastForward, "fast-forward", CommandChannel::Primary, "ssap://media.controls/fastForward"},
    {CommandAction::Up,          "up",           CommandChannel::Input,   "UP"},
    {CommandAction::Down,        "down",         CommandChannel::Input,   "DOWN"},
    {CommandAction::Left,        "left",         CommandChannel::Input,   "LEFT"},
    {CommandAction::Right,       "right",        CommandChannel::Input,   "RIGHT"},
    {CommandAction::Enter,       "enter",        CommandChannel::Input,   "ENTER"},
    {CommandAction::Back,        "back",         CommandChannel::Input,   "BACK"},
    {CommandAction::Home,        "home",         CommandChannel::Input,   "HOME"},
    {CommandAction::Menu,        "menu",         CommandChannel::Input,   "MENU"},
    {CommandAction::Info,        "info",         CommandChannel::Input,   "INFO"},
    {CommandAction::LaunchApp,   "launch-app",   CommandChannel::Primary, "ssap://system.launcher/launch"},
    {CommandAction::ListInputs,  "list-inputs",  CommandChannel::Primary, "ssap://tv/getExternalInputList"},
    {CommandAction::SelectInput, "select-input", CommandChannel::Primary, "ssap://tv/switchInput"},
};

constexpr int kCommandCount = static_cast<int>(sizeof(kCommands) / sizeof(kCommands[0]));
static_assert(kCommandCount == static_cast<int>(CommandAction::SelectInput) + 1,
              "command table must cover every CommandAction");

const CommandEntry& entry(CommandAction action)
{
    return kCommands[static_cast<int>(action)];
}

} // namespace

RemoteCommand RemoteCommand::launchApp(const QString& appId)
{
    RemoteCommand cmd(CommandAction::LaunchApp);
    cmd.argument = appId;
    return cmd;
}

RemoteCommand RemoteCommand::selectInput(const QString& inputId)
{
    RemoteCommand cmd(CommandAction::SelectInput);
    cmd.argument = inputId;
    return cmd;
}

RemoteCommand RemoteCommand::setVolume(int level)
{
    RemoteCommand cmd(CommandAction::SetVolume);
    cmd.level = level;
    return cmd;
}

QList<CommandAction> CommandTable::allActions()
{
    QList<CommandAction> actions;
    actions.reserve(kCommandCount);
    for (const auto& e : kCommands)
        actions.append(e.action);
    return actions;
}

CommandChannel CommandTable::channel(CommandAction action)
{
    return entry(action).channel;
}

QString CommandTable::uri(CommandAction action)
{
    const auto& e = entry(action);
    if (e.channel != CommandChannel::Primary) return {};
    return QString::fromLatin1(e.target);
}

QString CommandTable::buttonName(CommandAction action)
{
    const auto& e = entry(action);
    if (e.channel != CommandChannel::Input) return {};
    return QString::fromLatin1(e.target);
}

QJsonObject CommandTable::payload(const RemoteCommand& command)
{
    QJsonObject payload;
    switch (command.action) {
    case CommandAction::PowerOff:
        payload["standbyMode"] = "active";
        break;
    case CommandAction::Mute:
        payload["mute"] = true;
        break;
    case CommandAction::Unmute:
        payload["mute"] = false;
        break;
    case CommandAction::SetVolume:
        payload["volume"] = qBound(0, command.level, 100);
        break;
    case CommandAction::LaunchApp:
        payload["id"] = command.argument;
        break;
    case CommandAction::SelectInput:
        payload["inputId"] = command.argument;
        break;
    default:
        break;
    }
    return payload;
}

QString CommandTable::name(CommandAction action)
{
    return QString::fromLatin1(entry(action).name);
}

bool CommandTable::fromName(const QString& name, CommandAction& action)
{
    const QString wanted = name.trimmed().toLower();
    for (const auto& e : kCommands) {
        if (wanted == QLatin1String(e.name)) {
            action = e.action;
            return true;
        }
    }
    return false;
}

bool CommandTable::requiresArgument(CommandAction action)
{
    return action == CommandAction::LaunchApp
        || action == CommandAction::SelectInput
        || action == CommandAction::SetVolume;
}

} // namespace ssap
