#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QTextStream>
#include <QTimer>
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>
#include "core/PinPrompt.hpp"
#include "core/YamlConfig.hpp"
#include "core/services/RemoteControlService.hpp"
#include "core/services/YamlCredentialStore.hpp"

namespace {

void applyLogLevel(const QString& level)
{
    namespace logging = boost::log;
    auto severity = logging::trivial::info;
    if (level == "trace") severity = logging::trivial::trace;
    else if (level == "debug") severity = logging::trivial::debug;
    else if (level == "warning") severity = logging::trivial::warning;
    else if (level == "error") severity = logging::trivial::error;
    logging::core::get()->set_filter(logging::trivial::severity >= severity);
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tvremote");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Remote control for LG webOS TVs");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption scanOption("scan", "Scan the local network for TVs.");
    QCommandLineOption addressOption("address", "TV IPv4 address.", "ip");
    QCommandLineOption pinOption("pin", "Pairing PIN shown on the TV.", "pin");
    QCommandLineOption forgetOption("forget", "Forget the stored pairing.");
    QCommandLineOption configOption("config", "Configuration file.", "path",
                                    tvr::YamlConfig::defaultConfigPath());
    parser.addOption(scanOption);
    parser.addOption(addressOption);
    parser.addOption(pinOption);
    parser.addOption(forgetOption);
    parser.addOption(configOption);
    parser.addPositionalArgument("commands",
                                 "Commands to send once paired, e.g. volume-up mute launch-app=netflix.",
                                 "[commands...]");
    parser.process(app);

    tvr::YamlConfig config;
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            BOOST_LOG_TRIVIAL(error) << "Failed to load " << configPath.toStdString()
                                     << ": " << e.what();
            return 1;
        }
    } else if (parser.isSet(configOption)) {
        BOOST_LOG_TRIVIAL(error) << "Config file not found: " << configPath.toStdString();
        return 1;
    }
    applyLogLevel(config.logLevel());

    tvr::YamlCredentialStore credentials(config.credentialsPath());
    tvr::RemoteControlService service(config, &credentials);

    QTextStream out(stdout);
    QObject::connect(&service, &tvr::RemoteControlService::statusChanged,
                     [&out](const QString& status) { out << status << Qt::endl; });

    if (parser.isSet(forgetOption)) {
        service.forgetPairing();
        out << "Pairing forgotten" << Qt::endl;
        if (!parser.isSet(scanOption) && !parser.isSet(addressOption)
                && parser.positionalArguments().isEmpty())
            return 0;
    }

    if (parser.isSet(scanOption)) {
        QObject::connect(&service, &tvr::RemoteControlService::scanFinished,
                         &app, [&](const QList<ssap::DeviceDescriptor>& devices) {
            for (const auto& device : devices)
                out << device.address << "\t" << device.name << Qt::endl;
            app.exit(devices.isEmpty() ? 2 : 0);
        });
        if (!service.scanForDevices())
            return 1;
        return app.exec();
    }

    const QString address = parser.isSet(addressOption) ? parser.value(addressOption)
                                                        : config.tvAddress();
    if (address.isEmpty()) {
        BOOST_LOG_TRIVIAL(error) << "No TV address; use --address or set tv.address";
        return 1;
    }

    const QStringList commands = parser.positionalArguments();
    const QString cliPin = parser.value(pinOption);

    QTextStream pinIn(stdin);
    int pinAttempts = 0;
    auto askForPin = [&]() {
        if (!cliPin.isEmpty()) {
            service.submitPin(cliPin);
            return;
        }
        QString pin;
        if (++pinAttempts > tvr::MAX_PIN_ATTEMPTS) {
            BOOST_LOG_TRIVIAL(error) << "Too many PIN attempts";
            app.exit(1);
            return;
        }
        if (!tvr::promptForPin(pinIn, out, pin)) {
            BOOST_LOG_TRIVIAL(error) << "No PIN entered";
            app.exit(1);
            return;
        }
        service.submitPin(pin);
    };

    QObject::connect(&service, &tvr::RemoteControlService::pinRequested, &app, askForPin);

    // A rejected PIN from the command line is final; an interactive one is asked
    // again from the event loop, since InvalidPin is reported inside submitPin
    QObject::connect(service.session(), &ssap::WebOSSession::errorOccurred, &app,
                     [&](ssap::SessionError error, const QString&) {
        if (error == ssap::SessionError::PairingRejected
                || error == ssap::SessionError::InvalidPin) {
            if (!cliPin.isEmpty()) {
                app.exit(1);
                return;
            }
            QTimer::singleShot(0, &app, askForPin);
        } else if (error == ssap::SessionError::PairingTimedOut) {
            app.exit(1);
        }
    });

    QObject::connect(service.session(), &ssap::WebOSSession::stateChanged, &app,
                     [&](ssap::SessionState state) {
        if (state == ssap::SessionState::Disconnected)
            app.exit(1);
    });

    bool sent = false;
    auto sendAll = [&]() {
        if (sent) return;
        sent = true;
        int failures = 0;
        for (const auto& entry : commands) {
            const int eq = entry.indexOf('=');
            const QString name = eq < 0 ? entry : entry.left(eq);
            const QString argument = eq < 0 ? QString() : entry.mid(eq + 1);
            if (!service.sendCommandByName(name, argument)) {
                out << "Failed: " << entry << " (" << service.lastError() << ")" << Qt::endl;
                ++failures;
            }
        }
        // Let the sockets flush before closing
        QTimer::singleShot(500, &app, [&, failures]() {
            service.disconnectFromTv();
            app.exit(failures == 0 ? 0 : 1);
        });
    };

    auto needsInputChannel = [&commands]() {
        for (const auto& entry : commands) {
            ssap::CommandAction action;
            if (ssap::CommandTable::fromName(entry.section('=', 0, 0), action)
                    && ssap::CommandTable::channel(action) == ssap::CommandChannel::Input)
                return true;
        }
        return false;
    };

    QObject::connect(&service, &tvr::RemoteControlService::paired, &app, [&]() {
        if (needsInputChannel() && !service.session()->isInputChannelOpen())
            return;
        sendAll();
    });
    QObject::connect(service.session(), &ssap::WebOSSession::inputChannelReady, &app, [&]() {
        if (service.isConnected())
            sendAll();
    });

    service.connectToTv(address);
    return app.exec();
}
