#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QSocketNotifier>
#include <memory>
#include <stdexcept>
#include <boost/log/trivial.hpp>
#include <odk/Transport/HidapiBackend.hpp>
#include <odk/Version.hpp>
#include "core/Logging.hpp"
#include "core/YamlConfig.hpp"
#include "core/deck/DeviceManager.hpp"
#include "core/host/OpenActionLink.hpp"

namespace {

int g_signalFd[2] = {-1, -1};

void onTerminationSignal(int)
{
    const char c = 1;
    ssize_t ignored = ::write(g_signalFd[0], &c, sizeof(c));
    (void)ignored;
}

bool installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalFd) != 0)
        return false;

    struct sigaction sa{};
    sa.sa_handler = onTerminationSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    return ::sigaction(SIGTERM, &sa, nullptr) == 0
        && ::sigaction(SIGINT, &sa, nullptr) == 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("opendeck-bridge");
    app.setApplicationVersion(odk::VERSION_STRING);

    QCommandLineParser parser;
    parser.setApplicationDescription("OpenDeck plugin for Ajazz and Mirabox stream decks");
    parser.setSingleDashWordOptionMode(QCommandLineParser::ParseAsLongOptions);
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption portOption("port", "Host WebSocket port.", "port");
    QCommandLineOption uuidOption("pluginUUID", "Plugin UUID assigned by the host.", "uuid");
    QCommandLineOption registerOption("registerEvent", "Registration event name.", "event");
    QCommandLineOption infoOption("info", "Host info JSON.", "json");
    QCommandLineOption configOption("config", "Configuration file.", "path",
                                    odb::YamlConfig::defaultPath());
    parser.addOptions({portOption, uuidOption, registerOption, infoOption, configOption});
    parser.process(app);

    // Config first: it decides the log level
    odb::YamlConfig config;
    const QString configPath = parser.value(configOption);
    QString configProblem;
    if (QFile::exists(configPath)) {
        try {
            config.load(configPath);
        } catch (const YAML::Exception& e) {
            // load() leaves the defaults in place
            configProblem = QString::fromStdString(e.what());
        }
    }

    odb::initLogging(config.logLevel());

    if (!configProblem.isEmpty()) {
        BOOST_LOG_TRIVIAL(warning) << "[Main] Ignoring " << configPath.toStdString()
                                   << ": " << configProblem.toStdString();
    }

    bool portOk = false;
    const int port = parser.value(portOption).toInt(&portOk);
    if (!portOk || port <= 0 || port > 65535 || !parser.isSet(uuidOption)
        || !parser.isSet(registerOption)) {
        BOOST_LOG_TRIVIAL(error) << "[Main] Missing -port, -pluginUUID or -registerEvent";
        return 1;
    }

    BOOST_LOG_TRIVIAL(info) << "[Main] opendeck-bridge " << odk::VERSION_STRING << " starting";
    if (parser.isSet(infoOption))
        BOOST_LOG_TRIVIAL(debug) << "[Main] Host info: " << parser.value(infoOption).toStdString();

    odk::HidapiBackend backend(config.pollIntervalMs());
    if (!backend.isInitialized())
        return 1;

    odb::OpenActionLink host(static_cast<quint16>(port), parser.value(uuidOption),
                             parser.value(registerOption));

    odb::DeviceManager::Options options;
    options.deviceNamespace = config.deviceNamespace();
    options.workerThreads = config.workerThreads();
    options.session.defaultBrightness = config.defaultBrightness();
    options.session.readTimeoutMs = config.readTimeoutMs();
    options.session.jpegQuality = config.jpegQuality();

    std::unique_ptr<odb::DeviceManager> manager;
    try {
        manager = std::make_unique<odb::DeviceManager>(&backend, &host, options);
    } catch (const std::logic_error& e) {
        BOOST_LOG_TRIVIAL(fatal) << "[Main] " << e.what();
        return 1;
    }

    bool shuttingDown = false;
    const auto shutdown = [&]() {
        if (shuttingDown)
            return;
        shuttingDown = true;

        BOOST_LOG_TRIVIAL(info) << "[Main] Shutting down";
        const bool drained = manager->shutdown(config.shutdownTimeoutMs());
        BOOST_LOG_TRIVIAL(info) << "[Main] "
                                << (drained ? "All devices released" : "Gave up waiting for devices")
                                << ", exiting now";
        host.close();
        app.quit();
    };

    if (!installSignalHandlers()) {
        BOOST_LOG_TRIVIAL(warning) << "[Main] Could not install signal handlers";
    } else {
        auto* notifier = new QSocketNotifier(g_signalFd[1], QSocketNotifier::Read, &app);
        QObject::connect(notifier, &QSocketNotifier::activated, &app, [&, notifier]() {
            char c;
            ssize_t ignored = ::read(g_signalFd[1], &c, sizeof(c));
            (void)ignored;
            notifier->setEnabled(false);
            shutdown();
        });
    }

    // Without the host there is nobody to serve
    QObject::connect(&host, &odb::IHostLink::hostDisconnected, &app, shutdown);

    manager->start();
    host.open();

    const int ret = app.exec();

    manager.reset();
    return ret;
}
