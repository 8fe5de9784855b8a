#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QStandardPaths>
#include <QTimer>
#include <atomic>
#include <csignal>

#include "config/config_store.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"

namespace {

std::atomic_bool g_stopRequested{false};

void requestStop(int)
{
    g_stopRequested.store(true);
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("switchboard"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));
    app.setOrganizationName(QStringLiteral("Switchboard"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local reverse proxy that fails over between LLM API providers"));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption({QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Configuration file."), QStringLiteral("path"));
    const QCommandLineOption portOption({QStringLiteral("p"), QStringLiteral("port")},
                                        QStringLiteral("Listen port, overrides the configuration."),
                                        QStringLiteral("port"));
    const QCommandLineOption logDirOption(QStringLiteral("log-dir"),
                                          QStringLiteral("Directory for switchboard.log."), QStringLiteral("dir"));
    const QCommandLineOption debugOption({QStringLiteral("d"), QStringLiteral("debug")},
                                         QStringLiteral("Debug logging."));
    parser.addOptions({configOption, portOption, logDirOption, debugOption});
    parser.process(app);

    // --- 1. Data directory ---
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QDir().mkpath(dataDir);
    const QString configPath = parser.isSet(configOption)
        ? parser.value(configOption) : dataDir + QStringLiteral("/config.json");
    const QString logDir = parser.isSet(logDirOption)
        ? parser.value(logDirOption) : dataDir + QStringLiteral("/logs");
    QDir().mkpath(logDir);

    // --- 2. Log ---
    LogManager::instance().initialize(logDir);
    LogManager::instance().setConsoleEcho(true);
    if (parser.isSet(debugOption))
        LogManager::instance().setMinimumLevel(LogManager::Debug);
    LOG_INFO(QStringLiteral("switchboard %1 starting").arg(app.applicationVersion()));

    // --- 3. Config ---
    ConfigStore configStore;
    if (!configStore.load(configPath)) {
        LOG_ERROR(QStringLiteral("cannot load configuration from %1").arg(configPath));
        return 1;
    }
    if (!QFileInfo::exists(configStore.filePath()) && !configStore.save())
        LOG_WARNING(QStringLiteral("cannot create default configuration at %1").arg(configStore.filePath()));

    // --- 4. Components and listener ---
    Bootstrap bootstrap(configStore);
    if (parser.isSet(portOption)) {
        bool ok = false;
        const int port = parser.value(portOption).toInt(&ok);
        if (!ok || port < 0 || port > 65535) {
            LOG_ERROR(QStringLiteral("invalid port '%1'").arg(parser.value(portOption)));
            return 2;
        }
        bootstrap.setPortOverride(port);
    }
    bootstrap.setDebugOverride(parser.isSet(debugOption));
    if (!bootstrap.startAll())
        return 1;

    // --- 5. Signals ---
    std::signal(SIGINT, requestStop);
    std::signal(SIGTERM, requestStop);
    QTimer signalPoll;
    QObject::connect(&signalPoll, &QTimer::timeout, &app, [&app]() {
        if (g_stopRequested.load()) {
            LOG_INFO(QStringLiteral("stop requested"));
            app.quit();
        }
    });
    signalPoll.start(200);

    const int rc = app.exec();
    bootstrap.stopAll();
    return rc;
}
