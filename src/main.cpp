#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "config/config_store.h"
#include "config/provider_table.h"
#include "core/bootstrap.h"
#include "core/log_manager.h"
#include "core/signal_watcher.h"
#include "proxy/proxy_server.h"

#ifndef OLLAMA_PROXY_VERSION
#define OLLAMA_PROXY_VERSION "0.0.0"
#endif

namespace {

constexpr int kExitBindFailure = 1;
constexpr int kExitConfigInvalid = 2;

int reportInvalid(const QStringList& errors)
{
    for (const QString& error : errors)
        LOG_ERROR(QStringLiteral("Config: %1").arg(error));
    LOG_ERROR(QStringLiteral("Configuration invalid, %1 problem(s)").arg(errors.size()));
    return kExitConfigInvalid;
}

}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("ollama-proxy"));
    app.setApplicationVersion(QStringLiteral(OLLAMA_PROXY_VERSION));
    app.setOrganizationName(QStringLiteral("ollama-proxy"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Ollama-compatible endpoint that routes each request to a configured provider "
                       "by the provider prefix of its model name."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Configuration file (default: $OLLAMA_PROXY_CONFIG, then %1).")
            .arg(ConfigStore::defaultConfigPath()),
        QStringLiteral("path"));
    const QCommandLineOption portOption(QStringLiteral("port"),
        QStringLiteral("Listen port, overrides the file."), QStringLiteral("port"));
    const QCommandLineOption listenOption(QStringLiteral("listen"),
        QStringLiteral("Listen address, overrides the file."), QStringLiteral("address"));
    const QCommandLineOption logLevelOption(QStringLiteral("log-level"),
        QStringLiteral("debug, info, warning or error."), QStringLiteral("level"));
    const QCommandLineOption checkOption(QStringLiteral("check-config"),
        QStringLiteral("Validate the configuration, print the tagged model names and exit."));
    const QCommandLineOption exampleOption(QStringLiteral("print-example-config"),
        QStringLiteral("Print an example configuration and exit."));
    parser.addOptions({configOption, portOption, listenOption, logLevelOption,
                       checkOption, exampleOption});
    parser.process(app);

    QTextStream out(stdout);
    if (parser.isSet(exampleOption)) {
        out << ConfigStore::exampleConfig();
        return 0;
    }

    // --- 1. Log level from the command line applies before the file is read ---
    LogManager& logger = LogManager::instance();
    std::optional<LogManager::Level> cliLevel;
    if (parser.isSet(logLevelOption)) {
        cliLevel = LogManager::parseLevel(parser.value(logLevelOption));
        if (!cliLevel)
            return reportInvalid({QStringLiteral("unknown log level '%1'").arg(parser.value(logLevelOption))});
        logger.setMinimumLevel(*cliLevel);
    }

    // --- 2. Config ---
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                          : ConfigStore::defaultConfigPath();

    ConfigStore configStore;
    const bool loaded = configStore.load(configPath);
    for (const QString& warning : configStore.warnings())
        LOG_WARNING(QStringLiteral("Config: %1").arg(warning));
    if (!loaded)
        return reportInvalid(configStore.errors());

    ProxyConfig config = configStore.proxyConfig();
    if (parser.isSet(portOption)) {
        bool ok = false;
        config.port = parser.value(portOption).toInt(&ok);
        if (!ok)
            return reportInvalid({QStringLiteral("--port is not a number: %1").arg(parser.value(portOption))});
    }
    if (parser.isSet(listenOption))
        config.listenAddress = parser.value(listenOption);

    const QStringList errors = ConfigStore::validate(config);
    if (!errors.isEmpty())
        return reportInvalid(errors);

    // --- 3. Log ---
    if (!cliLevel) {
        const auto fileLevel = LogManager::parseLevel(config.runtime.logLevel);
        if (fileLevel)
            logger.setMinimumLevel(*fileLevel);
    }
    logger.initialize(config.runtime.logDir);
    LOG_INFO(QStringLiteral("Config: loaded %1").arg(configPath));

    if (parser.isSet(checkOption)) {
        auto table = ProviderTable::build(config.providers);
        if (!table)
            return reportInvalid({table.error().message});
        for (const QString& name : Bootstrap::taggedModels(**table))
            out << name << '\n';
        return 0;
    }

    // --- 4. Proxy server ---
    auto& proxyServer = *new ProxyServer(&app);

    Bootstrap bootstrap(&app);
    bootstrap.setProxy(&proxyServer);
    bootstrap.setVersion(app.applicationVersion());

    const VoidResult started = bootstrap.startAll(config);
    if (!started) {
        LOG_ERROR(started.error().message);
        return started.error().kind == ErrorKind::ConfigurationInvalid
                   ? kExitConfigInvalid
                   : kExitBindFailure;
    }

    // --- 5. Lifecycle ---
    SignalWatcher signalWatcher(&app);
    if (!signalWatcher.install())
        LOG_WARNING(QStringLiteral("Signal handling unavailable, stop with the process manager"));
    QObject::connect(&signalWatcher, &SignalWatcher::terminationRequested,
                     &bootstrap, [&bootstrap](int) { bootstrap.stopAll(); });
    QObject::connect(&bootstrap, &Bootstrap::stopped, &app, &QCoreApplication::quit);

    return app.exec();
}
