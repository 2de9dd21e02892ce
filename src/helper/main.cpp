#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QFileInfo>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/common/SystemMonitor.hpp"
#include "core/restic/ResticCommandService.hpp"
#include "core/security/SecurityOperationRecorder.hpp"
#include "core/security/SecurityService.hpp"
#include "core/xpc/XPCServiceHost.hpp"
#include "platform/linux/LinuxSignalWatcher.hpp"

#include <signal.h>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("rbum-helper");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("dev.mpy");
    app.setOrganizationDomain("mpy.dev");

    QCommandLineParser parser;
    parser.setApplicationDescription("Runs restic on behalf of rBUM clients");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption({"c", "config"}, "Read settings from <file> (ini format).", "file");
    QCommandLineOption verboseOption({"v", "verbose"}, "Log at debug level.");
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.process(app);

    try {
        auto& config = Rbum::Config::instance();
        if (parser.isSet(configOption)) {
            config.initializeFromFile(QFileInfo(parser.value(configOption)).absoluteFilePath());
        } else {
            config.initialize();
        }

        Rbum::Logger::instance().initialize(
            config.getLogFilePath().toStdString(),
            parser.isSet(verboseOption) ? Rbum::Logger::Level::Debug : Rbum::Logger::Level::Info);
        Rbum::Logger::instance().info("Starting rbum-helper v{}", app.applicationVersion().toStdString());

        const Rbum::SecurityMode mode = Rbum::securityModeFromSettings(config.getSecuritySettings());
        auto recorder = std::make_shared<Rbum::SecurityOperationRecorder>();
        auto security = Rbum::createSecurityService(mode, recorder);
        Rbum::Logger::instance().info("Using {} security service", security->name().toStdString());

        Rbum::SystemMonitor monitor;
        Rbum::ResticCommandService service(security, &monitor, Rbum::ResticServiceConfig::fromConfig(config));

        const auto connection = config.getConnectionSettings();
        Rbum::XPCServiceHostConfig hostConfig;
        hostConfig.serviceName = connection.serviceName;
        hostConfig.interfaceVersion = connection.interfaceVersion;
        hostConfig.maxConnections = config.getResourceSettings().maxConnections;
        hostConfig.defaultResourcePath = config.getResticCachePath();

        Rbum::XPCServiceHost host(&service, &monitor, hostConfig);
        auto started = host.start();
        if (started.hasError()) {
            Rbum::Logger::instance().critical("Could not start service: {}", Rbum::toStdString(started.error()));
            return 1;
        }

        QObject::connect(&app, &QCoreApplication::aboutToQuit, &host, [&host, &service]() {
            service.cancelOperation();
            host.stop();
        });

        // SIGTERM and SIGINT go through quit() so the running restic is stopped
        Rbum::LinuxSignalWatcher signalWatcher;
        auto watching = signalWatcher.install({SIGTERM, SIGINT});
        if (watching.hasError()) {
            Rbum::Logger::instance().critical("Could not install signal handlers: {}",
                                              Rbum::toStdString(watching.error()));
            return 1;
        }
        QObject::connect(&signalWatcher, &Rbum::LinuxSignalWatcher::terminationRequested,
                         &app, &QCoreApplication::quit);

        const int result = app.exec();

        config.sync();
        Rbum::Logger::instance().info("rbum-helper shutdown complete ({} security operations recorded)",
                                      recorder->recordCount());
        Rbum::Logger::instance().shutdown();
        return result;

    } catch (const std::exception& e) {
        Rbum::Logger::instance().critical("Fatal error: {}", e.what());
        return 1;
    }
}
