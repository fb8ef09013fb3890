#include <exception>
#include <iostream>
#include <memory>

#include <QCoreApplication>
#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/cascade_daemon.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("cascade-daemon"));

    const QStringList arguments = QCoreApplication::arguments();
    if (arguments.contains(QStringLiteral("--help")) || arguments.contains(QStringLiteral("-h"))) {
        std::cout << cascade::configHelpText().toStdString();
        return 0;
    }

    QString configError;
    const auto config = cascade::loadConfig(arguments, &configError);
    if (!config) {
        std::cerr << "cascade-daemon: " << configError.toStdString() << "\n"
                  << cascade::configHelpText().toStdString();
        return 1;
    }

    cascade::logging::initLogging(QStringLiteral("cascade-daemon"), config->trace);
    CLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              (nlohmann::json{{"rulesDir", config->rulesDir.toStdString()},
                              {"tickIntervalMs", config->tickIntervalMs},
                              {"maxConcurrentBatches", config->maxConcurrentBatches}}));

    std::unique_ptr<cascade::CascadeDaemon> daemon;
    try {
        daemon = std::make_unique<cascade::CascadeDaemon>(*config);
    } catch (const std::exception &ex) {
        qCritical() << "Cascade: failed to open the variable store:" << ex.what();
        return 1;
    }

    if (!daemon->start()) {
        return 1;
    }

    // The daemon lives for the lifetime of the process; drain it before the
    // event loop's objects go away.
    QObject::connect(&app, &QCoreApplication::aboutToQuit, daemon.get(),
                     [&daemon]() { daemon->stop(); });

    return app.exec();
}
