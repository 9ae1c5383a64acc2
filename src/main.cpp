#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QStringList>
#include <iostream>
#include <boost/log/trivial.hpp>
#include "core/InstallerConfig.hpp"
#include "core/Logging.hpp"
#include "core/install/InstallLayout.hpp"
#include "core/lifecycle/Installer.hpp"
#include "core/lifecycle/Uninstaller.hpp"
#include "core/prompt/TerminalPrompt.hpp"
#include "core/services/UserServiceManager.hpp"
#include "core/system/ProcessCommandRunner.hpp"

static void printUsage()
{
    std::cerr << "Usage: tuxagent-setup <install|uninstall|status>\n";
}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tuxagent-setup");
    app.setApplicationVersion("0.1.0");

    const QStringList args = app.arguments().mid(1);
    if (args.size() != 1) {
        printUsage();
        return 2;
    }
    const QString command = args.first();

    // Logging first at the default level so config errors are visible
    tas::initLogging(boost::log::trivial::info);

    tas::InstallerConfig config;
    QString configPath = qEnvironmentVariable("TUXAGENT_SETUP_CONFIG");
    if (configPath.isEmpty())
        configPath = QDir(config.sourceDir()).filePath("config/installer.yaml");
    if (QFile::exists(configPath) && !config.load(configPath))
        BOOST_LOG_TRIVIAL(warning) << "Ignoring " << configPath.toStdString() << ", using built-in defaults";

    QString level = qEnvironmentVariable("TUXAGENT_LOG_LEVEL");
    if (level.isEmpty())
        level = config.logLevel();
    tas::initLogging(tas::parseSeverity(level));

    tas::ProcessCommandRunner runner;
    tas::TerminalPrompt prompt;

    if (command == "install") {
        tas::Installer installer(config, &runner, &prompt);
        return installer.run().exitCode();
    }

    if (command == "uninstall") {
        tas::Uninstaller uninstaller(config, &runner, &prompt);
        return uninstaller.run().exitCode();
    }

    if (command == "status") {
        const auto layout = tas::InstallLayout::fromConfig(config);
        tas::UserServiceManager service(&runner, config.serviceUnitName(), layout.serviceUnitFile);
        std::cout << config.serviceUnitName().toStdString() << ": "
                  << tas::serviceStateName(service.state()).toStdString() << std::endl;
        return 0;
    }

    printUsage();
    return 2;
}
