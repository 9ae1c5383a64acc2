#include "Uninstaller.hpp"
#include "core/InstallerConfig.hpp"
#include "core/install/FileProvisioner.hpp"
#include "core/prompt/IConfirmationPrompt.hpp"
#include "core/services/UserServiceManager.hpp"
#include <boost/log/trivial.hpp>

namespace tas {

QString uninstallOutcomeName(UninstallOutcome outcome)
{
    switch (outcome) {
    case UninstallOutcome::CancelledAtGate1: return QStringLiteral("cancelled-at-gate-1");
    case UninstallOutcome::CompletedDataPreserved: return QStringLiteral("completed-data-preserved");
    case UninstallOutcome::CompletedDataDeleted: return QStringLiteral("completed-data-deleted");
    }
    return {};
}

Uninstaller::Uninstaller(const InstallerConfig& config, ICommandRunner* runner, IConfirmationPrompt* prompt)
    : config_(config)
    , runner_(runner)
    , prompt_(prompt)
    , layout_(InstallLayout::fromConfig(config))
    , manifest_(InstallManifest::build(config, layout_))
{
}

UninstallReport Uninstaller::run()
{
    UninstallReport report;
    const std::string product = config_.productName().toStdString();

    BOOST_LOG_TRIVIAL(info) << "=== " << product << " Uninstallation ===";

    if (!prompt_->askConfirmation(QStringLiteral("Are you sure you want to uninstall %1?")
                                      .arg(config_.productName()))) {
        BOOST_LOG_TRIVIAL(info) << "Uninstall cancelled.";
        report.outcome = UninstallOutcome::CancelledAtGate1;
        return report;
    }

    // Not abortable from here on: a half-removed install is worse than a finished one
    removeProgram(report);

    report.outcome = removeUserData(report) ? UninstallOutcome::CompletedDataDeleted
                                            : UninstallOutcome::CompletedDataPreserved;

    BOOST_LOG_TRIVIAL(info) << "=== " << product << " Uninstalled! ===";
    BOOST_LOG_TRIVIAL(info) << "Restart Nautilus to fully unload the extension: nautilus -q";
    return report;
}

void Uninstaller::removeProgram(UninstallReport& report)
{
    UserServiceManager service(runner_, config_.serviceUnitName(), layout_.serviceUnitFile);

    BOOST_LOG_TRIVIAL(info) << "Stopping " << config_.productName().toStdString() << " services...";
    // Not running / not installed are normal here
    if (!service.stop()) {
        const auto msg = QStringLiteral("%1 was not stopped (not running?)").arg(config_.serviceUnitName());
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }
    if (!service.disable()) {
        const auto msg = QStringLiteral("%1 was not disabled (not enabled?)").arg(config_.serviceUnitName());
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }

    BOOST_LOG_TRIVIAL(info) << "Removing installed files...";
    FileProvisioner files(runner_, config_.elevationCommand());

    auto system = files.remove(manifest_.removalTargets(Privilege::System), Privilege::System);
    report.warnings.append(system.warnings);

    auto user = files.remove(manifest_.removalTargets(Privilege::User), Privilege::User);
    report.warnings.append(user.warnings);

    if (!service.reload()) {
        const auto msg = QStringLiteral("systemctl --user daemon-reload failed");
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }
}

bool Uninstaller::removeUserData(UninstallReport& report)
{
    BOOST_LOG_TRIVIAL(info) << "Keeping user data (config, conversations):";
    BOOST_LOG_TRIVIAL(info) << "  Config: " << layout_.configDir.toStdString();
    BOOST_LOG_TRIVIAL(info) << "  Conversations: " << layout_.dataDir.toStdString();
    BOOST_LOG_TRIVIAL(info) << "  Cache: " << layout_.cacheDir.toStdString();

    if (!prompt_->askConfirmation(QStringLiteral("Delete user data too?")))
        return false;

    FileProvisioner files(runner_, config_.elevationCommand());
    auto removed = files.remove(manifest_.userDataDirectories(), Privilege::User);
    report.warnings.append(removed.warnings);

    BOOST_LOG_TRIVIAL(info) << "User data deleted.";
    return true;
}

} // namespace tas
