#include "Installer.hpp"
#include "core/InstallerConfig.hpp"
#include "core/install/FileProvisioner.hpp"
#include "core/packages/DependencyProvisioner.hpp"
#include "core/packages/PackageManagers.hpp"
#include "core/prompt/IConfirmationPrompt.hpp"
#include "core/services/UserServiceManager.hpp"
#include <boost/log/trivial.hpp>

namespace tas {

QString installOutcomeName(InstallOutcome outcome)
{
    switch (outcome) {
    case InstallOutcome::Completed: return QStringLiteral("completed");
    case InstallOutcome::CompletedWithErrors: return QStringLiteral("completed-with-errors");
    case InstallOutcome::Cancelled: return QStringLiteral("cancelled");
    case InstallOutcome::MissingRuntime: return QStringLiteral("missing-runtime");
    }
    return {};
}

int InstallReport::exitCode() const
{
    switch (outcome) {
    case InstallOutcome::Completed:
    case InstallOutcome::Cancelled:
        return 0;
    case InstallOutcome::CompletedWithErrors:
    case InstallOutcome::MissingRuntime:
        return 1;
    }
    return 1;
}

Installer::Installer(const InstallerConfig& config, ICommandRunner* runner, IConfirmationPrompt* prompt)
    : config_(config)
    , runner_(runner)
    , prompt_(prompt)
    , layout_(InstallLayout::fromConfig(config))
    , manifest_(InstallManifest::build(config, layout_))
{
}

InstallReport Installer::run()
{
    InstallReport report;

    BOOST_LOG_TRIVIAL(info) << "=== " << config_.productName().toStdString() << " Installation ===";

    HostDetector detector(runner_, config_.osReleasePath());
    report.host = detector.detect(config_.runtimeInterpreter(), config_.runtimeInstaller());

    if (!report.host.runtimeAvailable) {
        const auto msg = QStringLiteral("%1 is required but not installed")
                             .arg(config_.runtimeInterpreter());
        BOOST_LOG_TRIVIAL(error) << msg.toStdString();
        report.errors.append(msg);
        report.outcome = InstallOutcome::MissingRuntime;
        return report;
    }

    BOOST_LOG_TRIVIAL(info) << "Python version: " << report.host.runtimeVersion.toStdString();
    BOOST_LOG_TRIVIAL(info) << "Detected distro: " << report.host.distroId.toStdString()
                            << " (" << familyKey(report.host.family).toStdString() << ")";

    if (report.host.family == DistroFamily::Unknown && !confirmUnknownHost(report.host)) {
        BOOST_LOG_TRIVIAL(info) << "Installation cancelled.";
        report.outcome = InstallOutcome::Cancelled;
        return report;
    }

    provisionDependencies(report);
    provisionFiles(report);
    activateService(report);

    report.outcome = report.errors.isEmpty() ? InstallOutcome::Completed
                                             : InstallOutcome::CompletedWithErrors;
    printSummary(report);
    return report;
}

bool Installer::confirmUnknownHost(const HostProfile& host)
{
    BOOST_LOG_TRIVIAL(warning) << "Unknown distro: " << host.distroId.toStdString();
    BOOST_LOG_TRIVIAL(info) << "Please install these dependencies manually:";
    for (const auto& dep : config_.manualDependencies())
        BOOST_LOG_TRIVIAL(info) << "  - " << dep.toStdString();

    return prompt_->askConfirmation(QStringLiteral("Continue anyway?"));
}

void Installer::provisionDependencies(InstallReport& report)
{
    auto manager = createPackageManager(report.host.family, runner_, config_.elevationCommand());

    DependencyProvisioner provisioner(runner_, config_);
    auto deps = provisioner.provision(report.host, manager.get());
    report.warnings.append(deps.warnings);
}

void Installer::provisionFiles(InstallReport& report)
{
    FileProvisioner files(runner_, config_.elevationCommand());

    BOOST_LOG_TRIVIAL(info) << "Installing " << config_.productName().toStdString()
                            << " files into " << layout_.installDir.toStdString() << "...";
    auto system = files.apply(manifest_.entries(Privilege::System), Privilege::System);
    report.warnings.append(system.warnings);
    report.errors.append(system.errors);

    BOOST_LOG_TRIVIAL(info) << "Installing user services, desktop entries and extension...";
    auto user = files.apply(manifest_.entries(Privilege::User), Privilege::User);
    report.warnings.append(user.warnings);
    report.errors.append(user.errors);

    BOOST_LOG_TRIVIAL(debug) << "Applied " << (system.applied + user.applied) << " entries, skipped "
                             << (system.skipped + user.skipped);
}

void Installer::activateService(InstallReport& report)
{
    BOOST_LOG_TRIVIAL(info) << "Enabling " << config_.serviceUnitName().toStdString() << "...";

    UserServiceManager service(runner_, config_.serviceUnitName(), layout_.serviceUnitFile);
    if (!service.reload()) {
        const auto msg = QStringLiteral("systemctl --user daemon-reload failed");
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }

    report.serviceEnabled = service.enable();
    if (!report.serviceEnabled) {
        const auto msg = QStringLiteral("could not enable %1 (it may already be enabled)")
                             .arg(config_.serviceUnitName());
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }
}

void Installer::printSummary(const InstallReport& report) const
{
    if (report.outcome == InstallOutcome::CompletedWithErrors) {
        BOOST_LOG_TRIVIAL(error) << "Installation finished with " << report.errors.size()
                                 << " error(s); re-run after fixing them.";
        return;
    }

    const auto cli = config_.executableForRole(QStringLiteral("cli")).name.toStdString();
    const auto daemon = config_.executableForRole(QStringLiteral("daemon")).name.toStdString();
    const auto overlay = config_.executableForRole(QStringLiteral("overlay")).name.toStdString();

    BOOST_LOG_TRIVIAL(info) << "=== Installation Complete! ===";
    BOOST_LOG_TRIVIAL(info) << "Usage:";
    BOOST_LOG_TRIVIAL(info) << "  " << cli << " ask \"How do I install Chrome?\"";
    BOOST_LOG_TRIVIAL(info) << "  " << cli << " interactive";
    BOOST_LOG_TRIVIAL(info) << "  " << cli << " status";
    BOOST_LOG_TRIVIAL(info) << "Start the daemon manually with: " << daemon;
    BOOST_LOG_TRIVIAL(info) << "Open the overlay with: " << overlay;
    BOOST_LOG_TRIVIAL(info) << "The daemon will start automatically on next login.";
    BOOST_LOG_TRIVIAL(info) << "Restart Nautilus to load the extension: nautilus -q";
}

} // namespace tas
