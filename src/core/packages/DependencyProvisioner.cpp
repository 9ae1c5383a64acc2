#include "DependencyProvisioner.hpp"
#include "IPackageManager.hpp"
#include "core/InstallerConfig.hpp"
#include "core/system/ICommandRunner.hpp"
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>

namespace tas {

DependencySet DependencySet::forFamily(const InstallerConfig& config, DistroFamily family)
{
    DependencySet set;
    if (family != DistroFamily::Unknown) {
        set.nativePackages = config.nativePackages(familyKey(family));
        set.runtimeInstallerPackage = config.runtimeInstallerPackage(familyKey(family));
    }
    set.fallbackRuntimePackages = config.fallbackRuntimePackages();
    return set;
}

DependencyProvisioner::DependencyProvisioner(ICommandRunner* runner, const InstallerConfig& config)
    : runner_(runner), config_(config)
{
}

DependencyReport DependencyProvisioner::provision(const HostProfile& host, IPackageManager* manager)
{
    DependencyReport report;
    if (manager)
        installNative(host, manager, report);
    installRuntime(report);
    return report;
}

void DependencyProvisioner::installNative(const HostProfile& host, IPackageManager* manager,
                                          DependencyReport& report)
{
    const auto deps = DependencySet::forFamily(config_, manager->family());
    report.nativeAttempted = true;

    BOOST_LOG_TRIVIAL(info) << "Installing system dependencies with "
                            << manager->name().toStdString() << "...";

    if (!host.runtimeInstallerAvailable && !deps.runtimeInstallerPackage.isEmpty()) {
        BOOST_LOG_TRIVIAL(info) << "Installing " << config_.runtimeInstaller().toStdString() << "...";
        auto result = manager->installPackages({deps.runtimeInstallerPackage});
        if (!result.ok()) {
            const auto msg = QStringLiteral("Could not install %1 (exit code %2)")
                                 .arg(deps.runtimeInstallerPackage).arg(result.exitCode);
            BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
            report.warnings.append(msg);
        }
    }

    auto result = manager->installPackages(deps.nativePackages);
    report.nativeOk = result.ok();
    if (!report.nativeOk) {
        // Non-zero here usually means some packages were already present or
        // have another name on this release.
        const auto msg = QStringLiteral("Some packages may already be installed (%1 exited with %2)")
                             .arg(manager->name()).arg(result.exitCode);
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }
}

void DependencyProvisioner::installRuntime(DependencyReport& report)
{
    BOOST_LOG_TRIVIAL(info) << "Installing Python dependencies...";

    const QString installer = config_.runtimeInstaller();
    if (runner_->findExecutable(installer).isEmpty()) {
        const auto msg = QStringLiteral("%1 not found, install the Python dependencies manually")
                             .arg(installer);
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
        return;
    }

    const QString requirements = QDir(config_.sourceDir()).filePath(config_.requirementsFile());
    if (QFile::exists(requirements)) {
        auto result = runner_->run(installer,
                                   {QStringLiteral("install"), QStringLiteral("--user"),
                                    QStringLiteral("-r"), requirements},
                                   ICommandRunner::Mode::Forwarded);
        if (result.ok()) {
            report.runtimeOk = true;
            return;
        }
        BOOST_LOG_TRIVIAL(debug) << "Requirements install failed, falling back to package list";
    } else {
        BOOST_LOG_TRIVIAL(debug) << "No " << requirements.toStdString() << ", using package list";
    }

    report.usedFallback = true;
    auto result = runner_->run(installer,
                               QStringList{QStringLiteral("install"), QStringLiteral("--user")}
                                   + config_.fallbackRuntimePackages(),
                               ICommandRunner::Mode::Forwarded);
    report.runtimeOk = result.ok();
    if (!report.runtimeOk) {
        const auto msg = QStringLiteral("%1 exited with %2 installing Python packages")
                             .arg(installer).arg(result.exitCode);
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }
}

} // namespace tas
