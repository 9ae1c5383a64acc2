#pragma once

#include "core/host/HostProfile.hpp"
#include <QString>
#include <QStringList>

namespace tas {

class ICommandRunner;
class IPackageManager;
class InstallerConfig;

struct DependencySet {
    QStringList nativePackages;
    QString runtimeInstallerPackage;   // native package providing pip
    QStringList fallbackRuntimePackages;

    static DependencySet forFamily(const InstallerConfig& config, DistroFamily family);
};

struct DependencyReport {
    bool nativeAttempted = false;
    bool nativeOk = false;
    bool runtimeOk = false;
    bool usedFallback = false;
    QStringList warnings;
};

/// Best-effort dependency installation. Nothing here is fatal: every
/// failure becomes a warning in the report.
class DependencyProvisioner {
public:
    DependencyProvisioner(ICommandRunner* runner, const InstallerConfig& config);

    /// Native packages through manager (skipped when manager is null), then
    /// runtime packages through the runtime's own installer.
    DependencyReport provision(const HostProfile& host, IPackageManager* manager);

    void installNative(const HostProfile& host, IPackageManager* manager, DependencyReport& report);
    void installRuntime(DependencyReport& report);

private:
    ICommandRunner* runner_;
    const InstallerConfig& config_;
};

} // namespace tas
