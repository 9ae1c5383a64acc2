#pragma once

#include "core/host/HostProfile.hpp"
#include "core/install/InstallLayout.hpp"
#include "core/install/InstallManifest.hpp"
#include <QStringList>

namespace tas {

class ICommandRunner;
class IConfirmationPrompt;
class InstallerConfig;

enum class InstallOutcome {
    Completed,
    CompletedWithErrors,  // a required file could not be written
    Cancelled,            // operator declined to continue on an unknown distro
    MissingRuntime
};

QString installOutcomeName(InstallOutcome outcome);

struct InstallReport {
    InstallOutcome outcome = InstallOutcome::Completed;
    HostProfile host;
    QStringList warnings;
    QStringList errors;
    bool serviceEnabled = false;

    int exitCode() const;
};

/// Runs the install sequence: runtime check, host detection, dependencies,
/// system files, user files, service activation. Only a missing runtime
/// stops the run; every other failure is recorded and the next step runs.
class Installer {
public:
    Installer(const InstallerConfig& config, ICommandRunner* runner, IConfirmationPrompt* prompt);

    InstallReport run();

    const InstallLayout& layout() const { return layout_; }
    const InstallManifest& manifest() const { return manifest_; }

private:
    const InstallerConfig& config_;
    ICommandRunner* runner_;
    IConfirmationPrompt* prompt_;
    InstallLayout layout_;
    InstallManifest manifest_;

    bool confirmUnknownHost(const HostProfile& host);
    void provisionDependencies(InstallReport& report);
    void provisionFiles(InstallReport& report);
    void activateService(InstallReport& report);
    void printSummary(const InstallReport& report) const;
};

} // namespace tas
