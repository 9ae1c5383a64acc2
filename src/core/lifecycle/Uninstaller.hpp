#pragma once

#include "core/install/InstallLayout.hpp"
#include "core/install/InstallManifest.hpp"
#include <QStringList>

namespace tas {

class ICommandRunner;
class IConfirmationPrompt;
class InstallerConfig;

enum class UninstallOutcome {
    CancelledAtGate1,
    CompletedDataPreserved,
    CompletedDataDeleted
};

QString uninstallOutcomeName(UninstallOutcome outcome);

struct UninstallReport {
    UninstallOutcome outcome = UninstallOutcome::CancelledAtGate1;
    QStringList warnings;

    int exitCode() const { return 0; }
};

/// Two-gate removal. Gate 1 guards everything; once passed, program files
/// and service registration are removed to completion. Gate 2 separately
/// guards the operator's config, conversations and cache.
class Uninstaller {
public:
    Uninstaller(const InstallerConfig& config, ICommandRunner* runner, IConfirmationPrompt* prompt);

    UninstallReport run();

private:
    const InstallerConfig& config_;
    ICommandRunner* runner_;
    IConfirmationPrompt* prompt_;
    InstallLayout layout_;
    InstallManifest manifest_;

    void removeProgram(UninstallReport& report);
    bool removeUserData(UninstallReport& report);
};

} // namespace tas
