#pragma once

#include "core/host/HostProfile.hpp"
#include "core/system/ICommandRunner.hpp"
#include <QString>
#include <QStringList>

namespace tas {

/// A distribution's native package manager.
class IPackageManager {
public:
    virtual ~IPackageManager() = default;

    virtual DistroFamily family() const = 0;

    /// Program name, e.g. "apt".
    virtual QString name() const = 0;

    /// Install all packages in one invocation. The result of the install
    /// command itself is returned; auxiliary steps (index refresh) are logged.
    virtual CommandResult installPackages(const QStringList& packages) = 0;
};

} // namespace tas
