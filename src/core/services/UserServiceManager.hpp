#pragma once

#include <QString>
#include <QStringList>

namespace tas {

class ICommandRunner;

enum class ServiceState {
    Absent,
    InstalledDisabled,
    InstalledEnabledStopped,
    InstalledEnabledRunning
};

QString serviceStateName(ServiceState state);

/// The operator's systemd user instance, driven through systemctl --user.
/// Every call reports success; callers decide whether failure matters.
class UserServiceManager {
public:
    UserServiceManager(ICommandRunner* runner, const QString& unitName, const QString& unitFile);

    bool reload();
    bool enable();
    bool disable();
    bool stop();

    bool isEnabled() const;
    bool isActive() const;

    /// Absent when the unit file is missing, otherwise derived from
    /// is-enabled / is-active.
    ServiceState state() const;

    QString unitName() const { return unitName_; }

private:
    ICommandRunner* runner_;
    QString unitName_;
    QString unitFile_;

    bool systemctl(const QStringList& arguments) const;
};

} // namespace tas
