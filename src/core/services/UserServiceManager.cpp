#include "UserServiceManager.hpp"
#include "core/system/ICommandRunner.hpp"
#include <QFileInfo>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace tas {

QString serviceStateName(ServiceState state)
{
    switch (state) {
    case ServiceState::Absent: return QStringLiteral("absent");
    case ServiceState::InstalledDisabled: return QStringLiteral("installed-disabled");
    case ServiceState::InstalledEnabledStopped: return QStringLiteral("installed-enabled-stopped");
    case ServiceState::InstalledEnabledRunning: return QStringLiteral("installed-enabled-running");
    }
    return QStringLiteral("absent");
}

UserServiceManager::UserServiceManager(ICommandRunner* runner, const QString& unitName,
                                       const QString& unitFile)
    : runner_(runner), unitName_(unitName), unitFile_(unitFile)
{
}

bool UserServiceManager::systemctl(const QStringList& arguments) const
{
    auto result = runner_->run(QStringLiteral("systemctl"), QStringList{QStringLiteral("--user")} + arguments);
    if (!result.ok()) {
        BOOST_LOG_TRIVIAL(debug) << "systemctl --user " << arguments.join(' ').toStdString()
                                 << " failed: "
                                 << QString::fromUtf8(result.standardError).trimmed().toStdString();
    }
    return result.ok();
}

bool UserServiceManager::reload()
{
    return systemctl({QStringLiteral("daemon-reload")});
}

bool UserServiceManager::enable()
{
    return systemctl({QStringLiteral("enable"), unitName_});
}

bool UserServiceManager::disable()
{
    return systemctl({QStringLiteral("disable"), unitName_});
}

bool UserServiceManager::stop()
{
    return systemctl({QStringLiteral("stop"), unitName_});
}

bool UserServiceManager::isEnabled() const
{
    return systemctl({QStringLiteral("is-enabled"), QStringLiteral("--quiet"), unitName_});
}

bool UserServiceManager::isActive() const
{
    return systemctl({QStringLiteral("is-active"), QStringLiteral("--quiet"), unitName_});
}

ServiceState UserServiceManager::state() const
{
    if (!QFileInfo::exists(unitFile_))
        return ServiceState::Absent;
    if (!isEnabled())
        return ServiceState::InstalledDisabled;
    return isActive() ? ServiceState::InstalledEnabledRunning
                      : ServiceState::InstalledEnabledStopped;
}

} // namespace tas
