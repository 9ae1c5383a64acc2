#include "InstallLayout.hpp"
#include "core/InstallerConfig.hpp"
#include <QDir>
#include <QFileInfo>

namespace tas {

QString InstallLayout::wrapperPath(const QString& executableName) const
{
    return QDir(binDir).filePath(executableName);
}

InstallLayout InstallLayout::fromConfig(const InstallerConfig& config)
{
    InstallLayout l;
    const QDir home(config.homeDir());
    const QString id = config.productId();

    l.sourceDir = config.sourceDir();
    l.installDir = config.installDir();
    l.binDir = config.binDir();

    l.homeDir = home.path();
    l.systemdUserDir = home.filePath(".config/systemd/user");
    l.dbusServicesDir = home.filePath(".local/share/dbus-1/services");
    l.applicationsDir = home.filePath(".local/share/applications");
    l.autostartDir = home.filePath(".config/autostart");
    l.extensionDir = home.filePath(config.extensionDir());

    l.configDir = home.filePath(".config/" + id);
    l.dataDir = home.filePath(".local/share/" + id);
    l.conversationsDir = QDir(l.dataDir).filePath("conversations");
    l.cacheDir = home.filePath(".cache/" + id);

    l.serviceUnitFile = QDir(l.systemdUserDir).filePath(config.serviceUnitName());
    l.busServiceFile = QDir(l.dbusServicesDir).filePath(config.busName() + ".service");
    l.desktopFile = QDir(l.applicationsDir).filePath(config.desktopId() + ".desktop");

    const auto daemon = config.executableForRole(QStringLiteral("daemon"));
    l.autostartFile = QDir(l.autostartDir).filePath(
        (daemon.name.isEmpty() ? id : daemon.name) + ".desktop");

    l.extensionFile = QDir(l.extensionDir).filePath(QFileInfo(config.extensionSource()).fileName());

    return l;
}

} // namespace tas
