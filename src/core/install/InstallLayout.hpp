#pragma once

#include <QString>

namespace tas {

class InstallerConfig;

/// Every concrete path the installer touches, resolved once from the
/// configuration and the operator's home directory.
struct InstallLayout {
    QString sourceDir;

    // System domain
    QString installDir;
    QString binDir;

    // User domain
    QString homeDir;
    QString systemdUserDir;
    QString dbusServicesDir;
    QString applicationsDir;
    QString autostartDir;
    QString extensionDir;

    // User data (only removed after the second uninstall confirmation)
    QString configDir;
    QString dataDir;
    QString conversationsDir;
    QString cacheDir;

    // Generated files
    QString serviceUnitFile;
    QString busServiceFile;
    QString desktopFile;
    QString autostartFile;
    QString extensionFile;

    QString wrapperPath(const QString& executableName) const;

    static InstallLayout fromConfig(const InstallerConfig& config);
};

} // namespace tas
