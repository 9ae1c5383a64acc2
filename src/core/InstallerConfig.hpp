#pragma once

#include <QList>
#include <QString>
#include <QStringList>
#include <yaml-cpp/yaml.h>

namespace tas {

struct ExecutableSpec {
    QString name;   // wrapper installed into the bin dir, e.g. "tuxagent-daemon"
    QString entry;  // entry script relative to the install dir, e.g. "src/daemon/main.py"
    QString role;   // "cli", "daemon" or "overlay"
};

/// Installer settings: built-in defaults deep-merged with an optional
/// YAML override file.
class InstallerConfig {
public:
    InstallerConfig();

    /// Merge the file over the defaults. On a missing or malformed file the
    /// defaults are kept and false is returned.
    bool load(const QString& filePath);

    // Product
    QString productName() const;
    QString productId() const;
    QString productComment() const;
    QString desktopId() const;
    QString icon() const;

    // Paths
    QString sourceDir() const;
    void setSourceDir(const QString& v);
    QString homeDir() const;
    void setHomeDir(const QString& v);
    QString installDir() const;
    void setInstallDir(const QString& v);
    QString binDir() const;
    void setBinDir(const QString& v);
    QString osReleasePath() const;
    void setOsReleasePath(const QString& v);

    // Privilege
    QString elevationCommand() const;
    void setElevationCommand(const QString& v);

    // Service
    QString serviceUnitName() const;
    QString busName() const;
    int restartSec() const;
    QString sessionTarget() const;

    // Executables
    QList<ExecutableSpec> executables() const;
    ExecutableSpec executableForRole(const QString& role) const;

    // Autostart
    bool autostartEnabled() const;
    void setAutostartEnabled(bool v);
    int autostartDelay() const;

    // File-manager extension
    QString extensionSource() const;
    QString extensionDir() const;

    // Language runtime
    QString runtimeInterpreter() const;
    QString runtimeInstaller() const;
    QString requirementsFile() const;
    QString searchPathVariable() const;
    QStringList fallbackRuntimePackages() const;

    // Native dependencies, keyed by family ("debian", "fedora", "arch", "suse")
    QStringList nativePackages(const QString& family) const;
    QString runtimeInstallerPackage(const QString& family) const;
    QStringList manualDependencies() const;

    // Logging
    QString logLevel() const;

private:
    YAML::Node root_;

    void initDefaults();
    QStringList stringList(const YAML::Node& node) const;
};

} // namespace tas
