#pragma once

#include <QByteArray>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

namespace tas {

class InstallerConfig;
struct InstallLayout;
struct ExecutableSpec;

/// Template fills for the files that wire the installed program into the
/// desktop session. No branching on host state: the same inputs always give
/// the same bytes.
class ServiceDescriptors {
public:
    /// systemd user unit: dbus-activated, restart on failure, bound to the
    /// graphical session target.
    static QByteArray serviceUnit(const InstallerConfig& config, const InstallLayout& layout);

    /// D-Bus session service file mapping the bus name to the daemon wrapper.
    static QByteArray busActivation(const InstallerConfig& config, const InstallLayout& layout);

    /// Application launcher for the overlay.
    static QByteArray desktopEntry(const InstallerConfig& config, const InstallLayout& layout);

    /// Delayed, hidden autostart entry for the daemon.
    static QByteArray autostartEntry(const InstallerConfig& config, const InstallLayout& layout);

    /// Shell wrapper that sets the interpreter search path to the install
    /// dir and execs the entry script.
    static QByteArray wrapperScript(const InstallerConfig& config, const InstallLayout& layout,
                                    const ExecutableSpec& executable);
};

/// Minimal reader for the "[Group]\nKey=Value" format shared by systemd
/// units, D-Bus service files and desktop entries.
class KeyFile {
public:
    struct Group {
        QString name;
        QList<QPair<QString, QString>> entries;  // keys may repeat (Environment=)
    };

    /// Returns false and fills error (with the 1-based line) on malformed input.
    bool parse(const QByteArray& content, QString* error = nullptr);

    QStringList groupNames() const;
    bool hasGroup(const QString& group) const;
    QString value(const QString& group, const QString& key) const;
    QStringList values(const QString& group, const QString& key) const;

private:
    QList<Group> groups_;
};

} // namespace tas
