#include "InstallManifest.hpp"
#include "InstallLayout.hpp"
#include "ServiceDescriptors.hpp"
#include "core/InstallerConfig.hpp"
#include <QDir>

namespace tas {

static ManifestEntry directory(Privilege privilege, const QString& path)
{
    ManifestEntry e;
    e.kind = ManifestEntry::Kind::Directory;
    e.privilege = privilege;
    e.label = path;
    e.destination = path;
    return e;
}

static ManifestEntry generated(Privilege privilege, const QString& label, const QString& destination,
                               const QByteArray& content, bool executable = false)
{
    ManifestEntry e;
    e.kind = ManifestEntry::Kind::Generated;
    e.privilege = privilege;
    e.label = label;
    e.destination = destination;
    e.content = content;
    e.executable = executable;
    return e;
}

InstallManifest InstallManifest::build(const InstallerConfig& config, const InstallLayout& layout)
{
    InstallManifest m;
    const QDir source(layout.sourceDir);
    const QDir install(layout.installDir);

    // --- System domain ---
    m.entries_.append(directory(Privilege::System, layout.installDir));
    m.entries_.append(directory(Privilege::System, layout.binDir));

    for (const char* tree : {"src", "config"}) {
        ManifestEntry e;
        e.kind = ManifestEntry::Kind::CopyTree;
        e.privilege = Privilege::System;
        e.label = QStringLiteral("%1/").arg(QLatin1String(tree));
        e.source = source.filePath(QLatin1String(tree));
        e.destination = install.filePath(QLatin1String(tree));
        m.entries_.append(e);
    }

    for (const auto& exe : config.executables()) {
        const QString path = layout.wrapperPath(exe.name);
        m.entries_.append(generated(Privilege::System, exe.name, path,
                                    ServiceDescriptors::wrapperScript(config, layout, exe), true));
        m.systemRemovals_.append(path);
    }
    m.systemRemovals_.append(layout.installDir);

    // --- User domain ---
    for (const auto& dir : {layout.systemdUserDir, layout.dbusServicesDir, layout.applicationsDir,
                            layout.autostartDir, layout.configDir, layout.conversationsDir,
                            layout.cacheDir, layout.extensionDir}) {
        m.entries_.append(directory(Privilege::User, dir));
    }

    m.entries_.append(generated(Privilege::User, QStringLiteral("D-Bus service"),
                                layout.busServiceFile,
                                ServiceDescriptors::busActivation(config, layout)));
    m.entries_.append(generated(Privilege::User, QStringLiteral("systemd user service"),
                                layout.serviceUnitFile,
                                ServiceDescriptors::serviceUnit(config, layout)));
    m.entries_.append(generated(Privilege::User, QStringLiteral("desktop entry"),
                                layout.desktopFile,
                                ServiceDescriptors::desktopEntry(config, layout)));
    m.userRemovals_ << layout.serviceUnitFile << layout.busServiceFile << layout.desktopFile;

    if (config.autostartEnabled()) {
        auto autostart = generated(Privilege::User, QStringLiteral("autostart entry"),
                                   layout.autostartFile,
                                   ServiceDescriptors::autostartEntry(config, layout));
        autostart.required = false;
        m.entries_.append(autostart);
    }
    // Listed even when disabled so an earlier install's entry is cleaned up
    m.userRemovals_.append(layout.autostartFile);

    ManifestEntry extension;
    extension.kind = ManifestEntry::Kind::CopyFile;
    extension.privilege = Privilege::User;
    extension.label = QStringLiteral("Nautilus extension");
    extension.source = source.filePath(config.extensionSource());
    extension.destination = layout.extensionFile;
    extension.required = false;
    m.entries_.append(extension);
    m.userRemovals_.append(layout.extensionFile);

    m.userData_ << layout.configDir << layout.dataDir << layout.cacheDir;

    return m;
}

QList<ManifestEntry> InstallManifest::entries(Privilege privilege) const
{
    QList<ManifestEntry> result;
    for (const auto& e : entries_) {
        if (e.privilege == privilege)
            result.append(e);
    }
    return result;
}

QStringList InstallManifest::removalTargets(Privilege privilege) const
{
    return privilege == Privilege::System ? systemRemovals_ : userRemovals_;
}

} // namespace tas
