#pragma once

#include <QByteArray>
#include <QList>
#include <QString>
#include <QStringList>

namespace tas {

class InstallerConfig;
struct InstallLayout;

enum class Privilege {
    System,  // written through the elevation command
    User     // written directly, stays owned by the operator
};

struct ManifestEntry {
    enum class Kind {
        Directory,  // create-if-absent
        CopyFile,   // source file -> destination file
        CopyTree,   // source directory merged into destination directory
        Generated   // content -> destination file
    };

    Kind kind = Kind::Directory;
    Privilege privilege = Privilege::User;
    QString label;          // shown in progress output
    QString source;         // absolute; empty for Directory/Generated
    QString destination;    // absolute
    QByteArray content;     // Generated only
    bool executable = false;
    bool required = true;
};

/// The fixed set of targets an install creates. The uninstaller rebuilds the
/// same manifest instead of relying on install-time bookkeeping.
class InstallManifest {
public:
    static InstallManifest build(const InstallerConfig& config, const InstallLayout& layout);

    const QList<ManifestEntry>& entries() const { return entries_; }
    QList<ManifestEntry> entries(Privilege privilege) const;

    /// Files and directories the uninstaller deletes for a domain. Shared
    /// parent directories (bin dir, XDG dirs) are never listed.
    QStringList removalTargets(Privilege privilege) const;

    /// Config, data and cache directories. Removed only on explicit opt-in.
    QStringList userDataDirectories() const { return userData_; }

private:
    QList<ManifestEntry> entries_;
    QStringList systemRemovals_;
    QStringList userRemovals_;
    QStringList userData_;
};

} // namespace tas
