#pragma once

#include "InstallManifest.hpp"
#include <QString>
#include <QStringList>

namespace tas {

class ICommandRunner;

struct ProvisionReport {
    int applied = 0;
    int skipped = 0;
    QStringList warnings;
    QStringList errors;  // required entries that could not be written

    bool ok() const { return errors.isEmpty(); }
};

/// Applies manifest entries and removes targets, one privilege domain per
/// call. System-domain work goes through the elevation command when one is
/// configured; user-domain work is always done by this process directly.
class FileProvisioner {
public:
    FileProvisioner(ICommandRunner* runner, const QString& elevation);

    /// Every operation is create-if-absent or overwrite, so applying the same
    /// entries again converges to the same tree. Entries of the other domain
    /// are ignored.
    ProvisionReport apply(const QList<ManifestEntry>& entries, Privilege domain);

    /// Best-effort deletion. Absent targets count as removed; failures are
    /// warnings, never errors.
    ProvisionReport remove(const QStringList& targets, Privilege domain);

private:
    ICommandRunner* runner_;
    QString elevation_;

    bool elevated(Privilege domain) const;
    bool applyDirect(const ManifestEntry& entry, QString* error);
    bool applyElevated(const ManifestEntry& entry, QString* error);
    bool removeDirect(const QString& target, QString* error);
    bool removeElevated(const QString& target, QString* error);

    static bool writeFile(const QString& destination, const QByteArray& content,
                          bool executable, QString* error);
    static bool copyFile(const QString& source, const QString& destination, QString* error);
    static bool copyTree(const QString& source, const QString& destination, QString* error);
};

} // namespace tas
