#include "FileProvisioner.hpp"
#include "core/system/ICommandRunner.hpp"
#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QTemporaryFile>
#include <boost/log/trivial.hpp>

namespace tas {

static const QFileDevice::Permissions kFileMode =
    QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ReadGroup | QFileDevice::ReadOther;
static const QFileDevice::Permissions kExecutableMode =
    kFileMode | QFileDevice::ExeOwner | QFileDevice::ExeGroup | QFileDevice::ExeOther;

static QString commandError(const CommandResult& result)
{
    if (!result.started)
        return QStringLiteral("could not start command");
    QString err = QString::fromUtf8(result.standardError).trimmed();
    if (err.isEmpty())
        err = QStringLiteral("exit code %1").arg(result.exitCode);
    return err;
}

FileProvisioner::FileProvisioner(ICommandRunner* runner, const QString& elevation)
    : runner_(runner), elevation_(elevation)
{
}

bool FileProvisioner::elevated(Privilege domain) const
{
    return domain == Privilege::System && !elevation_.isEmpty();
}

ProvisionReport FileProvisioner::apply(const QList<ManifestEntry>& entries, Privilege domain)
{
    ProvisionReport report;

    for (const auto& entry : entries) {
        if (entry.privilege != domain)
            continue;

        const bool needsSource = entry.kind == ManifestEntry::Kind::CopyFile
                                 || entry.kind == ManifestEntry::Kind::CopyTree;
        if (needsSource && !QFileInfo::exists(entry.source)) {
            const auto msg = QStringLiteral("%1: source %2 not found")
                                 .arg(entry.label, entry.source);
            if (entry.required) {
                BOOST_LOG_TRIVIAL(error) << msg.toStdString();
                report.errors.append(msg);
            } else {
                BOOST_LOG_TRIVIAL(warning) << msg.toStdString() << ", skipping";
                report.warnings.append(msg);
            }
            ++report.skipped;
            continue;
        }

        QString error;
        const bool ok = elevated(domain) ? applyElevated(entry, &error) : applyDirect(entry, &error);
        if (ok) {
            if (entry.kind != ManifestEntry::Kind::Directory)
                BOOST_LOG_TRIVIAL(debug) << "Installed " << entry.label.toStdString()
                                         << " -> " << entry.destination.toStdString();
            ++report.applied;
            continue;
        }

        const auto msg = QStringLiteral("%1: %2").arg(entry.label, error);
        if (entry.required) {
            BOOST_LOG_TRIVIAL(error) << msg.toStdString();
            report.errors.append(msg);
        } else {
            BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
            report.warnings.append(msg);
        }
    }

    return report;
}

bool FileProvisioner::applyDirect(const ManifestEntry& entry, QString* error)
{
    switch (entry.kind) {
    case ManifestEntry::Kind::Directory:
        if (!QDir().mkpath(entry.destination)) {
            *error = QStringLiteral("cannot create directory %1").arg(entry.destination);
            return false;
        }
        return true;
    case ManifestEntry::Kind::Generated:
        return writeFile(entry.destination, entry.content, entry.executable, error);
    case ManifestEntry::Kind::CopyFile:
        return copyFile(entry.source, entry.destination, error);
    case ManifestEntry::Kind::CopyTree:
        return copyTree(entry.source, entry.destination, error);
    }
    return false;
}

bool FileProvisioner::applyElevated(const ManifestEntry& entry, QString* error)
{
    const QString mode = entry.executable ? QStringLiteral("0755") : QStringLiteral("0644");
    CommandResult result;

    switch (entry.kind) {
    case ManifestEntry::Kind::Directory:
        result = runElevated(*runner_, elevation_, QStringLiteral("mkdir"),
                             {QStringLiteral("-p"), entry.destination});
        break;
    case ManifestEntry::Kind::CopyTree:
        result = runElevated(*runner_, elevation_, QStringLiteral("mkdir"),
                             {QStringLiteral("-p"), entry.destination});
        if (result.ok()) {
            // -T merges into an existing destination instead of nesting
            result = runElevated(*runner_, elevation_, QStringLiteral("cp"),
                                 {QStringLiteral("-rT"), entry.source, entry.destination});
        }
        break;
    case ManifestEntry::Kind::CopyFile:
        result = runElevated(*runner_, elevation_, QStringLiteral("install"),
                             {QStringLiteral("-D"), QStringLiteral("-m"), mode,
                              entry.source, entry.destination});
        break;
    case ManifestEntry::Kind::Generated: {
        QTemporaryFile staged;
        if (!staged.open() || staged.write(entry.content) != entry.content.size() || !staged.flush()) {
            *error = QStringLiteral("cannot stage content: %1").arg(staged.errorString());
            return false;
        }
        result = runElevated(*runner_, elevation_, QStringLiteral("install"),
                             {QStringLiteral("-D"), QStringLiteral("-m"), mode,
                              staged.fileName(), entry.destination});
        break;
    }
    }

    if (!result.ok()) {
        *error = commandError(result);
        return false;
    }
    return true;
}

ProvisionReport FileProvisioner::remove(const QStringList& targets, Privilege domain)
{
    ProvisionReport report;

    for (const auto& target : targets) {
        QString error;
        const bool ok = elevated(domain) ? removeElevated(target, &error) : removeDirect(target, &error);
        if (ok) {
            ++report.applied;
            continue;
        }
        const auto msg = QStringLiteral("could not remove %1: %2").arg(target, error);
        BOOST_LOG_TRIVIAL(warning) << msg.toStdString();
        report.warnings.append(msg);
    }

    return report;
}

bool FileProvisioner::removeDirect(const QString& target, QString* error)
{
    const QFileInfo info(target);
    if (!info.exists() && !info.isSymLink()) {
        BOOST_LOG_TRIVIAL(debug) << target.toStdString() << " already absent";
        return true;
    }

    if (info.isDir() && !info.isSymLink()) {
        if (!QDir(target).removeRecursively()) {
            *error = QStringLiteral("directory not fully removed");
            return false;
        }
    } else {
        QFile file(target);
        if (!file.remove()) {
            *error = file.errorString();
            return false;
        }
    }

    BOOST_LOG_TRIVIAL(debug) << "Removed " << target.toStdString();
    return true;
}

bool FileProvisioner::removeElevated(const QString& target, QString* error)
{
    const QFileInfo info(target);
    const QString flags = (info.isDir() && !info.isSymLink()) ? QStringLiteral("-rf")
                                                              : QStringLiteral("-f");
    auto result = runElevated(*runner_, elevation_, QStringLiteral("rm"), {flags, target});
    if (!result.ok()) {
        *error = commandError(result);
        return false;
    }
    return true;
}

bool FileProvisioner::writeFile(const QString& destination, const QByteArray& content,
                                bool executable, QString* error)
{
    if (!QDir().mkpath(QFileInfo(destination).absolutePath())) {
        *error = QStringLiteral("cannot create parent of %1").arg(destination);
        return false;
    }

    QSaveFile file(destination);
    if (!file.open(QIODevice::WriteOnly)) {
        *error = file.errorString();
        return false;
    }
    if (file.write(content) != content.size() || !file.commit()) {
        *error = file.errorString();
        return false;
    }

    if (!QFile::setPermissions(destination, executable ? kExecutableMode : kFileMode)) {
        *error = QStringLiteral("cannot set permissions on %1").arg(destination);
        return false;
    }
    return true;
}

bool FileProvisioner::copyFile(const QString& source, const QString& destination, QString* error)
{
    QFile in(source);
    if (!in.open(QIODevice::ReadOnly)) {
        *error = QStringLiteral("%1: %2").arg(source, in.errorString());
        return false;
    }
    const QByteArray content = in.readAll();
    const bool executable = in.permissions().testFlag(QFileDevice::ExeOwner);
    return writeFile(destination, content, executable, error);
}

bool FileProvisioner::copyTree(const QString& source, const QString& destination, QString* error)
{
    const QDir sourceDir(source);
    if (!QDir().mkpath(destination)) {
        *error = QStringLiteral("cannot create directory %1").arg(destination);
        return false;
    }

    QDirIterator it(source, QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden,
                    QDirIterator::Subdirectories);
    while (it.hasNext()) {
        const QString path = it.next();
        const QFileInfo info = it.fileInfo();
        const QString target = QDir(destination).filePath(sourceDir.relativeFilePath(path));

        if (info.isDir()) {
            if (!QDir().mkpath(target)) {
                *error = QStringLiteral("cannot create directory %1").arg(target);
                return false;
            }
        } else if (!copyFile(path, target, error)) {
            return false;
        }
    }
    return true;
}

} // namespace tas
