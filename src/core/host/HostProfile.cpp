#include "HostProfile.hpp"
#include "core/system/ICommandRunner.hpp"
#include <QFile>
#include <QStringList>
#include <boost/log/trivial.hpp>

namespace tas {

QString familyKey(DistroFamily family)
{
    switch (family) {
    case DistroFamily::Debian: return QStringLiteral("debian");
    case DistroFamily::Fedora: return QStringLiteral("fedora");
    case DistroFamily::Arch:   return QStringLiteral("arch");
    case DistroFamily::Suse:   return QStringLiteral("suse");
    case DistroFamily::Unknown: break;
    }
    return QStringLiteral("unknown");
}

HostDetector::HostDetector(ICommandRunner* runner, const QString& osReleasePath)
    : runner_(runner), osReleasePath_(osReleasePath)
{
}

HostProfile HostDetector::detect(const QString& interpreter, const QString& installer) const
{
    HostProfile profile;

    QString idLike;
    profile.distroId = detectDistroId(&idLike);
    profile.family = familyForId(profile.distroId, idLike);

    profile.runtimeAvailable = !runner_->findExecutable(interpreter).isEmpty();
    if (profile.runtimeAvailable)
        profile.runtimeVersion = probeRuntimeVersion(interpreter);
    profile.runtimeInstallerAvailable = !runner_->findExecutable(installer).isEmpty();

    BOOST_LOG_TRIVIAL(debug) << "Host: id=" << profile.distroId.toStdString()
                             << " family=" << familyKey(profile.family).toStdString()
                             << " runtime=" << profile.runtimeAvailable
                             << " installer=" << profile.runtimeInstallerAvailable;
    return profile;
}

QString HostDetector::detectDistroId(QString* idLike) const
{
    QFile osRelease(osReleasePath_);
    if (osRelease.open(QIODevice::ReadOnly)) {
        const QByteArray content = osRelease.readAll();
        if (idLike)
            *idLike = osReleaseValue(content, QStringLiteral("ID_LIKE"));
        const QString id = osReleaseValue(content, QStringLiteral("ID"));
        if (!id.isEmpty())
            return id.toLower();
    }

    if (!runner_->findExecutable(QStringLiteral("lsb_release")).isEmpty()) {
        auto result = runner_->run(QStringLiteral("lsb_release"), {QStringLiteral("-si")});
        const QString id = QString::fromUtf8(result.standardOutput).trimmed().toLower();
        if (result.ok() && !id.isEmpty())
            return id;
    }

    return QStringLiteral("unknown");
}

DistroFamily HostDetector::familyForId(const QString& id, const QString& idLike)
{
    static const QStringList debianIds = {"ubuntu", "debian", "linuxmint", "pop", "elementary", "zorin"};
    static const QStringList fedoraIds = {"fedora", "rhel", "centos", "rocky", "alma"};
    static const QStringList archIds = {"arch", "manjaro", "endeavouros", "garuda"};

    auto lookup = [](const QString& candidate) {
        if (debianIds.contains(candidate)) return DistroFamily::Debian;
        if (fedoraIds.contains(candidate)) return DistroFamily::Fedora;
        if (archIds.contains(candidate)) return DistroFamily::Arch;
        if (candidate.startsWith("opensuse") || candidate.startsWith("suse"))
            return DistroFamily::Suse;
        return DistroFamily::Unknown;
    };

    auto family = lookup(id.toLower());
    if (family != DistroFamily::Unknown)
        return family;

    for (const auto& token : idLike.toLower().split(' ', Qt::SkipEmptyParts)) {
        family = lookup(token);
        if (family != DistroFamily::Unknown)
            return family;
    }
    return DistroFamily::Unknown;
}

QString HostDetector::osReleaseValue(const QByteArray& content, const QString& key)
{
    const QString prefix = key + '=';
    for (const auto& rawLine : QString::fromUtf8(content).split('\n')) {
        const QString line = rawLine.trimmed();
        if (!line.startsWith(prefix))
            continue;

        QString value = line.mid(prefix.size()).trimmed();
        if (value.size() >= 2
            && (value.startsWith('"') || value.startsWith('\''))
            && value.endsWith(value.at(0))) {
            value = value.mid(1, value.size() - 2);
        }
        return value;
    }
    return {};
}

QString HostDetector::probeRuntimeVersion(const QString& interpreter) const
{
    auto result = runner_->run(interpreter, {
        QStringLiteral("-c"),
        QStringLiteral("import sys; print(f\"{sys.version_info.major}.{sys.version_info.minor}\")")});
    if (!result.ok())
        return {};
    return QString::fromUtf8(result.standardOutput).trimmed();
}

} // namespace tas
