#include "PackageManagers.hpp"
#include <boost/log/trivial.hpp>

namespace tas {

CommandPackageManager::CommandPackageManager(ICommandRunner* runner, const QString& elevation)
    : runner_(runner), elevation_(elevation)
{
}

CommandResult CommandPackageManager::installPackages(const QStringList& packages)
{
    if (packages.isEmpty()) {
        BOOST_LOG_TRIVIAL(debug) << name().toStdString() << ": nothing to install";
        CommandResult nothing;
        nothing.started = true;
        nothing.exitCode = 0;
        return nothing;
    }

    if (!prepared_) {
        prepare();
        prepared_ = true;
    }
    return runManager(installArguments() + packages);
}

CommandResult CommandPackageManager::runManager(const QStringList& arguments)
{
    return runElevated(*runner_, elevation_, name(), arguments, ICommandRunner::Mode::Forwarded);
}

// --- apt ---

QStringList AptPackageManager::installArguments() const
{
    return {QStringLiteral("install"), QStringLiteral("-y")};
}

void AptPackageManager::prepare()
{
    auto result = runManager({QStringLiteral("update")});
    if (!result.ok())
        BOOST_LOG_TRIVIAL(warning) << "apt update exited with " << result.exitCode;
}

// --- dnf ---

QStringList DnfPackageManager::installArguments() const
{
    return {QStringLiteral("install"), QStringLiteral("-y")};
}

// --- pacman ---

QStringList PacmanPackageManager::installArguments() const
{
    return {QStringLiteral("-S"), QStringLiteral("--noconfirm"), QStringLiteral("--needed")};
}

// --- zypper ---

QStringList ZypperPackageManager::installArguments() const
{
    return {QStringLiteral("install"), QStringLiteral("-y")};
}

std::unique_ptr<IPackageManager> createPackageManager(DistroFamily family,
                                                      ICommandRunner* runner,
                                                      const QString& elevation)
{
    switch (family) {
    case DistroFamily::Debian:
        return std::make_unique<AptPackageManager>(runner, elevation);
    case DistroFamily::Fedora:
        return std::make_unique<DnfPackageManager>(runner, elevation);
    case DistroFamily::Arch:
        return std::make_unique<PacmanPackageManager>(runner, elevation);
    case DistroFamily::Suse:
        return std::make_unique<ZypperPackageManager>(runner, elevation);
    case DistroFamily::Unknown:
        break;
    }
    return nullptr;
}

} // namespace tas
