#pragma once

#include "IPackageManager.hpp"
#include <memory>

namespace tas {

/// Shared plumbing: runs "<elevation> <program> <args...> <packages...>"
/// with the terminal forwarded so confirmation and password prompts work.
class CommandPackageManager : public IPackageManager {
public:
    CommandPackageManager(ICommandRunner* runner, const QString& elevation);

    CommandResult installPackages(const QStringList& packages) override;

protected:
    /// Arguments placed before the package names.
    virtual QStringList installArguments() const = 0;

    /// Hook run once before the first install (index refresh). Default does nothing.
    virtual void prepare() {}

    CommandResult runManager(const QStringList& arguments);

private:
    ICommandRunner* runner_;
    QString elevation_;
    bool prepared_ = false;
};

class AptPackageManager : public CommandPackageManager {
public:
    using CommandPackageManager::CommandPackageManager;
    DistroFamily family() const override { return DistroFamily::Debian; }
    QString name() const override { return QStringLiteral("apt"); }

protected:
    QStringList installArguments() const override;
    void prepare() override;
};

class DnfPackageManager : public CommandPackageManager {
public:
    using CommandPackageManager::CommandPackageManager;
    DistroFamily family() const override { return DistroFamily::Fedora; }
    QString name() const override { return QStringLiteral("dnf"); }

protected:
    QStringList installArguments() const override;
};

class PacmanPackageManager : public CommandPackageManager {
public:
    using CommandPackageManager::CommandPackageManager;
    DistroFamily family() const override { return DistroFamily::Arch; }
    QString name() const override { return QStringLiteral("pacman"); }

protected:
    QStringList installArguments() const override;
};

class ZypperPackageManager : public CommandPackageManager {
public:
    using CommandPackageManager::CommandPackageManager;
    DistroFamily family() const override { return DistroFamily::Suse; }
    QString name() const override { return QStringLiteral("zypper"); }

protected:
    QStringList installArguments() const override;
};

/// Package manager for the family, or nullptr for DistroFamily::Unknown.
std::unique_ptr<IPackageManager> createPackageManager(DistroFamily family,
                                                      ICommandRunner* runner,
                                                      const QString& elevation);

} // namespace tas
