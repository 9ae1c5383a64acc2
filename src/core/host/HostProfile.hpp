#pragma once

#include <QByteArray>
#include <QString>

namespace tas {

class ICommandRunner;

enum class DistroFamily {
    Debian,
    Fedora,
    Arch,
    Suse,
    Unknown
};

/// Key used in configuration and logs: "debian", "fedora", "arch", "suse", "unknown".
QString familyKey(DistroFamily family);

struct HostProfile {
    DistroFamily family = DistroFamily::Unknown;
    QString distroId = QStringLiteral("unknown");

    bool runtimeAvailable = false;
    QString runtimeVersion;             // "major.minor", empty if unknown
    bool runtimeInstallerAvailable = false;
};

/// Reads the OS identification and probes the language runtime.
class HostDetector {
public:
    HostDetector(ICommandRunner* runner, const QString& osReleasePath);

    /// Detect family and runtime. interpreter/installer are looked up on PATH.
    HostProfile detect(const QString& interpreter, const QString& installer) const;

    /// Distribution id from os-release, then lsb_release, else "unknown".
    /// idLike receives the os-release ID_LIKE value when present.
    QString detectDistroId(QString* idLike = nullptr) const;

    /// Exact-id table lookup; ID_LIKE tokens are tried when the id is not listed.
    static DistroFamily familyForId(const QString& id, const QString& idLike = {});

    /// Value of key (e.g. "ID") in os-release content, unquoted; empty if absent.
    static QString osReleaseValue(const QByteArray& content, const QString& key);

private:
    ICommandRunner* runner_;
    QString osReleasePath_;

    QString probeRuntimeVersion(const QString& interpreter) const;
};

} // namespace tas
