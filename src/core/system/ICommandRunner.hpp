#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace tas {

struct CommandResult {
    bool started = false;       // false if the program could not be launched at all
    int exitCode = -1;
    QByteArray standardOutput;  // empty in Forwarded mode
    QByteArray standardError;

    bool ok() const { return started && exitCode == 0; }
};

/// Single entry point for everything that touches host state outside the
/// filesystem: package managers, the user service manager, the runtime.
/// Tests substitute a scripted fake.
class ICommandRunner {
public:
    enum class Mode {
        Captured,   // collect stdout/stderr into the result
        Forwarded   // child shares the terminal (package managers, sudo prompts)
    };

    virtual ~ICommandRunner() = default;

    /// Run program synchronously. Never throws; launch failures come back
    /// with started == false.
    virtual CommandResult run(const QString& program, const QStringList& arguments,
                              Mode mode = Mode::Captured) = 0;

    /// Absolute path of an executable on PATH, or empty if not found.
    virtual QString findExecutable(const QString& name) const = 0;
};

/// Run program through the elevation command (e.g. "sudo"). An empty
/// elevation command runs the program directly.
inline CommandResult runElevated(ICommandRunner& runner, const QString& elevation,
                                 const QString& program, const QStringList& arguments,
                                 ICommandRunner::Mode mode = ICommandRunner::Mode::Captured)
{
    if (elevation.isEmpty())
        return runner.run(program, arguments, mode);
    return runner.run(elevation, QStringList{program} + arguments, mode);
}

} // namespace tas
