#pragma once

#include "ICommandRunner.hpp"

namespace tas {

/// ICommandRunner backed by QProcess.
class ProcessCommandRunner : public ICommandRunner {
public:
    /// timeoutMs < 0 waits forever (package installs can take minutes).
    explicit ProcessCommandRunner(int timeoutMs = -1);

    CommandResult run(const QString& program, const QStringList& arguments,
                      Mode mode = Mode::Captured) override;
    QString findExecutable(const QString& name) const override;

private:
    int timeoutMs_;
};

} // namespace tas
