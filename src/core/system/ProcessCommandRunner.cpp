#include "ProcessCommandRunner.hpp"
#include <QProcess>
#include <QStandardPaths>
#include <boost/log/trivial.hpp>

namespace tas {

ProcessCommandRunner::ProcessCommandRunner(int timeoutMs)
    : timeoutMs_(timeoutMs)
{
}

CommandResult ProcessCommandRunner::run(const QString& program, const QStringList& arguments,
                                        Mode mode)
{
    CommandResult result;

    BOOST_LOG_TRIVIAL(debug) << "$ " << program.toStdString() << " "
                             << arguments.join(' ').toStdString();

    QProcess proc;
    if (mode == Mode::Forwarded) {
        proc.setProcessChannelMode(QProcess::ForwardedChannels);
        proc.setInputChannelMode(QProcess::ForwardedInputChannel);
    }

    proc.start(program, arguments);
    if (!proc.waitForStarted()) {
        BOOST_LOG_TRIVIAL(debug) << "Failed to start " << program.toStdString() << ": "
                                 << proc.errorString().toStdString();
        return result;
    }
    result.started = true;

    if (!proc.waitForFinished(timeoutMs_)) {
        BOOST_LOG_TRIVIAL(warning) << program.toStdString() << " did not finish, killing it";
        proc.kill();
        proc.waitForFinished();
        result.exitCode = -1;
        return result;
    }

    if (proc.exitStatus() == QProcess::CrashExit) {
        result.exitCode = -1;
    } else {
        result.exitCode = proc.exitCode();
    }

    if (mode == Mode::Captured) {
        result.standardOutput = proc.readAllStandardOutput();
        result.standardError = proc.readAllStandardError();
    }

    BOOST_LOG_TRIVIAL(debug) << program.toStdString() << " exited with " << result.exitCode;
    return result;
}

QString ProcessCommandRunner::findExecutable(const QString& name) const
{
    return QStandardPaths::findExecutable(name);
}

} // namespace tas
