#include "ServiceDescriptors.hpp"
#include "InstallLayout.hpp"
#include "core/InstallerConfig.hpp"
#include <QDir>
#include <QTextStream>

namespace tas {

static QString daemonWrapper(const InstallerConfig& config, const InstallLayout& layout)
{
    return layout.wrapperPath(config.executableForRole(QStringLiteral("daemon")).name);
}

QByteArray ServiceDescriptors::serviceUnit(const InstallerConfig& config, const InstallLayout& layout)
{
    QString out;
    QTextStream s(&out);
    const QString target = config.sessionTarget();

    s << "[Unit]\n"
      << "Description=" << config.productName() << " - " << config.productComment() << "\n"
      << "After=" << target << "\n"
      << "PartOf=" << target << "\n"
      << "\n"
      << "[Service]\n"
      << "Type=dbus\n"
      << "BusName=" << config.busName() << "\n"
      << "ExecStart=" << daemonWrapper(config, layout) << "\n"
      << "Restart=on-failure\n"
      << "RestartSec=" << config.restartSec() << "\n"
      << "Environment=" << config.searchPathVariable() << "=" << layout.installDir << "\n"
      << "Environment=PYTHONUNBUFFERED=1\n"
      << "\n"
      << "[Install]\n"
      << "WantedBy=" << target << "\n";

    s.flush();
    return out.toUtf8();
}

QByteArray ServiceDescriptors::busActivation(const InstallerConfig& config, const InstallLayout& layout)
{
    return QStringLiteral("[D-BUS Service]\nName=%1\nExec=%2\n")
        .arg(config.busName(), daemonWrapper(config, layout))
        .toUtf8();
}

QByteArray ServiceDescriptors::desktopEntry(const InstallerConfig& config, const InstallLayout& layout)
{
    QString out;
    QTextStream s(&out);
    const auto overlay = config.executableForRole(QStringLiteral("overlay"));

    s << "[Desktop Entry]\n"
      << "Type=Application\n"
      << "Name=" << config.productName() << "\n"
      << "Comment=" << config.productComment() << "\n"
      << "Icon=" << config.icon() << "\n"
      << "Exec=" << layout.wrapperPath(overlay.name) << "\n"
      << "Terminal=false\n"
      << "Categories=Utility;System;\n"
      << "Keywords=AI;Assistant;Help;Linux;\n"
      << "StartupNotify=false\n";

    s.flush();
    return out.toUtf8();
}

QByteArray ServiceDescriptors::autostartEntry(const InstallerConfig& config, const InstallLayout& layout)
{
    QString out;
    QTextStream s(&out);

    s << "[Desktop Entry]\n"
      << "Type=Application\n"
      << "Name=" << config.productName() << " Daemon\n"
      << "Exec=" << daemonWrapper(config, layout) << "\n"
      << "Hidden=false\n"
      << "NoDisplay=true\n"
      << "X-GNOME-Autostart-enabled=true\n"
      << "X-GNOME-Autostart-Delay=" << config.autostartDelay() << "\n";

    s.flush();
    return out.toUtf8();
}

// Escapes the characters bash still expands inside double quotes.
static QString escapedForDoubleQuotes(QString value)
{
    value.replace(QLatin1Char('\\'), QLatin1String("\\\\"));
    value.replace(QLatin1Char('"'), QLatin1String("\\\""));
    value.replace(QLatin1Char('$'), QLatin1String("\\$"));
    value.replace(QLatin1Char('`'), QLatin1String("\\`"));
    return value;
}

QByteArray ServiceDescriptors::wrapperScript(const InstallerConfig& config, const InstallLayout& layout,
                                             const ExecutableSpec& executable)
{
    const QString var = config.searchPathVariable();
    return QStringLiteral("#!/bin/bash\n"
                          "export %1=\"%2:$%1\"\n"
                          "exec %3 \"%4\" \"$@\"\n")
        .arg(var, escapedForDoubleQuotes(layout.installDir), config.runtimeInterpreter(),
             escapedForDoubleQuotes(QDir(layout.installDir).filePath(executable.entry)))
        .toUtf8();
}

// --- KeyFile ---

bool KeyFile::parse(const QByteArray& content, QString* error)
{
    groups_.clear();

    auto fail = [error](int lineNo, const QString& what) {
        if (error)
            *error = QStringLiteral("line %1: %2").arg(lineNo).arg(what);
        return false;
    };

    const QStringList lines = QString::fromUtf8(content).split('\n');
    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        const int lineNo = i + 1;

        if (line.isEmpty() || line.startsWith('#') || line.startsWith(';'))
            continue;

        if (line.startsWith('[')) {
            if (!line.endsWith(']') || line.size() < 3)
                return fail(lineNo, QStringLiteral("malformed group header"));
            groups_.append(Group{line.mid(1, line.size() - 2), {}});
            continue;
        }

        const int eq = line.indexOf('=');
        if (eq <= 0)
            return fail(lineNo, QStringLiteral("expected Key=Value"));
        if (groups_.isEmpty())
            return fail(lineNo, QStringLiteral("entry outside of a group"));

        groups_.last().entries.append({line.left(eq).trimmed(), line.mid(eq + 1).trimmed()});
    }

    if (groups_.isEmpty())
        return fail(0, QStringLiteral("no groups"));
    return true;
}

QStringList KeyFile::groupNames() const
{
    QStringList names;
    for (const auto& g : groups_)
        names.append(g.name);
    return names;
}

bool KeyFile::hasGroup(const QString& group) const
{
    return groupNames().contains(group);
}

QString KeyFile::value(const QString& group, const QString& key) const
{
    const QStringList all = values(group, key);
    return all.isEmpty() ? QString() : all.first();
}

QStringList KeyFile::values(const QString& group, const QString& key) const
{
    QStringList result;
    for (const auto& g : groups_) {
        if (g.name != group)
            continue;
        for (const auto& entry : g.entries) {
            if (entry.first == key)
                result.append(entry.second);
        }
    }
    return result;
}

} // namespace tas
