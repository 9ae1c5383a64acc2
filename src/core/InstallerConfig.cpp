#include "core/InstallerConfig.hpp"
#include <QDir>
#include <QFile>
#include <boost/log/trivial.hpp>

namespace tas {

// Deep merge: mappings recurse, sequences and scalars in the overlay replace
// the base entirely, keys missing from the overlay keep their defaults. An
// overlay node of a different kind than the default (a scalar where a mapping
// belongs) is dropped so accessors never subscript the wrong node type.
static YAML::Node mergeNodes(const YAML::Node& base, const YAML::Node& overlay,
                             const std::string& path = {})
{
    if (!overlay.IsDefined() || overlay.IsNull())
        return YAML::Clone(base);

    if (!base.IsDefined() || base.IsNull())
        return YAML::Clone(overlay);

    if (base.Type() != overlay.Type()) {
        BOOST_LOG_TRIVIAL(warning) << "Ignoring installer config key '"
                                   << (path.empty() ? std::string("<root>") : path)
                                   << "': unexpected value type";
        return YAML::Clone(base);
    }

    if (!base.IsMap())
        return YAML::Clone(overlay);

    YAML::Node result = YAML::Clone(base);
    for (auto it = overlay.begin(); it != overlay.end(); ++it) {
        const auto key = it->first.as<std::string>();
        const auto keyPath = path.empty() ? key : path + "." + key;
        if (result[key])
            result[key] = mergeNodes(result[key], it->second, keyPath);
        else
            result[key] = YAML::Clone(it->second);
    }
    return result;
}

static YAML::Node sequence(std::initializer_list<const char*> items)
{
    YAML::Node seq(YAML::NodeType::Sequence);
    for (const char* item : items)
        seq.push_back(item);
    return seq;
}

static YAML::Node executable(const char* name, const char* entry, const char* role)
{
    YAML::Node node;
    node["name"] = name;
    node["entry"] = entry;
    node["role"] = role;
    return node;
}

InstallerConfig::InstallerConfig()
{
    initDefaults();
}

void InstallerConfig::initDefaults()
{
    root_ = YAML::Node(YAML::NodeType::Map);

    root_["product"]["name"] = "TuxAgent";
    root_["product"]["id"] = "tuxagent";
    root_["product"]["comment"] = "Linux AI Assistant";
    root_["product"]["desktop_id"] = "org.tuxagent";
    root_["product"]["icon"] = "dialog-question";

    // Empty source/home mean "current directory" and "$HOME"
    root_["paths"]["source_dir"] = "";
    root_["paths"]["home"] = "";
    root_["paths"]["install_dir"] = "/usr/lib/tuxagent";
    root_["paths"]["bin_dir"] = "/usr/local/bin";
    root_["paths"]["os_release"] = "/etc/os-release";

    root_["elevation"]["command"] = "sudo";

    root_["service"]["unit_name"] = "tuxagent.service";
    root_["service"]["bus_name"] = "org.tuxagent.Assistant";
    root_["service"]["restart_sec"] = 5;
    root_["service"]["session_target"] = "graphical-session.target";

    YAML::Node executables(YAML::NodeType::Sequence);
    executables.push_back(executable("tux", "src/cli/tux.py", "cli"));
    executables.push_back(executable("tuxagent-daemon", "src/daemon/main.py", "daemon"));
    executables.push_back(executable("tuxagent-overlay", "src/ui/main.py", "overlay"));
    root_["executables"] = executables;

    root_["autostart"]["enabled"] = true;
    root_["autostart"]["delay"] = 5;

    root_["extension"]["source"] = "extensions/nautilus/tuxagent-extension.py";
    root_["extension"]["dir"] = ".local/share/nautilus-python/extensions";

    root_["runtime"]["interpreter"] = "python3";
    root_["runtime"]["installer"] = "pip3";
    root_["runtime"]["requirements"] = "requirements.txt";
    root_["runtime"]["search_path_variable"] = "PYTHONPATH";
    root_["runtime"]["fallback_packages"] = sequence({
        "httpx", "Pillow", "markdown", "psutil", "python-dateutil", "requests", "beautifulsoup4"});

    root_["dependencies"]["debian"]["packages"] = sequence({
        "python3-gi", "python3-gi-cairo", "gir1.2-gtk-4.0", "gir1.2-adw-1", "python3-dbus",
        "libgirepository1.0-dev", "xdg-desktop-portal", "xdg-desktop-portal-gtk",
        "python3-nautilus"});
    root_["dependencies"]["debian"]["runtime_installer"] = "python3-pip";

    root_["dependencies"]["fedora"]["packages"] = sequence({
        "python3-gobject", "gtk4", "libadwaita", "python3-dbus", "gobject-introspection-devel",
        "xdg-desktop-portal", "xdg-desktop-portal-gtk", "nautilus-python"});
    root_["dependencies"]["fedora"]["runtime_installer"] = "python3-pip";

    root_["dependencies"]["arch"]["packages"] = sequence({
        "python-gobject", "gtk4", "libadwaita", "python-dbus", "gobject-introspection",
        "xdg-desktop-portal", "xdg-desktop-portal-gtk", "python-nautilus"});
    root_["dependencies"]["arch"]["runtime_installer"] = "python-pip";

    root_["dependencies"]["suse"]["packages"] = sequence({
        "python3-gobject", "gtk4", "libadwaita", "python3-dbus", "gobject-introspection",
        "xdg-desktop-portal", "xdg-desktop-portal-gtk"});
    root_["dependencies"]["suse"]["runtime_installer"] = "python3-pip";

    root_["dependencies"]["manual"] = sequence({
        "Python 3 GTK bindings (python3-gi/python-gobject)", "GTK 4", "libadwaita",
        "xdg-desktop-portal"});

    root_["logging"]["level"] = "info";
}

bool InstallerConfig::load(const QString& filePath)
{
    if (!QFile::exists(filePath)) {
        BOOST_LOG_TRIVIAL(debug) << "No installer config at " << filePath.toStdString();
        return false;
    }

    try {
        initDefaults();
        YAML::Node defaults = YAML::Clone(root_);
        YAML::Node loaded = YAML::LoadFile(filePath.toStdString());
        root_ = mergeNodes(defaults, loaded);
    } catch (const YAML::Exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Failed to parse installer config " << filePath.toStdString()
                                 << ": " << e.what();
        initDefaults();
        return false;
    }

    BOOST_LOG_TRIVIAL(debug) << "Loaded installer config " << filePath.toStdString();
    return true;
}

// --- Product ---

QString InstallerConfig::productName() const
{
    return QString::fromStdString(root_["product"]["name"].as<std::string>("TuxAgent"));
}

QString InstallerConfig::productId() const
{
    return QString::fromStdString(root_["product"]["id"].as<std::string>("tuxagent"));
}

QString InstallerConfig::productComment() const
{
    return QString::fromStdString(root_["product"]["comment"].as<std::string>(""));
}

QString InstallerConfig::desktopId() const
{
    return QString::fromStdString(root_["product"]["desktop_id"].as<std::string>("org.tuxagent"));
}

QString InstallerConfig::icon() const
{
    return QString::fromStdString(root_["product"]["icon"].as<std::string>("dialog-question"));
}

// --- Paths ---

QString InstallerConfig::sourceDir() const
{
    auto v = QString::fromStdString(root_["paths"]["source_dir"].as<std::string>(""));
    return v.isEmpty() ? QDir::currentPath() : v;
}

void InstallerConfig::setSourceDir(const QString& v)
{
    root_["paths"]["source_dir"] = v.toStdString();
}

QString InstallerConfig::homeDir() const
{
    auto v = QString::fromStdString(root_["paths"]["home"].as<std::string>(""));
    return v.isEmpty() ? QDir::homePath() : v;
}

void InstallerConfig::setHomeDir(const QString& v)
{
    root_["paths"]["home"] = v.toStdString();
}

QString InstallerConfig::installDir() const
{
    return QString::fromStdString(root_["paths"]["install_dir"].as<std::string>("/usr/lib/tuxagent"));
}

void InstallerConfig::setInstallDir(const QString& v)
{
    root_["paths"]["install_dir"] = v.toStdString();
}

QString InstallerConfig::binDir() const
{
    return QString::fromStdString(root_["paths"]["bin_dir"].as<std::string>("/usr/local/bin"));
}

void InstallerConfig::setBinDir(const QString& v)
{
    root_["paths"]["bin_dir"] = v.toStdString();
}

QString InstallerConfig::osReleasePath() const
{
    return QString::fromStdString(root_["paths"]["os_release"].as<std::string>("/etc/os-release"));
}

void InstallerConfig::setOsReleasePath(const QString& v)
{
    root_["paths"]["os_release"] = v.toStdString();
}

// --- Privilege ---

QString InstallerConfig::elevationCommand() const
{
    return QString::fromStdString(root_["elevation"]["command"].as<std::string>(""));
}

void InstallerConfig::setElevationCommand(const QString& v)
{
    root_["elevation"]["command"] = v.toStdString();
}

// --- Service ---

QString InstallerConfig::serviceUnitName() const
{
    return QString::fromStdString(root_["service"]["unit_name"].as<std::string>("tuxagent.service"));
}

QString InstallerConfig::busName() const
{
    return QString::fromStdString(root_["service"]["bus_name"].as<std::string>("org.tuxagent.Assistant"));
}

int InstallerConfig::restartSec() const
{
    return root_["service"]["restart_sec"].as<int>(5);
}

QString InstallerConfig::sessionTarget() const
{
    return QString::fromStdString(
        root_["service"]["session_target"].as<std::string>("graphical-session.target"));
}

// --- Executables ---

QList<ExecutableSpec> InstallerConfig::executables() const
{
    QList<ExecutableSpec> result;
    const YAML::Node node = root_["executables"];
    if (!node.IsSequence())
        return result;

    for (const auto& item : node) {
        if (!item.IsMap())
            continue;
        ExecutableSpec spec;
        spec.name = QString::fromStdString(item["name"].as<std::string>(""));
        spec.entry = QString::fromStdString(item["entry"].as<std::string>(""));
        spec.role = QString::fromStdString(item["role"].as<std::string>(""));
        if (!spec.name.isEmpty() && !spec.entry.isEmpty())
            result.append(spec);
    }
    return result;
}

ExecutableSpec InstallerConfig::executableForRole(const QString& role) const
{
    for (const auto& spec : executables()) {
        if (spec.role == role)
            return spec;
    }
    return {};
}

// --- Autostart ---

bool InstallerConfig::autostartEnabled() const
{
    return root_["autostart"]["enabled"].as<bool>(true);
}

void InstallerConfig::setAutostartEnabled(bool v)
{
    root_["autostart"]["enabled"] = v;
}

int InstallerConfig::autostartDelay() const
{
    return root_["autostart"]["delay"].as<int>(5);
}

// --- Extension ---

QString InstallerConfig::extensionSource() const
{
    return QString::fromStdString(root_["extension"]["source"].as<std::string>(""));
}

QString InstallerConfig::extensionDir() const
{
    return QString::fromStdString(root_["extension"]["dir"].as<std::string>(""));
}

// --- Runtime ---

QString InstallerConfig::runtimeInterpreter() const
{
    return QString::fromStdString(root_["runtime"]["interpreter"].as<std::string>("python3"));
}

QString InstallerConfig::runtimeInstaller() const
{
    return QString::fromStdString(root_["runtime"]["installer"].as<std::string>("pip3"));
}

QString InstallerConfig::requirementsFile() const
{
    return QString::fromStdString(root_["runtime"]["requirements"].as<std::string>("requirements.txt"));
}

QString InstallerConfig::searchPathVariable() const
{
    return QString::fromStdString(
        root_["runtime"]["search_path_variable"].as<std::string>("PYTHONPATH"));
}

QStringList InstallerConfig::fallbackRuntimePackages() const
{
    return stringList(root_["runtime"]["fallback_packages"]);
}

// --- Dependencies ---

QStringList InstallerConfig::nativePackages(const QString& family) const
{
    return stringList(root_["dependencies"][family.toStdString()]["packages"]);
}

QString InstallerConfig::runtimeInstallerPackage(const QString& family) const
{
    return QString::fromStdString(
        root_["dependencies"][family.toStdString()]["runtime_installer"].as<std::string>(""));
}

QStringList InstallerConfig::manualDependencies() const
{
    return stringList(root_["dependencies"]["manual"]);
}

QString InstallerConfig::logLevel() const
{
    return QString::fromStdString(root_["logging"]["level"].as<std::string>("info"));
}

QStringList InstallerConfig::stringList(const YAML::Node& node) const
{
    QStringList result;
    if (!node.IsSequence())
        return result;
    for (const auto& item : node) {
        auto value = QString::fromStdString(item.as<std::string>(""));
        if (!value.isEmpty())
            result.append(value);
    }
    return result;
}

} // namespace tas
