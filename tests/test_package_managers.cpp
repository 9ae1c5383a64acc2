#include <QtTest>
#include <QFile>
#include "core/packages/DependencyProvisioner.hpp"
#include "core/packages/PackageManagers.hpp"
#include "FakeCommandRunner.hpp"
#include "TestSandbox.hpp"

class TestPackageManagers : public QObject {
    Q_OBJECT
private slots:
    void testFactory();
    void testAptRefreshesThenInstalls();
    void testAptUpdateFailureStillInstalls();
    void testAptRefreshesOncePerInstance();
    void testDnfPacmanZypper();
    void testNoElevation();
    void testEmptyPackageListRunsNothing();
    void testForwardedMode();

    void testDependencySetForFamily();
    void testProvisionWithRequirements();
    void testProvisionInstallsPipFirst();
    void testProvisionFallbackWithoutRequirements();
    void testProvisionFallbackAfterRequirementsFailure();
    void testProvisionMissingPip();
    void testNativeFailureIsWarning();
    void testUnknownFamilySkipsNative();
};

void TestPackageManagers::testFactory()
{
    FakeCommandRunner runner;
    QCOMPARE(tas::createPackageManager(tas::DistroFamily::Debian, &runner, "sudo")->name(), QString("apt"));
    QCOMPARE(tas::createPackageManager(tas::DistroFamily::Fedora, &runner, "sudo")->name(), QString("dnf"));
    QCOMPARE(tas::createPackageManager(tas::DistroFamily::Arch, &runner, "sudo")->name(), QString("pacman"));
    QCOMPARE(tas::createPackageManager(tas::DistroFamily::Suse, &runner, "sudo")->name(), QString("zypper"));
    QVERIFY(tas::createPackageManager(tas::DistroFamily::Unknown, &runner, "sudo") == nullptr);

    auto apt = tas::createPackageManager(tas::DistroFamily::Debian, &runner, "sudo");
    QCOMPARE(apt->family(), tas::DistroFamily::Debian);
}

void TestPackageManagers::testAptRefreshesThenInstalls()
{
    FakeCommandRunner runner;
    tas::AptPackageManager apt(&runner, "sudo");

    auto result = apt.installPackages({"python3-gi", "gir1.2-gtk-4.0"});
    QVERIFY(result.ok());
    QCOMPARE(runner.commandLines(), QStringList({
        "sudo apt update",
        "sudo apt install -y python3-gi gir1.2-gtk-4.0"}));
}

void TestPackageManagers::testAptUpdateFailureStillInstalls()
{
    FakeCommandRunner runner;
    runner.failOn("sudo apt update", 100);
    tas::AptPackageManager apt(&runner, "sudo");

    auto result = apt.installPackages({"python3-gi"});
    QVERIFY(result.ok());
    QVERIFY(runner.ran("sudo apt install -y python3-gi"));
}

void TestPackageManagers::testAptRefreshesOncePerInstance()
{
    FakeCommandRunner runner;
    tas::AptPackageManager apt(&runner, "sudo");

    QVERIFY(apt.installPackages({"python3-pip"}).ok());
    QVERIFY(apt.installPackages({"python3-gi"}).ok());
    QCOMPARE(runner.commandLines(), QStringList({
        "sudo apt update",
        "sudo apt install -y python3-pip",
        "sudo apt install -y python3-gi"}));
}

void TestPackageManagers::testDnfPacmanZypper()
{
    FakeCommandRunner runner;
    tas::DnfPackageManager dnf(&runner, "sudo");
    tas::PacmanPackageManager pacman(&runner, "sudo");
    tas::ZypperPackageManager zypper(&runner, "sudo");

    dnf.installPackages({"gtk4"});
    pacman.installPackages({"gtk4", "libadwaita"});
    zypper.installPackages({"gtk4"});

    QCOMPARE(runner.commandLines(), QStringList({
        "sudo dnf install -y gtk4",
        "sudo pacman -S --noconfirm --needed gtk4 libadwaita",
        "sudo zypper install -y gtk4"}));
}

void TestPackageManagers::testNoElevation()
{
    FakeCommandRunner runner;
    tas::DnfPackageManager dnf(&runner, QString());
    dnf.installPackages({"gtk4"});
    QCOMPARE(runner.commandLines(), QStringList({"dnf install -y gtk4"}));
}

void TestPackageManagers::testEmptyPackageListRunsNothing()
{
    FakeCommandRunner runner;
    tas::AptPackageManager apt(&runner, "sudo");
    QVERIFY(apt.installPackages({}).ok());
    QVERIFY(runner.calls.isEmpty());
}

void TestPackageManagers::testForwardedMode()
{
    FakeCommandRunner runner;
    tas::PacmanPackageManager pacman(&runner, "sudo");
    pacman.installPackages({"gtk4"});
    QCOMPARE(runner.calls.size(), 1);
    QCOMPARE(runner.calls[0].mode, tas::ICommandRunner::Mode::Forwarded);
    QCOMPARE(runner.calls[0].program, QString("sudo"));
}

void TestPackageManagers::testDependencySetForFamily()
{
    tas::InstallerConfig config;
    auto arch = tas::DependencySet::forFamily(config, tas::DistroFamily::Arch);
    QVERIFY(arch.nativePackages.contains("python-gobject"));
    QCOMPARE(arch.runtimeInstallerPackage, QString("python-pip"));
    QCOMPARE(arch.fallbackRuntimePackages.size(), 7);

    auto unknown = tas::DependencySet::forFamily(config, tas::DistroFamily::Unknown);
    QVERIFY(unknown.nativePackages.isEmpty());
    QVERIFY(unknown.runtimeInstallerPackage.isEmpty());
    QCOMPARE(unknown.fallbackRuntimePackages, config.fallbackRuntimePackages());
}

void TestPackageManagers::testProvisionWithRequirements()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::HostProfile host;
    host.family = tas::DistroFamily::Fedora;
    host.runtimeAvailable = true;
    host.runtimeInstallerAvailable = true;

    tas::DnfPackageManager dnf(&runner, "sudo");
    tas::DependencyProvisioner provisioner(&runner, box.config);
    auto report = provisioner.provision(host, &dnf);

    QVERIFY(report.nativeAttempted);
    QVERIFY(report.nativeOk);
    QVERIFY(report.runtimeOk);
    QVERIFY(!report.usedFallback);
    QVERIFY(report.warnings.isEmpty());

    const QStringList lines = runner.commandLines();
    QCOMPARE(lines.size(), 2);
    QVERIFY(lines[0].startsWith("sudo dnf install -y python3-gobject"));
    QCOMPARE(lines[1], "pip3 install --user -r " + box.project + "/requirements.txt");
}

void TestPackageManagers::testProvisionInstallsPipFirst()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::HostProfile host;
    host.family = tas::DistroFamily::Debian;
    host.runtimeAvailable = true;
    host.runtimeInstallerAvailable = false;

    tas::AptPackageManager apt(&runner, "sudo");
    tas::DependencyProvisioner provisioner(&runner, box.config);
    provisioner.provision(host, &apt);

    const QStringList lines = runner.commandLines();
    QVERIFY(lines.size() >= 3);
    QCOMPARE(lines[0], QString("sudo apt update"));
    QCOMPARE(lines[1], QString("sudo apt install -y python3-pip"));
    QCOMPARE(lines[2], "sudo apt install -y " + box.config.nativePackages("debian").join(' '));
    QCOMPARE(lines.filter("apt update").size(), 1);
}

void TestPackageManagers::testProvisionFallbackWithoutRequirements()
{
    TestSandbox box;
    QVERIFY(QFile::remove(box.project + "/requirements.txt"));
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::DependencyProvisioner provisioner(&runner, box.config);
    tas::DependencyReport report;
    provisioner.installRuntime(report);

    QVERIFY(report.usedFallback);
    QVERIFY(report.runtimeOk);
    QCOMPARE(runner.commandLines(), QStringList({
        "pip3 install --user httpx Pillow markdown psutil python-dateutil requests beautifulsoup4"}));
}

void TestPackageManagers::testProvisionFallbackAfterRequirementsFailure()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.provideRuntime();
    runner.failOn("pip3 install --user -r");
    runner.failOn("pip3 install --user httpx");

    tas::DependencyProvisioner provisioner(&runner, box.config);
    tas::DependencyReport report;
    provisioner.installRuntime(report);

    QCOMPARE(runner.calls.size(), 2);
    QVERIFY(report.usedFallback);
    QVERIFY(!report.runtimeOk);
    QCOMPARE(report.warnings.size(), 1);
}

void TestPackageManagers::testProvisionMissingPip()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.executables["python3"] = "/usr/bin/python3";

    tas::DependencyProvisioner provisioner(&runner, box.config);
    tas::DependencyReport report;
    provisioner.installRuntime(report);

    QVERIFY(!report.runtimeOk);
    QCOMPARE(report.warnings.size(), 1);
    QVERIFY(report.warnings[0].contains("pip3"));
    QVERIFY(runner.calls.isEmpty());
}

void TestPackageManagers::testNativeFailureIsWarning()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.provideRuntime();
    runner.failOn("sudo pacman", 1);

    tas::HostProfile host;
    host.family = tas::DistroFamily::Arch;
    host.runtimeAvailable = true;
    host.runtimeInstallerAvailable = true;

    tas::PacmanPackageManager pacman(&runner, "sudo");
    tas::DependencyProvisioner provisioner(&runner, box.config);
    auto report = provisioner.provision(host, &pacman);

    QVERIFY(report.nativeAttempted);
    QVERIFY(!report.nativeOk);
    QVERIFY(report.runtimeOk);
    QCOMPARE(report.warnings.size(), 1);
    QVERIFY(report.warnings[0].startsWith("Some packages may already be installed"));
}

void TestPackageManagers::testUnknownFamilySkipsNative()
{
    TestSandbox box;
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::HostProfile host;
    host.runtimeAvailable = true;
    host.runtimeInstallerAvailable = true;

    tas::DependencyProvisioner provisioner(&runner, box.config);
    auto report = provisioner.provision(host, nullptr);

    QVERIFY(!report.nativeAttempted);
    QVERIFY(report.runtimeOk);
    QCOMPARE(runner.calls.size(), 1);
    QVERIFY(runner.calls[0].line().startsWith("pip3 install --user -r"));
}

QTEST_MAIN(TestPackageManagers)
#include "test_package_managers.moc"
