#include <QtTest>
#include "core/host/HostProfile.hpp"
#include "FakeCommandRunner.hpp"

Q_DECLARE_METATYPE(tas::DistroFamily)

class TestHostDetector : public QObject {
    Q_OBJECT
private slots:
    void testOsReleaseValue();
    void testOsReleaseValueQuoting();
    void testFamilyTable_data();
    void testFamilyTable();
    void testIdLikeFallback();
    void testDetectFromFile();
    void testDerivativeUsesIdLike();
    void testLsbReleaseFallback();
    void testNothingAvailableIsUnknown();
    void testRuntimeProbe();
    void testMissingRuntime();
};

static QString dataFile(const char* name)
{
    return QString(TEST_DATA_DIR) + "/" + name;
}

void TestHostDetector::testOsReleaseValue()
{
    const QByteArray content = "NAME=\"Ubuntu\"\nID=ubuntu\nID_LIKE=debian\nVERSION_ID=\"24.04\"\n";
    QCOMPARE(tas::HostDetector::osReleaseValue(content, "ID"), QString("ubuntu"));
    QCOMPARE(tas::HostDetector::osReleaseValue(content, "ID_LIKE"), QString("debian"));
    QCOMPARE(tas::HostDetector::osReleaseValue(content, "VERSION_ID"), QString("24.04"));
    // "ID" must not match the ID_LIKE line
    QCOMPARE(tas::HostDetector::osReleaseValue("ID_LIKE=debian\n", "ID"), QString());
    QCOMPARE(tas::HostDetector::osReleaseValue(content, "MISSING"), QString());
}

void TestHostDetector::testOsReleaseValueQuoting()
{
    QCOMPARE(tas::HostDetector::osReleaseValue("ID='arch'\n", "ID"), QString("arch"));
    QCOMPARE(tas::HostDetector::osReleaseValue("ID=\"fedora\"\n", "ID"), QString("fedora"));
    // Mismatched quotes are left alone
    QCOMPARE(tas::HostDetector::osReleaseValue("ID=\"odd'\n", "ID"), QString("\"odd'"));
}

void TestHostDetector::testFamilyTable_data()
{
    QTest::addColumn<QString>("id");
    QTest::addColumn<tas::DistroFamily>("family");

    QTest::newRow("ubuntu") << "ubuntu" << tas::DistroFamily::Debian;
    QTest::newRow("debian") << "debian" << tas::DistroFamily::Debian;
    QTest::newRow("linuxmint") << "linuxmint" << tas::DistroFamily::Debian;
    QTest::newRow("pop") << "pop" << tas::DistroFamily::Debian;
    QTest::newRow("elementary") << "elementary" << tas::DistroFamily::Debian;
    QTest::newRow("zorin") << "zorin" << tas::DistroFamily::Debian;
    QTest::newRow("fedora") << "fedora" << tas::DistroFamily::Fedora;
    QTest::newRow("rhel") << "rhel" << tas::DistroFamily::Fedora;
    QTest::newRow("centos") << "centos" << tas::DistroFamily::Fedora;
    QTest::newRow("rocky") << "rocky" << tas::DistroFamily::Fedora;
    QTest::newRow("alma") << "alma" << tas::DistroFamily::Fedora;
    QTest::newRow("arch") << "arch" << tas::DistroFamily::Arch;
    QTest::newRow("manjaro") << "manjaro" << tas::DistroFamily::Arch;
    QTest::newRow("endeavouros") << "endeavouros" << tas::DistroFamily::Arch;
    QTest::newRow("garuda") << "garuda" << tas::DistroFamily::Arch;
    QTest::newRow("opensuse-leap") << "opensuse-leap" << tas::DistroFamily::Suse;
    QTest::newRow("suse") << "suse" << tas::DistroFamily::Suse;
    QTest::newRow("gentoo") << "gentoo" << tas::DistroFamily::Unknown;
    QTest::newRow("empty") << "" << tas::DistroFamily::Unknown;
}

void TestHostDetector::testFamilyTable()
{
    QFETCH(QString, id);
    QFETCH(tas::DistroFamily, family);
    QCOMPARE(tas::HostDetector::familyForId(id), family);
}

void TestHostDetector::testIdLikeFallback()
{
    QCOMPARE(tas::HostDetector::familyForId("nobara", "rhel centos fedora"), tas::DistroFamily::Fedora);
    QCOMPARE(tas::HostDetector::familyForId("kali", "debian"), tas::DistroFamily::Debian);
    // An exact id wins over ID_LIKE
    QCOMPARE(tas::HostDetector::familyForId("manjaro", "debian"), tas::DistroFamily::Arch);
    QCOMPARE(tas::HostDetector::familyForId("gentoo", "unrelated"), tas::DistroFamily::Unknown);
}

void TestHostDetector::testDetectFromFile()
{
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::HostDetector fedora(&runner, dataFile("os-release-fedora"));
    auto profile = fedora.detect("python3", "pip3");
    QCOMPARE(profile.distroId, QString("fedora"));
    QCOMPARE(profile.family, tas::DistroFamily::Fedora);

    tas::HostDetector suse(&runner, dataFile("os-release-opensuse"));
    profile = suse.detect("python3", "pip3");
    QCOMPARE(profile.distroId, QString("opensuse-tumbleweed"));
    QCOMPARE(profile.family, tas::DistroFamily::Suse);

    // The file was enough, lsb_release is never consulted
    QVERIFY(!runner.ran("lsb_release"));
}

void TestHostDetector::testDerivativeUsesIdLike()
{
    FakeCommandRunner runner;
    tas::HostDetector detector(&runner, dataFile("os-release-derivative"));

    QString idLike;
    QCOMPARE(detector.detectDistroId(&idLike), QString("nobara"));
    QCOMPARE(idLike, QString("rhel centos fedora"));
    QCOMPARE(detector.detect("python3", "pip3").family, tas::DistroFamily::Fedora);
}

void TestHostDetector::testLsbReleaseFallback()
{
    FakeCommandRunner runner;
    runner.executables["lsb_release"] = "/usr/bin/lsb_release";
    runner.respond("lsb_release -si", "Ubuntu\n");

    tas::HostDetector detector(&runner, "/nonexistent/os-release");
    auto profile = detector.detect("python3", "pip3");
    QCOMPARE(profile.distroId, QString("ubuntu"));
    QCOMPARE(profile.family, tas::DistroFamily::Debian);
}

void TestHostDetector::testNothingAvailableIsUnknown()
{
    FakeCommandRunner runner;
    tas::HostDetector detector(&runner, "/nonexistent/os-release");

    auto profile = detector.detect("python3", "pip3");
    QCOMPARE(profile.distroId, QString("unknown"));
    QCOMPARE(profile.family, tas::DistroFamily::Unknown);
    QVERIFY(!runner.ran("lsb_release"));
}

void TestHostDetector::testRuntimeProbe()
{
    FakeCommandRunner runner;
    runner.provideRuntime();

    tas::HostDetector detector(&runner, dataFile("os-release-unknown"));
    auto profile = detector.detect("python3", "pip3");
    QCOMPARE(profile.family, tas::DistroFamily::Unknown);
    QVERIFY(profile.runtimeAvailable);
    QVERIFY(profile.runtimeInstallerAvailable);
    QCOMPARE(profile.runtimeVersion, QString("3.12"));
}

void TestHostDetector::testMissingRuntime()
{
    FakeCommandRunner runner;
    tas::HostDetector detector(&runner, dataFile("os-release-fedora"));

    auto profile = detector.detect("python3", "pip3");
    QVERIFY(!profile.runtimeAvailable);
    QVERIFY(!profile.runtimeInstallerAvailable);
    QVERIFY(profile.runtimeVersion.isEmpty());
    QVERIFY(!runner.ran("python3"));
}

QTEST_MAIN(TestHostDetector)
#include "test_host_detector.moc"
