#include <QtTest>
#include "core/system/ProcessCommandRunner.hpp"

class TestProcessCommandRunner : public QObject {
    Q_OBJECT
private slots:
    void testCapturesOutputAndExitCode();
    void testMissingProgram();
    void testFindExecutable();
    void testRunElevatedPrefix();
};

void TestProcessCommandRunner::testCapturesOutputAndExitCode()
{
    tas::ProcessCommandRunner runner;
    auto result = runner.run("sh", {"-c", "echo out; echo err >&2; exit 3"});
    QVERIFY(result.started);
    QCOMPARE(result.exitCode, 3);
    QVERIFY(!result.ok());
    QCOMPARE(result.standardOutput, QByteArray("out\n"));
    QCOMPARE(result.standardError, QByteArray("err\n"));

    QVERIFY(runner.run("sh", {"-c", "exit 0"}).ok());
}

void TestProcessCommandRunner::testMissingProgram()
{
    tas::ProcessCommandRunner runner;
    auto result = runner.run("/nonexistent/definitely-not-a-program", {});
    QVERIFY(!result.started);
    QVERIFY(!result.ok());
}

void TestProcessCommandRunner::testFindExecutable()
{
    tas::ProcessCommandRunner runner;
    QVERIFY(!runner.findExecutable("sh").isEmpty());
    QVERIFY(runner.findExecutable("definitely-not-a-program-xyz").isEmpty());
}

void TestProcessCommandRunner::testRunElevatedPrefix()
{
    tas::ProcessCommandRunner runner;
    // "env" as the elevation command runs the program unchanged
    auto result = tas::runElevated(runner, "env", "sh", {"-c", "echo elevated"});
    QVERIFY(result.ok());
    QCOMPARE(result.standardOutput, QByteArray("elevated\n"));

    result = tas::runElevated(runner, QString(), "sh", {"-c", "echo direct"});
    QCOMPARE(result.standardOutput, QByteArray("direct\n"));
}

QTEST_MAIN(TestProcessCommandRunner)
#include "test_process_command_runner.moc"
