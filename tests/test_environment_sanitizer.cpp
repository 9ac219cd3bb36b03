#include <QtTest/QtTest>
#include <QtCore/QProcessEnvironment>

#include "utils/TestUtils.hpp"
#include "../src/core/security/EnvironmentSanitizer.hpp"

using namespace Attest;
using namespace Attest::Test;

class TestEnvironmentSanitizer : public QObject {
    Q_OBJECT

private slots:
    void testAllowListedVariablesAreCopied();
    void testCredentialsAreDropped();
    void testMissingVariablesAreNotInvented();
    void testAllowListComposition();
};

void TestEnvironmentSanitizer::testAllowListedVariablesAreCopied() {
    QProcessEnvironment parent;
    parent.insert("PATH", "/usr/bin:/bin");
    parent.insert("HOME", "/home/tester");
    parent.insert("BASE_URL", "http://localhost:3000");
    parent.insert("PLAYWRIGHT_HEADLESS", "1");
    parent.insert("NODE_OPTIONS", "--max-old-space-size=512");

    const QProcessEnvironment child = EnvironmentSanitizer::build(parent);
    QCOMPARE(child.value("PATH"), QString("/usr/bin:/bin"));
    QCOMPARE(child.value("HOME"), QString("/home/tester"));
    QCOMPARE(child.value("BASE_URL"), QString("http://localhost:3000"));
    QCOMPARE(child.value("PLAYWRIGHT_HEADLESS"), QString("1"));
    QCOMPARE(child.value("NODE_OPTIONS"), QString("--max-old-space-size=512"));
    QCOMPARE(child.keys().size(), 5);
}

void TestEnvironmentSanitizer::testCredentialsAreDropped() {
    QProcessEnvironment parent;
    parent.insert("PATH", "/usr/bin");
    parent.insert("ANTHROPIC_API_KEY", "sk-secret");
    parent.insert("AWS_SECRET_ACCESS_KEY", "aws-secret");
    parent.insert("GITHUB_TOKEN", "ghp_secret");
    parent.insert("SOME_FUTURE_CREDENTIAL", "unknown-name");
    parent.insert("LD_PRELOAD", "/tmp/evil.so");

    const QProcessEnvironment child = EnvironmentSanitizer::build(parent);
    QCOMPARE(child.keys(), QStringList({"PATH"}));
    for (const QString& name : child.keys()) {
        QVERIFY(!child.value(name).contains("secret"));
    }
}

void TestEnvironmentSanitizer::testMissingVariablesAreNotInvented() {
    const QProcessEnvironment child = EnvironmentSanitizer::build(QProcessEnvironment());
    QVERIFY(child.isEmpty());
    QVERIFY(!child.contains("USER"));
    QVERIFY(!child.contains("LANG"));
}

void TestEnvironmentSanitizer::testAllowListComposition() {
    const QStringList allowed = EnvironmentSanitizer::allowedVariables();
    QCOMPARE(allowed.size(), EnvironmentSanitizer::baseVariables().size() +
                             EnvironmentSanitizer::runnerVariables().size() +
                             EnvironmentSanitizer::runtimeVariables().size());
    QVERIFY(allowed.contains("PLAYWRIGHT_BROWSERS_PATH"));
    QVERIFY(allowed.contains("NODE_PATH"));
    for (const QString& name : allowed) {
        QVERIFY2(!name.contains("KEY") && !name.contains("TOKEN") && !name.contains("SECRET"),
                 qPrintable(name));
    }
}

int runTestEnvironmentSanitizer(int argc, char** argv) {
    TestEnvironmentSanitizer test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_environment_sanitizer.moc"
