#include <QtTest/QtTest>
#include <QtCore/QDir>
#include <QtCore/QFile>

#include "utils/TestUtils.hpp"
#include "../src/core/security/PathGuard.hpp"

using namespace Attest;
using namespace Attest::Test;

class TestPathGuard : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void cleanupTestCase();

    void testFileInsideAllowedDirIsAccepted();
    void testTraversalIsRejected();
    void testAbsolutePathOutsideIsRejected();
    void testDotDotStayingInsideIsAccepted();
    void testSymlinkEscapeIsRejected();
    void testRootItselfIsRejected();
    void testSiblingWithSharedPrefixIsRejected();
    void testEmptyAndNulPathsAreRejected();
    void testNonexistentTailInsideRootIsAccepted();
    void testCanonicalizeResolvesRelativeToBase();

private:
    QString root_;
    SandboxConfig config_;
};

void TestPathGuard::initTestCase() {
    TestUtils::initializeTestEnvironment();
    root_ = TestUtils::createTempDirectory("path_guard");
    TestUtils::createProjectTree(root_);
    TestUtils::createTestTextFile(root_ + "/tests", "test('a', () => {});", "a.spec.ts");
    TestUtils::createTestTextFile(root_ + "/tests/sub", "test('b', () => {});", "b.spec.ts");

    config_ = TestUtils::sandboxConfigFor(root_);
    config_.allowedDirs = {"./tests"};
}

void TestPathGuard::cleanupTestCase() {
    TestUtils::cleanupTempDirectory(root_);
}

void TestPathGuard::testFileInsideAllowedDirIsAccepted() {
    QVERIFY(PathGuard::validate("tests/a.spec.ts", config_));
    QVERIFY(PathGuard::validate("./tests/sub/b.spec.ts", config_));
    QVERIFY(PathGuard::validate(root_ + "/tests/a.spec.ts", config_));
}

void TestPathGuard::testTraversalIsRejected() {
    QVERIFY(!PathGuard::validate("../../../etc/passwd", config_));
    QVERIFY(!PathGuard::validate("tests/../../etc/passwd", config_));
    QVERIFY(!PathGuard::validate("tests/../artifacts/x.png", config_));
}

void TestPathGuard::testAbsolutePathOutsideIsRejected() {
    QVERIFY(!PathGuard::validate("/etc/passwd", config_));
    QVERIFY(!PathGuard::validate("/tmp", config_));
}

void TestPathGuard::testDotDotStayingInsideIsAccepted() {
    QVERIFY(PathGuard::validate("tests/sub/../a.spec.ts", config_));
    QVERIFY(PathGuard::validate("tests/./sub/./b.spec.ts", config_));
}

void TestPathGuard::testSymlinkEscapeIsRejected() {
    const QString outside = TestUtils::createTempDirectory("outside");
    TestUtils::createTestTextFile(outside, "secret", "secret.txt");

    const QString link = root_ + "/tests/escape";
    QVERIFY(QFile::link(outside, link));

    QVERIFY(!PathGuard::validate("tests/escape/secret.txt", config_));
    QVERIFY(!PathGuard::validate("tests/escape", config_));

    QFile::remove(link);
    TestUtils::cleanupTempDirectory(outside);
}

void TestPathGuard::testRootItselfIsRejected() {
    QVERIFY(!PathGuard::validate("tests", config_));
    QVERIFY(!PathGuard::validate("./tests/", config_));
    QVERIFY(!PathGuard::validate(root_, config_));
}

void TestPathGuard::testSiblingWithSharedPrefixIsRejected() {
    QDir(root_).mkpath("tests-evil");
    TestUtils::createTestTextFile(root_ + "/tests-evil", "x", "a.spec.ts");

    QVERIFY(!PathGuard::validate("tests-evil/a.spec.ts", config_));
}

void TestPathGuard::testEmptyAndNulPathsAreRejected() {
    QVERIFY(!PathGuard::validate(QString(), config_));

    QString withNul = "tests/a.spec.ts";
    withNul.insert(5, QChar(0));
    QVERIFY(!PathGuard::validate(withNul, config_));
}

void TestPathGuard::testNonexistentTailInsideRootIsAccepted() {
    QVERIFY(PathGuard::validate("tests/not-yet/written.spec.ts", config_));
    QVERIFY(!PathGuard::validate("tests/not-yet/../../../x", config_));
}

void TestPathGuard::testCanonicalizeResolvesRelativeToBase() {
    const QString canonical = PathGuard::canonicalize("tests/sub/../a.spec.ts", root_);
    QVERIFY(!canonical.isEmpty());
    QVERIFY(canonical.endsWith("/tests/a.spec.ts"));
    QVERIFY(!canonical.contains(".."));

    const QStringList roots = PathGuard::canonicalRoots(config_);
    QCOMPARE(roots.size(), 1);
    QVERIFY(canonical.startsWith(roots.first() + "/"));
}

int runTestPathGuard(int argc, char** argv) {
    TestPathGuard test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_path_guard.moc"
