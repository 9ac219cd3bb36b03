#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include <vector>

#include "core/common/Expected.hpp"

namespace Attest {

enum class ReportError {
    Empty,
    MalformedJson,
    NotAnObject
};

QString toString(ReportError error);

struct RunnerResult {
    QString status;
    QStringList stdoutLines;
    QStringList stderrLines;
    std::optional<QString> errorMessage;

    // Anything other than passed/skipped, including a missing status, is a failure
    bool passed() const;
};

struct RunnerTest {
    std::vector<RunnerResult> results;
};

struct RunnerSpec {
    QString title;
    std::vector<RunnerTest> tests;
};

struct RunnerSuite {
    QString title;
    std::vector<RunnerSpec> specs;
    std::vector<RunnerSuite> suites;
};

/**
 * @brief Decoded JSON report of the browser test runner
 *
 * Only the parts the pipeline reads are kept: suites -> specs -> tests ->
 * results, with child suites followed recursively. Unknown keys are ignored
 * and wrongly typed values are treated as absent.
 */
class RunnerReport {
public:
    std::vector<RunnerSuite> suites;

    // True when every result passed or was skipped (vacuously true with no results)
    bool allPassed() const;

    // stderr entries mentioning "error" (any case), each cut to kMaxMessageChars
    QStringList consoleErrors() const;

    // Result error messages that look like network or timeout failures
    QStringList networkFailures() const;

    int resultCount() const;

    // Accepts the report on its own or embedded in other output; in the
    // latter case the text between the first '{' and the last '}' is tried.
    static Expected<RunnerReport, ReportError> decode(const QByteArray& output);

    static constexpr int kMaxMessageChars = 200;

private:
    template<typename Visitor>
    void forEachResult(Visitor&& visit) const;
};

} // namespace Attest
