#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QJsonDocument>
#include <QtCore/QTextStream>
#include <chrono>
#include <cstdio>
#include <exception>
#include <memory>
#include <optional>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/execution/ExecutionTypes.hpp"
#include "core/validation/ValidationPipeline.hpp"

namespace {

constexpr int kExitPassed = 0;
constexpr int kExitFailed = 1;
constexpr int kExitUsage = 2;

void printVerdict(const Attest::PipelineResult& result, const QString& target) {
    QTextStream out(stdout);
    if (result.securityViolation) {
        out << "REFUSED " << target << "\n";
    } else {
        out << (result.passed() ? "PASS " : "FAIL ") << target << "\n";
    }
    for (const QString& error : result.verdict.errors) {
        out << "  error: " << error << "\n";
    }
    for (const QString& warning : result.verdict.warnings) {
        out << "  warning: " << warning << "\n";
    }
    out << "  evidence: " << result.evidence.size() << " file(s)\n";
    if (result.enrichment) {
        out << "  enrichment confidence: " << result.enrichment->confidence << "\n";
    }
    if (!result.enrichmentAdvisory.isEmpty()) {
        out << "  note: " << result.enrichmentAdvisory << "\n";
    }
    out << "  duration: " << result.durationMs << " ms\n";
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("attest");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Attest");

    QCommandLineParser parser;
    parser.setApplicationDescription("Run a browser test under sandbox limits and validate its evidence");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("target", "Test file to execute, inside one of the allowed directories");

    QCommandLineOption timeoutOption("timeout", "Wall-clock timeout in seconds", "seconds");
    QCommandLineOption configOption("config", "INI file with [sandbox] and [pipeline] settings", "file");
    QCommandLineOption jsonOption("json", "Print the full result as JSON");
    QCommandLineOption showConfigOption("show-config", "Print the effective sandbox configuration and exit");
    QCommandLineOption logFileOption("log-file", "Also write logs to this file", "path");
    QCommandLineOption logLevelOption("log-level", "trace, debug, info, warn, error or critical", "level", "info");
    parser.addOptions({timeoutOption, configOption, jsonOption, showConfigOption, logFileOption, logLevelOption});

    if (!parser.parse(app.arguments())) {
        std::fprintf(stderr, "%s\n\n%s", qPrintable(parser.errorText()), qPrintable(parser.helpText()));
        return kExitUsage;
    }
    if (parser.isSet("help")) {
        std::fputs(qPrintable(parser.helpText()), stdout);
        return kExitPassed;
    }
    if (parser.isSet("version")) {
        std::printf("%s %s\n", qPrintable(app.applicationName()), qPrintable(app.applicationVersion()));
        return kExitPassed;
    }

    Attest::Logger::instance().initialize(
        parser.value(logFileOption).toStdString(),
        Attest::Logger::parseLevel(parser.value(logLevelOption).toStdString()));

    try {
        std::unique_ptr<Attest::Config> config;
        if (parser.isSet(configOption)) {
            config = std::make_unique<Attest::Config>(parser.value(configOption));
        } else {
            config = std::make_unique<Attest::Config>(app.organizationName(), app.applicationName());
        }
        const Attest::SandboxConfig sandboxConfig = config->sandboxConfig();

        if (parser.isSet(showConfigOption)) {
            std::fputs(QJsonDocument(sandboxConfig.toJson()).toJson(QJsonDocument::Indented).constData(), stdout);
            return kExitPassed;
        }

        const QStringList positional = parser.positionalArguments();
        if (positional.size() != 1) {
            std::fprintf(stderr, "Expected exactly one target\n\n%s", qPrintable(parser.helpText()));
            return kExitUsage;
        }
        const QString target = positional.first();

        std::optional<std::chrono::seconds> timeout;
        if (parser.isSet(timeoutOption)) {
            bool ok = false;
            const qint64 seconds = parser.value(timeoutOption).toLongLong(&ok);
            if (!ok || seconds <= 0) {
                std::fprintf(stderr, "Invalid --timeout value: %s\n", qPrintable(parser.value(timeoutOption)));
                return kExitUsage;
            }
            timeout = std::chrono::seconds(seconds);
        }

        // Enrichment needs a provider, which the command line tool does not ship
        Attest::ValidationPipeline pipeline(sandboxConfig, config->pipelineOptions());
        const Attest::PipelineResult result =
            pipeline.run(Attest::ExecutionRequest::forBrowserTest(target, timeout));

        if (parser.isSet(jsonOption)) {
            std::fputs(QJsonDocument(result.toJson()).toJson(QJsonDocument::Indented).constData(), stdout);
        } else {
            printVerdict(result, target);
        }
        return result.passed() ? kExitPassed : kExitFailed;

    } catch (const std::exception& e) {
        ATTEST_CRITICAL("Fatal error: {}", e.what());
        return kExitFailed;
    }
}
