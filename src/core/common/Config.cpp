#include "Config.hpp"
#include "Logger.hpp"

#include <QtCore/QFileInfo>

namespace Attest {

Config::Config(const QString& iniPath)
    : settings_(std::make_unique<QSettings>(iniPath, QSettings::IniFormat)) {
    if (!QFileInfo::exists(iniPath)) {
        ATTEST_WARN("Config file not found, using defaults: {}", iniPath.toStdString());
    } else if (settings_->status() != QSettings::NoError) {
        ATTEST_WARN("Config file could not be parsed, using defaults: {}", iniPath.toStdString());
    } else {
        ATTEST_DEBUG("Config loaded from {}", iniPath.toStdString());
    }
}

Config::Config(const QString& organizationName, const QString& applicationName)
    : settings_(std::make_unique<QSettings>(organizationName, applicationName)) {
    ATTEST_DEBUG("Config initialized for {}/{}",
                 organizationName.toStdString(), applicationName.toStdString());
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    return settings_->value(key, defaultValue);
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

qint64 Config::getInt(const QString& key, qint64 defaultValue) const {
    bool ok = false;
    const qint64 value = getValue(key, defaultValue).toLongLong(&ok);
    if (!ok) {
        ATTEST_WARN("Config key {} is not an integer, using {}", key.toStdString(), defaultValue);
        return defaultValue;
    }
    return value;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    if (!settings_->contains(key)) {
        return defaultValue;
    }
    // INI values without commas come back as a plain string
    QStringList items = settings_->value(key).toStringList();
    QStringList cleaned;
    for (const QString& item : items) {
        for (const QString& part : item.split(',', Qt::SkipEmptyParts)) {
            const QString trimmed = part.trimmed();
            if (!trimmed.isEmpty()) {
                cleaned.append(trimmed);
            }
        }
    }
    return cleaned;
}

SandboxConfig Config::sandboxConfig() const {
    SandboxConfig config;
    config.maxCpuSeconds = getInt("sandbox/maxCpuSeconds", config.maxCpuSeconds);
    config.maxMemoryBytes = getInt("sandbox/maxMemoryMb", config.maxMemoryBytes / (1024 * 1024)) * 1024 * 1024;
    config.maxWallSeconds = getInt("sandbox/maxWallSeconds", config.maxWallSeconds);
    config.maxFileBytes = getInt("sandbox/maxFileSizeMb", config.maxFileBytes / (1024 * 1024)) * 1024 * 1024;
    config.maxProcesses = getInt("sandbox/maxProcesses", config.maxProcesses);
    config.maxOutputBytes = getInt("sandbox/maxOutputBytes", config.maxOutputBytes);
    config.allowedDirs = getStringList("sandbox/allowedDirs", config.allowedDirs);

    const QStringList commands = getStringList("sandbox/allowedCommands", config.sortedCommands());
    config.allowedCommands = QSet<QString>(commands.begin(), commands.end());

    config.projectRoot = getString("sandbox/projectRoot", config.projectRoot);
    config.artifactsDir = getString("sandbox/artifactsDir", config.artifactsDir);
    config.resultsDir = getString("sandbox/resultsDir", config.resultsDir);
    config.evidenceSuffix = getString("sandbox/evidenceSuffix", config.evidenceSuffix);
    return config;
}

PipelineOptions Config::pipelineOptions() const {
    PipelineOptions options;
    options.enrichmentEnabled = getBool("pipeline/enrichmentEnabled", options.enrichmentEnabled);
    options.maxEnrichmentArtifacts = static_cast<int>(
        getInt("pipeline/maxEnrichmentArtifacts", options.maxEnrichmentArtifacts));
    options.maxContextChars = static_cast<int>(
        getInt("pipeline/maxContextChars", options.maxContextChars));
    return options;
}

QString Config::source() const {
    return settings_->fileName();
}

QSettings::Status Config::status() const {
    return settings_->status();
}

} // namespace Attest
