#pragma once

#include <QtCore/QSettings>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <memory>

#include "core/security/SandboxTypes.hpp"
#include "core/validation/ValidationPipeline.hpp"

namespace Attest {

/**
 * @brief INI-backed settings reader
 *
 * Keys live under the "sandbox/" and "pipeline/" groups; any key that is
 * missing keeps the SandboxConfig / PipelineOptions default. The resulting
 * values are plain copies, so the Config object can be dropped once they
 * have been read.
 */
class Config {
public:
    // Reads settings from an INI file
    explicit Config(const QString& iniPath);
    // Reads the platform settings store for organization/application
    Config(const QString& organizationName, const QString& applicationName);

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    qint64 getInt(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;

    SandboxConfig sandboxConfig() const;
    PipelineOptions pipelineOptions() const;

    QString source() const;
    QSettings::Status status() const;

private:
    std::unique_ptr<QSettings> settings_;
};

} // namespace Attest
