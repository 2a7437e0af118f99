#pragma once
#include "config_types.h"
#include <QByteArray>
#include <QString>
#include <QStringList>

class ConfigStore {
public:
    ConfigStore() = default;

    // Reads and validates the file. On failure errors() lists every violation.
    bool load(const QString& path);
    bool loadFromJson(const QByteArray& json);

    const QStringList& errors() const { return m_errors; }
    const QStringList& warnings() const { return m_warnings; }
    const QString& filePath() const { return m_filePath; }

    ProxyConfig proxyConfig() const { return m_config; }
    RuntimeOptions runtimeConfig() const { return m_config.runtime; }

    static QStringList validate(const ProxyConfig& config);
    static QString defaultConfigPath();
    static QByteArray exampleConfig();

private:
    ProxyConfig m_config;
    QString m_filePath;
    QStringList m_errors;
    QStringList m_warnings;
};
