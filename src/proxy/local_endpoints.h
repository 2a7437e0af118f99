#pragma once
#include "config/provider_table.h"
#include <QDateTime>
#include <memory>

// Responses the proxy answers itself instead of relaying.
class LocalEndpoints {
public:
    LocalEndpoints(std::shared_ptr<const ProviderTable> table,
                   const QString& version,
                   const QDateTime& startedAt = QDateTime::currentDateTimeUtc());

    QByteArray healthBody() const;
    QByteArray versionJson() const;
    QByteArray tagsJson() const;      // Ollama /api/tags
    QByteArray modelsJson() const;    // OpenAI /v1/models

private:
    std::shared_ptr<const ProviderTable> m_table;
    QString m_version;
    QDateTime m_startedAt;
};
