#include "local_endpoints.h"
#include <QCryptographicHash>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

LocalEndpoints::LocalEndpoints(std::shared_ptr<const ProviderTable> table,
                               const QString& version,
                               const QDateTime& startedAt)
    : m_table(std::move(table))
    , m_version(version)
    , m_startedAt(startedAt.toUTC())
{
}

QByteArray LocalEndpoints::healthBody() const
{
    return QByteArrayLiteral("Ollama is running");
}

QByteArray LocalEndpoints::versionJson() const
{
    QJsonObject root;
    root[QStringLiteral("version")] = m_version;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray LocalEndpoints::tagsJson() const
{
    const QString modifiedAt = m_startedAt.toString(Qt::ISODate);

    QJsonArray models;
    for (const Provider& provider : m_table->providers()) {
        for (const QString& native : provider.models) {
            const QString tagged = ProviderTable::taggedName(provider.name, native);

            QJsonObject details;
            details[QStringLiteral("format")] = QString();
            details[QStringLiteral("family")] = provider.name;
            details[QStringLiteral("families")] = QJsonArray{provider.name};
            details[QStringLiteral("parameter_size")] = QString();
            details[QStringLiteral("quantization_level")] = QString();

            QJsonObject model;
            model[QStringLiteral("name")] = tagged;
            model[QStringLiteral("model")] = tagged;
            model[QStringLiteral("modified_at")] = modifiedAt;
            model[QStringLiteral("size")] = 0;
            model[QStringLiteral("digest")] = QString::fromLatin1(
                QCryptographicHash::hash(tagged.toUtf8(), QCryptographicHash::Sha256).toHex());
            model[QStringLiteral("details")] = details;
            models.append(model);
        }
    }

    QJsonObject root;
    root[QStringLiteral("models")] = models;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QByteArray LocalEndpoints::modelsJson() const
{
    const qint64 created = m_startedAt.toSecsSinceEpoch();

    QJsonArray data;
    for (const Provider& provider : m_table->providers()) {
        for (const QString& native : provider.models) {
            QJsonObject model;
            model[QStringLiteral("id")] = ProviderTable::taggedName(provider.name, native);
            model[QStringLiteral("object")] = QStringLiteral("model");
            model[QStringLiteral("created")] = created;
            model[QStringLiteral("owned_by")] = provider.name;
            data.append(model);
        }
    }

    QJsonObject root;
    root[QStringLiteral("object")] = QStringLiteral("list");
    root[QStringLiteral("data")] = data;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}
