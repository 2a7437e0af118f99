#include "provider_table.h"

QString apiTypeName(ApiType type)
{
    switch (type) {
    case ApiType::Ollama: return QStringLiteral("Ollama");
    case ApiType::OpenAI: return QStringLiteral("OpenAI");
    }
    return QStringLiteral("Ollama");
}

std::optional<ApiType> parseApiType(const QString& text)
{
    const QString t = text.trimmed().toLower();
    if (t == QStringLiteral("ollama"))
        return ApiType::Ollama;
    if (t == QStringLiteral("openai"))
        return ApiType::OpenAI;
    return std::nullopt;
}

ProviderTable::ProviderTable(const QList<Provider>& providers)
    : m_providers(providers)
{
    for (int i = 0; i < m_providers.size(); ++i) {
        m_index.insert(m_providers[i].name, i);
        m_modelSets.append(QSet<QString>(m_providers[i].models.cbegin(),
                                         m_providers[i].models.cend()));
    }
}

Result<std::shared_ptr<const ProviderTable>> ProviderTable::build(const QList<Provider>& providers)
{
    if (providers.isEmpty()) {
        return std::unexpected(DomainFailure::configurationInvalid(
            QStringLiteral("provider table is empty")));
    }

    QSet<QString> names;
    for (const Provider& p : providers) {
        if (p.name.isEmpty()) {
            return std::unexpected(DomainFailure::configurationInvalid(
                QStringLiteral("provider name must not be empty")));
        }
        if (names.contains(p.name)) {
            return std::unexpected(DomainFailure::configurationInvalid(
                QStringLiteral("duplicate provider name '%1'").arg(p.name)));
        }
        names.insert(p.name);
    }

    return std::shared_ptr<const ProviderTable>(new ProviderTable(providers));
}

const Provider* ProviderTable::find(const QString& name) const
{
    auto it = m_index.constFind(name);
    if (it == m_index.constEnd())
        return nullptr;
    return &m_providers[it.value()];
}

bool ProviderTable::serves(const Provider& provider, const QString& nativeModel) const
{
    auto it = m_index.constFind(provider.name);
    if (it == m_index.constEnd())
        return false;
    const QSet<QString>& models = m_modelSets[it.value()];
    return models.isEmpty() || models.contains(nativeModel);
}

QString ProviderTable::taggedName(const QString& providerName, const QString& nativeModel)
{
    return providerName + QLatin1Char('-') + nativeModel;
}
