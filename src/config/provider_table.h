#pragma once
#include "config_types.h"
#include "core/result.h"
#include <QHash>
#include <QSet>
#include <memory>

// Immutable provider registry. Built once before the listener binds and
// shared read-only by every connection afterwards.
class ProviderTable {
public:
    static Result<std::shared_ptr<const ProviderTable>> build(const QList<Provider>& providers);

    const QList<Provider>& providers() const { return m_providers; }
    const Provider* find(const QString& name) const;
    int size() const { return m_providers.size(); }

    // True if the provider declares no model list or lists this exact name.
    bool serves(const Provider& provider, const QString& nativeModel) const;

    static QString taggedName(const QString& providerName, const QString& nativeModel);

private:
    explicit ProviderTable(const QList<Provider>& providers);

    QList<Provider> m_providers;
    QHash<QString, int> m_index;
    QList<QSet<QString>> m_modelSets;
};
