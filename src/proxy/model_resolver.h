#pragma once
#include "config/provider_table.h"
#include <memory>

struct ResolvedModel {
    const Provider* provider = nullptr;   // points into the immutable table
    QString nativeModel;
};

// Maps "<provider>-<native>" to its provider by exact, case-sensitive prefix.
// When several provider names match, the longest one wins.
class ModelResolver {
public:
    ModelResolver(std::shared_ptr<const ProviderTable> table, UnknownModelPolicy policy);

    Result<ResolvedModel> resolve(const QString& taggedModel) const;

    const ProviderTable& table() const { return *m_table; }
    UnknownModelPolicy policy() const { return m_policy; }

private:
    std::shared_ptr<const ProviderTable> m_table;
    UnknownModelPolicy m_policy;
};
