#include "model_resolver.h"

ModelResolver::ModelResolver(std::shared_ptr<const ProviderTable> table, UnknownModelPolicy policy)
    : m_table(std::move(table))
    , m_policy(policy)
{
}

Result<ResolvedModel> ModelResolver::resolve(const QString& taggedModel) const
{
    const Provider* best = nullptr;
    for (const Provider& p : m_table->providers()) {
        if (taggedModel.size() <= p.name.size()
            || taggedModel.at(p.name.size()) != QLatin1Char('-')
            || !taggedModel.startsWith(p.name)) {
            continue;
        }
        if (!best || p.name.size() > best->name.size())
            best = &p;
    }

    if (!best)
        return std::unexpected(DomainFailure::unknownProvider(taggedModel));

    ResolvedModel resolved;
    resolved.provider = best;
    resolved.nativeModel = taggedModel.mid(best->name.size() + 1);

    if (resolved.nativeModel.isEmpty())
        return std::unexpected(DomainFailure::unknownModel(best->name, resolved.nativeModel));

    if (m_policy == UnknownModelPolicy::Reject && !m_table->serves(*best, resolved.nativeModel))
        return std::unexpected(DomainFailure::unknownModel(best->name, resolved.nativeModel));

    return resolved;
}
