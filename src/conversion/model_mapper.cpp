#include "model_mapper.h"

ModelMapper::ModelMapper(const ModelMappingConfig& config)
    : m_config(config)
{
}

QString ModelMapper::map(const QString& clientModel) const
{
    // Tier keywords, checked in this order; an empty tier id counts as unmatched.
    const struct {
        const char* keyword;
        const QString& target;
    } tiers[] = {
        {"haiku",  m_config.smallModel},
        {"sonnet", m_config.middleModel},
        {"opus",   m_config.bigModel},
    };

    for (const auto& tier : tiers) {
        if (clientModel.contains(QLatin1String(tier.keyword), Qt::CaseInsensitive)
            && !tier.target.isEmpty()) {
            return tier.target;
        }
    }

    if (!m_config.fallbackModel.isEmpty())
        return m_config.fallbackModel;
    return clientModel;
}
