#pragma once
#include "config/config_types.h"
#include <QString>

class ModelMapper {
public:
    explicit ModelMapper(const ModelMappingConfig& config);

    QString map(const QString& clientModel) const;

private:
    ModelMappingConfig m_config;
};
