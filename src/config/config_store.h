#pragma once
#include "config_types.h"
#include <QJsonObject>
#include <QProcessEnvironment>

// Builds the BridgeConfig: defaults, then an optional JSON file, then the
// environment. Keys in the file may be snake_case or camelCase.
class ConfigStore {
public:
    ConfigStore() = default;

    bool load(const QString& path);
    bool loadJson(const QJsonObject& root);
    void applyEnvironment(const QProcessEnvironment& env = QProcessEnvironment::systemEnvironment());

    const BridgeConfig& config() const { return m_config; }
    QString lastError() const { return m_lastError; }
    QString filePath() const { return m_filePath; }

    static QJsonObject toJson(const BridgeConfig& config);

private:
    BridgeConfig m_config;
    QString m_filePath;
    QString m_lastError;
    bool m_middleModelSet = false;

    void clampValues();
};
