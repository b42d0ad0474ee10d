#pragma once
#include "config_types.h"
#include <QJsonObject>

class ConfigStore {
public:
    ConfigStore() = default;

    bool load(const QString& path);
    bool save();

    // Fills paths left empty by the file from the given data directory.
    void applyDataDir(const QString& dataDir);

    const QString& filePath() const { return m_filePath; }
    const ServiceConfig& config() const { return m_config; }
    ServiceConfig& config() { return m_config; }

private:
    ServiceConfig m_config;
    QString m_filePath;

    QJsonObject toJson() const;
    void fromJson(const QJsonObject& root);
};
