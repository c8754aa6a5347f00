#pragma once

#include <QtCore/QHash>
#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace Scribe {

struct ModelSettings {
    QString storageRoot;
    int progressIntervalMs = 30;
    int persistIntervalMs = 1000;
    int readTimeoutMs = 30000;
    QString userAgent = "ScribeDesktop/1.0";
    QHash<QString, QString> urlOverrides;   // model id -> source URL
};

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Scribe",
                   const QString& applicationName = "ScribeDesktop");

    // Settings backed by an INI file instead of the platform store
    void initializeWithFile(const QString& iniFilePath);

    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    ModelSettings getModelSettings() const;
    void setModelSettings(const ModelSettings& settings);

    QString getDataPath() const;
    QString getDefaultStorageRoot() const;
    QString getLogPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

} // namespace Scribe
