#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QStringList>

namespace Scribe {

namespace {
const QString kUrlGroup = QStringLiteral("models/urls");
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeWithFile(const QString& iniFilePath) {
    settings_ = std::make_unique<QSettings>(iniFilePath, QSettings::IniFormat);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized from {}", iniFilePath.toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

void Config::remove(const QString& key) {
    if (settings_) {
        settings_->remove(key);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    const int value = getValue(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

ModelSettings Config::getModelSettings() const {
    ModelSettings settings;
    settings.storageRoot = getString("models/storageRoot", getDefaultStorageRoot());
    settings.progressIntervalMs = qMax(0, getInt("models/progressIntervalMs", settings.progressIntervalMs));
    settings.persistIntervalMs = qMax(0, getInt("models/persistIntervalMs", settings.persistIntervalMs));
    settings.readTimeoutMs = qMax(0, getInt("models/readTimeoutMs", settings.readTimeoutMs));
    settings.userAgent = getString("models/userAgent", settings.userAgent);

    if (settings_) {
        settings_->beginGroup(kUrlGroup);
        const QStringList ids = settings_->childKeys();
        for (const QString& id : ids) {
            settings.urlOverrides.insert(id, settings_->value(id).toString());
        }
        settings_->endGroup();
    }

    return settings;
}

void Config::setModelSettings(const ModelSettings& settings) {
    setValue("models/storageRoot", settings.storageRoot);
    setValue("models/progressIntervalMs", settings.progressIntervalMs);
    setValue("models/persistIntervalMs", settings.persistIntervalMs);
    setValue("models/readTimeoutMs", settings.readTimeoutMs);
    setValue("models/userAgent", settings.userAgent);

    remove(kUrlGroup);
    for (auto it = settings.urlOverrides.cbegin(); it != settings.urlOverrides.cend(); ++it) {
        setValue(kUrlGroup + "/" + it.key(), it.value());
    }
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
}

QString Config::getDefaultStorageRoot() const {
    return getDataPath();
}

QString Config::getLogPath() const {
    return QDir(getDataPath()).filePath("scribe.log");
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QStringList paths = {
        getDataPath(),
        getString("models/storageRoot", getDefaultStorageRoot())
    };

    for (const QString& path : paths) {
        if (path.isEmpty()) {
            continue;
        }
        QDir dir;
        if (!dir.mkpath(path)) {
            SCRIBE_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Scribe
