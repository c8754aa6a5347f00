#include "ModelStateStore.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QSaveFile>
#include <algorithm>

namespace Scribe {

const char* const ModelStateStore::kStatesKey = "modelStates";

ModelStateStore::ModelStateStore(const QString& filePath, const QStringList& catalogIds)
    : filePath_(filePath)
    , catalogIds_(catalogIds) {
}

ModelSnapshot ModelStateStore::defaults() const {
    ModelSnapshot snapshot;
    for (const QString& id : catalogIds_) {
        snapshot.insert(id, ModelRecord::notPresent());
    }
    return snapshot;
}

ModelSnapshot ModelStateStore::load() const {
    QFile file(filePath_);
    if (!file.exists()) {
        SCRIBE_DEBUG("No model state file at {}, using defaults", filePath_.toStdString());
        return defaults();
    }

    if (!file.open(QIODevice::ReadOnly)) {
        SCRIBE_WARN("Cannot read model state file {}: {}",
                    filePath_.toStdString(), file.errorString().toStdString());
        return defaults();
    }

    return parse(file.readAll());
}

ModelSnapshot ModelStateStore::parse(const QByteArray& document) const {
    ModelSnapshot snapshot = defaults();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(document, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        SCRIBE_WARN("Model state file {} is corrupt ({}), using defaults",
                    filePath_.toStdString(), parseError.errorString().toStdString());
        return snapshot;
    }

    const QJsonObject root = doc.object();
    // Documents written before versioning keep the records at the top level
    const QJsonObject states = root.contains(kStatesKey) ? root.value(kStatesKey).toObject() : root;

    for (const QString& id : catalogIds_) {
        const QJsonValue value = states.value(id);
        if (!value.isObject()) {
            continue;
        }

        const QJsonObject recordObj = value.toObject();
        const auto state = lifecycleStateFromString(recordObj.value("state").toString());
        if (!state) {
            SCRIBE_WARN("Model {} has unknown stored state, treating as not downloaded", id.toStdString());
            continue;
        }

        ModelRecord record;
        record.state = *state;
        const QJsonValue progress = recordObj.value("progress");
        if (progress.isDouble()) {
            record.progress = static_cast<int>(std::clamp(progress.toDouble(), 0.0, 100.0));
        }
        snapshot.insert(id, record);
    }

    return snapshot;
}

QByteArray ModelStateStore::serialize(const ModelSnapshot& snapshot) const {
    QJsonObject states;
    for (const QString& id : catalogIds_) {
        const ModelRecord record = snapshot.value(id, ModelRecord::notPresent());
        QJsonObject recordObj;
        recordObj["state"] = lifecycleStateToString(record.state);
        recordObj["progress"] = std::clamp(record.progress, 0, 100);
        states[id] = recordObj;
    }

    QJsonObject root;
    root["version"] = kFormatVersion;
    root[kStatesKey] = states;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}

Expected<void, ModelError> ModelStateStore::save(const ModelSnapshot& snapshot) {
    const QString directory = QFileInfo(filePath_).absolutePath();
    if (!QDir().mkpath(directory)) {
        SCRIBE_ERROR("Cannot create directory for model states: {}", directory.toStdString());
        return makeUnexpected(ModelError::PersistenceFailed);
    }

    QSaveFile file(filePath_);
    if (!file.open(QIODevice::WriteOnly)) {
        SCRIBE_ERROR("Cannot open model state file {}: {}",
                     filePath_.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ModelError::PersistenceFailed);
    }

    const QByteArray data = serialize(snapshot);
    if (file.write(data) != data.size()) {
        SCRIBE_ERROR("Short write to model state file {}: {}",
                     filePath_.toStdString(), file.errorString().toStdString());
        file.cancelWriting();
        return makeUnexpected(ModelError::PersistenceFailed);
    }

    if (!file.commit()) {
        SCRIBE_ERROR("Cannot commit model state file {}: {}",
                     filePath_.toStdString(), file.errorString().toStdString());
        return makeUnexpected(ModelError::PersistenceFailed);
    }

    return Expected<void, ModelError>();
}

} // namespace Scribe
