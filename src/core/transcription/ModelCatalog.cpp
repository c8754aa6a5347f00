#include "ModelCatalog.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>

namespace Scribe {

namespace {

ModelCatalogEntry makeDefaultEntry(const QString& id, const QString& displayName, qint64 approximateMb) {
    ModelCatalogEntry entry;
    entry.id = id;
    entry.displayName = displayName;
    entry.sourceUrl = QUrl(QString("https://huggingface.co/ggerganov/whisper.cpp/resolve/main/ggml-%1.bin").arg(id));
    entry.relativePath = QString("models/%1.bin").arg(id);
    entry.approximateSize = approximateMb * 1024 * 1024;
    return entry;
}

} // namespace

ModelCatalog::ModelCatalog(std::vector<ModelCatalogEntry> entries)
    : entries_(std::move(entries)) {
}

ModelCatalog ModelCatalog::defaultCatalog() {
    return ModelCatalog({
        makeDefaultEntry("tiny", "Tiny", 75),
        makeDefaultEntry("base", "Base", 142),
        makeDefaultEntry("small", "Small", 466),
        makeDefaultEntry("medium", "Medium", 1500),
        makeDefaultEntry("large", "Large", 2900)
    });
}

QStringList ModelCatalog::ids() const {
    QStringList result;
    result.reserve(size());
    for (const auto& entry : entries_) {
        result.append(entry.id);
    }
    return result;
}

bool ModelCatalog::contains(const QString& id) const {
    return find(id).hasValue();
}

Expected<ModelCatalogEntry, ModelError> ModelCatalog::find(const QString& id) const {
    for (const auto& entry : entries_) {
        if (entry.id == id) {
            return entry;
        }
    }
    return makeUnexpected(ModelError::ModelNotFound);
}

int ModelCatalog::applyUrlOverrides(const QHash<QString, QString>& overrides) {
    int changed = 0;
    for (auto it = overrides.cbegin(); it != overrides.cend(); ++it) {
        if (setSourceUrl(it.key(), QUrl(it.value()))) {
            ++changed;
        } else {
            SCRIBE_WARN("Ignoring URL override for unknown model: {}", it.key().toStdString());
        }
    }
    return changed;
}

bool ModelCatalog::setSourceUrl(const QString& id, const QUrl& url) {
    ModelCatalogEntry* entry = findMutable(id);
    if (!entry) {
        return false;
    }
    entry->sourceUrl = url;
    return true;
}

QStringList ModelCatalog::misconfiguredIds() const {
    QStringList result;
    for (const auto& entry : entries_) {
        if (!entry.hasSourceUrl()) {
            result.append(entry.id);
        }
    }
    return result;
}

QString ModelCatalog::absolutePath(const QString& storageRoot, const QString& id) const {
    auto entry = find(id);
    if (entry.hasError()) {
        return QString();
    }
    return QDir::cleanPath(QDir(storageRoot).absoluteFilePath(entry.value().relativePath));
}

ModelCatalogEntry* ModelCatalog::findMutable(const QString& id) {
    for (auto& entry : entries_) {
        if (entry.id == id) {
            return &entry;
        }
    }
    return nullptr;
}

} // namespace Scribe
