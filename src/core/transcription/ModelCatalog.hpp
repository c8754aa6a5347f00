#pragma once

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>
#include <vector>

#include "core/common/Expected.hpp"
#include "ModelTypes.hpp"

namespace Scribe {

struct ModelCatalogEntry {
    QString id;
    QString displayName;
    QUrl sourceUrl;
    QString relativePath;       // below the storage root
    qint64 approximateSize = 0; // bytes, informational

    bool hasSourceUrl() const {
        return sourceUrl.isValid() && !sourceUrl.isRelative();
    }
};

/**
 * @brief The closed set of Whisper models the application knows about
 *
 * Identifiers are fixed at build time. Configuration may redirect the source
 * URL of a known identifier but can never add one.
 */
class ModelCatalog {
public:
    ModelCatalog() = default;
    explicit ModelCatalog(std::vector<ModelCatalogEntry> entries);

    // tiny, base, small, medium, large
    static ModelCatalog defaultCatalog();

    const std::vector<ModelCatalogEntry>& entries() const { return entries_; }
    QStringList ids() const;
    int size() const { return static_cast<int>(entries_.size()); }
    bool contains(const QString& id) const;

    Expected<ModelCatalogEntry, ModelError> find(const QString& id) const;

    // Unknown identifiers are ignored; returns how many entries changed
    int applyUrlOverrides(const QHash<QString, QString>& overrides);
    bool setSourceUrl(const QString& id, const QUrl& url);

    // Entries whose downloads can only fail
    QStringList misconfiguredIds() const;

    QString absolutePath(const QString& storageRoot, const QString& id) const;

private:
    std::vector<ModelCatalogEntry> entries_;

    ModelCatalogEntry* findMutable(const QString& id);
};

} // namespace Scribe
