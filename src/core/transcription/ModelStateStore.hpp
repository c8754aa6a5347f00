#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"
#include "ModelTypes.hpp"

namespace Scribe {

/**
 * @brief Durable record of every catalog model's lifecycle state
 *
 * Stored as one JSON document. load() never fails: a missing or unreadable
 * document yields catalog defaults. save() replaces the whole document
 * atomically, so readers see either the previous or the new set.
 */
class ModelStateStore {
public:
    static constexpr int kFormatVersion = 2;
    static const char* const kStatesKey;

    ModelStateStore(const QString& filePath, const QStringList& catalogIds);

    ModelSnapshot load() const;
    Expected<void, ModelError> save(const ModelSnapshot& snapshot);

    ModelSnapshot defaults() const;
    QString filePath() const { return filePath_; }
    const QStringList& catalogIds() const { return catalogIds_; }

    // Parsing is exposed for tests; unknown fields and identifiers are ignored
    ModelSnapshot parse(const QByteArray& document) const;
    QByteArray serialize(const ModelSnapshot& snapshot) const;

private:
    QString filePath_;
    QStringList catalogIds_;
};

} // namespace Scribe
