#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>

#include "ModelCatalog.hpp"
#include "ModelStateStore.hpp"
#include "ModelTypes.hpp"

namespace Scribe {

struct ReconcileResult {
    ModelSnapshot snapshot;
    QStringList repairedIds;
    bool persisted = false;

    bool changed() const { return !repairedIds.isEmpty(); }
};

/**
 * @brief Startup repair of persisted model states against the disk
 *
 * A record claiming "downloaded" must have a non-empty file; a record left
 * "downloading" by a previous process is always reset. Progress is pinned to
 * 0 or 100 for settled states. Running it twice in a row changes nothing.
 */
class ModelReconciler {
public:
    ModelReconciler(const ModelCatalog& catalog, const QString& storageRoot);

    // Repairs in place, returns the identifiers that changed
    QStringList reconcile(ModelSnapshot& snapshot) const;

    // load, reconcile, and save once if anything changed
    ReconcileResult run(ModelStateStore& store) const;

    bool isFilePresent(const QString& modelId) const;

private:
    const ModelCatalog& catalog_;
    QString storageRoot_;
};

} // namespace Scribe
