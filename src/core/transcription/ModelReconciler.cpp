#include "ModelReconciler.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>

namespace Scribe {

ModelReconciler::ModelReconciler(const ModelCatalog& catalog, const QString& storageRoot)
    : catalog_(catalog)
    , storageRoot_(storageRoot) {
}

bool ModelReconciler::isFilePresent(const QString& modelId) const {
    const QString path = catalog_.absolutePath(storageRoot_, modelId);
    if (path.isEmpty()) {
        return false;
    }
    const QFileInfo info(path);
    return info.isFile() && info.size() > 0;
}

QStringList ModelReconciler::reconcile(ModelSnapshot& snapshot) const {
    QStringList repaired;

    for (const QString& id : catalog_.ids()) {
        const ModelRecord before = snapshot.value(id, ModelRecord::notPresent());
        ModelRecord after = before;

        switch (before.state) {
            case LifecycleState::Downloading:
                SCRIBE_INFO("Resetting interrupted download of model {}", id.toStdString());
                after = ModelRecord::notPresent();
                break;
            case LifecycleState::Present:
                if (!isFilePresent(id)) {
                    SCRIBE_WARN("Model {} is marked downloaded but its file is missing", id.toStdString());
                    after = ModelRecord::notPresent();
                } else {
                    after.progress = 100;
                }
                break;
            case LifecycleState::NotPresent:
                after.progress = 0;
                break;
        }

        if (after != before || !snapshot.contains(id)) {
            snapshot.insert(id, after);
            repaired.append(id);
        }
    }

    return repaired;
}

ReconcileResult ModelReconciler::run(ModelStateStore& store) const {
    ReconcileResult result;
    result.snapshot = store.load();
    result.repairedIds = reconcile(result.snapshot);

    if (result.changed()) {
        auto saveResult = store.save(result.snapshot);
        if (saveResult.hasError()) {
            SCRIBE_ERROR("Failed to persist reconciled model states: {}",
                         modelErrorToString(saveResult.error()).toStdString());
        } else {
            result.persisted = true;
        }
        SCRIBE_INFO("Reconciled {} model record(s)", result.repairedIds.size());
    }

    return result;
}

} // namespace Scribe
