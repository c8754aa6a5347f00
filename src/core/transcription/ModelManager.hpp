#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <memory>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "ModelCatalog.hpp"
#include "ModelDownloader.hpp"
#include "ModelTypes.hpp"

class QNetworkAccessManager;

namespace Scribe {

/**
 * @brief Lifecycle state machine for the catalog's model files
 *
 * Receives download, cancel and delete intents, checks them against the
 * current record, drives one ModelDownloader per active identifier and
 * persists every transition through ModelStateStore. Intents are
 * fire-and-forget; illegal ones are dropped. The outcome of each intent is
 * observable through modelStateChanged().
 *
 * Transitions happen on the thread that owns the manager. The read accessors
 * (snapshot, record, resolveModelPath, presentModels, isTransferActive and
 * activeTransferCount) are guarded and may be called from any thread.
 */
class ModelManager : public QObject {
    Q_OBJECT

public:
    ModelManager(ModelCatalog catalog, ModelSettings settings, QObject* parent = nullptr);
    ~ModelManager() override;

    // Creates the storage root, reconciles persisted state and publishes it
    Expected<void, ModelError> initialize();
    void shutdown();
    bool isInitialized() const;

    // Intents
    void requestDownload(const QString& modelId);
    void requestCancel(const QString& modelId);
    void requestDelete(const QString& modelId);

    // Snapshot reads
    ModelSnapshot snapshot() const;
    Expected<ModelRecord, ModelError> record(const QString& modelId) const;
    Expected<QString, ModelError> resolveModelPath(const QString& modelId) const;
    QStringList presentModels() const;

    bool isTransferActive(const QString& modelId) const;
    int activeTransferCount() const;

    const ModelCatalog& catalog() const;
    QString storageRoot() const;
    QString stateFilePath() const;
    QString destinationPath(const QString& modelId) const;

    QNetworkAccessManager* networkAccessManager() const;

signals:
    void initialized();
    void modelStateChanged(const QString& modelId, const Scribe::ModelRecord& record);
    void transferFailed(const QString& modelId, const QString& message);

private:
    struct TransferHandle;
    class ModelManagerPrivate;
    std::unique_ptr<ModelManagerPrivate> d;

    bool acceptsIntent(const QString& modelId, const char* intent) const;

    void handleProgress(const QString& modelId, quint64 attemptId, int percent);
    void handleFinished(const QString& modelId, quint64 attemptId, TransferOutcome outcome);

    void transition(const QString& modelId, const ModelRecord& record);
    void persist();
    void removePartialFile(const QString& modelId);

    ModelDownloader::Options downloaderOptions() const;
};

} // namespace Scribe
