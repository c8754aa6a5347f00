#include "ModelManager.hpp"
#include "ModelReconciler.hpp"
#include "ModelStateStore.hpp"
#include "core/common/Logger.hpp"
#include "core/common/RateLimiter.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QHash>
#include <QtCore/QMetaObject>
#include <QtCore/QMutex>
#include <QtCore/QMutexLocker>
#include <QtCore/QPointer>
#include <QtNetwork/QNetworkAccessManager>
#include <algorithm>
#include <chrono>

namespace Scribe {

namespace {
const char* const kStateFileName = "model-states.json";
}

struct ModelManager::TransferHandle {
    QPointer<ModelDownloader> downloader;
    CancellationToken token;
    quint64 attemptId = 0;
    bool cancelRequested = false;
    RateLimiter persistLimiter;
};

class ModelManager::ModelManagerPrivate {
public:
    ModelCatalog catalog;
    ModelSettings settings;

    bool initialized = false;
    bool shuttingDown = false;

    std::unique_ptr<ModelStateStore> store;
    std::unique_ptr<QNetworkAccessManager> networkManager;

    // Guarded by mutex; everything else belongs to the owning thread.
    // transfers is only modified on the owning thread, under the mutex.
    ModelSnapshot records;
    QHash<QString, TransferHandle> transfers;
    mutable QMutex mutex;

    quint64 nextAttemptId = 1;
};

ModelManager::ModelManager(ModelCatalog catalog, ModelSettings settings, QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ModelManagerPrivate>())
{
    qRegisterMetaType<Scribe::ModelRecord>("Scribe::ModelRecord");
    qRegisterMetaType<Scribe::TransferOutcome>("Scribe::TransferOutcome");

    d->catalog = std::move(catalog);
    d->settings = std::move(settings);
    d->networkManager = std::make_unique<QNetworkAccessManager>();

    for (const QString& id : d->catalog.ids()) {
        d->records.insert(id, ModelRecord::notPresent());
    }
}

ModelManager::~ModelManager() {
    shutdown();

    // Downloaders still reference the network manager owned by d
    for (auto it = d->transfers.begin(); it != d->transfers.end(); ++it) {
        delete it->downloader.data();
    }
    QMutexLocker locker(&d->mutex);
    d->transfers.clear();
}

Expected<void, ModelError> ModelManager::initialize() {
    if (d->initialized) {
        return Expected<void, ModelError>();
    }

    if (d->settings.storageRoot.isEmpty()) {
        SCRIBE_ERROR("ModelManager: no storage root configured");
        return makeUnexpected(ModelError::InvalidConfiguration);
    }

    if (!QDir().mkpath(d->settings.storageRoot)) {
        SCRIBE_ERROR("ModelManager: cannot create storage root {}", d->settings.storageRoot.toStdString());
        return makeUnexpected(ModelError::DiskError);
    }

    const int overridden = d->catalog.applyUrlOverrides(d->settings.urlOverrides);
    if (overridden > 0) {
        SCRIBE_INFO("ModelManager: {} source URL override(s) applied", overridden);
    }
    for (const QString& id : d->catalog.misconfiguredIds()) {
        SCRIBE_WARN("ModelManager: model {} has no usable source URL, downloads will fail", id.toStdString());
    }

    d->store = std::make_unique<ModelStateStore>(stateFilePath(), d->catalog.ids());

    ModelReconciler reconciler(d->catalog, d->settings.storageRoot);
    const ReconcileResult reconciled = reconciler.run(*d->store);

    {
        QMutexLocker locker(&d->mutex);
        d->records = reconciled.snapshot;
    }
    d->initialized = true;

    SCRIBE_INFO("ModelManager initialized with storage root: {}", d->settings.storageRoot.toStdString());

    const ModelSnapshot published = snapshot();
    for (auto it = published.cbegin(); it != published.cend(); ++it) {
        emit modelStateChanged(it.key(), it.value());
    }
    emit initialized();

    return Expected<void, ModelError>();
}

void ModelManager::shutdown() {
    if (d->shuttingDown) {
        return;
    }
    d->shuttingDown = true;

    const QStringList active = d->transfers.keys();
    for (const QString& id : active) {
        requestCancel(id);
    }

    if (!active.isEmpty()) {
        SCRIBE_INFO("ModelManager: cancelled {} transfer(s) on shutdown", active.size());
    }
}

bool ModelManager::isInitialized() const {
    return d->initialized;
}

bool ModelManager::acceptsIntent(const QString& modelId, const char* intent) const {
    if (!d->initialized) {
        SCRIBE_WARN("ModelManager: {} for {} ignored, manager not initialized", intent, modelId.toStdString());
        return false;
    }
    if (!d->catalog.contains(modelId)) {
        SCRIBE_WARN("ModelManager: {} for unknown model '{}' ignored", intent, modelId.toStdString());
        return false;
    }
    return true;
}

void ModelManager::requestDownload(const QString& modelId) {
    if (!acceptsIntent(modelId, "download") || d->shuttingDown) {
        return;
    }

    const ModelRecord current = d->records.value(modelId);
    if (current.state != LifecycleState::NotPresent || d->transfers.contains(modelId)) {
        SCRIBE_DEBUG("ModelManager: download of {} ignored in state {}",
                     modelId.toStdString(), lifecycleStateToString(current.state).toStdString());
        return;
    }

    auto entry = d->catalog.find(modelId);
    if (entry.hasError()) {
        return;
    }

    TransferHandle handle;
    handle.attemptId = d->nextAttemptId++;
    handle.persistLimiter.setMinimumInterval(std::chrono::milliseconds(d->settings.persistIntervalMs));
    handle.persistLimiter.tryAcquire();
    handle.downloader = new ModelDownloader(d->networkManager.get(), entry.value(),
                                            destinationPath(modelId), handle.token,
                                            downloaderOptions(), this);

    const quint64 attemptId = handle.attemptId;
    connect(handle.downloader, &ModelDownloader::progressChanged, this,
            [this, attemptId](const QString& id, int percent) { handleProgress(id, attemptId, percent); });
    connect(handle.downloader, &ModelDownloader::finished, this,
            [this, attemptId](const QString& id, TransferOutcome outcome) { handleFinished(id, attemptId, outcome); });

    ModelDownloader* downloader = handle.downloader;
    {
        QMutexLocker locker(&d->mutex);
        d->transfers.insert(modelId, handle);
    }

    SCRIBE_INFO("ModelManager: download of {} started (attempt {})", modelId.toStdString(), attemptId);
    transition(modelId, ModelRecord::downloading(0));
    downloader->start();
}

void ModelManager::requestCancel(const QString& modelId) {
    if (!acceptsIntent(modelId, "cancel")) {
        return;
    }

    auto it = d->transfers.find(modelId);
    const ModelRecord current = d->records.value(modelId);
    if (current.state != LifecycleState::Downloading || it == d->transfers.end() || it->cancelRequested) {
        SCRIBE_DEBUG("ModelManager: cancel of {} ignored in state {}",
                     modelId.toStdString(), lifecycleStateToString(current.state).toStdString());
        return;
    }

    it->cancelRequested = true;
    it->token.requestCancellation();
    if (it->downloader) {
        QMetaObject::invokeMethod(it->downloader.data(), "checkCancellation", Qt::QueuedConnection);
    }

    SCRIBE_INFO("ModelManager: download of {} cancelled", modelId.toStdString());
    removePartialFile(modelId);
    transition(modelId, ModelRecord::notPresent());
}

void ModelManager::requestDelete(const QString& modelId) {
    if (!acceptsIntent(modelId, "delete")) {
        return;
    }

    const ModelRecord current = d->records.value(modelId);
    if (current.state != LifecycleState::Present) {
        SCRIBE_DEBUG("ModelManager: delete of {} ignored in state {}",
                     modelId.toStdString(), lifecycleStateToString(current.state).toStdString());
        return;
    }

    SCRIBE_INFO("ModelManager: deleting model {}", modelId.toStdString());
    removePartialFile(modelId);
    transition(modelId, ModelRecord::notPresent());
}

void ModelManager::handleProgress(const QString& modelId, quint64 attemptId, int percent) {
    auto it = d->transfers.find(modelId);
    if (it == d->transfers.end() || it->attemptId != attemptId || it->cancelRequested) {
        return;
    }

    ModelRecord updated = d->records.value(modelId);
    if (updated.state != LifecycleState::Downloading || percent <= updated.progress) {
        return;
    }
    updated.progress = std::min(percent, 100);

    {
        QMutexLocker locker(&d->mutex);
        d->records.insert(modelId, updated);
    }

    if (it->persistLimiter.tryAcquire()) {
        persist();
    } else {
        SCRIBE_TRACE("ModelManager: progress {}% of {} not persisted yet", updated.progress, modelId.toStdString());
    }

    emit modelStateChanged(modelId, updated);
}

void ModelManager::handleFinished(const QString& modelId, quint64 attemptId, TransferOutcome outcome) {
    auto it = d->transfers.find(modelId);
    if (it == d->transfers.end() || it->attemptId != attemptId) {
        return;
    }

    const TransferHandle handle = it.value();
    {
        QMutexLocker locker(&d->mutex);
        d->transfers.erase(it);
    }
    if (handle.downloader) {
        handle.downloader->deleteLater();
    }

    if (handle.cancelRequested) {
        // State already moved to NotPresent when the cancel was accepted
        SCRIBE_DEBUG("ModelManager: {} attempt {} ended as {} after cancel",
                     modelId.toStdString(), attemptId, transferOutcomeToString(outcome).toStdString());
        removePartialFile(modelId);
        return;
    }

    switch (outcome) {
        case TransferOutcome::Completed:
            SCRIBE_INFO("ModelManager: model {} downloaded", modelId.toStdString());
            transition(modelId, ModelRecord::present());
            break;

        case TransferOutcome::Cancelled:
            removePartialFile(modelId);
            transition(modelId, ModelRecord::notPresent());
            break;

        case TransferOutcome::Failed: {
            const DownloadError error = handle.downloader ? handle.downloader->error() : DownloadError::UnknownError;
            const QString detail = handle.downloader ? handle.downloader->errorString() : QString();
            SCRIBE_ERROR("ModelManager: download of {} failed: {} ({})", modelId.toStdString(),
                         downloadErrorToString(error).toStdString(), detail.toStdString());

            removePartialFile(modelId);
            transition(modelId, ModelRecord::notPresent());

            QString displayName = modelId;
            auto entry = d->catalog.find(modelId);
            if (entry.hasValue()) {
                displayName = entry.value().displayName;
            }
            emit transferFailed(modelId, userMessageFor(error, displayName));
            break;
        }
    }
}

void ModelManager::transition(const QString& modelId, const ModelRecord& record) {
    {
        QMutexLocker locker(&d->mutex);
        d->records.insert(modelId, record);
    }
    persist();
    emit modelStateChanged(modelId, record);
}

void ModelManager::persist() {
    if (!d->store) {
        return;
    }
    auto result = d->store->save(snapshot());
    if (result.hasError()) {
        SCRIBE_ERROR("ModelManager: cannot persist model states: {}",
                     modelErrorToString(result.error()).toStdString());
    }
}

void ModelManager::removePartialFile(const QString& modelId) {
    const QString path = destinationPath(modelId);
    if (path.isEmpty() || !QFile::exists(path)) {
        return;
    }
    QFile file(path);
    if (!file.remove()) {
        SCRIBE_WARN("ModelManager: cannot remove {}: {}", path.toStdString(), file.errorString().toStdString());
    }
}

ModelDownloader::Options ModelManager::downloaderOptions() const {
    ModelDownloader::Options options;
    options.progressIntervalMs = d->settings.progressIntervalMs;
    options.readTimeoutMs = d->settings.readTimeoutMs;
    options.userAgent = d->settings.userAgent;
    return options;
}

ModelSnapshot ModelManager::snapshot() const {
    QMutexLocker locker(&d->mutex);
    return d->records;
}

Expected<ModelRecord, ModelError> ModelManager::record(const QString& modelId) const {
    QMutexLocker locker(&d->mutex);
    auto it = d->records.constFind(modelId);
    if (it == d->records.constEnd()) {
        return makeUnexpected(ModelError::ModelNotFound);
    }
    return it.value();
}

Expected<QString, ModelError> ModelManager::resolveModelPath(const QString& modelId) const {
    auto current = record(modelId);
    if (current.hasError()) {
        return makeUnexpected(current.error());
    }
    if (current.value().state != LifecycleState::Present) {
        return makeUnexpected(ModelError::ModelNotPresent);
    }
    return destinationPath(modelId);
}

QStringList ModelManager::presentModels() const {
    QStringList present;
    QMutexLocker locker(&d->mutex);
    for (const QString& id : d->catalog.ids()) {
        if (d->records.value(id).state == LifecycleState::Present) {
            present.append(id);
        }
    }
    return present;
}

bool ModelManager::isTransferActive(const QString& modelId) const {
    QMutexLocker locker(&d->mutex);
    return d->transfers.contains(modelId);
}

int ModelManager::activeTransferCount() const {
    QMutexLocker locker(&d->mutex);
    return static_cast<int>(d->transfers.size());
}

const ModelCatalog& ModelManager::catalog() const {
    return d->catalog;
}

QString ModelManager::storageRoot() const {
    return d->settings.storageRoot;
}

QString ModelManager::stateFilePath() const {
    return QDir(d->settings.storageRoot).filePath(kStateFileName);
}

QString ModelManager::destinationPath(const QString& modelId) const {
    return d->catalog.absolutePath(d->settings.storageRoot, modelId);
}

QNetworkAccessManager* ModelManager::networkAccessManager() const {
    return d->networkManager.get();
}

} // namespace Scribe
