#include "ModelDownloader.hpp"
#include "core/common/Logger.hpp"
#include "core/common/RateLimiter.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QPointer>
#include <QtNetwork/QNetworkAccessManager>
#include <QtNetwork/QNetworkRequest>
#include <algorithm>

namespace Scribe {

namespace {
constexpr qint64 kReadChunkSize = 64 * 1024;
}

struct ModelDownloader::ModelDownloaderPrivate {
    QNetworkAccessManager* networkManager = nullptr;
    ModelCatalogEntry entry;
    QString destinationPath;
    CancellationToken token;
    Options options;

    QPointer<QNetworkReply> reply;
    QFile file;
    RateLimiter progressLimiter;

    bool started = false;
    bool finished = false;
    bool responseValidated = false;

    qint64 bytesReceived = 0;
    qint64 bytesTotal = 0;
    int percent = 0;
    int reportedPercent = -1;

    TransferOutcome outcome = TransferOutcome::Failed;
    DownloadError error = DownloadError::UnknownError;
    QString errorString;
};

ModelDownloader::ModelDownloader(QNetworkAccessManager* networkManager,
                                 const ModelCatalogEntry& entry,
                                 const QString& destinationPath,
                                 const CancellationToken& token,
                                 const Options& options,
                                 QObject* parent)
    : QObject(parent)
    , d(std::make_unique<ModelDownloaderPrivate>()) {
    d->networkManager = networkManager;
    d->entry = entry;
    d->destinationPath = destinationPath;
    d->token = token;
    d->options = options;
    d->progressLimiter.setMinimumInterval(std::chrono::milliseconds(std::max(0, options.progressIntervalMs)));
}

ModelDownloader::~ModelDownloader() {
    releaseReply(true);
    if (d->file.isOpen()) {
        d->file.close();
    }
}

void ModelDownloader::start() {
    if (d->started) {
        SCRIBE_WARN("ModelDownloader: attempt for {} already started", d->entry.id.toStdString());
        return;
    }
    d->started = true;

    if (!d->networkManager) {
        finishLater(TransferOutcome::Failed, DownloadError::UnknownError, "No network access manager");
        return;
    }

    if (!d->entry.hasSourceUrl()) {
        finishLater(TransferOutcome::Failed, DownloadError::InvalidUrl,
                    QString("Model %1 has no usable source URL").arg(d->entry.id));
        return;
    }

    auto prepared = prepareDestination();
    if (prepared.hasError()) {
        finishLater(TransferOutcome::Failed, prepared.error(), d->errorString);
        return;
    }

    if (d->token.isCancellationRequested()) {
        finishLater(TransferOutcome::Cancelled, DownloadError::CancellationRequested, "Cancelled before start");
        return;
    }

    QNetworkRequest request(d->entry.sourceUrl);
    request.setHeader(QNetworkRequest::UserAgentHeader, d->options.userAgent);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute,
                         QNetworkRequest::NoLessSafeRedirectPolicy);
    if (d->options.readTimeoutMs > 0) {
        request.setTransferTimeout(d->options.readTimeoutMs);
    }

    SCRIBE_INFO("ModelDownloader: fetching {} from {}",
                d->entry.id.toStdString(), d->entry.sourceUrl.toString().toStdString());

    d->reply = d->networkManager->get(request);
    connect(d->reply, &QNetworkReply::readyRead, this, &ModelDownloader::onReadyRead);
    connect(d->reply, &QNetworkReply::finished, this, &ModelDownloader::onReplyFinished);
}

Expected<void, DownloadError> ModelDownloader::prepareDestination() {
    const QString directory = QFileInfo(d->destinationPath).absolutePath();
    if (!QDir().mkpath(directory)) {
        d->errorString = QString("Cannot create directory %1").arg(directory);
        return makeUnexpected(DownloadError::FileSystemError);
    }
    d->file.setFileName(d->destinationPath);
    return Expected<void, DownloadError>();
}

QString ModelDownloader::modelId() const {
    return d->entry.id;
}

QString ModelDownloader::destinationPath() const {
    return d->destinationPath;
}

bool ModelDownloader::isRunning() const {
    return d->started && !d->finished;
}

bool ModelDownloader::isFinished() const {
    return d->finished;
}

qint64 ModelDownloader::bytesReceived() const {
    return d->bytesReceived;
}

qint64 ModelDownloader::bytesTotal() const {
    return d->bytesTotal;
}

int ModelDownloader::percent() const {
    return d->percent;
}

TransferOutcome ModelDownloader::outcome() const {
    return d->outcome;
}

DownloadError ModelDownloader::error() const {
    return d->error;
}

QString ModelDownloader::errorString() const {
    return d->errorString;
}

void ModelDownloader::checkCancellation() {
    if (isRunning()) {
        observeCancellation();
    }
}

bool ModelDownloader::observeCancellation() {
    if (!d->token.isCancellationRequested()) {
        return false;
    }
    SCRIBE_INFO("ModelDownloader: {} cancelled after {} bytes",
                d->entry.id.toStdString(), d->bytesReceived);
    finish(TransferOutcome::Cancelled, DownloadError::CancellationRequested, "Cancelled");
    return true;
}

Expected<void, DownloadError> ModelDownloader::validateResponse() {
    if (d->responseValidated) {
        return Expected<void, DownloadError>();
    }

    const QVariant statusAttribute = d->reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (statusAttribute.isValid()) {
        const int status = statusAttribute.toInt();
        if (status < 200 || status >= 300) {
            d->errorString = QString("HTTP status %1").arg(status);
            return makeUnexpected(DownloadError::ServerError);
        }
    }

    const QVariant length = d->reply->header(QNetworkRequest::ContentLengthHeader);
    d->bytesTotal = length.isValid() ? std::max<qint64>(0, length.toLongLong()) : 0;

    if (!d->file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        d->errorString = QString("Cannot open %1: %2").arg(d->destinationPath, d->file.errorString());
        return makeUnexpected(DownloadError::FileSystemError);
    }

    SCRIBE_DEBUG("ModelDownloader: {} response accepted, {} bytes declared",
                 d->entry.id.toStdString(), d->bytesTotal);
    d->responseValidated = true;
    return Expected<void, DownloadError>();
}

Expected<void, DownloadError> ModelDownloader::drainToFile() {
    while (d->reply && d->reply->bytesAvailable() > 0) {
        const QByteArray chunk = d->reply->read(kReadChunkSize);
        if (chunk.isEmpty()) {
            break;
        }
        if (d->file.write(chunk) != chunk.size()) {
            d->errorString = QString("Write to %1 failed: %2").arg(d->destinationPath, d->file.errorString());
            return makeUnexpected(DownloadError::FileSystemError);
        }
        d->bytesReceived += chunk.size();
    }
    return Expected<void, DownloadError>();
}

void ModelDownloader::updateProgress() {
    if (d->bytesTotal <= 0) {
        return;
    }

    const int current = static_cast<int>(std::min<qint64>(100, d->bytesReceived * 100 / d->bytesTotal));
    if (current > d->percent) {
        d->percent = current;
    }

    if (d->percent > d->reportedPercent && d->progressLimiter.tryAcquire()) {
        d->reportedPercent = d->percent;
        emit progressChanged(d->entry.id, d->percent);
    }
}

void ModelDownloader::onReadyRead() {
    if (d->finished || !d->reply) {
        return;
    }
    if (observeCancellation()) {
        return;
    }

    auto valid = validateResponse();
    if (valid.hasError()) {
        SCRIBE_WARN("ModelDownloader: {} rejected: {}",
                    d->entry.id.toStdString(), d->errorString.toStdString());
        finish(TransferOutcome::Failed, valid.error(), d->errorString);
        return;
    }

    auto drained = drainToFile();
    if (drained.hasError()) {
        finish(TransferOutcome::Failed, drained.error(), d->errorString);
        return;
    }

    updateProgress();
}

void ModelDownloader::onReplyFinished() {
    if (d->finished || !d->reply) {
        return;
    }
    if (observeCancellation()) {
        return;
    }

    if (d->reply->error() != QNetworkReply::NoError) {
        const DownloadError mapped = mapNetworkError(d->reply->error());
        finish(TransferOutcome::Failed, mapped, d->reply->errorString());
        return;
    }

    auto valid = validateResponse();
    if (valid.hasError()) {
        finish(TransferOutcome::Failed, valid.error(), d->errorString);
        return;
    }

    auto drained = drainToFile();
    if (drained.hasError()) {
        finish(TransferOutcome::Failed, drained.error(), d->errorString);
        return;
    }

    if (d->bytesReceived == 0) {
        finish(TransferOutcome::Failed, DownloadError::ServerError, "Empty response body");
        return;
    }

    if (d->bytesTotal > 0 && d->bytesReceived != d->bytesTotal) {
        finish(TransferOutcome::Failed, DownloadError::NetworkError,
               QString("Stream ended after %1 of %2 bytes").arg(d->bytesReceived).arg(d->bytesTotal));
        return;
    }

    if (!d->file.flush()) {
        finish(TransferOutcome::Failed, DownloadError::FileSystemError,
               QString("Flush of %1 failed: %2").arg(d->destinationPath, d->file.errorString()));
        return;
    }
    d->file.close();
    if (d->file.error() != QFileDevice::NoError) {
        finish(TransferOutcome::Failed, DownloadError::FileSystemError,
               QString("Close of %1 failed: %2").arg(d->destinationPath, d->file.errorString()));
        return;
    }

    d->percent = 100;
    finish(TransferOutcome::Completed);
}

void ModelDownloader::finishLater(TransferOutcome outcome, DownloadError error, const QString& message) {
    QPointer<ModelDownloader> self(this);
    QMetaObject::invokeMethod(this, [self, outcome, error, message]() {
        if (self) {
            self->finish(outcome, error, message);
        }
    }, Qt::QueuedConnection);
}

void ModelDownloader::finish(TransferOutcome outcome, DownloadError error, const QString& message) {
    if (d->finished) {
        return;
    }
    d->finished = true;
    d->outcome = outcome;

    if (outcome == TransferOutcome::Completed) {
        d->error = DownloadError::UnknownError;
        d->errorString.clear();
        SCRIBE_INFO("ModelDownloader: {} complete, {} bytes written to {}",
                    d->entry.id.toStdString(), d->bytesReceived, d->destinationPath.toStdString());
    } else {
        d->error = error;
        d->errorString = message;
        if (outcome == TransferOutcome::Failed) {
            SCRIBE_ERROR("ModelDownloader: {} failed ({}): {}",
                         d->entry.id.toStdString(),
                         downloadErrorToString(error).toStdString(),
                         message.toStdString());
        }
    }

    releaseReply(outcome != TransferOutcome::Completed);
    if (d->file.isOpen()) {
        d->file.close();
    }

    emit finished(d->entry.id, outcome);
}

void ModelDownloader::releaseReply(bool abort) {
    if (!d->reply) {
        return;
    }
    QNetworkReply* reply = d->reply;
    d->reply = nullptr;
    reply->disconnect(this);
    if (abort && reply->isRunning()) {
        reply->abort();
    }
    reply->deleteLater();
}

DownloadError ModelDownloader::mapNetworkError(QNetworkReply::NetworkError error) {
    switch (error) {
        case QNetworkReply::TimeoutError:
        case QNetworkReply::OperationCanceledError:  // raised by the transfer timeout
            return DownloadError::TimeoutError;
        case QNetworkReply::ConnectionRefusedError:
        case QNetworkReply::RemoteHostClosedError:
        case QNetworkReply::HostNotFoundError:
        case QNetworkReply::NetworkSessionFailedError:
        case QNetworkReply::TemporaryNetworkFailureError:
            return DownloadError::NetworkError;
        case QNetworkReply::ContentNotFoundError:
        case QNetworkReply::ContentAccessDenied:
        case QNetworkReply::InternalServerError:
        case QNetworkReply::ServiceUnavailableError:
        case QNetworkReply::UnknownServerError:
            return DownloadError::ServerError;
        case QNetworkReply::ProtocolUnknownError:
        case QNetworkReply::ProtocolInvalidOperationError:
            return DownloadError::InvalidUrl;
        default:
            return DownloadError::NetworkError;
    }
}

} // namespace Scribe
