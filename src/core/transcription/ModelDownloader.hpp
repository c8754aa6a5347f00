#pragma once

#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtNetwork/QNetworkReply>
#include <memory>

#include "core/common/CancellationToken.hpp"
#include "core/common/Expected.hpp"
#include "ModelCatalog.hpp"
#include "ModelTypes.hpp"

class QNetworkAccessManager;

namespace Scribe {

/**
 * @brief Streams one model file from its catalog URL to disk
 *
 * One instance performs exactly one attempt and reports exactly one outcome
 * through finished(), always from the event loop and never from inside
 * start(). The destination file is written incrementally and left in place
 * on cancellation or failure; removing it is up to the owner.
 */
class ModelDownloader : public QObject {
    Q_OBJECT

public:
    struct Options {
        int progressIntervalMs = 30;
        int readTimeoutMs = 30000;   // 0 disables the transfer timeout
        QString userAgent = "ScribeDesktop/1.0";
    };

    ModelDownloader(QNetworkAccessManager* networkManager,
                    const ModelCatalogEntry& entry,
                    const QString& destinationPath,
                    const CancellationToken& token,
                    const Options& options,
                    QObject* parent = nullptr);
    ~ModelDownloader() override;

    void start();

    QString modelId() const;
    QString destinationPath() const;
    bool isRunning() const;
    bool isFinished() const;

    qint64 bytesReceived() const;
    qint64 bytesTotal() const;     // 0 when the server did not declare a size
    int percent() const;           // exact, never decreases during the attempt

    TransferOutcome outcome() const;
    DownloadError error() const;
    QString errorString() const;

public slots:
    // Observes the token outside of the read path, e.g. while the stream is stalled
    void checkCancellation();

signals:
    void progressChanged(const QString& modelId, int percent);
    void finished(const QString& modelId, Scribe::TransferOutcome outcome);

private slots:
    void onReadyRead();
    void onReplyFinished();

private:
    struct ModelDownloaderPrivate;
    std::unique_ptr<ModelDownloaderPrivate> d;

    Expected<void, DownloadError> prepareDestination();
    Expected<void, DownloadError> validateResponse();
    Expected<void, DownloadError> drainToFile();
    void updateProgress();
    bool observeCancellation();

    void finishLater(TransferOutcome outcome, DownloadError error, const QString& message);
    void finish(TransferOutcome outcome, DownloadError error = DownloadError::UnknownError,
                const QString& message = QString());
    void releaseReply(bool abort);

    static DownloadError mapNetworkError(QNetworkReply::NetworkError error);
};

} // namespace Scribe
