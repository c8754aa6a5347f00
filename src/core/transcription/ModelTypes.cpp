#include "ModelTypes.hpp"

namespace Scribe {

QString lifecycleStateToString(LifecycleState state) {
    switch (state) {
        case LifecycleState::NotPresent: return QStringLiteral("not-downloaded");
        case LifecycleState::Downloading: return QStringLiteral("downloading");
        case LifecycleState::Present: return QStringLiteral("downloaded");
    }
    return QStringLiteral("not-downloaded");
}

std::optional<LifecycleState> lifecycleStateFromString(const QString& value) {
    if (value == QLatin1String("not-downloaded")) {
        return LifecycleState::NotPresent;
    }
    if (value == QLatin1String("downloading")) {
        return LifecycleState::Downloading;
    }
    if (value == QLatin1String("downloaded")) {
        return LifecycleState::Present;
    }
    return std::nullopt;
}

QString statusText(const ModelRecord& record) {
    switch (record.state) {
        case LifecycleState::NotPresent:
            return QStringLiteral("Not downloaded");
        case LifecycleState::Downloading:
            return QStringLiteral("Downloading (%1%)").arg(record.progress);
        case LifecycleState::Present:
            return QStringLiteral("Downloaded");
    }
    return QString();
}

QString availableAction(const ModelRecord& record) {
    switch (record.state) {
        case LifecycleState::NotPresent: return QStringLiteral("download");
        case LifecycleState::Downloading: return QStringLiteral("cancel");
        case LifecycleState::Present: return QStringLiteral("delete");
    }
    return QString();
}

QString transferOutcomeToString(TransferOutcome outcome) {
    switch (outcome) {
        case TransferOutcome::Completed: return QStringLiteral("completed");
        case TransferOutcome::Cancelled: return QStringLiteral("cancelled");
        case TransferOutcome::Failed: return QStringLiteral("failed");
    }
    return QString();
}

QString downloadErrorToString(DownloadError error) {
    switch (error) {
        case DownloadError::NetworkError: return QStringLiteral("network error");
        case DownloadError::TimeoutError: return QStringLiteral("timeout");
        case DownloadError::ServerError: return QStringLiteral("server error");
        case DownloadError::InvalidUrl: return QStringLiteral("invalid url");
        case DownloadError::FileSystemError: return QStringLiteral("file system error");
        case DownloadError::CancellationRequested: return QStringLiteral("cancelled");
        case DownloadError::UnknownError: return QStringLiteral("unknown error");
    }
    return QStringLiteral("unknown error");
}

QString modelErrorToString(ModelError error) {
    switch (error) {
        case ModelError::InitializationFailed: return QStringLiteral("initialization failed");
        case ModelError::ModelNotFound: return QStringLiteral("unknown model");
        case ModelError::ModelNotPresent: return QStringLiteral("model not downloaded");
        case ModelError::PersistenceFailed: return QStringLiteral("could not save model states");
        case ModelError::DiskError: return QStringLiteral("disk error");
        case ModelError::InvalidConfiguration: return QStringLiteral("invalid configuration");
    }
    return QStringLiteral("unknown error");
}

QString userMessageFor(DownloadError error, const QString& displayName) {
    switch (error) {
        case DownloadError::NetworkError:
        case DownloadError::TimeoutError:
            return QStringLiteral("Download of %1 failed. Check your connection and try again.").arg(displayName);
        case DownloadError::ServerError:
            return QStringLiteral("Download of %1 failed. The server did not provide the model.").arg(displayName);
        case DownloadError::InvalidUrl:
            return QStringLiteral("%1 cannot be downloaded: no download location is configured.").arg(displayName);
        case DownloadError::FileSystemError:
            return QStringLiteral("Download of %1 failed. The model could not be saved to disk.").arg(displayName);
        case DownloadError::CancellationRequested:
            return QStringLiteral("Download of %1 was cancelled.").arg(displayName);
        case DownloadError::UnknownError:
            break;
    }
    return QStringLiteral("Download of %1 failed.").arg(displayName);
}

} // namespace Scribe
