#pragma once

#include <QtCore/QMap>
#include <QtCore/QMetaType>
#include <QtCore/QString>
#include <optional>

namespace Scribe {

enum class ModelError {
    InitializationFailed,
    ModelNotFound,
    ModelNotPresent,
    PersistenceFailed,
    DiskError,
    InvalidConfiguration
};

enum class DownloadError {
    NetworkError,
    TimeoutError,
    ServerError,
    InvalidUrl,
    FileSystemError,
    CancellationRequested,
    UnknownError
};

enum class LifecycleState {
    NotPresent,
    Downloading,
    Present
};

enum class TransferOutcome {
    Completed,
    Cancelled,
    Failed
};

struct ModelRecord {
    LifecycleState state = LifecycleState::NotPresent;
    int progress = 0;   // 0-100

    static ModelRecord notPresent() { return {LifecycleState::NotPresent, 0}; }
    static ModelRecord downloading(int progress) { return {LifecycleState::Downloading, progress}; }
    static ModelRecord present() { return {LifecycleState::Present, 100}; }

    bool isSettled() const { return state != LifecycleState::Downloading; }

    bool operator==(const ModelRecord& other) const {
        return state == other.state && progress == other.progress;
    }
    bool operator!=(const ModelRecord& other) const { return !(*this == other); }
};

// One record per catalog identifier
using ModelSnapshot = QMap<QString, ModelRecord>;

// Persisted spelling: "not-downloaded", "downloading", "downloaded"
QString lifecycleStateToString(LifecycleState state);
std::optional<LifecycleState> lifecycleStateFromString(const QString& value);

// "Not downloaded", "Downloading (42%)", "Downloaded"
QString statusText(const ModelRecord& record);

// The single action offered for a record: "download", "cancel" or "delete"
QString availableAction(const ModelRecord& record);

QString transferOutcomeToString(TransferOutcome outcome);
QString downloadErrorToString(DownloadError error);
QString modelErrorToString(ModelError error);

// Text suitable for end users; raw transport detail belongs in the log
QString userMessageFor(DownloadError error, const QString& displayName);

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::ModelRecord)
Q_DECLARE_METATYPE(Scribe::TransferOutcome)
