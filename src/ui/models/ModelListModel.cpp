#include "ModelListModel.hpp"
#include "core/common/Logger.hpp"
#include "core/transcription/ModelManager.hpp"

namespace Scribe {

ModelListModel::ModelListModel(QObject* parent)
    : QAbstractListModel(parent) {
}

ModelListModel::~ModelListModel() = default;

int ModelListModel::rowCount(const QModelIndex& parent) const {
    if (parent.isValid()) {
        return 0;
    }
    return static_cast<int>(rows_.size());
}

QVariant ModelListModel::data(const QModelIndex& index, int role) const {
    if (!index.isValid() || index.row() < 0 || index.row() >= rowCount()) {
        return QVariant();
    }

    const Row& row = rows_[static_cast<size_t>(index.row())];

    switch (role) {
        case Qt::DisplayRole:
        case NameRole:
            return row.entry.displayName;
        case IdRole:
            return row.entry.id;
        case StateRole:
            return lifecycleStateToString(row.record.state);
        case ProgressRole:
            return row.record.progress;
        case StatusTextRole:
            return statusText(row.record);
        case ActionRole:
            return availableAction(row.record);
        case SizeRole:
            return row.entry.approximateSize;
        case PathRole:
            return modelPath(row.entry.id);
        default:
            return QVariant();
    }
}

QHash<int, QByteArray> ModelListModel::roleNames() const {
    QHash<int, QByteArray> roles;
    roles[IdRole] = "modelId";
    roles[NameRole] = "name";
    roles[StateRole] = "state";
    roles[ProgressRole] = "progress";
    roles[StatusTextRole] = "statusText";
    roles[ActionRole] = "action";
    roles[SizeRole] = "size";
    roles[PathRole] = "path";
    return roles;
}

void ModelListModel::setModelManager(ModelManager* manager) {
    if (manager_ == manager) {
        return;
    }

    if (manager_) {
        disconnect(manager_.data(), nullptr, this, nullptr);
    }

    manager_ = manager;

    if (manager_) {
        connect(manager_, &ModelManager::modelStateChanged, this, &ModelListModel::onModelStateChanged);
        connect(manager_, &ModelManager::transferFailed, this, &ModelListModel::onTransferFailed);
    }

    rebuild();
}

ModelManager* ModelListModel::modelManager() const {
    return manager_;
}

void ModelListModel::rebuild() {
    const int previousDownloading = downloadingCount();
    const int previousCount = rowCount();

    beginResetModel();
    rows_.clear();
    if (manager_) {
        const ModelSnapshot snapshot = manager_->snapshot();
        for (const ModelCatalogEntry& entry : manager_->catalog().entries()) {
            rows_.push_back({entry, snapshot.value(entry.id, ModelRecord::notPresent())});
        }
    }
    endResetModel();

    if (rowCount() != previousCount) {
        emit countChanged();
    }
    if (downloadingCount() != previousDownloading) {
        emit downloadingCountChanged();
    }
}

int ModelListModel::rowOf(const QString& modelId) const {
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].entry.id == modelId) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

void ModelListModel::onModelStateChanged(const QString& modelId, const ModelRecord& record) {
    const int row = rowOf(modelId);
    if (row < 0) {
        return;
    }

    Row& current = rows_[static_cast<size_t>(row)];
    if (current.record == record) {
        return;
    }

    const bool stateChanged = current.record.state != record.state;
    const int previousDownloading = downloadingCount();
    current.record = record;

    const QModelIndex changed = index(row);
    if (stateChanged) {
        emit dataChanged(changed, changed,
                         {StateRole, ProgressRole, StatusTextRole, ActionRole, PathRole});
    } else {
        emit dataChanged(changed, changed, {ProgressRole, StatusTextRole});
    }

    if (downloadingCount() != previousDownloading) {
        emit downloadingCountChanged();
    }
}

void ModelListModel::onTransferFailed(const QString& modelId, const QString& message) {
    SCRIBE_DEBUG("ModelListModel: showing failure for {}", modelId.toStdString());
    statusMessage_ = message;
    emit statusMessageChanged();
}

void ModelListModel::download(const QString& modelId) {
    if (manager_) {
        manager_->requestDownload(modelId);
    }
}

void ModelListModel::cancel(const QString& modelId) {
    if (manager_) {
        manager_->requestCancel(modelId);
    }
}

void ModelListModel::remove(const QString& modelId) {
    if (manager_) {
        manager_->requestDelete(modelId);
    }
}

void ModelListModel::triggerAction(int row) {
    if (row < 0 || row >= rowCount()) {
        return;
    }

    const Row& current = rows_[static_cast<size_t>(row)];
    switch (current.record.state) {
        case LifecycleState::NotPresent:
            download(current.entry.id);
            break;
        case LifecycleState::Downloading:
            cancel(current.entry.id);
            break;
        case LifecycleState::Present:
            remove(current.entry.id);
            break;
    }
}

QString ModelListModel::modelPath(const QString& modelId) const {
    if (!manager_) {
        return QString();
    }
    return manager_->resolveModelPath(modelId).valueOr(QString());
}

QVariantMap ModelListModel::get(int row) const {
    QVariantMap result;
    if (row < 0 || row >= rowCount()) {
        return result;
    }

    const QModelIndex idx = index(row);
    const QHash<int, QByteArray> roles = roleNames();
    for (auto it = roles.cbegin(); it != roles.cend(); ++it) {
        result.insert(QString::fromUtf8(it.value()), data(idx, it.key()));
    }
    return result;
}

int ModelListModel::downloadingCount() const {
    int count = 0;
    for (const Row& row : rows_) {
        if (row.record.state == LifecycleState::Downloading) {
            ++count;
        }
    }
    return count;
}

QString ModelListModel::statusMessage() const {
    return statusMessage_;
}

void ModelListModel::clearStatusMessage() {
    if (statusMessage_.isEmpty()) {
        return;
    }
    statusMessage_.clear();
    emit statusMessageChanged();
}

} // namespace Scribe
