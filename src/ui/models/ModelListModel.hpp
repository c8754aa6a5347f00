#pragma once

#include <QtCore/QAbstractListModel>
#include <QtCore/QPointer>
#include <QtCore/QVariantMap>
#include <vector>

#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelTypes.hpp"

namespace Scribe {

class ModelManager;

// One row per catalog model, in catalog order. Read-only; user actions are
// forwarded to the manager as intents.
class ModelListModel : public QAbstractListModel {
    Q_OBJECT

    Q_PROPERTY(int count READ rowCount NOTIFY countChanged)
    Q_PROPERTY(int downloadingCount READ downloadingCount NOTIFY downloadingCountChanged)
    Q_PROPERTY(QString statusMessage READ statusMessage NOTIFY statusMessageChanged)

public:
    enum Roles {
        IdRole = Qt::UserRole + 1,
        NameRole,
        StateRole,
        ProgressRole,
        StatusTextRole,
        ActionRole,
        SizeRole,
        PathRole
    };
    Q_ENUM(Roles)

    explicit ModelListModel(QObject* parent = nullptr);
    ~ModelListModel() override;

    int rowCount(const QModelIndex& parent = QModelIndex()) const override;
    QVariant data(const QModelIndex& index, int role = Qt::DisplayRole) const override;
    QHash<int, QByteArray> roleNames() const override;

    void setModelManager(ModelManager* manager);
    ModelManager* modelManager() const;

    Q_INVOKABLE void download(const QString& modelId);
    Q_INVOKABLE void cancel(const QString& modelId);
    Q_INVOKABLE void remove(const QString& modelId);
    // Triggers whichever action the row currently offers
    Q_INVOKABLE void triggerAction(int row);

    Q_INVOKABLE QString modelPath(const QString& modelId) const;
    Q_INVOKABLE QVariantMap get(int row) const;
    Q_INVOKABLE int rowOf(const QString& modelId) const;

    int downloadingCount() const;
    QString statusMessage() const;
    Q_INVOKABLE void clearStatusMessage();

signals:
    void countChanged();
    void downloadingCountChanged();
    void statusMessageChanged();

private slots:
    void onModelStateChanged(const QString& modelId, const Scribe::ModelRecord& record);
    void onTransferFailed(const QString& modelId, const QString& message);

private:
    struct Row {
        ModelCatalogEntry entry;
        ModelRecord record;
    };

    void rebuild();

    QPointer<ModelManager> manager_;
    std::vector<Row> rows_;
    QString statusMessage_;
};

} // namespace Scribe
