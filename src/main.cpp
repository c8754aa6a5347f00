#include <QtCore/QCommandLineParser>
#include <QtCore/QCoreApplication>
#include <QtCore/QEventLoop>
#include <QtCore/QSet>
#include <QtCore/QTextStream>

#include "core/common/Config.hpp"
#include "core/common/Logger.hpp"
#include "core/transcription/ModelCatalog.hpp"
#include "core/transcription/ModelManager.hpp"
#include "ui/models/ModelListModel.hpp"

namespace {

QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

QTextStream& err() {
    static QTextStream stream(stderr);
    return stream;
}

int listModels(Scribe::ModelManager& manager) {
    Scribe::ModelListModel model;
    model.setModelManager(&manager);

    for (int row = 0; row < model.rowCount(); ++row) {
        const QModelIndex idx = model.index(row);
        out() << model.data(idx, Scribe::ModelListModel::IdRole).toString().leftJustified(8)
              << model.data(idx, Scribe::ModelListModel::StatusTextRole).toString().leftJustified(20);
        const QString path = model.data(idx, Scribe::ModelListModel::PathRole).toString();
        if (!path.isEmpty()) {
            out() << path;
        }
        out() << Qt::endl;
    }
    return 0;
}

int downloadModels(Scribe::ModelManager& manager, const QStringList& ids) {
    QSet<QString> pending;
    for (const QString& id : ids) {
        if (!manager.catalog().contains(id)) {
            err() << "Unknown model: " << id << Qt::endl;
            return 1;
        }
        auto current = manager.record(id);
        if (current.hasValue() && current.value().state != Scribe::LifecycleState::Present) {
            pending.insert(id);
        }
    }

    QEventLoop loop;
    int lastPrinted = -1;

    QObject::connect(&manager, &Scribe::ModelManager::modelStateChanged, &loop,
                     [&](const QString& id, const Scribe::ModelRecord& record) {
        if (!pending.contains(id)) {
            return;
        }
        if (record.state == Scribe::LifecycleState::Downloading) {
            if (record.progress != lastPrinted) {
                lastPrinted = record.progress;
                out() << id << ": " << Scribe::statusText(record) << Qt::endl;
            }
            return;
        }
        out() << id << ": " << Scribe::statusText(record) << Qt::endl;
        pending.remove(id);
        lastPrinted = -1;
        if (pending.isEmpty()) {
            loop.quit();
        }
    });
    QObject::connect(&manager, &Scribe::ModelManager::transferFailed, &loop,
                     [](const QString&, const QString& message) {
        err() << message << Qt::endl;
    });

    const QStringList toStart = pending.values();
    for (const QString& id : toStart) {
        manager.requestDownload(id);
    }

    if (!pending.isEmpty()) {
        loop.exec();
    }

    int exitCode = 0;
    for (const QString& id : ids) {
        auto path = manager.resolveModelPath(id);
        if (path.hasError()) {
            exitCode = 1;
        }
    }
    return exitCode;
}

int deleteModels(Scribe::ModelManager& manager, const QStringList& ids) {
    int exitCode = 0;
    for (const QString& id : ids) {
        auto current = manager.record(id);
        if (current.hasError()) {
            err() << "Unknown model: " << id << Qt::endl;
            exitCode = 1;
            continue;
        }
        manager.requestDelete(id);
        out() << id << ": " << Scribe::statusText(manager.record(id).valueOr(Scribe::ModelRecord())) << Qt::endl;
    }
    return exitCode;
}

int printPath(Scribe::ModelManager& manager, const QString& id) {
    auto path = manager.resolveModelPath(id);
    if (path.hasError()) {
        err() << id << ": " << Scribe::modelErrorToString(path.error()) << Qt::endl;
        return 1;
    }
    out() << path.value() << Qt::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("ScribeDesktop");
    app.setApplicationVersion("1.0.0");
    app.setOrganizationName("Scribe");
    app.setOrganizationDomain("scribe.app");

    QCommandLineParser parser;
    parser.setApplicationDescription("Manage the speech recognition models used by Scribe");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption storageOption("storage", "Model storage directory.", "dir");
    QCommandLineOption configOption("config", "Read settings from an INI file.", "file");
    QCommandLineOption verboseOption("verbose", "Log debug output.");
    parser.addOption(storageOption);
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.addPositionalArgument("command", "list, download, delete or path");
    parser.addPositionalArgument("ids", "Model identifiers.", "[ids...]");

    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = args.first();
    const QStringList ids = args.mid(1);

    if (parser.isSet(configOption)) {
        Scribe::Config::instance().initializeWithFile(parser.value(configOption));
    } else {
        Scribe::Config::instance().initialize();
    }

    Scribe::Logger::instance().initialize(Scribe::Config::instance().getLogPath().toStdString(),
                                          parser.isSet(verboseOption) ? Scribe::Logger::Level::Debug
                                                                      : Scribe::Logger::Level::Warn);
    SCRIBE_INFO("Starting scribe-models v{}", app.applicationVersion().toStdString());

    Scribe::ModelSettings settings = Scribe::Config::instance().getModelSettings();
    if (parser.isSet(storageOption)) {
        settings.storageRoot = parser.value(storageOption);
    }

    Scribe::ModelManager manager(Scribe::ModelCatalog::defaultCatalog(), settings);
    auto initResult = manager.initialize();
    if (initResult.hasError()) {
        err() << "Cannot initialize model storage: "
              << Scribe::modelErrorToString(initResult.error()) << Qt::endl;
        return 1;
    }

    int result = 0;
    if (command == "list") {
        result = listModels(manager);
    } else if (command == "download" && !ids.isEmpty()) {
        result = downloadModels(manager, ids);
    } else if (command == "delete" && !ids.isEmpty()) {
        result = deleteModels(manager, ids);
    } else if (command == "path" && ids.size() == 1) {
        result = printPath(manager, ids.first());
    } else {
        err() << "Invalid command line: " << args.join(' ') << Qt::endl;
        parser.showHelp(1);
    }

    Scribe::Config::instance().sync();
    Scribe::Logger::instance().flush();
    return result;
}
