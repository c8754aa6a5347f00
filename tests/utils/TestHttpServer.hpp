#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>
#include <QtCore/QUrl>
#include <QtNetwork/QTcpServer>
#include <QtNetwork/QTcpSocket>
#include <memory>

namespace Scribe {
namespace Test {

/**
 * @brief Minimal in-process HTTP/1.1 server for transfer tests
 *
 * Serves GET requests on 127.0.0.1 from a table of routes. Bodies can be
 * trickled in chunks, stalled, or cut short to exercise the download paths.
 * Unknown paths answer 404.
 */
class TestHttpServer : public QObject {
    Q_OBJECT

public:
    struct Route {
        int status = 200;
        QByteArray body;
        int chunkSize = 16 * 1024;
        int chunkDelayMs = 0;
        bool sendContentLength = true;
        qint64 stallAfterBytes = -1;   // stop sending but keep the connection open
        qint64 closeAfterBytes = -1;   // drop the connection early
    };

    explicit TestHttpServer(QObject* parent = nullptr);
    ~TestHttpServer() override;

    bool start();
    void stop();
    bool isListening() const;

    void setRoute(const QString& path, const Route& route);
    QUrl url(const QString& path) const;

    int requestCount(const QString& path) const;
    QByteArray lastUserAgent() const;

private:
    struct Connection;

    void onNewConnection();
    void handleRequest(const std::shared_ptr<Connection>& connection);
    void sendNextChunk(const std::shared_ptr<Connection>& connection);

    static QByteArray reasonPhrase(int status);

    QTcpServer server_;
    QHash<QString, Route> routes_;
    QHash<QString, int> requestCounts_;
    QByteArray lastUserAgent_;
    QList<QPointer<QTcpSocket>> sockets_;
};

} // namespace Test
} // namespace Scribe
