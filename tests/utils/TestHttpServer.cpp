#include "TestHttpServer.hpp"

#include <QtCore/QTimer>
#include <QtNetwork/QHostAddress>
#include <algorithm>

namespace Scribe {
namespace Test {

struct TestHttpServer::Connection {
    QPointer<QTcpSocket> socket;
    QByteArray request;
    bool responding = false;
    Route route;
    qint64 sent = 0;
};

TestHttpServer::TestHttpServer(QObject* parent)
    : QObject(parent) {
    connect(&server_, &QTcpServer::newConnection, this, &TestHttpServer::onNewConnection);
}

TestHttpServer::~TestHttpServer() {
    stop();
}

bool TestHttpServer::start() {
    if (server_.isListening()) {
        return true;
    }
    return server_.listen(QHostAddress::LocalHost, 0);
}

void TestHttpServer::stop() {
    for (const QPointer<QTcpSocket>& socket : sockets_) {
        if (socket) {
            socket->abort();
            socket->deleteLater();
        }
    }
    sockets_.clear();
    server_.close();
}

bool TestHttpServer::isListening() const {
    return server_.isListening();
}

void TestHttpServer::setRoute(const QString& path, const Route& route) {
    routes_.insert(path, route);
}

QUrl TestHttpServer::url(const QString& path) const {
    return QUrl(QString("http://127.0.0.1:%1%2").arg(server_.serverPort()).arg(path));
}

int TestHttpServer::requestCount(const QString& path) const {
    return requestCounts_.value(path, 0);
}

QByteArray TestHttpServer::lastUserAgent() const {
    return lastUserAgent_;
}

void TestHttpServer::onNewConnection() {
    while (QTcpSocket* socket = server_.nextPendingConnection()) {
        auto connection = std::make_shared<Connection>();
        connection->socket = socket;
        sockets_.append(socket);

        connect(socket, &QTcpSocket::readyRead, this, [this, connection]() {
            if (!connection->socket || connection->responding) {
                return;
            }
            connection->request.append(connection->socket->readAll());
            if (connection->request.contains("\r\n\r\n")) {
                handleRequest(connection);
            }
        });
        connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
    }
}

void TestHttpServer::handleRequest(const std::shared_ptr<Connection>& connection) {
    connection->responding = true;

    const QList<QByteArray> lines = connection->request.split('\n');
    const QList<QByteArray> requestLine = lines.value(0).trimmed().split(' ');
    const QString path = QString::fromUtf8(requestLine.value(1));

    for (const QByteArray& line : lines) {
        if (line.toLower().startsWith("user-agent:")) {
            lastUserAgent_ = line.mid(static_cast<int>(qstrlen("user-agent:"))).trimmed();
        }
    }

    requestCounts_[path] += 1;

    if (routes_.contains(path)) {
        connection->route = routes_.value(path);
    } else {
        connection->route = Route();
        connection->route.status = 404;
        connection->route.body = "Not Found";
    }

    QByteArray header = "HTTP/1.1 " + QByteArray::number(connection->route.status) + " "
                        + reasonPhrase(connection->route.status) + "\r\n";
    header += "Content-Type: application/octet-stream\r\n";
    if (connection->route.sendContentLength) {
        header += "Content-Length: " + QByteArray::number(connection->route.body.size()) + "\r\n";
    }
    header += "Connection: close\r\n\r\n";
    connection->socket->write(header);

    sendNextChunk(connection);
}

void TestHttpServer::sendNextChunk(const std::shared_ptr<Connection>& connection) {
    QTcpSocket* socket = connection->socket;
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    const Route& route = connection->route;
    const qint64 total = route.body.size();

    if (route.stallAfterBytes >= 0 && connection->sent >= route.stallAfterBytes) {
        socket->flush();
        return;
    }
    if (route.closeAfterBytes >= 0 && connection->sent >= route.closeAfterBytes) {
        socket->flush();
        socket->disconnectFromHost();
        return;
    }
    if (connection->sent >= total) {
        socket->disconnectFromHost();
        return;
    }

    qint64 length = std::min<qint64>(std::max(1, route.chunkSize), total - connection->sent);
    if (route.stallAfterBytes >= 0) {
        length = std::min(length, route.stallAfterBytes - connection->sent);
    }
    if (route.closeAfterBytes >= 0) {
        length = std::min(length, route.closeAfterBytes - connection->sent);
    }

    socket->write(route.body.mid(static_cast<int>(connection->sent), static_cast<int>(length)));
    connection->sent += length;

    QTimer::singleShot(route.chunkDelayMs, this, [this, connection]() { sendNextChunk(connection); });
}

QByteArray TestHttpServer::reasonPhrase(int status) {
    switch (status) {
        case 200: return "OK";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default: return "Status";
    }
}

} // namespace Test
} // namespace Scribe
