/*!
 * @file        httpstub.hpp
 * @brief       Scripted in-process HTTP server for network tests.
 *
 * @copyright   Copyright (c) 2026 TheBoys.
 * @license     See LICENSE in repository root.
 */

#ifndef THEBOYS_TESTS_HTTPSTUB_HPP
#define THEBOYS_TESTS_HTTPSTUB_HPP

#include <QByteArray>
#include <QHash>
#include <QHostAddress>
#include <QList>
#include <QStringList>
#include <QTcpServer>
#include <QTcpSocket>
#include <QUrl>

/**
 * @class HttpStub
 * @brief Answers GET requests with queued canned responses per path.
 *
 * @details
 * Each path holds a queue; responses are consumed in order and the last one
 * repeats. A response marked `hang` never answers, which lets clients run
 * into their deadline. Runs on the caller's thread: the code under test
 * spins a local event loop while waiting, which services the server too.
 */
class HttpStub : public QTcpServer
{
public:
    struct Response {
        int status = 200;
        QByteArray body;
        QByteArray contentType = QByteArrayLiteral("application/octet-stream");
        bool hang = false;
    };

    HttpStub()
    {
        listen(QHostAddress::LocalHost, 0);
    }

    QUrl url(const QString& path) const
    {
        return QUrl(QStringLiteral("http://127.0.0.1:%1%2").arg(serverPort()).arg(path));
    }

    void enqueue(const QString& path, const Response& response)
    {
        m_routes[path].append(response);
    }

    void enqueue(const QString& path, int status, const QByteArray& body)
    {
        Response response;
        response.status = status;
        response.body = body;
        enqueue(path, response);
    }

    void enqueueHang(const QString& path)
    {
        Response response;
        response.hang = true;
        enqueue(path, response);
    }

    int hits(const QString& path) const
    {
        return m_hits.value(path, 0);
    }

    QStringList requestedPaths() const
    {
        return m_requested;
    }

protected:
    void incomingConnection(qintptr socketDescriptor) override
    {
        auto *socket = new QTcpSocket(this);
        if (!socket->setSocketDescriptor(socketDescriptor)) {
            socket->deleteLater();
            return;
        }

        connect(socket, &QTcpSocket::readyRead, this, [this, socket]() {
            QByteArray& pending = m_buffers[socket];
            pending += socket->readAll();
            const qsizetype headerEnd = pending.indexOf("\r\n\r\n");
            if (headerEnd < 0) {
                return;
            }
            const QList<QByteArray> requestLine = pending.left(pending.indexOf("\r\n")).split(' ');
            m_buffers.remove(socket);
            if (requestLine.size() < 2) {
                socket->disconnectFromHost();
                return;
            }
            respond(socket, QUrl(QString::fromLatin1(requestLine.at(1))).path());
        });
        connect(socket, &QTcpSocket::disconnected, this, [this, socket]() {
            m_buffers.remove(socket);
            socket->deleteLater();
        });
    }

private:
    void respond(QTcpSocket *socket, const QString& path)
    {
        m_requested.append(path);
        ++m_hits[path];

        Response response;
        QList<Response>& queue = m_routes[path];
        if (queue.isEmpty()) {
            response.status = 404;
            response.body = QByteArrayLiteral("{\"message\":\"Not Found\"}");
            response.contentType = QByteArrayLiteral("application/json");
        } else {
            response = queue.size() > 1 ? queue.takeFirst() : queue.first();
        }
        if (response.hang) {
            return;
        }

        QByteArray reply;
        reply += "HTTP/1.1 " + QByteArray::number(response.status) + " Stub\r\n";
        reply += "Content-Type: " + response.contentType + "\r\n";
        reply += "Content-Length: " + QByteArray::number(response.body.size()) + "\r\n";
        reply += "Connection: close\r\n\r\n";
        reply += response.body;
        socket->write(reply);
        socket->disconnectFromHost();
    }

    QHash<QString, QList<Response>> m_routes;
    QHash<QString, int> m_hits;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QStringList m_requested;
};

#endif // THEBOYS_TESTS_HTTPSTUB_HPP
