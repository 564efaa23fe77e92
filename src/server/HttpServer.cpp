/**
 * @file HttpServer.cpp
 * @brief Implementation of the HTTP listener
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/server/HttpServer.h"
#include "musicrelay/core/Types.h"

#include <QDebug>
#include <QJsonDocument>
#include <QJsonObject>

#include <httplib.h>

#include <algorithm>
#include <chrono>
#include <exception>

namespace MusicRelay {

namespace {

QByteArray reasonPhrase(int status)
{
    switch (status) {
        case 400: return QByteArrayLiteral("Bad Request");
        case 404: return QByteArrayLiteral("Not Found");
        case 405: return QByteArrayLiteral("Method Not Allowed");
        case 408: return QByteArrayLiteral("Request Timeout");
        case 413: return QByteArrayLiteral("Payload Too Large");
        case 414: return QByteArrayLiteral("URI Too Long");
        case 431: return QByteArrayLiteral("Request Header Fields Too Large");
        case 500: return QByteArrayLiteral("Internal Server Error");
        case 503: return QByteArrayLiteral("Service Unavailable");
        default:  return QByteArrayLiteral("Error");
    }
}

time_t toSeconds(Duration duration)
{
    return static_cast<time_t>(std::chrono::duration_cast<std::chrono::seconds>(duration).count());
}

HttpRequest toHttpRequest(const httplib::Request& req)
{
    HttpRequest request;
    request.method = QByteArray::fromStdString(req.method);
    request.path = QString::fromStdString(req.path);

    // Equal keys keep arrival order, so the first occurrence is seen first
    for (const auto& [name, value] : req.params) {
        const QString key = QString::fromStdString(name);
        if (!key.isEmpty() && !request.params.contains(key)) {
            request.params.insert(key, QString::fromStdString(value));
        }
    }
    for (const auto& [name, value] : req.headers) {
        const QByteArray key = QByteArray::fromStdString(name).toLower();
        if (!request.headers.contains(key)) {
            request.headers.insert(key, QByteArray::fromStdString(value));
        }
    }

    request.localAddress = QStringLiteral("%1:%2")
        .arg(QString::fromStdString(req.local_addr))
        .arg(req.local_port);
    request.remoteAddress = QString::fromStdString(req.remote_addr);
    return request;
}

// ═══════════════════════════════════════════════════════════════════════════════
// SinkWriter - chunked body over an httplib::DataSink
// ═══════════════════════════════════════════════════════════════════════════════

class SinkWriter : public ChunkWriter {
public:
    SinkWriter(httplib::DataSink& sink, const std::atomic<bool>& stopping)
        : m_sink(sink)
        , m_stopping(stopping)
    {
    }

    bool write(const QByteArray& chunk) override
    {
        if (!isOpen()) return false;
        if (chunk.isEmpty()) return true;

        // Blocks up to the write timeout; this is the stream's backpressure
        if (!m_sink.write(chunk.constData(), static_cast<size_t>(chunk.size()))) {
            qDebug() << "HttpServer: Write failed, peer gone";
            m_connected = false;
        }
        return m_connected;
    }

    bool isConnected() override
    {
        if (isOpen() && !m_sink.is_writable()) {
            qDebug() << "HttpServer: Peer closed the connection";
            m_connected = false;
        }
        return m_connected;
    }

    [[nodiscard]] bool peerGone() const noexcept { return !m_connected; }

private:
    bool isOpen()
    {
        if (m_connected && m_stopping.load(std::memory_order_acquire)) {
            m_connected = false;
        }
        return m_connected;
    }

    httplib::DataSink& m_sink;
    const std::atomic<bool>& m_stopping;
    bool m_connected = true;
};

// ═══════════════════════════════════════════════════════════════════════════════
// LibResponder - fills the httplib::Response of the current request
// ═══════════════════════════════════════════════════════════════════════════════

class LibResponder : public HttpResponder {
public:
    LibResponder(httplib::Response& response, const std::atomic<bool>& stopping)
        : m_response(response)
        , m_stopping(stopping)
    {
    }

    void sendResponse(int status, const HttpHeaders& headers, const QByteArray& body) override
    {
        m_response.status = status;
        const QByteArray contentType = applyHeaders(headers);
        m_response.set_content(body.toStdString(), contentType.constData());
    }

    void sendStream(int status, const HttpHeaders& headers, StreamProducer producer) override
    {
        m_response.status = status;
        const QByteArray contentType = applyHeaders(headers);

        const std::atomic<bool>& stopping = m_stopping;
        m_response.set_chunked_content_provider(
            contentType.toStdString(),
            [producer = std::move(producer), &stopping](size_t /*offset*/, httplib::DataSink& sink) {
                SinkWriter writer(sink, stopping);
                try {
                    producer(writer);
                } catch (const std::exception& e) {
                    qCritical() << "HttpServer: Stream aborted:" << e.what();
                    return false;
                }

                // Returning false drops the connection without the final chunk
                if (writer.peerGone()) {
                    return false;
                }
                sink.done();
                return true;
            });
    }

private:
    // Returns the Content-Type, which httplib sets itself
    QByteArray applyHeaders(const HttpHeaders& headers)
    {
        m_response.headers.clear();

        QByteArray contentType = QByteArrayLiteral("application/octet-stream");
        for (const auto& [name, value] : headers) {
            if (name.compare(QByteArrayLiteral("Content-Type"), Qt::CaseInsensitive) == 0) {
                contentType = value;
            } else {
                m_response.set_header(name.toStdString(), value.toStdString());
            }
        }
        return contentType;
    }

    httplib::Response& m_response;
    const std::atomic<bool>& m_stopping;
};

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// HttpServer Implementation
// ═══════════════════════════════════════════════════════════════════════════════

HttpServer::HttpServer(RequestHandler& handler, int maxConnections)
    : m_handler(handler)
    , m_maxConnections(std::max(1, maxConnections))
{
}

HttpServer::~HttpServer()
{
    stop();
}

bool HttpServer::start(const QString& host, quint16 port)
{
    if (m_server) {
        qWarning() << "HttpServer: Already started";
        return false;
    }

    m_stopping.store(false, std::memory_order_release);
    m_server = std::make_unique<httplib::Server>();
    installHandlers();

    const std::string address = host.toStdString();
    int bound = -1;
    if (port == 0) {
        bound = m_server->bind_to_any_port(address);
    } else if (m_server->bind_to_port(address, port)) {
        bound = port;
    }

    if (bound <= 0) {
        qCritical() << "HttpServer: Failed to listen on" << host << port;
        m_server.reset();
        return false;
    }
    m_port = static_cast<quint16>(bound);

    m_listener = std::thread([this]() {
        if (!m_server->listen_after_bind() && !m_stopping.load(std::memory_order_acquire)) {
            qCritical() << "HttpServer: Listener stopped unexpectedly";
        }
    });
    m_server->wait_until_ready();

    qInfo() << "HttpServer: Listening on" << host << m_port
            << "with up to" << m_maxConnections << "concurrent connections";
    return true;
}

void HttpServer::stop()
{
    if (!m_server) {
        return;
    }

    m_stopping.store(true, std::memory_order_release);
    m_server->stop();
    if (m_listener.joinable()) {
        m_listener.join();
    }
    m_server.reset();
    qInfo() << "HttpServer: Stopped";
}

bool HttpServer::isRunning() const
{
    return m_server && m_server->is_running();
}

void HttpServer::installHandlers()
{
    const int threads = m_maxConnections;
    m_server->new_task_queue = [threads]() {
        return new httplib::ThreadPool(static_cast<size_t>(threads));
    };

    m_server->set_keep_alive_max_count(1);
    m_server->set_read_timeout(toSeconds(Config::REQUEST_HEAD_TIMEOUT), 0);
    m_server->set_write_timeout(toSeconds(Config::SOCKET_WRITE_TIMEOUT), 0);
    m_server->set_payload_max_length(Config::MAX_REQUEST_PAYLOAD_BYTES);

    // Routing belongs to the handler, so every request is answered here
    m_server->set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        const HttpRequest request = toHttpRequest(req);
        qInfo().noquote() << "HttpServer:" << request.remoteAddress
                          << QString::fromLatin1(request.method) << request.path;

        LibResponder responder(res, m_stopping);
        m_handler.handle(request, responder);
        return httplib::Server::HandlerResponse::Handled;
    });

    // Requests httplib rejected itself reach here without a body
    m_server->set_error_handler([](const httplib::Request& /*req*/, httplib::Response& res) {
        if (!res.body.empty()) {
            return;
        }

        QJsonObject body;
        body[QStringLiteral("error")] = QString::fromLatin1(reasonPhrase(res.status));
        body[QStringLiteral("code")] = res.status;
        res.set_content(QJsonDocument(body).toJson(QJsonDocument::Compact).toStdString(),
                        "application/json");
    });
}

} // namespace MusicRelay
