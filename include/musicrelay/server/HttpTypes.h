/**
 * @file HttpTypes.h
 * @brief Request model and response interface shared by the server and handlers
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QHash>
#include <QList>
#include <QPair>
#include <QString>

#include <functional>

namespace MusicRelay {

using HttpHeaders = QList<QPair<QByteArray, QByteArray>>;

/**
 * @brief A decoded request
 */
struct HttpRequest {
    QByteArray method;
    QString path;                          ///< Decoded path without query
    QHash<QString, QString> params;        ///< Form-decoded query, first occurrence wins
    QHash<QByteArray, QByteArray> headers; ///< Lower-case names, first occurrence wins
    QString localAddress;                  ///< "addr:port" the connection arrived on
    QString remoteAddress;                 ///< Peer address

    /**
     * @brief Trimmed query parameter, empty if absent
     */
    [[nodiscard]] QString param(const QString& name) const {
        return params.value(name).trimmed();
    }

    [[nodiscard]] QByteArray header(const QByteArray& name) const {
        return headers.value(name.toLower());
    }

    /**
     * @brief Host header, or the local address when the client sent none
     */
    [[nodiscard]] QString host() const;
};

/**
 * @brief Body writer handed to a streaming response
 */
class ChunkWriter {
public:
    virtual ~ChunkWriter() = default;

    /**
     * @brief Send one chunk, blocking while the client is slow to read
     * @return false once the peer is gone
     */
    virtual bool write(const QByteArray& chunk) = 0;

    /**
     * @brief Poll the connection without sending anything
     * @return false once the peer has closed it
     */
    [[nodiscard]] virtual bool isConnected() = 0;
};

/**
 * @brief Produces a chunked body; runs on the connection's worker thread
 */
using StreamProducer = std::function<void(ChunkWriter& writer)>;

/**
 * @brief Response side of one request
 *
 * A handler calls exactly one of the two methods. A later call replaces
 * the earlier response as long as the handler has not returned.
 */
class HttpResponder {
public:
    virtual ~HttpResponder() = default;

    virtual void sendResponse(int status, const HttpHeaders& headers, const QByteArray& body) = 0;

    /**
     * @brief Answer with a chunked body generated by producer
     *
     * Headers go out before the producer runs.
     */
    virtual void sendStream(int status, const HttpHeaders& headers, StreamProducer producer) = 0;
};

/**
 * @brief Handles routed requests; implementations must be thread-safe
 */
class RequestHandler {
public:
    virtual ~RequestHandler() = default;

    virtual void handle(const HttpRequest& request, HttpResponder& responder) = 0;
};

} // namespace MusicRelay
