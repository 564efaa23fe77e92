/**
 * @file HttpServer.h
 * @brief HTTP listener serving each connection on a pooled worker thread
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/server/HttpTypes.h"

#include <QString>

#include <atomic>
#include <memory>
#include <thread>

namespace httplib {
class Server;
}

namespace MusicRelay {

/**
 * @class HttpServer
 * @brief Adapts an httplib::Server to a RequestHandler
 *
 * Every request, whatever its path or method, is decoded into an HttpRequest
 * and handed to the handler on the connection's worker thread. Streams block
 * their worker for their whole duration. Each connection serves one request
 * and is then closed.
 */
class HttpServer {
public:
    HttpServer(RequestHandler& handler, int maxConnections);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * @brief Bind and start accepting on a background thread
     * @param port 0 binds any free port
     * @return False if the address could not be bound
     */
    bool start(const QString& host, quint16 port);

    /**
     * @brief Stop accepting, end running streams and wait for the workers
     */
    void stop();

    [[nodiscard]] bool isRunning() const;

    /**
     * @brief Bound port, 0 before start()
     */
    [[nodiscard]] quint16 port() const noexcept { return m_port; }

private:
    void installHandlers();

    RequestHandler& m_handler;
    int m_maxConnections;
    std::unique_ptr<httplib::Server> m_server;
    std::thread m_listener;
    std::atomic<bool> m_stopping{false};
    quint16 m_port = 0;
};

} // namespace MusicRelay
