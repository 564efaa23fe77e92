/**
 * @file FallbackClient.h
 * @brief Interface for one request against a remote conversion instance
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QByteArray>
#include <QJsonObject>
#include <QString>

namespace MusicRelay {

/**
 * @brief Raw outcome of a fallback request
 */
struct FallbackResponse {
    bool transportOk = false;    ///< Request completed (connect, send, receive)
    long httpCode = 0;
    QByteArray body;
    QString error;               ///< Transport failure description
};

/**
 * @brief Sends a conversion request to a single instance
 *
 * Implementations must be thread-safe and must not throw.
 */
class FallbackClient {
public:
    virtual ~FallbackClient() = default;

    /**
     * @param instance Base URL without trailing slash
     * @param payload Request document
     */
    [[nodiscard]] virtual FallbackResponse post(const QString& instance, const QJsonObject& payload) = 0;
};

} // namespace MusicRelay
