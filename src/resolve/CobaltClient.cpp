/**
 * @file CobaltClient.cpp
 * @brief Implementation of the Cobalt instance client
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/CobaltClient.h"
#include "musicrelay/core/UserAgent.h"
#include "net/CurlWrapper.h"

#include <QJsonDocument>
#include <QUrl>

namespace MusicRelay {

namespace {
    // Origin and Referer the public instances accept
    constexpr auto FALLBACK_ORIGIN = "https://co.wuk.sh";
}

CobaltClient::CobaltClient(int timeoutSeconds)
    : m_timeoutSeconds(timeoutSeconds)
{
}

FallbackResponse CobaltClient::post(const QString& instance, const QJsonObject& payload)
{
    FallbackResponse response;

    CurlEasyHandle handle;
    if (!handle.isValid()) {
        response.error = QStringLiteral("Handle not initialized");
        return response;
    }

    handle.setUrl(QUrl(instance + QStringLiteral("/api/json")));
    handle.setTimeout(m_timeoutSeconds);
    handle.setFollowRedirects(true);
    handle.setUserAgent(randomUserAgent());
    handle.addHeader(QStringLiteral("Accept: application/json"));
    handle.addHeader(QStringLiteral("Content-Type: application/json"));
    handle.addHeader(QStringLiteral("Origin: %1").arg(QLatin1String(FALLBACK_ORIGIN)));
    handle.setReferer(QStringLiteral("%1/").arg(QLatin1String(FALLBACK_ORIGIN)));

    const CurlResult result = handle.performPost(QJsonDocument(payload).toJson(QJsonDocument::Compact));

    response.transportOk = result.transportOk();
    response.httpCode = result.httpCode;
    if (result.transportOk()) {
        response.body = handle.responseBody();
    } else {
        response.error = result.isTimeout() ? QStringLiteral("timeout") : result.errorMessage;
    }
    return response;
}

} // namespace MusicRelay
