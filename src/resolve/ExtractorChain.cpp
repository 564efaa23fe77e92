/**
 * @file ExtractorChain.cpp
 * @brief Implementation of the extraction chain
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/ExtractorChain.h"

#include <QDebug>
#include <QJsonDocument>
#include <QRandomGenerator>

#include <algorithm>

namespace MusicRelay {

ExtractorChain::ExtractorChain(ExtractionBackend& primary, FallbackClient& fallback,
                               QStringList instances)
    : m_primary(primary)
    , m_fallback(fallback)
    , m_instances(std::move(instances))
{
}

QJsonObject ExtractorChain::buildFallbackPayload(const QString& link)
{
    QJsonObject payload;
    payload[QStringLiteral("url")] = link;
    payload[QStringLiteral("aFormat")] = QStringLiteral("mp3");
    payload[QStringLiteral("isAudioOnly")] = true;
    payload[QStringLiteral("filenamePattern")] = QStringLiteral("basic");
    payload[QStringLiteral("disableMetadata")] = false;
    payload[QStringLiteral("youtubeMusic")] = false;
    return payload;
}

std::optional<QString> ExtractorChain::parseFallbackResponse(const QByteArray& body)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::nullopt;
    }

    const QJsonObject data = doc.object();

    if (data[QLatin1String("status")].toString() == QLatin1String("redirect")
        && data.contains(QLatin1String("url"))) {
        const QString url = data[QLatin1String("url")].toString();
        if (!url.isEmpty()) return url;
    }
    if (data.contains(QLatin1String("url"))) {
        const QString url = data[QLatin1String("url")].toString();
        if (!url.isEmpty()) return url;
    }
    if (data.contains(QLatin1String("audio"))) {
        const QString url = data[QLatin1String("audio")].toString();
        if (!url.isEmpty()) return url;
    }

    return std::nullopt;
}

ExtractionResult ExtractorChain::extract(const QString& link)
{
    ExtractionResult result;

    // Stage A
    const BackendResult primary = m_primary.extract(link);
    if (primary.ok()) {
        result.audioUrl = primary.audioUrl;
        result.source = QStringLiteral("yt-dlp");
        result.attempts << QStringLiteral("yt-dlp: ok");
        return result;
    }
    result.attempts << QStringLiteral("yt-dlp: %1").arg(primary.detail);
    qInfo() << "ExtractorChain: Primary extraction failed, trying fallback instances";

    // Stage B
    if (std::optional<QString> url = tryInstances(link, result)) {
        result.audioUrl = std::move(url);
        return result;
    }

    result.fallbackError = ErrorKind::AllInstancesExhausted;
    result.error = ErrorKind::ExtractionFailed;
    qWarning() << "ExtractorChain: Extraction failed for" << link.left(80)
               << "-" << result.attempts.join(QStringLiteral("; "));
    return result;
}

std::optional<QString> ExtractorChain::tryInstances(const QString& link, ExtractionResult& result)
{
    QStringList order = m_instances;
    if (m_shuffle) {
        std::shuffle(order.begin(), order.end(), *QRandomGenerator::global());
    }

    const QJsonObject payload = buildFallbackPayload(link);

    for (const QString& instance : order) {
        qInfo() << "ExtractorChain: Trying instance" << instance;

        const FallbackResponse response = m_fallback.post(instance, payload);

        if (!response.transportOk) {
            qWarning() << "ExtractorChain:" << instance << "transport error:" << response.error;
            result.attempts << QStringLiteral("%1: %2").arg(instance, response.error);
            continue;
        }
        if (response.httpCode != 200) {
            qWarning() << "ExtractorChain:" << instance << "status code" << response.httpCode;
            result.attempts << QStringLiteral("%1: HTTP %2").arg(instance).arg(response.httpCode);
            continue;
        }

        std::optional<QString> url = parseFallbackResponse(response.body);
        if (!url) {
            qWarning() << "ExtractorChain:" << instance << "returned no URL:" << response.body.left(200);
            result.attempts << QStringLiteral("%1: no URL in response").arg(instance);
            continue;
        }

        qInfo() << "ExtractorChain:" << instance << "succeeded:" << url->left(80);
        result.source = instance;
        result.attempts << QStringLiteral("%1: ok").arg(instance);
        return url;
    }

    qWarning() << "ExtractorChain: All fallback instances failed";
    return std::nullopt;
}

} // namespace MusicRelay
