/**
 * @file ExtractorChain.h
 * @brief Two-stage audio URL extraction: local backend, then remote instances
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"
#include "musicrelay/resolve/ExtractionBackend.h"
#include "musicrelay/resolve/FallbackClient.h"

#include <QStringList>

#include <optional>

namespace MusicRelay {

/**
 * @brief Outcome of running the chain for one link
 */
struct ExtractionResult {
    std::optional<QString> audioUrl;
    QString source;              ///< "yt-dlp" or the instance that answered
    ErrorKind error = ErrorKind::None;         ///< ExtractionFailed when both stages fail
    ErrorKind fallbackError = ErrorKind::None; ///< AllInstancesExhausted when stage B failed
    QStringList attempts;        ///< One line per attempt, in order

    [[nodiscard]] bool ok() const noexcept { return audioUrl.has_value(); }
};

/**
 * @class ExtractorChain
 * @brief Primary extraction with sequential instance fallback
 *
 * Stage A asks the local backend. If it fails, stage B tries the configured
 * instances one at a time in a freshly shuffled order and stops at the first
 * usable answer. Nothing is cached here.
 *
 * Collaborators are borrowed and must outlive the chain.
 */
class ExtractorChain {
public:
    ExtractorChain(ExtractionBackend& primary, FallbackClient& fallback, QStringList instances);

    [[nodiscard]] ExtractionResult extract(const QString& link);

    /**
     * @brief Disable per-call shuffling (instances are tried in list order)
     */
    void setShuffleInstances(bool shuffle) { m_shuffle = shuffle; }

    [[nodiscard]] const QStringList& instances() const noexcept { return m_instances; }

    /**
     * @brief Conversion request sent to every instance
     */
    [[nodiscard]] static QJsonObject buildFallbackPayload(const QString& link);

    /**
     * @brief Extract the audio URL from an instance response body
     *
     * Accepted shapes, in order: {status:"redirect", url}, {url}, {audio}.
     */
    [[nodiscard]] static std::optional<QString> parseFallbackResponse(const QByteArray& body);

private:
    std::optional<QString> tryInstances(const QString& link, ExtractionResult& result);

    ExtractionBackend& m_primary;
    FallbackClient& m_fallback;
    QStringList m_instances;
    bool m_shuffle = true;
};

} // namespace MusicRelay
