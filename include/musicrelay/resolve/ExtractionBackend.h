/**
 * @file ExtractionBackend.h
 * @brief Interface to a local media extraction backend
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QString>

#include <optional>

namespace MusicRelay {

/**
 * @brief Result of one extraction attempt
 */
struct BackendResult {
    std::optional<QString> audioUrl;   ///< Directly fetchable audio URL
    QString detail;                    ///< Failure description when audioUrl is empty

    [[nodiscard]] bool ok() const noexcept { return audioUrl.has_value(); }

    [[nodiscard]] static BackendResult failure(QString why) {
        return BackendResult{std::nullopt, std::move(why)};
    }
};

/**
 * @brief Descriptive metadata of a media item
 *
 * Fields the backend cannot supply keep their "Unknown"/empty defaults.
 */
struct MediaInfo {
    QString title = QStringLiteral("Unknown");
    QString artist = QStringLiteral("Unknown");
    int duration = 0;                  ///< Seconds
    QString thumbnail;
    QString description;               ///< First 200 characters, "..." appended

    [[nodiscard]] bool hasKnownArtist() const {
        return artist != QLatin1String("Unknown");
    }
};

/**
 * @brief Abstract extraction backend
 *
 * Implementations are called concurrently from request workers and must
 * never throw: every failure is reported through the returned value.
 */
class ExtractionBackend {
public:
    virtual ~ExtractionBackend() = default;

    /**
     * @brief Turn a media page link into a directly fetchable audio URL
     */
    [[nodiscard]] virtual BackendResult extract(const QString& link) = 0;

    /**
     * @brief Look up descriptive metadata for a URL
     */
    [[nodiscard]] virtual MediaInfo fetchInfo(const QString& url) = 0;
};

} // namespace MusicRelay
