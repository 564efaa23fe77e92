/**
 * @file OutputProfile.h
 * @brief Fixed encoder parameter sets for the supported client classes
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/core/Types.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace MusicRelay {

/**
 * @brief Which transcoder diagnostic lines reach the log
 */
enum class DiagnosticFilter : uint8_t {
    All,            ///< Every line, debug level
    ErrorsOnly      ///< Lines mentioning "error" or "invalid", warning level
};

/**
 * @brief Immutable encoder configuration
 */
struct OutputProfile {
    QString name;
    QString format = QStringLiteral("mp3");
    QString codec = QStringLiteral("libmp3lame");
    int sampleRate = 44100;
    int channels = 2;
    int bitrateKbps = 192;
    std::optional<int> vbrQuality;           ///< -q:a
    QString bufferSize;                      ///< -bufsize, empty to omit
    int maxDelayUs = 0;                      ///< -max_delay, 0 to omit
    QStringList extraArguments;              ///< Appended before -vn
    ByteCount chunkSize = Config::WEB_CHUNK_SIZE;
    bool reconnect = true;
    int reconnectDelayMaxSec = 5;
    DiagnosticFilter diagnostics = DiagnosticFilter::All;
    ByteCount progressEveryBytes = 0;        ///< Progress log interval, 0 = by chunks
    int progressEveryChunks = 0;

    /// Web players: 44.1 kHz stereo, 192 kbps
    [[nodiscard]] static const OutputProfile& web();

    /// Embedded devices: 24 kHz stereo, ~80 kbps VBR, small chunks
    [[nodiscard]] static const OutputProfile& constrained();

    /// File download: web quality without input reconnect or buffering flags
    [[nodiscard]] static const OutputProfile& download();

    /**
     * @brief Full transcoder argument list for a source URL
     */
    [[nodiscard]] QStringList transcoderArguments(const QString& sourceUrl) const;

    /**
     * @brief Whether a diagnostic line should be logged under this profile
     */
    [[nodiscard]] bool acceptsDiagnostic(const QByteArray& line) const;
};

} // namespace MusicRelay
