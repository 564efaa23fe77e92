/**
 * @file YtDlpExtractor.h
 * @brief Extraction backend driving the yt-dlp executable
 *
 * yt-dlp is GPL licensed. It is used as an external process, maintaining
 * license compatibility.
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/resolve/ExtractionBackend.h"

#include <QByteArray>
#include <QJsonObject>
#include <QStringList>

namespace MusicRelay {

/**
 * @class YtDlpExtractor
 * @brief Runs `yt-dlp -J` synchronously on the calling thread
 *
 * Each call owns its own QProcess, so one instance can serve many request
 * workers at once. A run that exceeds the process timeout is killed.
 */
class YtDlpExtractor : public ExtractionBackend {
public:
    /**
     * @param ytdlpPath Executable path; empty to search PATH
     * @param socketTimeoutSeconds Passed to yt-dlp as --socket-timeout
     * @param processTimeoutSeconds Upper bound on the whole run
     */
    YtDlpExtractor(const QString& ytdlpPath, int socketTimeoutSeconds, int processTimeoutSeconds);

    [[nodiscard]] BackendResult extract(const QString& link) override;
    [[nodiscard]] MediaInfo fetchInfo(const QString& url) override;

    [[nodiscard]] QString ytDlpPath() const { return m_ytdlpPath; }

    [[nodiscard]] bool isAvailable() const;

    /**
     * @brief Get yt-dlp version
     */
    [[nodiscard]] QString version() const;

    /**
     * @brief Command line used for audio extraction
     */
    [[nodiscard]] QStringList extractionArguments(const QString& link, const QString& userAgent) const;

    /**
     * @brief Pick the audio URL from a yt-dlp info document
     *
     * Top-level "url" wins; otherwise the first audio-only format.
     */
    [[nodiscard]] static std::optional<QString> selectAudioUrl(const QJsonObject& info);

    [[nodiscard]] static MediaInfo parseMediaInfo(const QJsonObject& info);

    /**
     * @brief Locate yt-dlp in PATH and common install locations
     */
    [[nodiscard]] static QString findYtDlp();

private:
    struct RunResult {
        bool finished = false;
        QByteArray output;
        QString error;
    };

    RunResult run(const QStringList& args) const;

    QString m_ytdlpPath;
    int m_socketTimeoutSeconds;
    int m_processTimeoutSeconds;
};

} // namespace MusicRelay
