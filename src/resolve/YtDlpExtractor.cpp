/**
 * @file YtDlpExtractor.cpp
 * @brief Implementation of the yt-dlp extraction backend
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/YtDlpExtractor.h"
#include "musicrelay/core/Types.h"
#include "musicrelay/core/UserAgent.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QProcess>
#include <QStandardPaths>

namespace MusicRelay {

namespace {
    constexpr auto AUDIO_FORMAT = "bestaudio[ext=m4a]/bestaudio/best";
    constexpr auto EXTRACTOR_ARGS = "youtube:player_client=android,web;player_skip=webpage";
    constexpr int DESCRIPTION_PREVIEW = 200;
    constexpr int VERSION_TIMEOUT_MS = 5000;

    std::optional<QJsonObject> parseInfo(const QByteArray& output, QString& error)
    {
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(output, &parseError);

        if (parseError.error != QJsonParseError::NoError) {
            error = QStringLiteral("JSON parse error: %1").arg(parseError.errorString());
            return std::nullopt;
        }
        if (!doc.isObject()) {
            error = QStringLiteral("Invalid yt-dlp output format");
            return std::nullopt;
        }
        return doc.object();
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Construction
// ═══════════════════════════════════════════════════════════════════════════════

YtDlpExtractor::YtDlpExtractor(const QString& ytdlpPath, int socketTimeoutSeconds,
                               int processTimeoutSeconds)
    : m_ytdlpPath(ytdlpPath.isEmpty() ? findYtDlp() : ytdlpPath)
    , m_socketTimeoutSeconds(socketTimeoutSeconds)
    , m_processTimeoutSeconds(processTimeoutSeconds)
{
    if (!m_ytdlpPath.isEmpty()) {
        qDebug() << "YtDlpExtractor: Using yt-dlp at" << m_ytdlpPath;
    } else {
        qWarning() << "YtDlpExtractor: yt-dlp not found";
    }
}

QString YtDlpExtractor::findYtDlp()
{
    QString path = QStandardPaths::findExecutable(QStringLiteral("yt-dlp"));
    if (!path.isEmpty()) {
        return path;
    }

    const QStringList extraDirs = {
        QStringLiteral("/usr/local/bin"),
        QStringLiteral("/usr/bin"),
        QDir::homePath() + QStringLiteral("/.local/bin"),
    };
    return QStandardPaths::findExecutable(QStringLiteral("yt-dlp"), extraDirs);
}

bool YtDlpExtractor::isAvailable() const
{
    if (m_ytdlpPath.isEmpty()) {
        return false;
    }

    QFileInfo info(m_ytdlpPath);
    return info.exists() && info.isExecutable();
}

QString YtDlpExtractor::version() const
{
    if (!isAvailable()) {
        return QString();
    }

    QProcess process;
    process.start(m_ytdlpPath, {QStringLiteral("--version")});

    if (process.waitForFinished(VERSION_TIMEOUT_MS)) {
        return QString::fromUtf8(process.readAllStandardOutput()).trimmed();
    }

    process.kill();
    process.waitForFinished(VERSION_TIMEOUT_MS);
    return QString();
}

// ═══════════════════════════════════════════════════════════════════════════════
// Extraction
// ═══════════════════════════════════════════════════════════════════════════════

QStringList YtDlpExtractor::extractionArguments(const QString& link, const QString& userAgent) const
{
    QStringList args;
    args << QStringLiteral("-J");
    args << QStringLiteral("--no-playlist");
    args << QStringLiteral("--no-warnings");
    args << QStringLiteral("--socket-timeout") << QString::number(m_socketTimeoutSeconds);
    args << QStringLiteral("-f") << QLatin1String(AUDIO_FORMAT);
    args << QStringLiteral("--extractor-args") << QLatin1String(EXTRACTOR_ARGS);
    args << QStringLiteral("--user-agent") << userAgent;
    args << QStringLiteral("--add-header") << QStringLiteral("Accept:*/*");
    args << QStringLiteral("--add-header") << QStringLiteral("Accept-Language:en-US,en;q=0.9");
    args << QStringLiteral("--add-header") << QStringLiteral("Accept-Encoding:gzip, deflate");
    args << QStringLiteral("--") << link;
    return args;
}

BackendResult YtDlpExtractor::extract(const QString& link)
{
    if (!isAvailable()) {
        return BackendResult::failure(QStringLiteral("yt-dlp is not available"));
    }

    qInfo() << "YtDlpExtractor: Extracting audio URL for" << link.left(80);

    const RunResult run = this->run(extractionArguments(link, randomUserAgent()));
    if (!run.finished) {
        qWarning() << "YtDlpExtractor:" << run.error;
        return BackendResult::failure(run.error);
    }

    QString error;
    const std::optional<QJsonObject> info = parseInfo(run.output, error);
    if (!info) {
        qWarning() << "YtDlpExtractor:" << error;
        return BackendResult::failure(error);
    }

    std::optional<QString> url = selectAudioUrl(*info);
    if (!url) {
        qWarning() << "YtDlpExtractor: No audio URL in info for" << link.left(80);
        return BackendResult::failure(QStringLiteral("No audio URL in yt-dlp output"));
    }

    qInfo() << "YtDlpExtractor: Found audio:" << (*info)[QLatin1String("title")].toString()
            << QStringLiteral("(%1s)").arg((*info)[QLatin1String("duration")].toDouble());
    qDebug() << "YtDlpExtractor: Audio URL:" << url->left(100);

    return BackendResult{std::move(url), QString()};
}

std::optional<QString> YtDlpExtractor::selectAudioUrl(const QJsonObject& info)
{
    const QString direct = info[QLatin1String("url")].toString();
    if (!direct.isEmpty()) {
        return direct;
    }

    const QJsonArray formats = info[QLatin1String("formats")].toArray();
    for (const QJsonValue& value : formats) {
        const QJsonObject format = value.toObject();

        // A missing acodec counts as present, a missing vcodec does not
        const QJsonValue acodec = format[QLatin1String("acodec")];
        const bool hasAudio = acodec.toString() != QLatin1String("none");
        const bool audioOnly = format[QLatin1String("vcodec")].toString() == QLatin1String("none");

        if (hasAudio && audioOnly) {
            const QString url = format[QLatin1String("url")].toString();
            if (!url.isEmpty()) {
                qDebug() << "YtDlpExtractor: Using format"
                         << format[QLatin1String("format_note")].toString(QStringLiteral("unknown"));
                return url;
            }
        }
    }

    return std::nullopt;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Media Info
// ═══════════════════════════════════════════════════════════════════════════════

MediaInfo YtDlpExtractor::fetchInfo(const QString& url)
{
    if (!isAvailable()) {
        return MediaInfo{};
    }

    const QStringList args = {
        QStringLiteral("-J"),
        QStringLiteral("--no-playlist"),
        QStringLiteral("--no-warnings"),
        QStringLiteral("--socket-timeout"), QString::number(m_socketTimeoutSeconds),
        QStringLiteral("--"), url,
    };

    const RunResult run = this->run(args);
    if (!run.finished) {
        qDebug() << "YtDlpExtractor: Info lookup failed:" << run.error;
        return MediaInfo{};
    }

    QString error;
    const std::optional<QJsonObject> info = parseInfo(run.output, error);
    if (!info) {
        qDebug() << "YtDlpExtractor: Info lookup failed:" << error;
        return MediaInfo{};
    }
    return parseMediaInfo(*info);
}

MediaInfo YtDlpExtractor::parseMediaInfo(const QJsonObject& info)
{
    MediaInfo media;

    const QString title = info[QLatin1String("title")].toString();
    if (!title.isEmpty()) {
        media.title = title;
    }

    QString artist = info[QLatin1String("artist")].toString();
    if (artist.isEmpty()) {
        artist = info[QLatin1String("uploader")].toString();
    }
    if (!artist.isEmpty()) {
        media.artist = artist;
    }

    media.duration = static_cast<int>(info[QLatin1String("duration")].toDouble());
    media.thumbnail = info[QLatin1String("thumbnail")].toString();

    const QString description = info[QLatin1String("description")].toString();
    if (!description.isEmpty()) {
        media.description = description.left(DESCRIPTION_PREVIEW) + QStringLiteral("...");
    }

    return media;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Process Execution
// ═══════════════════════════════════════════════════════════════════════════════

YtDlpExtractor::RunResult YtDlpExtractor::run(const QStringList& args) const
{
    RunResult result;

    QProcess process;
    process.start(m_ytdlpPath, args);

    if (!process.waitForStarted(static_cast<int>(Config::SPAWN_TIMEOUT.count()))) {
        result.error = QStringLiteral("Failed to start yt-dlp: %1").arg(process.errorString());
        return result;
    }

    if (!process.waitForFinished(m_processTimeoutSeconds * 1000)) {
        process.kill();
        process.waitForFinished(static_cast<int>(Config::KILL_GRACE_PERIOD.count()));
        result.error = QStringLiteral("yt-dlp timed out after %1s").arg(m_processTimeoutSeconds);
        return result;
    }

    if (process.exitStatus() != QProcess::NormalExit || process.exitCode() != 0) {
        const QString errorOutput = QString::fromUtf8(process.readAllStandardError()).trimmed();
        result.error = errorOutput.isEmpty()
            ? QStringLiteral("yt-dlp exited with code %1").arg(process.exitCode())
            : errorOutput.left(200);
        return result;
    }

    result.finished = true;
    result.output = process.readAllStandardOutput();
    return result;
}

} // namespace MusicRelay
