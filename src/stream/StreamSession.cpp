/**
 * @file StreamSession.cpp
 * @brief Implementation of transcoder subprocess ownership
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/stream/StreamSession.h"

#include <QDebug>

#include <atomic>
#include <exception>

namespace MusicRelay {

namespace {
    std::atomic<int> g_liveSessions{0};

    constexpr int MAX_DIAGNOSTIC_LINE = 4096;
}

StreamSession::StreamSession(const OutputProfile& profile)
    : m_profile(profile)
    , m_process(std::make_unique<QProcess>())
{
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    m_process->setReadChannel(QProcess::StandardOutput);
    g_liveSessions.fetch_add(1);
}

StreamSession::~StreamSession()
{
    if (m_started && isRunning()) {
        shutdown(Config::KILL_GRACE_PERIOD);
    }
    g_liveSessions.fetch_sub(1);
}

int StreamSession::liveSessions() noexcept
{
    return g_liveSessions.load();
}

bool StreamSession::start(const QString& program, const QStringList& arguments, Duration spawnTimeout)
{
    m_process->start(program, arguments, QIODevice::ReadOnly);

    if (!m_process->waitForStarted(static_cast<int>(spawnTimeout.count()))) {
        qWarning() << "StreamSession: Failed to start" << program << ":" << m_process->errorString();
        return false;
    }

    m_started = true;
    m_startTime.start();
    qDebug() << "StreamSession: Started" << program << "pid" << m_process->processId()
             << "profile" << m_profile.name;
    return true;
}

bool StreamSession::isRunning() const
{
    return m_process->state() != QProcess::NotRunning;
}

void StreamSession::drainDiagnostics() noexcept
{
    try {
        const QByteArray pending = m_process->readAllStandardError();
        if (pending.isEmpty()) {
            return;
        }

        m_diagnosticTail.append(pending);

        qsizetype start = 0;
        qsizetype newline = 0;
        while ((newline = m_diagnosticTail.indexOf('\n', start)) >= 0) {
            logDiagnosticLine(m_diagnosticTail.mid(start, newline - start));
            start = newline + 1;
        }
        m_diagnosticTail.remove(0, start);

        // ffmpeg rewrites its progress line with '\r' and no '\n'
        if (m_diagnosticTail.size() > MAX_DIAGNOSTIC_LINE) {
            logDiagnosticLine(m_diagnosticTail.right(MAX_DIAGNOSTIC_LINE));
            m_diagnosticTail.clear();
        }
    } catch (const std::exception& e) {
        m_diagnosticTail.clear();
        qDebug() << "StreamSession: Diagnostic drain failed:" << e.what();
    }
}

void StreamSession::logDiagnosticLine(const QByteArray& line) const
{
    const QByteArray trimmed = line.trimmed();
    if (trimmed.isEmpty() || !m_profile.acceptsDiagnostic(trimmed)) {
        return;
    }

    if (m_profile.diagnostics == DiagnosticFilter::All) {
        qDebug().noquote() << "FFmpeg:" << QString::fromUtf8(trimmed);
    } else {
        qWarning().noquote() << "FFmpeg:" << QString::fromUtf8(trimmed);
    }
}

TerminationKind StreamSession::shutdown(Duration grace)
{
    if (!m_started) {
        return TerminationKind::NotStarted;
    }

    if (m_process->state() == QProcess::NotRunning) {
        return TerminationKind::AlreadyExited;
    }

    m_process->terminate();
    if (m_process->waitForFinished(static_cast<int>(grace.count()))) {
        qDebug() << "StreamSession: Subprocess terminated";
        return TerminationKind::Terminated;
    }

    qWarning() << "StreamSession: Subprocess ignored SIGTERM for" << grace.count() << "ms, killing";
    m_process->kill();
    m_process->waitForFinished(static_cast<int>(Config::SPAWN_TIMEOUT.count()));
    return TerminationKind::Killed;
}

} // namespace MusicRelay
