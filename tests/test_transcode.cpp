/**
 * @file test_transcode.cpp
 * @brief Unit tests for encoder profiles and the transcoding loop
 *
 * The loop is driven by small shell scripts standing in for the transcoder.
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include <QtTest>

#include "musicrelay/stream/OutputProfile.h"
#include "musicrelay/stream/TranscodeEngine.h"

#include <algorithm>

using namespace MusicRelay;
using namespace std::chrono_literals;

namespace {

/// Runs a shell script instead of the transcoder
class ScriptEngine : public TranscodeEngine {
public:
    explicit ScriptEngine(QString script, QString program = QStringLiteral("/bin/sh"))
        : TranscodeEngine(QStringLiteral("/bin/false"))
        , m_script(std::move(script))
        , m_program(std::move(program))
    {
        setPollInterval(5ms);
    }

    TranscodeCommand buildCommand(const QString& /*sourceUrl*/, const OutputProfile& /*profile*/) const override {
        return TranscodeCommand{m_program, {QStringLiteral("-c"), m_script}};
    }

private:
    QString m_script;
    QString m_program;
};

ChunkSink collectInto(QByteArray& output)
{
    return [&output](const QByteArray& chunk) {
        output.append(chunk);
        return true;
    };
}

}

class TestTranscode : public QObject
{
    Q_OBJECT

private slots:
    // OutputProfile
    void testWebProfileArguments();
    void testConstrainedProfileArguments();
    void testDownloadProfileArguments();
    void testDiagnosticFilter();

    // TranscodeEngine
    void testStreamCompletes();
    void testChunksRespectProfileSize();
    void testNonZeroExitIsError();
    void testSpawnFailure();
    void testSinkRejectionStopsStream();
    void testTokenCancellation();
    void testStubbornProcessIsKilled();
    void testStallTimeout();
    void testSilentPeerProbeStopsStream();
    void testNoSessionsLeak();
};

// ═══════════════════════════════════════════════════════════════════════════════
// OutputProfile
// ═══════════════════════════════════════════════════════════════════════════════

void TestTranscode::testWebProfileArguments()
{
    const OutputProfile& profile = OutputProfile::web();
    const QStringList args = profile.transcoderArguments(QStringLiteral("https://cdn/a"));

    QCOMPARE(profile.chunkSize, ByteCount(8192));
    QCOMPARE(args.first(), QStringLiteral("-nostdin"));
    QVERIFY(args.contains(QStringLiteral("-reconnect")));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-reconnect_delay_max")) + 1), QStringLiteral("5"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-i")) + 1), QStringLiteral("https://cdn/a"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-f")) + 1), QStringLiteral("mp3"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-acodec")) + 1), QStringLiteral("libmp3lame"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-ar")) + 1), QStringLiteral("44100"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-ac")) + 1), QStringLiteral("2"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-b:a")) + 1), QStringLiteral("192k"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-bufsize")) + 1), QStringLiteral("512k"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-max_delay")) + 1), QStringLiteral("500000"));
    QVERIFY(!args.contains(QStringLiteral("-q:a")));
    QCOMPARE(args.mid(args.size() - 2), (QStringList{QStringLiteral("-vn"), QStringLiteral("-")}));

    // Reconnect options belong to the input
    QVERIFY(args.indexOf(QStringLiteral("-reconnect")) < args.indexOf(QStringLiteral("-i")));
}

void TestTranscode::testConstrainedProfileArguments()
{
    const OutputProfile& profile = OutputProfile::constrained();
    const QStringList args = profile.transcoderArguments(QStringLiteral("https://cdn/a"));

    QCOMPARE(profile.chunkSize, ByteCount(4096));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-ar")) + 1), QStringLiteral("24000"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-b:a")) + 1), QStringLiteral("80k"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-q:a")) + 1), QStringLiteral("7"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-bufsize")) + 1), QStringLiteral("160k"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-fflags")) + 1), QStringLiteral("+discardcorrupt"));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-max_muxing_queue_size")) + 1), QStringLiteral("640"));
    QVERIFY(!args.contains(QStringLiteral("-max_delay")));
    QCOMPARE(args.last(), QStringLiteral("-"));
}

void TestTranscode::testDownloadProfileArguments()
{
    const QStringList args = OutputProfile::download().transcoderArguments(QStringLiteral("https://cdn/a"));

    QVERIFY(!args.contains(QStringLiteral("-reconnect")));
    QVERIFY(!args.contains(QStringLiteral("-bufsize")));
    QVERIFY(!args.contains(QStringLiteral("-max_delay")));
    QCOMPARE(args.at(args.indexOf(QStringLiteral("-b:a")) + 1), QStringLiteral("192k"));
}

void TestTranscode::testDiagnosticFilter()
{
    const OutputProfile& web = OutputProfile::web();
    const OutputProfile& constrained = OutputProfile::constrained();

    QVERIFY(web.acceptsDiagnostic("size=     512kB time=00:00:21.33"));
    QVERIFY(!constrained.acceptsDiagnostic("size=     512kB time=00:00:21.33"));
    QVERIFY(constrained.acceptsDiagnostic("[mp3 @ 0x55] Error while decoding stream"));
    QVERIFY(constrained.acceptsDiagnostic("Invalid data found when processing input"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// TranscodeEngine
// ═══════════════════════════════════════════════════════════════════════════════

void TestTranscode::testStreamCompletes()
{
    ScriptEngine engine(QStringLiteral("head -c 20000 /dev/zero"));
    CancellationToken token;
    QByteArray output;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
                                                collectInto(output), token);

    QCOMPARE(outcome.state, StreamState::Completed);
    QCOMPARE(outcome.error, ErrorKind::None);
    QCOMPARE(outcome.bytesSent, ByteCount(20000));
    QCOMPARE(output.size(), qsizetype(20000));
    QCOMPARE(outcome.exitCode, 0);
    QCOMPARE(outcome.termination, TerminationKind::AlreadyExited);
}

void TestTranscode::testChunksRespectProfileSize()
{
    ScriptEngine engine(QStringLiteral("head -c 50000 /dev/zero"));
    CancellationToken token;
    qsizetype largest = 0;
    ByteCount total = 0;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::constrained(),
        [&](const QByteArray& chunk) {
            largest = std::max(largest, chunk.size());
            total += chunk.size();
            return true;
        }, token);

    QVERIFY(outcome.completed());
    QCOMPARE(total, ByteCount(50000));
    QVERIFY(largest <= 4096);
}

void TestTranscode::testNonZeroExitIsError()
{
    ScriptEngine engine(QStringLiteral("printf abc; echo 'Error opening input' >&2; exit 3"));
    CancellationToken token;
    QByteArray output;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
                                                collectInto(output), token);

    QCOMPARE(outcome.state, StreamState::SubprocessError);
    QCOMPARE(outcome.error, ErrorKind::SubprocessError);
    QCOMPARE(outcome.exitCode, 3);
    QCOMPARE(output, QByteArray("abc"));
}

void TestTranscode::testSpawnFailure()
{
    ScriptEngine engine(QString(), QStringLiteral("/nonexistent/musicrelay-transcoder"));
    CancellationToken token;
    bool called = false;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
        [&called](const QByteArray&) { called = true; return true; }, token);

    QCOMPARE(outcome.state, StreamState::SubprocessError);
    QCOMPARE(outcome.error, ErrorKind::SubprocessSpawnFailed);
    QCOMPARE(outcome.bytesSent, ByteCount(0));
    QVERIFY(!called);
    QCOMPARE(TranscodeEngine::activeSessions(), 0);
}

void TestTranscode::testSinkRejectionStopsStream()
{
    ScriptEngine engine(QStringLiteral("exec yes"));
    CancellationToken token;
    int calls = 0;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
        [&calls](const QByteArray&) { return ++calls < 5; }, token);

    QCOMPARE(outcome.state, StreamState::ClientDisconnected);
    QCOMPARE(outcome.chunksSent, qint64(4));
    QCOMPARE(calls, 5);
    QVERIFY(token.isCancelled());
    QVERIFY(outcome.termination == TerminationKind::Terminated
            || outcome.termination == TerminationKind::Killed);
}

void TestTranscode::testTokenCancellation()
{
    ScriptEngine engine(QStringLiteral("exec yes"));
    CancellationToken token;
    int calls = 0;

    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
        [&](const QByteArray&) {
            if (++calls == 3) token.cancel();
            return true;
        }, token);

    QCOMPARE(outcome.state, StreamState::ClientDisconnected);
    QCOMPARE(outcome.chunksSent, qint64(3));
}

void TestTranscode::testStubbornProcessIsKilled()
{
    ScriptEngine engine(QStringLiteral("trap '' TERM; while true; do echo tick; done"));
    engine.setKillGracePeriod(200ms);
    CancellationToken token;

    QElapsedTimer timer;
    timer.start();
    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
        [](const QByteArray&) { return false; }, token);

    QCOMPARE(outcome.state, StreamState::ClientDisconnected);
    QCOMPARE(outcome.termination, TerminationKind::Killed);
    QVERIFY(timer.elapsed() < 5000);
}

void TestTranscode::testStallTimeout()
{
    ScriptEngine engine(QStringLiteral("exec sleep 30"));
    engine.setStallTimeout(300ms);
    CancellationToken token;
    QByteArray output;

    QElapsedTimer timer;
    timer.start();
    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
                                                collectInto(output), token);

    QCOMPARE(outcome.state, StreamState::SubprocessError);
    QCOMPARE(outcome.error, ErrorKind::SubprocessError);
    QCOMPARE(outcome.termination, TerminationKind::Terminated);
    QVERIFY(timer.elapsed() < 10000);
}

void TestTranscode::testSilentPeerProbeStopsStream()
{
    ScriptEngine engine(QStringLiteral("exec sleep 30"));
    engine.setPeerCheckInterval(20ms);
    CancellationToken token;
    QByteArray output;
    int probes = 0;

    QElapsedTimer timer;
    timer.start();
    const StreamOutcome outcome = engine.stream(QStringLiteral("src"), OutputProfile::web(),
                                                collectInto(output), token,
                                                [&probes]() { return ++probes < 3; });

    QCOMPARE(outcome.state, StreamState::ClientDisconnected);
    QCOMPARE(outcome.termination, TerminationKind::Terminated);
    QCOMPARE(probes, 3);
    QVERIFY(token.isCancelled());
    QVERIFY(output.isEmpty());
    QVERIFY(timer.elapsed() < 5000);
    QCOMPARE(TranscodeEngine::activeSessions(), 0);
}

void TestTranscode::testNoSessionsLeak()
{
    ScriptEngine finishing(QStringLiteral("head -c 1000 /dev/zero"));
    ScriptEngine endless(QStringLiteral("exec yes"));

    for (int i = 0; i < 5; ++i) {
        CancellationToken a;
        CancellationToken b;
        (void)finishing.stream(QStringLiteral("src"), OutputProfile::web(),
                               [](const QByteArray&) { return true; }, a);
        (void)endless.stream(QStringLiteral("src"), OutputProfile::constrained(),
                             [](const QByteArray&) { return false; }, b);
        QCOMPARE(TranscodeEngine::activeSessions(), 0);
    }
}

QTEST_MAIN(TestTranscode)
#include "test_transcode.moc"
