/**
 * @file test_server.cpp
 * @brief Unit tests for the HTTP server and the endpoints
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include <QtTest>

#include <QJsonArray>
#include <QJsonDocument>
#include <QTcpSocket>
#include <QUrlQuery>

#include <httplib.h>

#include "musicrelay/cache/StreamCache.h"
#include "musicrelay/core/StatsRegistry.h"
#include "musicrelay/resolve/ExtractorChain.h"
#include "musicrelay/resolve/Resolver.h"
#include "musicrelay/resolve/StreamLocator.h"
#include "musicrelay/server/HttpServer.h"
#include "musicrelay/server/MusicService.h"
#include "musicrelay/stream/TranscodeEngine.h"

using namespace MusicRelay;
using namespace std::chrono_literals;

namespace {

class FakeSearch : public MetadataSearch {
public:
    bool found = true;

    std::optional<QList<SearchHit>> search(const QString& query, ResultClass /*cls*/) override {
        if (!found) return QList<SearchHit>{};
        return QList<SearchHit>{{QStringLiteral("vid001"), query, {QStringLiteral("Artist")}}};
    }
};

class FakeBackend : public ExtractionBackend {
public:
    QString url = QStringLiteral("https://cdn.example/audio.m4a");
    MediaInfo info;
    QString lastInfoUrl;

    QString lastLink;

    BackendResult extract(const QString& link) override {
        lastLink = link;
        return BackendResult{url, QString()};
    }

    MediaInfo fetchInfo(const QString& source) override {
        lastInfoUrl = source;
        return info;
    }
};

class NoFallback : public FallbackClient {
public:
    FallbackResponse post(const QString& /*instance*/, const QJsonObject& /*payload*/) override {
        return FallbackResponse{};
    }
};

/// Records what would have been passed to the transcoder and runs a script instead
class RecordingEngine : public TranscodeEngine {
public:
    RecordingEngine()
        : TranscodeEngine(QStringLiteral("/bin/false"))
    {
        setPollInterval(5ms);
    }

    TranscodeCommand buildCommand(const QString& sourceUrl, const OutputProfile& profile) const override {
        lastUrl = sourceUrl;
        lastProfile = profile.name;
        return TranscodeCommand{QStringLiteral("/bin/sh"), {QStringLiteral("-c"), script}};
    }

    QString script = QStringLiteral("head -c 10000 /dev/zero");
    mutable QString lastUrl;
    mutable QString lastProfile;
};

/// Collects a streamed body in memory
class BufferWriter : public ChunkWriter {
public:
    BufferWriter(QByteArray& body, int& chunks)
        : m_body(body)
        , m_chunks(chunks)
    {
    }

    bool write(const QByteArray& chunk) override {
        m_body.append(chunk);
        ++m_chunks;
        return true;
    }

    bool isConnected() override { return true; }

private:
    QByteArray& m_body;
    int& m_chunks;
};

/// Runs stream producers inline and keeps whatever was sent
class RecordingResponder : public HttpResponder {
public:
    void sendResponse(int code, const HttpHeaders& h, const QByteArray& b) override {
        status = code;
        headers = h;
        body = b;
        streamed = false;
    }

    void sendStream(int code, const HttpHeaders& h, StreamProducer producer) override {
        status = code;
        headers = h;
        body.clear();
        streamed = true;

        BufferWriter writer(body, chunks);
        producer(writer);
        ended = true;
    }

    QByteArray header(const QByteArray& name) const {
        for (const auto& [key, value] : headers) {
            if (key.compare(name, Qt::CaseInsensitive) == 0) return value;
        }
        return {};
    }

    QJsonObject json() const { return QJsonDocument::fromJson(body).object(); }
    QString text() const { return QString::fromUtf8(body); }

    int status = 0;
    HttpHeaders headers;
    QByteArray body;
    bool streamed = false;
    bool ended = false;
    int chunks = 0;
};

/// Builds the request the server would decode from target
HttpRequest makeRequest(const QByteArray& target, const QByteArray& method, const QByteArray& host)
{
    HttpRequest request;
    request.method = method;

    const qsizetype question = target.indexOf('?');
    request.path = QString::fromUtf8(question < 0 ? target : target.left(question));
    if (question >= 0) {
        QString query = QString::fromUtf8(target.mid(question + 1));
        query.replace(QLatin1Char('+'), QLatin1Char(' '));
        const auto items = QUrlQuery(query).queryItems(QUrl::FullyDecoded);
        for (const auto& [name, value] : items) {
            if (!request.params.contains(name)) {
                request.params.insert(name, value);
            }
        }
    }

    request.headers.insert(QByteArrayLiteral("host"), host);
    request.headers.insert(QByteArrayLiteral("user-agent"), QByteArrayLiteral("ESP32-Audio/1.0"));
    request.localAddress = QStringLiteral("192.168.1.10:7879");
    request.remoteAddress = QStringLiteral("192.168.1.77");
    return request;
}

/// A fully wired service over fakes
struct Harness {
    FakeSearch search;
    FakeBackend backend;
    NoFallback fallback;
    StreamCache cache{1800s, 100};
    Resolver resolver{search};
    ExtractorChain chain{backend, fallback, QStringList{}};
    StatsRegistry stats;
    StreamLocator locator{cache, resolver, chain, stats};
    RecordingEngine engine;
    MusicService service{locator, backend, engine, cache, stats,
                         ToolStatus{QStringLiteral("ffmpeg version 6.1"), QStringLiteral("2024.08.06")}};

    RecordingResponder request(const QByteArray& target, const QByteArray& method = "GET",
                               const QByteArray& host = "relay.local:7879") {
        RecordingResponder responder;
        service.handle(makeRequest(target, method, host), responder);
        return responder;
    }
};

/// Echo handler for socket tests
class EchoHandler : public RequestHandler {
public:
    void handle(const HttpRequest& request, HttpResponder& responder) override {
        if (request.path == QLatin1String("/chunked")) {
            responder.sendStream(200, {{QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/plain")}},
                                 [](ChunkWriter& writer) {
                                     writer.write("hello");
                                     writer.write("world!");
                                 });
            return;
        }
        responder.sendResponse(200, {{QByteArrayLiteral("Content-Type"), QByteArrayLiteral("text/plain")}},
                               (request.path + QLatin1Char('|') + request.param(QStringLiteral("q"))).toUtf8());
    }
};

/// Sends raw bytes and reads until the server closes the connection
QByteArray rawRoundTrip(quint16 port, const QByteArray& rawRequest)
{
    QByteArray response;
    QTcpSocket socket;
    socket.connectToHost(QHostAddress::LocalHost, port);
    if (socket.waitForConnected(5000)) {
        socket.write(rawRequest);
        socket.waitForBytesWritten(5000);
        while (socket.waitForReadyRead(5000)) {
            response += socket.readAll();
        }
        response += socket.readAll();
    }
    return response;
}

/// Opens a /stream request and reads until at least minBytes arrived
QByteArray openStream(QTcpSocket& socket, quint16 port, const QByteArray& target, qsizetype minBytes)
{
    QByteArray received;
    socket.connectToHost(QHostAddress::LocalHost, port);
    if (!socket.waitForConnected(5000)) {
        return received;
    }
    socket.write("GET " + target + " HTTP/1.1\r\nHost: localhost\r\n\r\n");
    socket.waitForBytesWritten(5000);

    while (received.size() < minBytes && socket.waitForReadyRead(5000)) {
        received += socket.readAll();
    }
    return received;
}

}

class TestServer : public QObject
{
    Q_OBJECT

private slots:
    void testHostFallback();

    // HttpServer over loopback
    void testServerFixedResponse();
    void testServerChunkedResponse();
    void testServerBadRequest();
    void testServerDecodesQuery();
    void testServerDebugReportsPeer();
    void testClientAbortMidStreamReapsTranscoder();
    void testClientLeavesBeforeFirstChunk();

    // MusicService
    void testStreamMissingQuery();
    void testStreamSuccess();
    void testStreamDirectLink();
    void testStreamNotFound();
    void testStreamTranscoderFailure();
    void testStreamEmptyOutput();
    void testEsp32Stream();
    void testEsp32StreamMissingSong();
    void testStreamPcmSuccess();
    void testStreamPcmMissingSong();
    void testStreamPcmNotFound();
    void testApiMusic();
    void testApiMusicErrors();
    void testDownload();
    void testDownloadFilename();
    void testClearCache();
    void testStatusAndStats();
    void testDebug();
    void testUnknownEndpoint();
    void testMethodNotAllowed();
};

void TestServer::testHostFallback()
{
    HttpRequest request;
    request.localAddress = QStringLiteral("192.168.1.10:7879");
    QCOMPARE(request.host(), QStringLiteral("192.168.1.10:7879"));

    request.headers.insert(QByteArrayLiteral("host"), QByteArrayLiteral("relay.local"));
    QCOMPARE(request.host(), QStringLiteral("relay.local"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// HttpServer
// ═══════════════════════════════════════════════════════════════════════════════

void TestServer::testServerFixedResponse()
{
    EchoHandler handler;
    HttpServer server(handler, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));
    QVERIFY(server.port() != 0);

    httplib::Client client("127.0.0.1", server.port());
    const auto res = client.Get("/echo?q=Hello+There");

    QVERIFY(res);
    QCOMPARE(res->status, 200);
    QCOMPARE(QString::fromStdString(res->body), QStringLiteral("/echo|Hello There"));
    QCOMPARE(QString::fromStdString(res->get_header_value("Content-Length")), QStringLiteral("17"));
    QCOMPARE(QString::fromStdString(res->get_header_value("Connection")), QStringLiteral("close"));

    server.stop();
    QVERIFY(!server.isRunning());
}

void TestServer::testServerChunkedResponse()
{
    EchoHandler handler;
    HttpServer server(handler, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    const QByteArray response = rawRoundTrip(server.port(), "GET /chunked HTTP/1.1\r\nHost: localhost\r\n\r\n");

    QVERIFY(response.startsWith("HTTP/1.1 200 OK\r\n"));
    QVERIFY(response.contains("Transfer-Encoding: chunked\r\n"));
    QVERIFY(response.contains("Content-Type: text/plain\r\n"));
    QVERIFY(response.endsWith("\r\n\r\n5\r\nhello\r\n6\r\nworld!\r\n0\r\n\r\n"));

    server.stop();
}

void TestServer::testServerBadRequest()
{
    EchoHandler handler;
    HttpServer server(handler, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    const QByteArray response = rawRoundTrip(server.port(), "NONSENSE\r\n\r\n");

    QVERIFY(response.startsWith("HTTP/1.1 400 Bad Request\r\n"));
    QVERIFY(response.contains("\"code\":400"));

    server.stop();
}

void TestServer::testServerDecodesQuery()
{
    Harness h;
    HttpServer server(h.service, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    httplib::Client client("127.0.0.1", server.port());
    const auto res = client.Get("/api/music?q=S%C6%A1n+T%C3%B9ng&q=ignored");

    QVERIFY(res);
    QCOMPARE(res->status, 200);
    QCOMPARE(QString::fromStdString(res->get_header_value("Content-Type")), QStringLiteral("application/json"));

    const QJsonObject body = QJsonDocument::fromJson(QByteArray::fromStdString(res->body)).object();
    QCOMPARE(body[QStringLiteral("data")][QStringLiteral("query")].toString(), QStringLiteral("Sơn Tùng"));

    server.stop();
}

void TestServer::testServerDebugReportsPeer()
{
    Harness h;
    HttpServer server(h.service, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    httplib::Client client("127.0.0.1", server.port());
    const auto res = client.Get("/debug", httplib::Headers{{"User-Agent", "ESP32-Audio/1.0"}});

    QVERIFY(res);
    QCOMPARE(res->status, 200);
    const QJsonObject body = QJsonDocument::fromJson(QByteArray::fromStdString(res->body)).object();
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("ip")].toString(), QStringLiteral("127.0.0.1"));
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("user_agent")].toString(),
             QStringLiteral("ESP32-Audio/1.0"));
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("method")].toString(), QStringLiteral("GET"));

    server.stop();
}

void TestServer::testClientAbortMidStreamReapsTranscoder()
{
    Harness h;
    h.engine.script = QStringLiteral("exec yes");
    HttpServer server(h.service, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    QTcpSocket socket;
    const QByteArray received = openStream(socket, server.port(), "/stream?q=endless", 16 * 1024);

    QVERIFY(received.startsWith("HTTP/1.1 200 OK\r\n"));
    QVERIFY(received.size() >= 16 * 1024);
    QCOMPARE(TranscodeEngine::activeSessions(), 1);

    socket.abort();

    QTRY_COMPARE_WITH_TIMEOUT(TranscodeEngine::activeSessions(), 0, 10000);
    server.stop();
}

void TestServer::testClientLeavesBeforeFirstChunk()
{
    Harness h;
    h.engine.script = QStringLiteral("exec sleep 30");
    h.engine.setPeerCheckInterval(50ms);
    HttpServer server(h.service, 4);
    QVERIFY(server.start(QStringLiteral("127.0.0.1"), 0));

    QTcpSocket socket;
    const QByteArray received = openStream(socket, server.port(), "/stream?q=silent", 1);
    QVERIFY(received.startsWith("HTTP/1.1 200"));
    QTRY_COMPARE_WITH_TIMEOUT(TranscodeEngine::activeSessions(), 1, 5000);

    QElapsedTimer timer;
    timer.start();
    socket.disconnectFromHost();

    // Reaped by the liveness poll well before the stall timeout
    QTRY_COMPARE_WITH_TIMEOUT(TranscodeEngine::activeSessions(), 0, 10000);
    QVERIFY(timer.elapsed() < h.engine.stallTimeout().count());
    server.stop();
}

// ═══════════════════════════════════════════════════════════════════════════════
// MusicService
// ═══════════════════════════════════════════════════════════════════════════════

void TestServer::testStreamMissingQuery()
{
    Harness h;
    const RecordingResponder r = h.request("/stream?q=+++");

    QCOMPARE(r.status, 400);
    QCOMPARE(r.text(), QStringLiteral("❌ Thiếu tên bài hát. Sử dụng: /stream?q=tên_bài_hát"));
}

void TestServer::testStreamSuccess()
{
    Harness h;
    const RecordingResponder r = h.request("/stream?q=Hello+Adele");

    QCOMPARE(r.status, 200);
    QVERIFY(r.streamed);
    QVERIFY(r.ended);
    QCOMPARE(r.header("Content-Type"), QByteArray("audio/mpeg"));
    QCOMPARE(r.header("Cache-Control"), QByteArray("no-cache, no-store, must-revalidate"));
    QCOMPARE(r.header("Content-Disposition"), QByteArray("inline; filename=\"Hello%20Adele.mp3\""));
    QCOMPARE(r.body.size(), qsizetype(10000));
    QCOMPARE(h.engine.lastUrl, h.backend.url);
    QCOMPARE(h.engine.lastProfile, QStringLiteral("web"));
    QCOMPARE(h.stats.snapshot().successfulStreams, qint64(1));
}

void TestServer::testStreamDirectLink()
{
    Harness h;
    h.search.found = false;
    const RecordingResponder r = h.request("/stream?q=https%3A%2F%2Fexample.com%2Fwatch%3Fv%3Dabc123");

    QCOMPARE(r.status, 200);
    QCOMPARE(r.header("Content-Type"), QByteArray("audio/mpeg"));
    QVERIFY(r.streamed);
    QVERIFY(!r.body.isEmpty());
    QCOMPARE(h.engine.lastUrl, h.backend.url);
    QCOMPARE(h.engine.lastProfile, QStringLiteral("web"));
    QCOMPARE(h.backend.lastLink, QStringLiteral("https://example.com/watch?v=abc123"));
}

void TestServer::testStreamNotFound()
{
    Harness h;
    h.search.found = false;
    const RecordingResponder r = h.request("/stream?q=nothing");

    QCOMPARE(r.status, 404);
    QCOMPARE(r.text(), QStringLiteral("❌ Không tìm thấy bài hát: nothing"));
    QCOMPARE(h.stats.snapshot().failedStreams, qint64(1));
    QVERIFY(h.engine.lastUrl.isEmpty());
}

void TestServer::testStreamTranscoderFailure()
{
    Harness h;
    h.engine.script = QStringLiteral("head -c 3000 /dev/zero; exit 1");
    const RecordingResponder r = h.request("/stream?q=broken");

    // Headers are already out, so the body is cut short
    QCOMPARE(r.status, 200);
    QVERIFY(r.streamed);
    QVERIFY(r.ended);
    QCOMPARE(r.body.size(), qsizetype(3000));

    h.engine.script = QStringLiteral("exit 1");
    const RecordingResponder silent = h.request("/stream?q=broken");
    QCOMPARE(silent.status, 200);
    QVERIFY(silent.streamed);
    QVERIFY(silent.body.isEmpty());
}

void TestServer::testStreamEmptyOutput()
{
    Harness h;
    h.engine.script = QStringLiteral("exit 0");
    const RecordingResponder r = h.request("/stream?q=silence");

    QCOMPARE(r.status, 200);
    QVERIFY(r.streamed);
    QVERIFY(r.ended);
    QVERIFY(r.body.isEmpty());
}

void TestServer::testEsp32Stream()
{
    Harness h;
    const RecordingResponder r = h.request("/esp32_stream?song=Hello&singer=Adele");

    QCOMPARE(r.status, 200);
    QCOMPARE(r.header("X-Content-Type-Options"), QByteArray("nosniff"));
    QCOMPARE(r.header("Content-Type"), QByteArray("audio/mpeg"));
    QCOMPARE(h.engine.lastProfile, QStringLiteral("constrained"));
    QCOMPARE(r.body.size(), qsizetype(10000));
    QVERIFY(r.chunks >= 3);
}

void TestServer::testEsp32StreamMissingSong()
{
    Harness h;
    const RecordingResponder r = h.request("/esp32_stream?singer=Adele");

    QCOMPARE(r.status, 400);
    QCOMPARE(r.text(), QStringLiteral("❌ Missing song parameter"));
}

void TestServer::testStreamPcmSuccess()
{
    Harness h;
    h.backend.info.title = QStringLiteral("Hello World (Official)");
    const RecordingResponder r = h.request("/stream_pcm?song=Hello+World&singer=Adele", "GET",
                                           "192.168.1.5:7879");

    QCOMPARE(r.status, 200);
    const QJsonObject body = r.json();
    QCOMPARE(body[QStringLiteral("title")].toString(), QStringLiteral("Hello World (Official)"));
    QCOMPARE(body[QStringLiteral("artist")].toString(), QStringLiteral("Adele"));
    QCOMPARE(body[QStringLiteral("audio_url")].toString(),
             QStringLiteral("http://192.168.1.5:7879/esp32_stream?song=Hello%20World&singer=Adele"));
    QCOMPARE(body[QStringLiteral("lyric_url")].toString(), QString());
    QCOMPARE(body[QStringLiteral("error")].toString(), QString());
    QCOMPARE(body[QStringLiteral("bitrate")].toInt(), 128);
    QCOMPARE(body[QStringLiteral("sample_rate")].toInt(), 44100);
    QCOMPARE(body[QStringLiteral("channels")].toInt(), 2);
    QCOMPARE(h.backend.lastInfoUrl, h.backend.url);

    // No transcoding happens for the JSON endpoint
    QVERIFY(h.engine.lastUrl.isEmpty());
}

void TestServer::testStreamPcmMissingSong()
{
    Harness h;
    const RecordingResponder r = h.request("/stream_pcm?singer=Adele");

    QCOMPARE(r.status, 400);
    const QJsonObject expected{
        {QStringLiteral("error"), QStringLiteral("Thiếu tham số song")},
        {QStringLiteral("artist"), QString()},
        {QStringLiteral("title"), QString()},
        {QStringLiteral("audio_url"), QString()},
        {QStringLiteral("lyric_url"), QString()},
    };
    QCOMPARE(r.json(), expected);
}

void TestServer::testStreamPcmNotFound()
{
    Harness h;
    h.search.found = false;
    const RecordingResponder r = h.request("/stream_pcm?song=Unknown+Song&singer=Nobody");

    QCOMPARE(r.status, 404);
    const QJsonObject expected{
        {QStringLiteral("error"), QStringLiteral("Không tìm thấy bài hát: Unknown Song Nobody")},
        {QStringLiteral("artist"), QStringLiteral("Nobody")},
        {QStringLiteral("title"), QStringLiteral("Unknown Song")},
        {QStringLiteral("audio_url"), QString()},
        {QStringLiteral("lyric_url"), QString()},
    };
    QCOMPARE(r.json(), expected);
    QCOMPARE(h.stats.snapshot().failedStreams, qint64(1));
}

void TestServer::testApiMusic()
{
    Harness h;
    h.backend.info.title = QStringLiteral("Hello");
    h.backend.info.artist = QStringLiteral("Adele");
    h.backend.info.duration = 295;
    const RecordingResponder r = h.request("/api/music?q=Hello+Adele");

    QCOMPARE(r.status, 200);
    const QJsonObject body = r.json();
    QCOMPARE(body[QStringLiteral("success")].toBool(), true);
    QVERIFY(body.contains(QStringLiteral("timestamp")));

    const QJsonObject data = body[QStringLiteral("data")].toObject();
    QCOMPARE(data[QStringLiteral("query")].toString(), QStringLiteral("Hello Adele"));
    QCOMPARE(data[QStringLiteral("title")].toString(), QStringLiteral("Hello"));
    QCOMPARE(data[QStringLiteral("artist")].toString(), QStringLiteral("Adele"));
    QCOMPARE(data[QStringLiteral("duration")].toInt(), 295);
    QCOMPARE(data[QStringLiteral("audio_url")].toString(), h.backend.url);
    QCOMPARE(data[QStringLiteral("stream_url")].toString(), QStringLiteral("/stream?q=Hello%20Adele"));
    QCOMPARE(data[QStringLiteral("download_url")].toString(), QStringLiteral("/download?q=Hello%20Adele"));
    QCOMPARE(data[QStringLiteral("api_url")].toString(), QStringLiteral("/api/music?q=Hello%20Adele"));

    // Informational endpoints do not count as streams
    QCOMPARE(h.stats.snapshot().successfulStreams, qint64(0));
}

void TestServer::testApiMusicErrors()
{
    Harness h;
    RecordingResponder r = h.request("/api/music");
    QCOMPARE(r.status, 400);
    QCOMPARE(r.json()[QStringLiteral("success")].toBool(true), false);
    QCOMPARE(r.json()[QStringLiteral("code")].toInt(), 400);

    h.search.found = false;
    r = h.request("/api/music?q=missing");
    QCOMPARE(r.status, 404);
    QCOMPARE(r.json()[QStringLiteral("error")].toString(), QStringLiteral("Không tìm thấy bài hát: missing"));
    QCOMPARE(r.json()[QStringLiteral("code")].toInt(), 404);
}

void TestServer::testDownload()
{
    Harness h;
    h.backend.info.title = QStringLiteral("Hello");
    h.backend.info.artist = QStringLiteral("Adele");
    const RecordingResponder r = h.request("/download?q=hello");

    QCOMPARE(r.status, 200);
    QCOMPARE(r.header("Content-Disposition"), QByteArray("attachment; filename=\"Hello - Adele.mp3\""));
    QCOMPARE(r.header("Cache-Control"), QByteArray("no-cache, no-store"));
    QCOMPARE(h.engine.lastProfile, QStringLiteral("download"));
    QCOMPARE(r.body.size(), qsizetype(10000));

    const RecordingResponder missing = h.request("/download");
    QCOMPARE(missing.status, 400);
    QCOMPARE(missing.text(), QStringLiteral("❌ Thiếu tên bài hát"));
}

void TestServer::testDownloadFilename()
{
    MediaInfo info;
    info.title = QStringLiteral("AC/DC \"Live\"");
    info.artist = QStringLiteral("Back\\Slash");
    QCOMPARE(MusicService::downloadFilename(info), QStringLiteral("AC_DC 'Live' - Back_Slash"));

    info.title = QString(150, QLatin1Char('a'));
    QCOMPARE(MusicService::downloadFilename(info).size(), qsizetype(100));

    QCOMPARE(MusicService::downloadFilename(MediaInfo{}), QStringLiteral("Unknown - Unknown"));
}

void TestServer::testClearCache()
{
    Harness h;
    (void)h.request("/api/music?q=one");
    (void)h.request("/api/music?q=two");
    QCOMPARE(h.cache.size(), 2);

    const RecordingResponder r = h.request("/clear_cache");
    QCOMPARE(r.status, 200);
    QCOMPARE(r.json()[QStringLiteral("success")].toBool(), true);
    QCOMPARE(r.json()[QStringLiteral("message")].toString(), QStringLiteral("Đã xóa 2 mục cache"));
    QCOMPARE(r.json()[QStringLiteral("cache_size")].toInt(-1), 0);
    QCOMPARE(h.cache.size(), 0);
}

void TestServer::testStatusAndStats()
{
    Harness h;
    (void)h.request("/api/music?q=one");
    (void)h.request("/api/music?q=one");

    const RecordingResponder status = h.request("/status");
    QCOMPARE(status.status, 200);
    const QJsonObject s = status.json();
    QCOMPARE(s[QStringLiteral("status")].toString(), QStringLiteral("running"));
    QCOMPARE(s[QStringLiteral("version")].toString(), QStringLiteral("2.1"));
    QCOMPARE(s[QStringLiteral("cache_size")].toInt(), 1);
    QCOMPARE(s[QStringLiteral("cache_max_size")].toInt(), 100);
    QCOMPARE(s[QStringLiteral("cache_duration_seconds")].toInt(), 1800);
    QCOMPARE(s[QStringLiteral("endpoints")].toArray().size(), qsizetype(9));
    QCOMPARE(s[QStringLiteral("tools")][QStringLiteral("ffmpeg")].toString(), QStringLiteral("ffmpeg version 6.1"));
    QCOMPARE(s[QStringLiteral("stats")][QStringLiteral("cache_hits")].toInt(), 1);
    QVERIFY(s[QStringLiteral("uptime_human")].toString().contains(QLatin1Char(':')));

    const RecordingResponder stats = h.request("/stats");
    QCOMPARE(stats.status, 200);
    const QJsonObject t = stats.json();
    QCOMPARE(t[QStringLiteral("server_stats")][QStringLiteral("total_requests")].toInt(), 4);
    QCOMPARE(t[QStringLiteral("cache_stats")][QStringLiteral("max_size")].toInt(), 100);
    QCOMPARE(t[QStringLiteral("cache_stats")][QStringLiteral("hit_rate")].toDouble(), 50.0);
    QVERIFY(t[QStringLiteral("performance")].toObject().contains(QStringLiteral("requests_per_hour")));
    QVERIFY(t[QStringLiteral("performance")].toObject().contains(QStringLiteral("success_rate")));
}

void TestServer::testDebug()
{
    Harness h;
    (void)h.request("/api/music?q=one");

    const RecordingResponder r = h.request("/debug", "GET", "192.168.1.10:7879");
    QCOMPARE(r.status, 200);

    const QJsonObject body = r.json();
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("ip")].toString(), QStringLiteral("192.168.1.77"));
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("user_agent")].toString(),
             QStringLiteral("ESP32-Audio/1.0"));
    QCOMPARE(body[QStringLiteral("client")][QStringLiteral("method")].toString(), QStringLiteral("GET"));
    QCOMPARE(body[QStringLiteral("server")][QStringLiteral("host")].toString(), QStringLiteral("192.168.1.10:7879"));
    QVERIFY(body[QStringLiteral("server")].toObject().contains(QStringLiteral("timestamp")));
    QCOMPARE(body[QStringLiteral("cache")][QStringLiteral("size")].toInt(), 1);
    QCOMPARE(body[QStringLiteral("cache")][QStringLiteral("max_size")].toInt(), 100);
}

void TestServer::testUnknownEndpoint()
{
    Harness h;
    const RecordingResponder r = h.request("/nope");

    QCOMPARE(r.status, 404);
    const QJsonObject expected{
        {QStringLiteral("error"), QStringLiteral("Not Found")},
        {QStringLiteral("message"), QStringLiteral("Endpoint không tồn tại")},
        {QStringLiteral("path"), QStringLiteral("/nope")},
    };
    QCOMPARE(r.json(), expected);
}

void TestServer::testMethodNotAllowed()
{
    Harness h;
    const RecordingResponder r = h.request("/stream?q=hello", "POST");

    QCOMPARE(r.status, 405);
    QCOMPARE(r.json()[QStringLiteral("error")].toString(), QStringLiteral("Method Not Allowed"));
    QVERIFY(h.engine.lastUrl.isEmpty());
}

QTEST_MAIN(TestServer)
#include "test_server.moc"
