/**
 * @file CurlWrapper.h
 * @brief RAII wrapper for libcurl request/response exchanges
 *
 * Provides a small, exception-safe interface to libcurl that handles:
 * - Global initialization/cleanup
 * - Easy handle lifecycle
 * - Request headers and bodies
 * - Response body capture
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#ifndef MUSICRELAY_CURLWRAPPER_H
#define MUSICRELAY_CURLWRAPPER_H

#include <curl/curl.h>
#include <QString>
#include <QUrl>
#include <QByteArray>

namespace MusicRelay {

// ═══════════════════════════════════════════════════════════════════════════════
// Result Types
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Result of a CURL operation
 */
struct CurlResult {
    CURLcode code = CURLE_OK;
    long httpCode = 0;
    QString errorMessage;
    qint64 bytesReceived = 0;

    [[nodiscard]] bool transportOk() const noexcept { return code == CURLE_OK; }

    [[nodiscard]] bool success() const noexcept {
        return code == CURLE_OK && httpCode >= 200 && httpCode < 300;
    }

    [[nodiscard]] bool isTimeout() const noexcept {
        return code == CURLE_OPERATION_TIMEDOUT;
    }

    [[nodiscard]] static CurlResult fromError(CURLcode c, const char* msg) {
        return CurlResult{c, 0, QString::fromUtf8(msg), 0};
    }
};

// ═══════════════════════════════════════════════════════════════════════════════
// CurlGlobalInit - RAII for global init/cleanup
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Manages global libcurl initialization
 *
 * Use via instance() to ensure single initialization. The first call must
 * happen before any worker thread creates a handle (main does this).
 */
class CurlGlobalInit {
public:
    static CurlGlobalInit& instance();

    ~CurlGlobalInit();

    CurlGlobalInit(const CurlGlobalInit&) = delete;
    CurlGlobalInit& operator=(const CurlGlobalInit&) = delete;
    CurlGlobalInit(CurlGlobalInit&&) = delete;
    CurlGlobalInit& operator=(CurlGlobalInit&&) = delete;

    [[nodiscard]] bool isValid() const noexcept { return m_valid; }

    /**
     * @brief Get libcurl version string
     */
    [[nodiscard]] QString version() const;

private:
    CurlGlobalInit();
    bool m_valid = false;
};

// ═══════════════════════════════════════════════════════════════════════════════
// CurlEasyHandle - RAII wrapper for CURL easy handle
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief RAII wrapper for a libcurl easy handle
 *
 * One handle per outbound request; handles are not shared between threads.
 * The response body is collected and available through responseBody().
 */
class CurlEasyHandle {
public:
    CurlEasyHandle();
    ~CurlEasyHandle();

    CurlEasyHandle(const CurlEasyHandle&) = delete;
    CurlEasyHandle& operator=(const CurlEasyHandle&) = delete;

    [[nodiscard]] bool isValid() const noexcept { return m_handle != nullptr; }

    // ═══════════════════════════════════════════════════════════════════════════
    // Configuration
    // ═══════════════════════════════════════════════════════════════════════════

    void setUrl(const QUrl& url);

    void setConnectTimeout(int seconds);

    /**
     * @brief Bound the whole transfer (connect + body)
     */
    void setTimeout(int seconds);

    void setUserAgent(const QString& userAgent);

    void setReferer(const QString& referer);

    /**
     * @brief Add custom HTTP header ("Name: value")
     */
    void addHeader(const QString& header);

    void setFollowRedirects(bool follow, int maxRedirects = 10);

    // ═══════════════════════════════════════════════════════════════════════════
    // Execution
    // ═══════════════════════════════════════════════════════════════════════════

    /**
     * @brief Perform a POST request with the given body
     */
    [[nodiscard]] CurlResult performPost(const QByteArray& body);

    [[nodiscard]] const QByteArray& responseBody() const noexcept { return m_body; }

private:
    static size_t writeCallbackStatic(char* ptr, size_t size, size_t nmemb, void* userdata);

    CURL* m_handle = nullptr;
    curl_slist* m_headerList = nullptr;
    char m_errorBuffer[CURL_ERROR_SIZE] = {0};

    QByteArray m_body;
};

} // namespace MusicRelay

#endif // MUSICRELAY_CURLWRAPPER_H
