/**
 * @file CurlWrapper.cpp
 * @brief Implementation of RAII libcurl wrapper
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "CurlWrapper.h"

#include "musicrelay/core/Types.h"

#include <QDebug>

namespace MusicRelay {

// ═══════════════════════════════════════════════════════════════════════════════
// CurlGlobalInit Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CurlGlobalInit& CurlGlobalInit::instance()
{
    static CurlGlobalInit instance;
    return instance;
}

CurlGlobalInit::CurlGlobalInit()
{
    CURLcode result = curl_global_init(CURL_GLOBAL_ALL);
    m_valid = (result == CURLE_OK);

    if (!m_valid) {
        qCritical() << "CurlGlobalInit: Failed to initialize libcurl:" << curl_easy_strerror(result);
    } else {
        qInfo() << "CurlGlobalInit: libcurl initialized:" << version();
    }
}

CurlGlobalInit::~CurlGlobalInit()
{
    if (m_valid) {
        curl_global_cleanup();
    }
}

QString CurlGlobalInit::version() const
{
    return QString::fromUtf8(curl_version());
}

// ═══════════════════════════════════════════════════════════════════════════════
// CurlEasyHandle Implementation
// ═══════════════════════════════════════════════════════════════════════════════

CurlEasyHandle::CurlEasyHandle()
{
    CurlGlobalInit::instance();

    m_handle = curl_easy_init();
    if (!m_handle) {
        qCritical() << "CurlEasyHandle: Failed to create CURL easy handle";
        return;
    }

    curl_easy_setopt(m_handle, CURLOPT_ERRORBUFFER, m_errorBuffer);

    // Worker threads: no signal-based DNS timeouts
    curl_easy_setopt(m_handle, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(m_handle, CURLOPT_SSL_VERIFYHOST, 2L);

    setConnectTimeout(Config::CONNECT_TIMEOUT_SECONDS);
    setTimeout(Config::NETWORK_TIMEOUT_SECONDS);
    setFollowRedirects(true);

    curl_easy_setopt(m_handle, CURLOPT_WRITEFUNCTION, &CurlEasyHandle::writeCallbackStatic);
    curl_easy_setopt(m_handle, CURLOPT_WRITEDATA, this);
}

CurlEasyHandle::~CurlEasyHandle()
{
    if (m_headerList) {
        curl_slist_free_all(m_headerList);
        m_headerList = nullptr;
    }

    if (m_handle) {
        curl_easy_cleanup(m_handle);
        m_handle = nullptr;
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Configuration Methods
// ═══════════════════════════════════════════════════════════════════════════════

void CurlEasyHandle::setUrl(const QUrl& url)
{
    if (!m_handle) return;
    QByteArray urlBytes = url.toString(QUrl::FullyEncoded).toUtf8();
    curl_easy_setopt(m_handle, CURLOPT_URL, urlBytes.constData());
}

void CurlEasyHandle::setConnectTimeout(int seconds)
{
    if (!m_handle) return;
    curl_easy_setopt(m_handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(seconds));
}

void CurlEasyHandle::setTimeout(int seconds)
{
    if (!m_handle) return;
    curl_easy_setopt(m_handle, CURLOPT_TIMEOUT, static_cast<long>(seconds));
}

void CurlEasyHandle::setUserAgent(const QString& userAgent)
{
    if (!m_handle) return;
    QByteArray ua = userAgent.toUtf8();
    curl_easy_setopt(m_handle, CURLOPT_USERAGENT, ua.constData());
}

void CurlEasyHandle::setReferer(const QString& referer)
{
    if (!m_handle) return;
    QByteArray ref = referer.toUtf8();
    curl_easy_setopt(m_handle, CURLOPT_REFERER, ref.constData());
}

void CurlEasyHandle::addHeader(const QString& header)
{
    if (!m_handle) return;
    QByteArray h = header.toUtf8();
    m_headerList = curl_slist_append(m_headerList, h.constData());
    curl_easy_setopt(m_handle, CURLOPT_HTTPHEADER, m_headerList);
}

void CurlEasyHandle::setFollowRedirects(bool follow, int maxRedirects)
{
    if (!m_handle) return;
    curl_easy_setopt(m_handle, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(m_handle, CURLOPT_MAXREDIRS, static_cast<long>(maxRedirects));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Static Callbacks
// ═══════════════════════════════════════════════════════════════════════════════

size_t CurlEasyHandle::writeCallbackStatic(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    auto* self = static_cast<CurlEasyHandle*>(userdata);
    const size_t totalSize = size * nmemb;

    self->m_body.append(ptr, static_cast<qsizetype>(totalSize));
    return totalSize;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Execution
// ═══════════════════════════════════════════════════════════════════════════════

CurlResult CurlEasyHandle::performPost(const QByteArray& body)
{
    if (!m_handle) {
        return CurlResult::fromError(CURLE_FAILED_INIT, "Handle not initialized");
    }

    curl_easy_setopt(m_handle, CURLOPT_POST, 1L);
    curl_easy_setopt(m_handle, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    curl_easy_setopt(m_handle, CURLOPT_COPYPOSTFIELDS, body.constData());

    m_errorBuffer[0] = '\0';
    m_body.clear();

    const CURLcode code = curl_easy_perform(m_handle);

    CurlResult result;
    result.code = code;

    if (code == CURLE_OK) {
        curl_easy_getinfo(m_handle, CURLINFO_RESPONSE_CODE, &result.httpCode);

        curl_off_t received = 0;
        curl_easy_getinfo(m_handle, CURLINFO_SIZE_DOWNLOAD_T, &received);
        result.bytesReceived = static_cast<qint64>(received);
    } else {
        result.errorMessage = QString::fromUtf8(m_errorBuffer[0] ?
                                                m_errorBuffer : curl_easy_strerror(code));
    }

    return result;
}

} // namespace MusicRelay
