/**
 * @file Types.h
 * @brief Core type definitions and constants for the MusicRelay server
 *
 * This header defines the fundamental types, enumerations, and constants
 * shared by the resolution pipeline, the cache, and the streaming engine.
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <QString>

namespace MusicRelay {

// ═══════════════════════════════════════════════════════════════════════════════
// Type Aliases
// ═══════════════════════════════════════════════════════════════════════════════

using ByteCount = int64_t;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// ═══════════════════════════════════════════════════════════════════════════════
// Constants
// ═══════════════════════════════════════════════════════════════════════════════

namespace Config {
    // Cache
    constexpr std::chrono::seconds CACHE_TTL{1800};                // 30 minutes
    constexpr int CACHE_CAPACITY = 100;

    // Network
    constexpr int NETWORK_TIMEOUT_SECONDS = 15;                    // search, extraction, fallback
    constexpr int EXTRACTOR_PROCESS_TIMEOUT_SECONDS = 45;          // whole yt-dlp run
    constexpr int CONNECT_TIMEOUT_SECONDS = 10;

    // Streaming
    constexpr Duration KILL_GRACE_PERIOD{2000};                    // terminate -> kill
    constexpr Duration SPAWN_TIMEOUT{5000};
    constexpr Duration READ_POLL_INTERVAL{10};                     // idle wait between reads
    constexpr Duration PEER_CHECK_INTERVAL{250};                   // liveness poll while idle
    constexpr Duration STALL_TIMEOUT{60000};                       // no subprocess output
    constexpr Duration SOCKET_WRITE_TIMEOUT{30000};                // client stopped reading
    constexpr ByteCount WEB_CHUNK_SIZE = 8 * 1024;
    constexpr ByteCount CONSTRAINED_CHUNK_SIZE = 4 * 1024;

    // Server
    constexpr quint16 DEFAULT_PORT = 7879;
    constexpr int DEFAULT_MAX_CONNECTIONS = 64;
    constexpr Duration REQUEST_HEAD_TIMEOUT{10000};
    constexpr std::size_t MAX_REQUEST_PAYLOAD_BYTES = 64 * 1024;        // only GET is served
}

// ═══════════════════════════════════════════════════════════════════════════════
// Error Taxonomy
// ═══════════════════════════════════════════════════════════════════════════════

/**
 * @brief Failure kinds surfaced by the resolution and streaming pipeline
 */
enum class ErrorKind : uint8_t {
    None,
    EmptyQuery,             ///< Caller supplied no query (400)
    NotFound,               ///< Both search passes yielded nothing (404)
    ExtractionFailed,       ///< Primary and fallback extraction exhausted (404)
    AllInstancesExhausted,  ///< Every fallback instance failed (feeds ExtractionFailed)
    SubprocessSpawnFailed,  ///< Transcoder could not be started
    SubprocessError         ///< Transcoder failed mid-stream
};

/**
 * @brief Stream session lifecycle states
 *
 * State transitions:
 *   Starting → Streaming → Completed          → Terminated
 *                        → ClientDisconnected → Terminated
 *                        → SubprocessError    → Terminated
 */
enum class StreamState : uint8_t {
    Starting,
    Streaming,
    Completed,
    ClientDisconnected,
    SubprocessError,
    Terminated
};

// ═══════════════════════════════════════════════════════════════════════════════
// Utility Functions
// ═══════════════════════════════════════════════════════════════════════════════

inline QString errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                  return QStringLiteral("None");
        case ErrorKind::EmptyQuery:            return QStringLiteral("EmptyQuery");
        case ErrorKind::NotFound:              return QStringLiteral("NotFound");
        case ErrorKind::ExtractionFailed:      return QStringLiteral("ExtractionFailed");
        case ErrorKind::AllInstancesExhausted: return QStringLiteral("AllInstancesExhausted");
        case ErrorKind::SubprocessSpawnFailed: return QStringLiteral("SubprocessSpawnFailed");
        case ErrorKind::SubprocessError:       return QStringLiteral("SubprocessError");
        default:                               return QStringLiteral("Unknown");
    }
}

inline QString streamStateToString(StreamState state) {
    switch (state) {
        case StreamState::Starting:           return QStringLiteral("Starting");
        case StreamState::Streaming:          return QStringLiteral("Streaming");
        case StreamState::Completed:          return QStringLiteral("Completed");
        case StreamState::ClientDisconnected: return QStringLiteral("ClientDisconnected");
        case StreamState::SubprocessError:    return QStringLiteral("SubprocessError");
        case StreamState::Terminated:         return QStringLiteral("Terminated");
        default:                              return QStringLiteral("Unknown");
    }
}

/**
 * @brief Format byte count for display (e.g., "1.5 MB")
 */
inline QString formatByteSize(ByteCount bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    if (bytes < 0) return QStringLiteral("Unknown");
    if (bytes < KB) return QStringLiteral("%1 B").arg(bytes);
    if (bytes < MB) return QStringLiteral("%1 KB").arg(bytes / KB, 0, 'f', 1);
    if (bytes < GB) return QStringLiteral("%1 MB").arg(bytes / MB, 0, 'f', 2);
    return QStringLiteral("%1 GB").arg(bytes / GB, 0, 'f', 2);
}

} // namespace MusicRelay
