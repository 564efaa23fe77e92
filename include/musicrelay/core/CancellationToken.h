/**
 * @file CancellationToken.h
 * @brief Cross-thread cancellation flag for a streaming request
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <atomic>

namespace MusicRelay {

/**
 * @class CancellationToken
 * @brief One-shot cancellation signal shared between a request and its stream
 *
 * The streaming engine cancels it when the peer is found gone, by a failed
 * write or by a liveness poll, and checks it at every chunk boundary. Any
 * other thread may cancel it too. Thread-safe.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() noexcept { m_cancelled.store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancelled() const noexcept {
        return m_cancelled.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> m_cancelled{false};
};

} // namespace MusicRelay
