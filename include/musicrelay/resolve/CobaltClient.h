/**
 * @file CobaltClient.h
 * @brief libcurl client for Cobalt-compatible conversion instances
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "musicrelay/resolve/FallbackClient.h"

namespace MusicRelay {

/**
 * @class CobaltClient
 * @brief POSTs the payload to {instance}/api/json, following redirects
 */
class CobaltClient : public FallbackClient {
public:
    explicit CobaltClient(int timeoutSeconds);

    [[nodiscard]] FallbackResponse post(const QString& instance, const QJsonObject& payload) override;

private:
    int m_timeoutSeconds;
};

} // namespace MusicRelay
