/**
 * @file UserAgent.h
 * @brief Browser user agents presented to upstream services
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QString>
#include <QStringList>

namespace MusicRelay {

/**
 * @brief The fixed pool of desktop browser user agents
 */
[[nodiscard]] const QStringList& userAgentPool();

/**
 * @brief Pick a user agent from the pool at random. Thread-safe.
 */
[[nodiscard]] QString randomUserAgent();

} // namespace MusicRelay
