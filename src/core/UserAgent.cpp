/**
 * @file UserAgent.cpp
 * @brief User agent rotation
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/core/UserAgent.h"

#include <QRandomGenerator>

namespace MusicRelay {

const QStringList& userAgentPool()
{
    static const QStringList pool = {
        QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"),
        QStringLiteral("Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:120.0) Gecko/20100101 Firefox/120.0"),
        QStringLiteral("Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/537.36 "
                       "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36"),
    };
    return pool;
}

QString randomUserAgent()
{
    const QStringList& pool = userAgentPool();
    // QRandomGenerator::global() is thread-safe
    return pool.at(QRandomGenerator::global()->bounded(static_cast<int>(pool.size())));
}

} // namespace MusicRelay
