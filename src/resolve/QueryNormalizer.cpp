/**
 * @file QueryNormalizer.cpp
 * @brief Query normalization
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/resolve/QueryNormalizer.h"

namespace MusicRelay::QueryNormalizer {

bool isDirectLink(const QString& key)
{
    return key.startsWith(QLatin1String("http://")) || key.startsWith(QLatin1String("https://"));
}

std::optional<ResolutionRequest> normalize(const QString& input)
{
    const QString trimmed = input.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }

    ResolutionRequest request;
    request.original = trimmed;
    request.key = trimmed.toLower();
    request.isDirectLink = isDirectLink(request.key);
    return request;
}

QString composeQuery(const QString& song, const QString& singer)
{
    const QString s = song.trimmed();
    const QString a = singer.trimmed();

    if (!a.isEmpty() && a.compare(QLatin1String("youtube"), Qt::CaseInsensitive) != 0) {
        return s + QLatin1Char(' ') + a;
    }
    return s;
}

} // namespace MusicRelay::QueryNormalizer
