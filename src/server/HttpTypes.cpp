/**
 * @file HttpTypes.cpp
 * @brief HTTP request helpers
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#include "musicrelay/server/HttpTypes.h"

namespace MusicRelay {

QString HttpRequest::host() const
{
    const QByteArray value = headers.value(QByteArrayLiteral("host")).trimmed();
    return value.isEmpty() ? localAddress : QString::fromUtf8(value);
}

} // namespace MusicRelay
