/**
 * @file QueryNormalizer.h
 * @brief Classification and cache-key derivation for user queries
 *
 * @copyright Copyright (c) 2024 MusicRelay Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include <QString>

#include <optional>

namespace MusicRelay {

/**
 * @brief A normalized query ready for resolution
 */
struct ResolutionRequest {
    QString original;            ///< Trimmed input, case preserved
    QString key;                 ///< trim(lower(input)), the cache key
    bool isDirectLink = false;   ///< Key starts with http:// or https://

    bool operator==(const ResolutionRequest& other) const = default;
};

namespace QueryNormalizer {

/**
 * @brief Normalize a raw query
 * @return std::nullopt if the input is empty after trimming
 *
 * Idempotent: normalize(s) and normalize(trim(lower(s))) share key and
 * isDirectLink.
 */
[[nodiscard]] std::optional<ResolutionRequest> normalize(const QString& input);

/**
 * @brief Build a search query from song and singer
 *
 * The singer is appended unless empty or equal to "youtube" (any case).
 */
[[nodiscard]] QString composeQuery(const QString& song, const QString& singer);

[[nodiscard]] bool isDirectLink(const QString& key);

} // namespace QueryNormalizer

} // namespace MusicRelay
