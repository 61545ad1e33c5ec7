#pragma once

/// @file verse_record.hpp
/// @brief Verse corpus records and recommendation results.

#include "core/types.hpp"

#include <string>
#include <vector>

namespace vedika::verse
{
    /// @brief One entry of the verse corpus.
    struct VerseRecord
    {
        std::string id;
        std::string devanagari;         ///< Source text in Devanagari
        std::string transliteration;
        std::string meaning;            ///< English meaning
        std::string deity;              ///< Deity or theme the verse is addressed to
        std::string source;             ///< e.g. "Bhagavad Gita 9.22"
        std::vector<std::string> tags;
    };

    /// @brief Insertion-ordered, read-only verse corpus.
    using Corpus = std::vector<VerseRecord>;

    /// @brief A ranked match.
    struct RecommendationResult
    {
        VerseRecord verse;
        f64 score{0.0};
        i32 rank{1};                            ///< 1-based
        std::vector<std::string> query_tags;    ///< Normalized tags that produced the match
        bool fallback{false};                   ///< Default verse returned because nothing matched
    };

} // namespace vedika::verse
