#pragma once

/// @file scoring.hpp
/// @brief Tag normalization and the interchangeable verse scoring backends.

#include "verse/verse_record.hpp"

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vedika::verse
{
    /// @brief Relevance of one record to a normalized query. 0 means no match.
    using VerseScorer = std::function<f64(const VerseRecord& record,
                                          const std::vector<std::string>& query_tags)>;

    /// @brief Lowercase ASCII, strip non-alphanumerics at both ends, collapse inner whitespace.
    [[nodiscard]] std::string normalize_tag(std::string_view tag);

    /// @brief Normalize a tag list.
    ///
    /// Multi-word tags are kept and also split into their words. Empty tags
    /// and duplicates are dropped; first occurrence order is kept.
    [[nodiscard]] std::vector<std::string> normalize_tags(const std::vector<std::string>& tags);

    /// @brief Exact tag overlap, with a half-point substring bonus when there is no overlap.
    ///
    ///   score = |tags ∩ query|                     if the overlap is non-empty
    ///         = 0.5 if any query word occurs in the meaning or deity text
    ///         = 0 otherwise
    [[nodiscard]] VerseScorer keyword_scorer();

    /// @brief Cosine similarity of hashed character-trigram vectors.
    ///
    /// Query text is the query tags; record text is tags, deity and meaning.
    /// Trigrams are hashed with FNV-1a into 256 buckets. A record scores 0
    /// unless some query word has at least half of its trigrams in the record
    /// text; similarities below 0.05 also count as no match.
    [[nodiscard]] VerseScorer vector_scorer();

    /// @brief Scorer by configuration name ("keyword" or "vector").
    [[nodiscard]] std::optional<VerseScorer> make_scorer(std::string_view name);

} // namespace vedika::verse
