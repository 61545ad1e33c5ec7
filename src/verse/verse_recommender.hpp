#pragma once

/// @file verse_recommender.hpp
/// @brief Ranks corpus verses against a set of query tags.

#include "verse/scoring.hpp"
#include "verse/verse_record.hpp"

#include <string>
#include <vector>

namespace vedika::verse
{
    /// @brief Deterministic verse ranking over an immutable corpus.
    ///
    /// Results are ordered by descending score; equal scores keep corpus
    /// order. When nothing scores above zero the default verse is returned
    /// alone with `fallback` set, so a non-empty corpus always yields at
    /// least one result.
    class VerseRecommender
    {
    public:
        /// @param scorer Scoring backend (keyword_scorer() or vector_scorer()).
        /// @param default_verse_id Fallback verse; the first corpus record when empty or not found.
        explicit VerseRecommender(VerseScorer scorer, std::string default_verse_id = {});

        /// @brief Best matches for `query_tags`, at most `top_k`.
        /// @throws std::invalid_argument if top_k < 1.
        /// @throws core::ComputationError (CorpusEmpty) if the corpus is empty.
        [[nodiscard]] std::vector<RecommendationResult> recommend(const Corpus& corpus,
                                                                  const std::vector<std::string>& query_tags,
                                                                  i32 top_k) const;

        [[nodiscard]] const std::string& default_verse_id() const { return m_default_verse_id; }

    private:
        [[nodiscard]] const VerseRecord& default_verse(const Corpus& corpus) const;

        VerseScorer m_scorer;
        std::string m_default_verse_id;
    };

} // namespace vedika::verse
