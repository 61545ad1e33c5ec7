/// @file verse_recommender.cpp
/// @brief Scoring, stable ranking and default-verse fallback.

#include "verse/verse_recommender.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace vedika::verse
{

VerseRecommender::VerseRecommender(VerseScorer scorer, std::string default_verse_id)
    : m_scorer(std::move(scorer))
    , m_default_verse_id(std::move(default_verse_id))
{
    if (!m_scorer)
    {
        throw std::invalid_argument("VerseRecommender requires a scorer");
    }
}

const VerseRecord& VerseRecommender::default_verse(const Corpus& corpus) const
{
    const auto it = std::find_if(corpus.begin(), corpus.end(), [this](const VerseRecord& v) {
        return v.id == m_default_verse_id;
    });
    if (it == corpus.end())
    {
        if (!m_default_verse_id.empty())
        {
            VDK_CORE_WARN("VerseRecommender: default verse '{}' not in corpus, using '{}'",
                          m_default_verse_id, corpus.front().id);
        }
        return corpus.front();
    }
    return *it;
}

std::vector<RecommendationResult> VerseRecommender::recommend(const Corpus& corpus,
                                                              const std::vector<std::string>& query_tags,
                                                              i32 top_k) const
{
    if (top_k < 1)
    {
        throw std::invalid_argument("top_k must be at least 1");
    }
    if (corpus.empty())
    {
        core::fail(core::ErrorKind::CorpusEmpty, "verse corpus has no records");
    }

    const auto query = normalize_tags(query_tags);

    std::vector<std::pair<f64, std::size_t>> scored;
    if (!query.empty())
    {
        for (std::size_t i = 0; i < corpus.size(); ++i)
        {
            const f64 score = m_scorer(corpus[i], query);
            if (score > 0.0)
            {
                scored.emplace_back(score, i);
            }
        }
    }

    // Ties keep corpus order
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.first > b.first;
    });

    std::vector<RecommendationResult> results;
    if (scored.empty())
    {
        const auto& fallback = default_verse(corpus);
        VDK_CORE_DEBUG("VerseRecommender: no match for [{}], default verse '{}'",
                       fmt::join(query, ", "), fallback.id);
        results.push_back(RecommendationResult{
            .verse      = fallback,
            .score      = 0.0,
            .rank       = 1,
            .query_tags = query,
            .fallback   = true,
        });
        return results;
    }

    const auto count = std::min(scored.size(), static_cast<std::size_t>(top_k));
    results.reserve(count);
    for (std::size_t r = 0; r < count; ++r)
    {
        results.push_back(RecommendationResult{
            .verse      = corpus[scored[r].second],
            .score      = scored[r].first,
            .rank       = static_cast<i32>(r) + 1,
            .query_tags = query,
            .fallback   = false,
        });
    }

    VDK_CORE_DEBUG("VerseRecommender: [{}] -> '{}' ({:.3f})",
                   fmt::join(query, ", "), results.front().verse.id, results.front().score);
    return results;
}

} // namespace vedika::verse
