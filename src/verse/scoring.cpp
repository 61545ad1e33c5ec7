/// @file scoring.cpp
/// @brief Keyword and hashed-trigram scorers.

#include "verse/scoring.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <sstream>
#include <string_view>
#include <unordered_set>

namespace vedika::verse
{

namespace
{
    constexpr f64 kSubstringBonus = 0.5;

    constexpr std::size_t kVectorDim = 256;
    constexpr f64 kMinCosine = 0.05;

    constexpr u32 kFnvOffset = 2166136261u;
    constexpr u32 kFnvPrime = 16777619u;

    using TrigramVector = std::array<f64, kVectorDim>;

    [[nodiscard]] bool is_alnum(char c)
    {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
    }

    [[nodiscard]] std::string to_lower(std::string_view text)
    {
        std::string out(text);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    [[nodiscard]] u32 fnv1a(std::string_view bytes)
    {
        u32 hash = kFnvOffset;
        for (const char c : bytes)
        {
            hash ^= static_cast<u8>(c);
            hash *= kFnvPrime;
        }
        return hash;
    }

    /// Lowercase alphanumeric runs of a text.
    [[nodiscard]] std::vector<std::string> words_of(std::string_view text)
    {
        std::vector<std::string> words;
        std::string current;
        for (const char c : text)
        {
            if (is_alnum(c))
            {
                current += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            }
            else if (!current.empty())
            {
                words.push_back(std::move(current));
                current.clear();
            }
        }
        if (!current.empty()) words.push_back(std::move(current));
        return words;
    }

    /// Trigrams of one word, padded with a space on both sides.
    [[nodiscard]] std::vector<std::string> trigrams(const std::string& word)
    {
        const std::string padded = " " + word + " ";
        std::vector<std::string> out;
        for (std::size_t i = 0; i + 3 <= padded.size(); ++i)
        {
            out.push_back(padded.substr(i, 3));
        }
        return out;
    }

    [[nodiscard]] TrigramVector embed(std::string_view text)
    {
        TrigramVector v{};
        for (const auto& word : words_of(text))
        {
            for (const auto& t : trigrams(word))
            {
                v[fnv1a(t) % kVectorDim] += 1.0;
            }
        }
        return v;
    }

    /// True when some query word has at least half of its trigrams in the record
    /// text. Compared unhashed, so bucket collisions never count as a match.
    [[nodiscard]] bool shares_a_word(const std::vector<std::string>& query, std::string_view record_text)
    {
        std::unordered_set<std::string> record_trigrams;
        for (const auto& word : words_of(record_text))
        {
            for (auto& t : trigrams(word))
            {
                record_trigrams.insert(std::move(t));
            }
        }

        for (const auto& tag : query)
        {
            for (const auto& word : words_of(tag))
            {
                const auto grams = trigrams(word);
                const auto shared = std::count_if(grams.begin(), grams.end(), [&](const std::string& t) {
                    return record_trigrams.count(t) > 0;
                });
                if (static_cast<std::size_t>(shared) * 2 >= grams.size()) return true;
            }
        }
        return false;
    }

    [[nodiscard]] f64 cosine(const TrigramVector& a, const TrigramVector& b)
    {
        f64 dot = 0.0;
        f64 na = 0.0;
        f64 nb = 0.0;
        for (std::size_t i = 0; i < kVectorDim; ++i)
        {
            dot += a[i] * b[i];
            na += a[i] * a[i];
            nb += b[i] * b[i];
        }
        if (na == 0.0 || nb == 0.0) return 0.0;
        return dot / (std::sqrt(na) * std::sqrt(nb));
    }

    [[nodiscard]] std::string join(const std::vector<std::string>& parts)
    {
        std::string out;
        for (const auto& p : parts)
        {
            if (!out.empty()) out += ' ';
            out += p;
        }
        return out;
    }
}

// -----------------------------------------------------------------
// Normalization
// -----------------------------------------------------------------

std::string normalize_tag(std::string_view tag)
{
    const auto first = std::find_if(tag.begin(), tag.end(), is_alnum);
    const auto last = std::find_if(tag.rbegin(), tag.rend(), is_alnum).base();
    if (first >= last) return {};

    std::string out;
    bool pending_space = false;
    for (auto it = first; it != last; ++it)
    {
        const auto c = static_cast<unsigned char>(*it);
        if (std::isspace(c))
        {
            pending_space = true;
            continue;
        }
        if (pending_space)
        {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(c));
    }
    return out;
}

std::vector<std::string> normalize_tags(const std::vector<std::string>& tags)
{
    std::vector<std::string> out;
    std::unordered_set<std::string> seen;

    const auto add = [&](std::string t) {
        if (!t.empty() && seen.insert(t).second)
        {
            out.push_back(std::move(t));
        }
    };

    for (const auto& raw : tags)
    {
        std::string tag = normalize_tag(raw);
        if (tag.find(' ') != std::string::npos)
        {
            add(tag);
            std::istringstream words(tag);
            std::string word;
            while (words >> word)
            {
                add(normalize_tag(word));
            }
        }
        else
        {
            add(std::move(tag));
        }
    }
    return out;
}

// -----------------------------------------------------------------
// Scorers
// -----------------------------------------------------------------

VerseScorer keyword_scorer()
{
    return [](const VerseRecord& record, const std::vector<std::string>& query) -> f64 {
        const auto record_tags = normalize_tags(record.tags);

        i32 overlap = 0;
        for (const auto& q : query)
        {
            if (std::find(record_tags.begin(), record_tags.end(), q) != record_tags.end())
            {
                ++overlap;
            }
        }
        if (overlap > 0) return static_cast<f64>(overlap);

        const std::string text = to_lower(record.meaning + " " + record.deity);
        for (const auto& q : query)
        {
            if (text.find(q) != std::string::npos) return kSubstringBonus;
        }
        return 0.0;
    };
}

VerseScorer vector_scorer()
{
    return [](const VerseRecord& record, const std::vector<std::string>& query) -> f64 {
        const std::string record_text = join(record.tags) + " " + record.deity + " " + record.meaning;
        if (!shares_a_word(query, record_text)) return 0.0;

        const f64 similarity = cosine(embed(join(query)), embed(record_text));
        return similarity < kMinCosine ? 0.0 : similarity;
    };
}

std::optional<VerseScorer> make_scorer(std::string_view name)
{
    if (name == "keyword") return keyword_scorer();
    if (name == "vector") return vector_scorer();
    return std::nullopt;
}

} // namespace vedika::verse
