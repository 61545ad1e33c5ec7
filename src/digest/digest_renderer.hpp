#pragma once
// digest/digest_renderer.hpp - Plain-text console rendering of digests and charts
//
// Renders panels in the same boxed terminal style for the weekly digest,
// a single panchang day and a janam patri.

#include "digest/weekly_digest.hpp"
#include "panchang/janam_patri.hpp"

#include <ostream>
#include <string>

namespace vedika::digest
{

// -----------------------------------------------------------------------
// DigestRenderer
// -----------------------------------------------------------------------
class DigestRenderer
{
public:
    /// Width of the rendered panels (characters)
    int panel_w{78};

    /// Week table, observances, verse per day, verse of the week, lifestyle.
    void render_digest(std::ostream& out, const WeeklyDigest& digest) const;

    /// One panchang day with its observances.
    void render_day(std::ostream& out,
                    const panchang::PanchangDay& day,
                    const panchang::ObservanceSet& observances) const;

    /// Birth chart with theme, lifestyle lines and verses.
    void render_janam_patri(std::ostream& out, const panchang::JanamPatri& chart) const;

    /// Ranked verses for an ad-hoc query.
    void render_verses(std::ostream& out,
                       const std::vector<verse::RecommendationResult>& results) const;

private:
    void hline(std::ostream& out, char c = '-') const;
    void title(std::ostream& out, const std::string& text) const;
    void row(std::ostream& out, const std::string& label, const std::string& value) const;

    static void verse_block(std::ostream& out, const verse::RecommendationResult& result,
                            const std::string& indent);
};

} // namespace vedika::digest
