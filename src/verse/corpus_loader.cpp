/// @file corpus_loader.cpp
/// @brief Implementation of the YAML verse corpus loader.

#include "verse/corpus_loader.hpp"

#include "core/logger.hpp"

#include <yaml-cpp/yaml.h>

#include <string>
#include <unordered_set>

namespace vedika::verse
{

namespace
{
    [[nodiscard]] std::string scalar_or_empty(const YAML::Node& record, const char* key)
    {
        const YAML::Node value = record[key];
        return value && value.IsScalar() ? value.as<std::string>() : std::string{};
    }
}

// -----------------------------------------------------------------
// Load corpus: sequence of {id, devanagari, transliteration, meaning,
//                           deity, source, tags}
// -----------------------------------------------------------------

std::optional<Corpus> CorpusLoader::load_yaml(const std::filesystem::path& path)
{
    if (!std::filesystem::exists(path))
    {
        VDK_CORE_ERROR("CorpusLoader: File not found: {}", path.string());
        return std::nullopt;
    }

    YAML::Node root;
    try
    {
        root = YAML::LoadFile(path.string());
    }
    catch (const YAML::Exception& e)
    {
        VDK_CORE_ERROR("CorpusLoader: Failed to parse {}: {}", path.string(), e.what());
        return std::nullopt;
    }

    if (!root.IsSequence())
    {
        VDK_CORE_ERROR("CorpusLoader: Expected a sequence of verse records in {}", path.string());
        return std::nullopt;
    }

    Corpus corpus;
    std::unordered_set<std::string> seen_ids;
    u32 skipped = 0;
    u32 index = 0;

    for (const auto& record : root)
    {
        ++index;

        if (!record.IsMap())
        {
            VDK_CORE_WARN("CorpusLoader: Record {} is not a map", index);
            ++skipped;
            continue;
        }

        VerseRecord verse;
        try
        {
            verse.id = scalar_or_empty(record, "id");
            verse.devanagari = scalar_or_empty(record, "devanagari");
            verse.transliteration = scalar_or_empty(record, "transliteration");
            verse.meaning = scalar_or_empty(record, "meaning");
            verse.deity = scalar_or_empty(record, "deity");
            verse.source = scalar_or_empty(record, "source");

            if (const YAML::Node tags = record["tags"]; tags && tags.IsSequence())
            {
                for (const auto& tag : tags)
                {
                    verse.tags.push_back(tag.as<std::string>());
                }
            }
        }
        catch (const YAML::Exception& e)
        {
            VDK_CORE_WARN("CorpusLoader: Malformed record {}: {}", index, e.what());
            ++skipped;
            continue;
        }

        if (verse.id.empty() || verse.meaning.empty())
        {
            VDK_CORE_WARN("CorpusLoader: Record {} lacks id or meaning", index);
            ++skipped;
            continue;
        }

        if (!seen_ids.insert(verse.id).second)
        {
            VDK_CORE_WARN("CorpusLoader: Duplicate id '{}' at record {}", verse.id, index);
            ++skipped;
            continue;
        }

        corpus.push_back(std::move(verse));
    }

    if (corpus.empty())
    {
        VDK_CORE_ERROR("CorpusLoader: No valid verses found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        VDK_CORE_WARN("CorpusLoader: Skipped {} malformed records", skipped);
    }

    VDK_CORE_INFO("CorpusLoader: Loaded {} verses from {}", corpus.size(), path.string());

    return corpus;
}

} // namespace vedika::verse
