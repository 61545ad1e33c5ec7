#pragma once

/// @file corpus_loader.hpp
/// @brief Loads the verse corpus from a YAML (or JSON) file.

#include "verse/verse_record.hpp"

#include <filesystem>
#include <optional>

namespace vedika::verse
{
    /// @brief Static utility class for loading verse corpora.
    class CorpusLoader
    {
    public:
        CorpusLoader() = delete;

        /// @brief Load a corpus file.
        ///
        /// The document is a sequence of maps (JSON arrays of objects parse
        /// the same way):
        ///
        ///   - id: bg-9.22
        ///     devanagari: "..."
        ///     transliteration: "..."
        ///     meaning: "..."
        ///     deity: Vishnu
        ///     source: Bhagavad Gita 9.22
        ///     tags: [devotion, vishnu]
        ///
        /// `id` and `meaning` are required; other fields default to empty.
        /// Records without them, and records whose id repeats an earlier one,
        /// are skipped with a warning. File order is kept.
        ///
        /// @param path Path to the corpus file.
        /// @return The records, or std::nullopt if the file is missing,
        ///         unparsable or holds no valid record.
        [[nodiscard]] static std::optional<Corpus> load_yaml(const std::filesystem::path& path);
    };

} // namespace vedika::verse
