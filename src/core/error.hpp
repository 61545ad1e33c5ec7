#pragma once

/// @file error.hpp
/// @brief Fatal computation errors and their kinds.

#include <stdexcept>
#include <string>
#include <string_view>

namespace vedika::core
{
    /// @brief Classification of a failed computation.
    enum class ErrorKind
    {
        EphemerisUnavailable,   ///< Provider unreachable or returned invalid data
        InvalidDate,            ///< No valid calendar mapping (e.g. no sunrise at this latitude)
        CorpusEmpty,            ///< No verse record available at all
    };

    /// @brief Stable identifier for an error kind ("EphemerisUnavailable", ...).
    [[nodiscard]] std::string_view to_string(ErrorKind kind);

    /// @brief Whole-operation failure carrying the originating error kind.
    ///
    /// Thrown at the point of detection and propagated unchanged; callers
    /// never receive partially computed results.
    class ComputationError : public std::runtime_error
    {
    public:
        ComputationError(ErrorKind kind, const std::string& message);

        [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /// @brief Log the failure on the core logger, then throw ComputationError.
    [[noreturn]] void fail(ErrorKind kind, const std::string& message);

} // namespace vedika::core
