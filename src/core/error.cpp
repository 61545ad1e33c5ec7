/// @file error.cpp
/// @brief ComputationError and the log-then-throw helper.

#include "core/error.hpp"

#include "core/logger.hpp"

namespace vedika::core
{

std::string_view to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::EphemerisUnavailable: return "EphemerisUnavailable";
    case ErrorKind::InvalidDate:          return "InvalidDate";
    case ErrorKind::CorpusEmpty:          return "CorpusEmpty";
    }
    return "Unknown";
}

ComputationError::ComputationError(ErrorKind kind, const std::string& message)
    : std::runtime_error(message)
    , m_kind(kind)
{
}

void fail(ErrorKind kind, const std::string& message)
{
    VDK_CORE_ERROR("{}: {}", to_string(kind), message);
    throw ComputationError(kind, message);
}

} // namespace vedika::core
