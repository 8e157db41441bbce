/// @file error.cpp
/// @brief Error message and context formatting.

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

#include <utility>

namespace darksky::core
{

std::string_view error_kind_name(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::DataUnavailable:       return "DataUnavailable";
        case ErrorKind::InvalidInput:          return "InvalidInput";
        case ErrorKind::InconsistentEphemeris: return "InconsistentEphemeris";
        case ErrorKind::MissingData:           return "MissingData";
        case ErrorKind::InsufficientData:      return "InsufficientData";
    }
    return "Unknown";
}

std::string ErrorContext::describe() const
{
    std::string out = fmt::format("operation={}", operation.empty() ? "?" : operation);
    if (latitude && longitude)
    {
        out += fmt::format(", location=({:.4f}, {:.4f})", *latitude, *longitude);
    }
    if (when)
    {
        out += fmt::format(", at={}", *when);
    }
    return out;
}

DarkskyError::DarkskyError(ErrorKind kind, const std::string& message, ErrorContext context)
    : std::runtime_error(fmt::format("{}: {} [{}]", error_kind_name(kind), message, context.describe()))
    , m_kind(kind)
    , m_message(message)
    , m_context(std::move(context))
{
}

} // namespace darksky::core
