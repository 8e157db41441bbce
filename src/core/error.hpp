#pragma once

/// @file error.hpp
/// @brief Error taxonomy for the forecast core.

#include "core/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace darksky::core
{
    /// @brief Failure classes surfaced by the forecast core.
    enum class ErrorKind
    {
        DataUnavailable,        ///< No complete dataset within the lookback window
        InvalidInput,           ///< Out-of-domain coordinate, percentage or rating
        InconsistentEphemeris,  ///< Rise/set/transit ordering could not be established
        MissingData,            ///< A specific hour has no forecast record
        InsufficientData,       ///< Too few hourly scores to grade
    };

    [[nodiscard]] std::string_view error_kind_name(ErrorKind kind);

    /// @brief Reproduction context attached to every error.
    struct ErrorContext
    {
        std::string operation;
        std::optional<f64> latitude;
        std::optional<f64> longitude;
        std::optional<std::string> when;   ///< Requested date or hour, as given by the caller

        [[nodiscard]] std::string describe() const;
    };

    /// @brief Base class of all forecast-core exceptions.
    class DarkskyError : public std::runtime_error
    {
    public:
        DarkskyError(ErrorKind kind, const std::string& message, ErrorContext context);

        [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }
        [[nodiscard]] const ErrorContext& context() const noexcept { return m_context; }
        [[nodiscard]] const std::string& message() const noexcept { return m_message; }

    private:
        ErrorKind m_kind;
        std::string m_message;
        ErrorContext m_context;
    };

    class DataUnavailableError : public DarkskyError
    {
    public:
        DataUnavailableError(const std::string& message, ErrorContext context = {})
            : DarkskyError(ErrorKind::DataUnavailable, message, std::move(context)) {}
    };

    class InvalidInputError : public DarkskyError
    {
    public:
        InvalidInputError(const std::string& message, ErrorContext context = {})
            : DarkskyError(ErrorKind::InvalidInput, message, std::move(context)) {}
    };

    class InconsistentEphemerisError : public DarkskyError
    {
    public:
        InconsistentEphemerisError(const std::string& message, ErrorContext context = {})
            : DarkskyError(ErrorKind::InconsistentEphemeris, message, std::move(context)) {}
    };

    class MissingDataError : public DarkskyError
    {
    public:
        MissingDataError(const std::string& message, ErrorContext context = {})
            : DarkskyError(ErrorKind::MissingData, message, std::move(context)) {}
    };

    class InsufficientDataError : public DarkskyError
    {
    public:
        InsufficientDataError(const std::string& message, ErrorContext context = {})
            : DarkskyError(ErrorKind::InsufficientData, message, std::move(context)) {}
    };

} // namespace darksky::core
