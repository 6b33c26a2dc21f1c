#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace tollgate
{

    /**
     * Error kinds for Tollgate operations
     */
    enum class ErrorCode
    {
        ConfigError,
        InvalidConfiguration,
        ParsingError,
        IOError
    };

    /**
     * Convert ErrorCode to string representation
     */
    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::InvalidConfiguration:
            return "InvalidConfiguration";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * Tollgate error with code and message
     */
    class TollgateError : public std::runtime_error
    {
    public:
        ErrorCode code;

        TollgateError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static TollgateError config(const std::string &msg)
        {
            return TollgateError(ErrorCode::ConfigError, msg);
        }

        static TollgateError invalid_configuration(const std::string &msg)
        {
            return TollgateError(ErrorCode::InvalidConfiguration, msg);
        }

        static TollgateError parsing(const std::string &msg)
        {
            return TollgateError(ErrorCode::ParsingError, msg);
        }

        static TollgateError io(const std::string &msg)
        {
            return TollgateError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, TollgateError>;

} // namespace tollgate
