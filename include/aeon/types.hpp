#pragma once

#include <expected>
#include <string>
#include <stdexcept>

namespace aeon
{

    /**
     * Error types for AEON identity operations
     */
    enum class ErrorCode
    {
        InvalidName,
        InvalidKey,
        InvalidEncoding,
        InvalidDid,
        ConfigError,
        StorageError,
        NotFound,
        ParsingError,
        IOError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::InvalidName:
            return "InvalidName";
        case ErrorCode::InvalidKey:
            return "InvalidKey";
        case ErrorCode::InvalidEncoding:
            return "InvalidEncoding";
        case ErrorCode::InvalidDid:
            return "InvalidDid";
        case ErrorCode::ConfigError:
            return "ConfigError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::ParsingError:
            return "ParsingError";
        case ErrorCode::IOError:
            return "IOError";
        }
        return "Unknown";
    }

    /**
     * AEON error with code and message
     */
    class AeonError : public std::runtime_error
    {
    public:
        ErrorCode code;

        AeonError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static AeonError invalid_name(const std::string &msg)
        {
            return AeonError(ErrorCode::InvalidName, msg);
        }

        static AeonError invalid_key(const std::string &msg)
        {
            return AeonError(ErrorCode::InvalidKey, msg);
        }

        static AeonError invalid_encoding(const std::string &msg)
        {
            return AeonError(ErrorCode::InvalidEncoding, msg);
        }

        static AeonError invalid_did(const std::string &msg)
        {
            return AeonError(ErrorCode::InvalidDid, msg);
        }

        static AeonError config(const std::string &msg)
        {
            return AeonError(ErrorCode::ConfigError, msg);
        }

        static AeonError storage(const std::string &msg)
        {
            return AeonError(ErrorCode::StorageError, msg);
        }

        static AeonError not_found(const std::string &msg)
        {
            return AeonError(ErrorCode::NotFound, msg);
        }

        static AeonError parsing(const std::string &msg)
        {
            return AeonError(ErrorCode::ParsingError, msg);
        }

        static AeonError io(const std::string &msg)
        {
            return AeonError(ErrorCode::IOError, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, AeonError>;

} // namespace aeon
