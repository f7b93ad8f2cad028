#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <stdexcept>

namespace sharecost
{

    /**
     * Error codes for sharecost operations.
     * The Auth* codes are what the routing layer sees; the Token* codes are the
     * codec's detail and are folded into AuthInvalid by the authority.
     */
    enum class ErrorCode
    {
        AuthMissing,
        AuthInvalid,
        AuthForbidden,
        ValidationError,
        NotFound,
        TokenMalformed,
        TokenSignatureMismatch,
        TokenExpired,
        ConfigError,
        CryptoError,
        StorageError,
        ParsingError,
        InternalError
    };

    /**
     * Stable name of an error code, used in JSON error bodies and logs
     */
    inline std::string_view error_code_name(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::AuthMissing:
            return "auth_missing";
        case ErrorCode::AuthInvalid:
            return "auth_invalid";
        case ErrorCode::AuthForbidden:
            return "auth_forbidden";
        case ErrorCode::ValidationError:
            return "validation_error";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::TokenMalformed:
            return "token_malformed";
        case ErrorCode::TokenSignatureMismatch:
            return "token_signature_mismatch";
        case ErrorCode::TokenExpired:
            return "token_expired";
        case ErrorCode::ConfigError:
            return "config_error";
        case ErrorCode::CryptoError:
            return "crypto_error";
        case ErrorCode::StorageError:
            return "storage_error";
        case ErrorCode::ParsingError:
            return "parsing_error";
        case ErrorCode::InternalError:
            return "internal_error";
        }
        return "unknown";
    }

    /**
     * Sharecost error with code and message
     */
    class SharecostError : public std::runtime_error
    {
    public:
        ErrorCode code;

        SharecostError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static SharecostError auth_missing(const std::string &msg)
        {
            return SharecostError(ErrorCode::AuthMissing, msg);
        }

        static SharecostError auth_invalid(const std::string &msg)
        {
            return SharecostError(ErrorCode::AuthInvalid, msg);
        }

        static SharecostError forbidden(const std::string &msg)
        {
            return SharecostError(ErrorCode::AuthForbidden, msg);
        }

        static SharecostError validation(const std::string &msg)
        {
            return SharecostError(ErrorCode::ValidationError, msg);
        }

        static SharecostError not_found(const std::string &msg)
        {
            return SharecostError(ErrorCode::NotFound, msg);
        }

        static SharecostError token_malformed(const std::string &msg)
        {
            return SharecostError(ErrorCode::TokenMalformed, msg);
        }

        static SharecostError signature_mismatch(const std::string &msg)
        {
            return SharecostError(ErrorCode::TokenSignatureMismatch, msg);
        }

        static SharecostError token_expired(const std::string &msg)
        {
            return SharecostError(ErrorCode::TokenExpired, msg);
        }

        static SharecostError config(const std::string &msg)
        {
            return SharecostError(ErrorCode::ConfigError, msg);
        }

        static SharecostError crypto(const std::string &msg)
        {
            return SharecostError(ErrorCode::CryptoError, msg);
        }

        static SharecostError storage(const std::string &msg)
        {
            return SharecostError(ErrorCode::StorageError, msg);
        }

        static SharecostError parsing(const std::string &msg)
        {
            return SharecostError(ErrorCode::ParsingError, msg);
        }

        static SharecostError internal(const std::string &msg)
        {
            return SharecostError(ErrorCode::InternalError, msg);
        }

        /** True for the three codec failure kinds */
        bool is_token_failure() const
        {
            return code == ErrorCode::TokenMalformed ||
                   code == ErrorCode::TokenSignatureMismatch ||
                   code == ErrorCode::TokenExpired;
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, SharecostError>;

} // namespace sharecost
