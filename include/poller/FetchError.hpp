#pragma once

#include <boost/system/error_code.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace jpoll {
    enum class FetchErrorKind {
        Transport,  ///< request not sent / no response: DNS, connect, TLS, deadline, cancel, malformed URL
        HttpStatus, ///< response received, status outside 2xx
        Decode      ///< body is not JSON, or its shape does not match the payload type
    };

    inline const char *to_string(FetchErrorKind k) {
        switch (k) {
            case FetchErrorKind::Transport: return "transport";
            case FetchErrorKind::HttpStatus: return "http_status";
            case FetchErrorKind::Decode: return "decode";
            default: return "UNKNOWN";
        }
    }

    /**
     * @brief Outcome of a failed fetch. All kinds are one failure category for the caller;
     *        the fields only add detail for logs and tests.
     */
    struct FetchError {
        FetchErrorKind kind{FetchErrorKind::Transport};
        boost::system::error_code ec; ///< Transport only
        unsigned http_status{0};      ///< HttpStatus only
        std::string detail;

        static FetchError transport(boost::system::error_code ec);

        static FetchError http_status_error(unsigned status);

        static FetchError decode(std::string what);

        /// e.g. "transport: Connection refused", "http_status: HTTP 404", "decode: [json.exception.parse_error.101] ..."
        [[nodiscard]] std::string message() const;
    };

    /// Success is exactly 200..299; anything else is an HttpStatus error (the body is discarded).
    std::optional<FetchError> classify_status(unsigned status);

    template<class T>
    using FetchResult = std::variant<T, FetchError>;

    /// Thrown by JsonPollerBuilder::build() when the HTTP client cannot be constructed.
    class ConstructionError : public std::runtime_error {
    public:
        explicit ConstructionError(const std::string &what, boost::system::error_code ec = {})
            : std::runtime_error(what), ec_(ec) {
        }

        [[nodiscard]] boost::system::error_code code() const noexcept { return ec_; }

    private:
        boost::system::error_code ec_;
    };
} // namespace jpoll
