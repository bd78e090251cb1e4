#include "poller/FetchError.hpp"

namespace jpoll {
    FetchError FetchError::transport(boost::system::error_code ec) {
        FetchError e;
        e.kind = FetchErrorKind::Transport;
        e.ec = ec;
        e.detail = ec.message();
        return e;
    }

    FetchError FetchError::http_status_error(unsigned status) {
        FetchError e;
        e.kind = FetchErrorKind::HttpStatus;
        e.http_status = status;
        e.detail = "HTTP " + std::to_string(status);
        return e;
    }

    FetchError FetchError::decode(std::string what) {
        FetchError e;
        e.kind = FetchErrorKind::Decode;
        e.detail = std::move(what);
        return e;
    }

    std::string FetchError::message() const {
        return std::string(to_string(kind)) + ": " + detail;
    }

    std::optional<FetchError> classify_status(unsigned status) {
        if (status >= 200 && status < 300) return std::nullopt;
        return FetchError::http_status_error(status);
    }
} // namespace jpoll
