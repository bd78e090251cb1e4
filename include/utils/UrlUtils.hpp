#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace jpoll {
    /**
     * @brief Resolved request endpoint: where to connect and what to ask for.
     *
     * `target` always starts with '/' and keeps the query string, e.g. "/json?x=1".
     */
    struct EndPoint {
        std::string scheme; ///< "http" or "https" (lower-cased)
        std::string host;   ///< e.g. "httpbin.org"; IPv6 literals are stored without brackets
        std::string port;   ///< e.g. "443"
        std::string target; ///< e.g. "/json"

        [[nodiscard]] bool tls() const noexcept { return scheme == "https"; }

        /// Value for the Host header: default ports are omitted.
        [[nodiscard]] std::string host_header() const;

        /// Connection pool key: scheme://host:port
        [[nodiscard]] std::string pool_key() const;
    };

    namespace url {
        /**
         * @brief Split an absolute http(s) URL into an EndPoint.
         *
         * Accepts `scheme://host[:port][/path][?query][#fragment]`. Userinfo, unknown schemes,
         * an empty host or a non-numeric port are rejected with std::nullopt. The fragment is dropped.
         */
        std::optional<EndPoint> parse(std::string_view raw);

        inline const char *default_port(std::string_view scheme) {
            return scheme == "https" ? "443" : "80";
        }
    }
} // namespace jpoll
