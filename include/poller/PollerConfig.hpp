#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "abstract/HttpClient.hpp"

namespace jpoll {
    inline constexpr std::uint64_t kPollIntervalMs = 500;
    inline constexpr std::size_t kPoolMaxIdlePerHost = 1;
    inline constexpr std::uint64_t kPoolIdleTimeoutSecs = 90;
    inline constexpr std::uint64_t kRequestTimeoutMs = 1000;
    inline constexpr std::uint64_t kTcpKeepaliveSecs = 60;

    /**
     * @brief Everything a poller is built from.
     *
     * Only `url` and `poll_interval` are read by the poller itself; the remaining fields are baked
     * into the HTTP client at build time (see client_options()).
     */
    struct PollerConfig {
        std::string url; ///< required, not validated until the first request

        std::chrono::milliseconds poll_interval{kPollIntervalMs};
        std::size_t pool_max_idle_per_host{kPoolMaxIdlePerHost};
        std::chrono::seconds pool_idle_timeout{kPoolIdleTimeoutSecs};
        std::chrono::milliseconds request_timeout{kRequestTimeoutMs};
        std::chrono::seconds tcp_keepalive{kTcpKeepaliveSecs};

        [[nodiscard]] HttpClientOptions client_options() const {
            HttpClientOptions o;
            o.pool_max_idle_per_host = pool_max_idle_per_host;
            o.pool_idle_timeout = pool_idle_timeout;
            o.request_timeout = request_timeout;
            o.tcp_keepalive = tcp_keepalive;
            return o;
        }

        bool operator==(const PollerConfig &) const = default;
    };
} // namespace jpoll
