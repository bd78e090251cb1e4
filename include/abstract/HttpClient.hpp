#pragma once

#include <boost/system/error_code.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>

namespace jpoll {
    /**
     * @brief Settings baked into an HTTP client when it is constructed.
     *
     * Pool semantics:
     *  - After a complete response, the connection is parked for reuse if the server agreed to
     *    keep-alive and fewer than `pool_max_idle_per_host` connections are idle for that host.
     *  - `pool_max_idle_per_host == 0` disables reuse entirely (requests send `Connection: close`).
     *  - Idle connections older than `pool_idle_timeout` are evicted the next time the pool is consulted.
     */
    struct HttpClientOptions {
        std::size_t pool_max_idle_per_host{1};
        std::chrono::seconds pool_idle_timeout{90};

        /// Whole-request deadline: resolve + connect + TLS handshake + write + read.
        std::chrono::milliseconds request_timeout{1000};

        /// TCP_KEEPIDLE for new sockets; zero leaves SO_KEEPALIVE off.
        std::chrono::seconds tcp_keepalive{60};

        std::chrono::milliseconds shutdown_timeout{200};

        // safety limits
        std::size_t max_header_bytes{32 * 1024};
        std::size_t max_body_bytes{2 * 1024 * 1024};

        std::string user_agent{"jpoll-httpclient"};
    };

    struct HttpResponse {
        unsigned status{0};
        std::string body;
        bool reused_connection{false}; ///< served over a pooled connection
    };

    /**
     * @brief Asynchronous GET client.
     *
     * Contract:
     *  - async_get() completes exactly once with (ec, response).
     *  - A non-2xx status is NOT an error at this layer: ec is clear and response.status carries it.
     *  - At most one request is in flight per client; a second call fails with operation_in_progress.
     *  - cancel() aborts the in-flight request (operation_aborted) and is safe to call at any time.
     */
    struct IHttpClient {
        using ResponseHandler = std::function<void(boost::system::error_code, HttpResponse)>;

        virtual ~IHttpClient() = default;

        virtual void async_get(const std::string &url, ResponseHandler cb) = 0;

        virtual void cancel() = 0;
    };
} // namespace jpoll
