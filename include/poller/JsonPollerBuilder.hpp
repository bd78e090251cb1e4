#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "client_connection_handlers/HttpClient.hpp"
#include "poller/FetchError.hpp"
#include "poller/JsonPoller.hpp"
#include "poller/PollerConfig.hpp"
#include "utils/LogUtils.hpp"

namespace jpoll {
    /**
     * @brief Accumulates overrides over PollerConfig defaults, then materializes a JsonPoller<T>.
     *
     * No bounds checking: zero or huge values are taken as-is. The URL is not validated here;
     * a malformed URL surfaces as a transport failure on the first fetch.
     *
     *   auto poller = jpoll::JsonPoller<Quote>::builder("https://example.com/quote")
     *                     .poll_interval_ms(250)
     *                     .request_timeout_ms(800)
     *                     .build(ioc);
     */
    template<class T>
    class JsonPollerBuilder {
    public:
        explicit JsonPollerBuilder(std::string url) {
            cfg_.url = std::move(url);
        }

        JsonPollerBuilder &poll_interval_ms(std::uint64_t ms) {
            cfg_.poll_interval = std::chrono::milliseconds(ms);
            return *this;
        }

        JsonPollerBuilder &pool_max_idle_per_host(std::size_t max) {
            cfg_.pool_max_idle_per_host = max;
            return *this;
        }

        JsonPollerBuilder &pool_idle_timeout_secs(std::uint64_t secs) {
            cfg_.pool_idle_timeout = std::chrono::seconds(secs);
            return *this;
        }

        JsonPollerBuilder &request_timeout_ms(std::uint64_t ms) {
            cfg_.request_timeout = std::chrono::milliseconds(ms);
            return *this;
        }

        JsonPollerBuilder &tcp_keepalive_secs(std::uint64_t secs) {
            cfg_.tcp_keepalive = std::chrono::seconds(secs);
            return *this;
        }

        /// Sink shared by the poller and its HTTP client. Defaults to log::stderr_sink.
        JsonPollerBuilder &logger(LogFn fn) {
            logger_ = std::move(fn);
            return *this;
        }

        [[nodiscard]] const PollerConfig &config() const noexcept { return cfg_; }

        /**
         * @brief Build the HTTP client with the pool/timeout/keepalive settings and wrap it in a poller.
         *
         * No network I/O and no work is queued on `ioc`.
         * @throws ConstructionError if the HTTP client (TLS context) cannot be constructed.
         */
        std::shared_ptr<JsonPoller<T> > build(boost::asio::io_context &ioc) const {
            std::shared_ptr<HttpClient> client;
            try {
                client = HttpClient::create(ioc, cfg_.client_options());
            } catch (const boost::system::system_error &e) {
                throw ConstructionError(std::string("HTTP client construction failed: ") + e.what(), e.code());
            }
            client->set_logger(logger_);

            auto poller = JsonPoller<T>::create(ioc, std::move(client), cfg_);
            poller->set_logger(logger_);
            return poller;
        }

    private:
        PollerConfig cfg_;
        LogFn logger_{&log::stderr_sink};
    };

    template<class T>
    JsonPollerBuilder<T> JsonPoller<T>::builder(std::string url) {
        return JsonPollerBuilder<T>(std::move(url));
    }
} // namespace jpoll
