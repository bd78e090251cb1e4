// HttpClient.hpp
#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

#include "abstract/HttpClient.hpp"
#include "utils/LogUtils.hpp"
#include "utils/UrlUtils.hpp"

namespace jpoll {
    /**
     * @class HttpClient
     *
     * @brief Async HTTP/1.1 GET client (plain or TLS) built on Boost.Asio + Boost.Beast, with an idle connection pool.
     *
     * Chain for a fresh connection (all async, serialized on strand_):
     *     resolve DNS → TCP connect (+ keepalive options) → [SNI + TLS handshake] → HTTP write → HTTP read
     * A pooled connection skips straight to the HTTP write.
     *
     * After the read:
     *  - server agreed to keep-alive and the host has room in the pool → connection parked, callback fired;
     *  - otherwise → orderly TLS shutdown (https) or hard close (http), then callback fired.
     *
     * Deadlines:
     *  - `request_timeout` covers the whole chain. On expiry the socket is closed, the pending operation
     *    completes with an error and the request finishes with errc::timed_out.
     *  - TLS shutdown is bounded separately by `shutdown_timeout`.
     *
     * Stale pooled connections: if a reused connection fails before any response byte arrives
     * (peer closed it while idle) the request is re-sent once on a fresh connection, under the same deadline.
     *
     * Ownership & Lifetime:
     *  - Construct via create(); pending async ops hold a shared_ptr to the client.
     *  - Exactly one I/O operation is outstanding while a request is in flight.
     */
    class HttpClient final : public IHttpClient, public std::enable_shared_from_this<HttpClient> {
    public:
        /**
         * @brief Factory: ensures shared_from_this() is always valid.
         *
         * Builds the TLS context (system default CA paths, peer verification). No I/O is started.
         * @throws boost::system::system_error if the TLS context cannot be set up.
         */
        static std::shared_ptr<HttpClient> create(boost::asio::io_context &ioc, HttpClientOptions opts = {}) {
            return std::shared_ptr<HttpClient>(new HttpClient(ioc, std::move(opts)));
        }

        HttpClient(const HttpClient &) = delete;

        HttpClient &operator=(const HttpClient &) = delete;

        void set_logger(LogFn fn) { logger_ = std::move(fn); }

        void async_get(const std::string &url, ResponseHandler cb) override;

        /// Abort the in-flight request; its callback completes with operation_aborted. Safe from any thread.
        void cancel() override;

        /// Close every parked connection. Safe from any thread.
        void close_idle_connections();

        [[nodiscard]] const HttpClientOptions &options() const noexcept { return opts_; }

        /// Parked connections across all hosts. Read from the strand or after the io_context stopped.
        [[nodiscard]] std::size_t idle_connections() const;

        /// Connections opened since construction (fresh TCP connects that succeeded).
        [[nodiscard]] std::uint64_t connections_opened() const noexcept { return connections_opened_; }

        [[nodiscard]] unsigned last_http_status() const noexcept { return last_http_status_; }

    private:
        using tcp = boost::asio::ip::tcp;
        using tls_stream = boost::beast::ssl_stream<tcp::socket>;

        struct Connection {
            std::string key;
            std::unique_ptr<tls_stream> tls; // set for https
            std::unique_ptr<tcp::socket> plain; // set for http
            std::chrono::steady_clock::time_point idle_since{};
            bool handshook{false};

            tcp::socket &socket() { return tls ? boost::beast::get_lowest_layer(*tls) : *plain; }
        };

        HttpClient(boost::asio::io_context &ioc, HttpClientOptions opts);

        // Chain helpers (all executed on strand_)
        void start_request_();

        void do_resolve_();

        void do_tcp_connect_(const tcp::resolver::results_type &results);

        void do_tls_handshake_();

        void do_http_request_();

        void do_http_read_();

        void do_tls_shutdown_();

        /// Returns false (and fails the request) if ec is set or the request was aborted meanwhile.
        bool proceed_(std::uint64_t id, boost::system::error_code ec);

        void fail_(boost::system::error_code ec);

        void finish_();

        // state mgmt
        void reset_per_request_state_();

        void fresh_parser_();

        std::unique_ptr<Connection> make_connection_();

        std::unique_ptr<Connection> checkout_(const std::string &key);

        void park_(std::unique_ptr<Connection> conn);

        void evict_expired_();

        void apply_keepalive_(tcp::socket &sock);

        static void close_socket_hard_(Connection &conn) noexcept;

        static bool is_stale_connection_error_(boost::system::error_code ec);

        // deadlines
        void arm_deadline_();

        void disarm_deadline_();

        void arm_shutdown_deadline_();

        void cancel_shutdown_deadline_();

        void emit_log_(LogLevel level, std::string_view msg) const {
            if (logger_) logger_(level, msg);
        }

    private:
        boost::asio::io_context &ioc_;
        const HttpClientOptions opts_;

        // Serialize *all* operations.
        boost::asio::strand<boost::asio::io_context::executor_type> strand_;

        boost::asio::ssl::context ssl_ctx_{boost::asio::ssl::context::tls_client};
        tcp::resolver resolver_;

        std::unique_ptr<Connection> conn_; // connection serving the in-flight request

        std::unordered_map<std::string, std::deque<std::unique_ptr<Connection> > > idle_;

        boost::beast::flat_buffer buffer_;
        boost::beast::http::request<boost::beast::http::string_body> req_;
        std::unique_ptr<boost::beast::http::response_parser<boost::beast::http::string_body> > parser_;

        std::string url_;
        EndPoint ep_;

        ResponseHandler cb_;

        bool in_flight_{false};
        std::uint64_t req_id_{0};
        bool reused_{false};
        bool retried_{false};
        bool deadline_hit_{false};
        bool cancelled_{false};
        bool shutting_down_{false};

        boost::system::error_code final_ec_;
        HttpResponse response_;
        bool server_keep_alive_{false};

        boost::asio::steady_timer deadline_;
        boost::asio::steady_timer shutdown_deadline_;

        unsigned last_http_status_{0};
        std::uint64_t connections_opened_{0};

        LogFn logger_;
    };
} // namespace jpoll
