// HttpClient.cpp
#include "client_connection_handlers/HttpClient.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h> // X509_check_host

#include <netinet/in.h>
#include <netinet/tcp.h>

namespace jpoll {
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = boost::asio::ssl;

    HttpClient::HttpClient(boost::asio::io_context &ioc, HttpClientOptions opts)
        : ioc_(ioc),
          opts_(std::move(opts)),
          strand_(ioc.get_executor()),
          ssl_ctx_(ssl::context::tls_client),
          resolver_(ioc_),
          deadline_(ioc_),
          shutdown_deadline_(ioc_) {
        // Baseline secure defaults
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(ssl::verify_peer);
    }

    void HttpClient::async_get(const std::string &url, ResponseHandler cb) {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self, url, cb = std::move(cb)]() mutable {
            if (self->in_flight_) {
                if (cb) cb(make_error_code(boost::system::errc::operation_in_progress), {});
                return;
            }

            self->in_flight_ = true;
            ++self->req_id_;
            self->url_ = url;
            self->cb_ = std::move(cb);
            self->reset_per_request_state_();

            auto ep = url::parse(self->url_);
            if (!ep) {
                self->emit_log_(LogLevel::DEBUG, "[HTTPCLIENT] malformed url '" + self->url_ + "'");
                self->final_ec_ = make_error_code(boost::system::errc::invalid_argument);
                self->finish_();
                return;
            }
            self->ep_ = std::move(*ep);

            self->req_.version(11);
            self->req_.method(http::verb::get);
            self->req_.target(self->ep_.target);
            self->req_.set(http::field::host, self->ep_.host_header());
            self->req_.set(http::field::user_agent,
                           std::string(BOOST_BEAST_VERSION_STRING) + " " + self->opts_.user_agent);
            self->req_.set(http::field::connection,
                           self->opts_.pool_max_idle_per_host > 0 ? "keep-alive" : "close");

            self->arm_deadline_();
            self->start_request_();
        });
    }

    void HttpClient::cancel() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            if (!self->in_flight_) return;

            // Exactly one op is pending; closing the socket makes it complete, proceed_() then fails the request.
            self->cancelled_ = true;
            self->resolver_.cancel();
            if (self->conn_) close_socket_hard_(*self->conn_);
        });
    }

    void HttpClient::close_idle_connections() {
        auto self = shared_from_this();
        boost::asio::dispatch(strand_, [self] {
            for (auto &[key, conns]: self->idle_) {
                for (auto &c: conns) close_socket_hard_(*c);
            }
            self->idle_.clear();
        });
    }

    std::size_t HttpClient::idle_connections() const {
        std::size_t n = 0;
        for (const auto &[key, conns]: idle_) n += conns.size();
        return n;
    }

    void HttpClient::reset_per_request_state_() {
        disarm_deadline_();
        cancel_shutdown_deadline_();

        reused_ = false;
        retried_ = false;
        deadline_hit_ = false;
        cancelled_ = false;
        shutting_down_ = false;

        final_ec_.clear();
        response_ = {};
        server_keep_alive_ = false;
        last_http_status_ = 0;

        req_ = {};
        fresh_parser_();
    }

    void HttpClient::fresh_parser_() {
        buffer_.consume(buffer_.size());
        parser_ = std::make_unique<http::response_parser<http::string_body> >();
        parser_->header_limit(static_cast<std::uint32_t>(opts_.max_header_bytes));
        parser_->body_limit(static_cast<std::uint64_t>(opts_.max_body_bytes));
    }

    std::unique_ptr<HttpClient::Connection> HttpClient::make_connection_() {
        auto c = std::make_unique<Connection>();
        c->key = ep_.pool_key();

        if (!ep_.tls()) {
            c->plain = std::make_unique<tcp::socket>(ioc_);
            return c;
        }

        c->tls = std::make_unique<tls_stream>(ioc_, ssl_ctx_);
        c->tls->set_verify_mode(ssl::verify_peer);

        // Hostname (or IP literal) verification on leaf cert (depth 0)
        const std::string host_for_verify = ep_.host;
        boost::system::error_code addr_ec;
        boost::asio::ip::make_address(host_for_verify, addr_ec);
        const bool is_ip_literal = !addr_ec;

        c->tls->set_verify_callback(
            [host_for_verify, is_ip_literal](bool preverified, ssl::verify_context &ctx) {
                if (!preverified) return false;

                X509_STORE_CTX *sctx = ctx.native_handle();
                if (X509_STORE_CTX_get_error_depth(sctx) != 0) return true;

                X509 *cert = X509_STORE_CTX_get_current_cert(sctx);
                if (!cert) return false;

                if (is_ip_literal) {
                    return X509_check_ip_asc(cert, host_for_verify.c_str(), 0) == 1;
                }
                return X509_check_host(
                           cert,
                           host_for_verify.c_str(),
                           host_for_verify.size(),
                           0,
                           nullptr) == 1;
            }
        );
        return c;
    }

    void HttpClient::evict_expired_() {
        const auto now = std::chrono::steady_clock::now();
        for (auto it = idle_.begin(); it != idle_.end();) {
            auto &conns = it->second;
            for (auto c = conns.begin(); c != conns.end();) {
                const bool expired = now - (*c)->idle_since >= opts_.pool_idle_timeout;
                if (expired || !(*c)->socket().is_open()) {
                    close_socket_hard_(**c);
                    c = conns.erase(c);
                } else {
                    ++c;
                }
            }
            if (conns.empty()) it = idle_.erase(it);
            else ++it;
        }
    }

    std::unique_ptr<HttpClient::Connection> HttpClient::checkout_(const std::string &key) {
        evict_expired_();

        auto it = idle_.find(key);
        if (it == idle_.end()) return nullptr;

        // Most recently parked first: least likely to have been dropped by the peer.
        auto conn = std::move(it->second.back());
        it->second.pop_back();
        if (it->second.empty()) idle_.erase(it);
        return conn;
    }

    void HttpClient::park_(std::unique_ptr<Connection> conn) {
        if (opts_.pool_max_idle_per_host == 0) {
            close_socket_hard_(*conn);
            return;
        }

        auto &conns = idle_[conn->key];
        if (conns.size() >= opts_.pool_max_idle_per_host) {
            close_socket_hard_(*conn);
            return;
        }

        conn->idle_since = std::chrono::steady_clock::now();
        conns.push_back(std::move(conn));
    }

    void HttpClient::apply_keepalive_(tcp::socket &sock) {
        if (opts_.tcp_keepalive.count() <= 0) return;

        using keep_idle = boost::asio::detail::socket_option::integer<IPPROTO_TCP, TCP_KEEPIDLE>;

        boost::system::error_code ec;
        sock.set_option(tcp::socket::keep_alive(true), ec);
        if (!ec) sock.set_option(keep_idle(static_cast<int>(opts_.tcp_keepalive.count())), ec);
        if (ec) emit_log_(LogLevel::WARN, "[HTTPCLIENT] tcp keepalive not applied: " + ec.message());
    }

    void HttpClient::close_socket_hard_(Connection &conn) noexcept {
        boost::system::error_code ignored;
        auto &sock = conn.socket();
        sock.cancel(ignored);
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
    }

    bool HttpClient::is_stale_connection_error_(boost::system::error_code ec) {
        return ec == http::error::end_of_stream ||
               ec == boost::asio::error::eof ||
               ec == boost::asio::error::connection_reset ||
               ec == boost::asio::error::connection_aborted ||
               ec == boost::asio::error::broken_pipe ||
               ec == ssl::error::stream_truncated;
    }

    bool HttpClient::proceed_(std::uint64_t id, boost::system::error_code ec) {
        // strand-only
        if (id != req_id_ || !in_flight_) return false;

        if (deadline_hit_) {
            fail_(make_error_code(boost::system::errc::timed_out));
            return false;
        }
        if (cancelled_) {
            fail_(boost::asio::error::operation_aborted);
            return false;
        }
        if (ec) {
            fail_(ec);
            return false;
        }
        return true;
    }

    void HttpClient::fail_(boost::system::error_code ec) {
        // strand-only
        if (!in_flight_) return;

        const bool can_resend = reused_ && !retried_ && !deadline_hit_ && !cancelled_ &&
                                is_stale_connection_error_(ec) && !parser_->got_some();
        if (can_resend) {
            emit_log_(LogLevel::DEBUG, "[HTTPCLIENT] pooled connection went stale (" + ec.message() + "), reconnecting");
            retried_ = true;
            reused_ = false;
            close_socket_hard_(*conn_);
            fresh_parser_();
            conn_ = make_connection_();
            do_resolve_();
            return;
        }

        final_ec_ = ec;
        emit_log_(LogLevel::DEBUG, "[HTTPCLIENT] GET " + url_ + " failed: " + ec.message());
        if (conn_) close_socket_hard_(*conn_);
        finish_();
    }

    void HttpClient::finish_() {
        // strand-only, ensure single completion
        if (!in_flight_) return;

        disarm_deadline_();
        cancel_shutdown_deadline_();

        const auto ec = final_ec_;

        if (conn_) {
            const bool keep = !ec && !shutting_down_ && server_keep_alive_ && opts_.pool_max_idle_per_host > 0;
            if (keep) park_(std::move(conn_));
            else close_socket_hard_(*conn_);
            conn_.reset();
        }

        auto cb = std::move(cb_);
        cb_ = {};
        auto response = std::move(response_);
        response_ = {};

        in_flight_ = false;

        // The callback may start the next request immediately.
        if (cb) cb(ec, std::move(response));
    }

    void HttpClient::start_request_() {
        conn_ = checkout_(ep_.pool_key());
        if (conn_) {
            reused_ = true;
            do_http_request_();
            return;
        }

        reused_ = false;
        conn_ = make_connection_();
        do_resolve_();
    }

    void HttpClient::do_resolve_() {
        auto self = shared_from_this();
        const auto id = req_id_;

        resolver_.async_resolve(
            ep_.host, ep_.port,
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec,
                                                  const tcp::resolver::results_type &results) {
                                           if (!self->proceed_(id, ec)) return;
                                           self->do_tcp_connect_(results);
                                       }
            )
        );
    }

    void HttpClient::do_tcp_connect_(const tcp::resolver::results_type &results) {
        auto self = shared_from_this();
        const auto id = req_id_;

        boost::asio::async_connect(
            conn_->socket(), results,
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec, const tcp::endpoint &) {
                                           if (!self->proceed_(id, ec)) return;

                                           ++self->connections_opened_;
                                           self->apply_keepalive_(self->conn_->socket());

                                           if (!self->conn_->tls) {
                                               self->do_http_request_();
                                               return;
                                           }

                                           // SNI
                                           if (!SSL_set_tlsext_host_name(
                                               self->conn_->tls->native_handle(), self->ep_.host.c_str())) {
                                               const boost::system::error_code sni_ec{
                                                   static_cast<int>(::ERR_get_error()),
                                                   boost::asio::error::get_ssl_category()
                                               };
                                               self->fail_(sni_ec);
                                               return;
                                           }

                                           self->do_tls_handshake_();
                                       }
            )
        );
    }

    void HttpClient::do_tls_handshake_() {
        auto self = shared_from_this();
        const auto id = req_id_;

        conn_->tls->async_handshake(
            ssl::stream_base::client,
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec) {
                                           if (!self->proceed_(id, ec)) return;

                                           self->conn_->handshook = true;
                                           self->do_http_request_();
                                       }
            )
        );
    }

    void HttpClient::do_http_request_() {
        auto self = shared_from_this();
        const auto id = req_id_;

        auto on_write = boost::asio::bind_executor(
            strand_,
            [self, id](const boost::system::error_code &ec, std::size_t) {
                if (!self->proceed_(id, ec)) return;
                self->do_http_read_();
            });

        if (conn_->tls) http::async_write(*conn_->tls, req_, std::move(on_write));
        else http::async_write(*conn_->plain, req_, std::move(on_write));
    }

    void HttpClient::do_http_read_() {
        auto self = shared_from_this();
        const auto id = req_id_;

        auto on_read = boost::asio::bind_executor(
            strand_,
            [self, id](const boost::system::error_code &ec, std::size_t) {
                if (!self->proceed_(id, ec)) return;

                self->disarm_deadline_();

                auto &res = self->parser_->get();
                self->last_http_status_ = res.result_int();
                self->server_keep_alive_ = res.keep_alive();

                self->response_.status = res.result_int();
                self->response_.body = std::move(res.body());
                self->response_.reused_connection = self->reused_;
                self->final_ec_.clear();

                const bool poolable = self->server_keep_alive_ && self->opts_.pool_max_idle_per_host > 0;
                if (poolable || !self->conn_->tls) {
                    self->finish_();
                    return;
                }

                self->do_tls_shutdown_();
            });

        if (conn_->tls) http::async_read(*conn_->tls, buffer_, *parser_, std::move(on_read));
        else http::async_read(*conn_->plain, buffer_, *parser_, std::move(on_read));
    }

    void HttpClient::do_tls_shutdown_() {
        // strand-only
        if (!in_flight_) return;
        if (shutting_down_) return;
        shutting_down_ = true;

        arm_shutdown_deadline_();

        auto self = shared_from_this();
        const auto id = req_id_;

        conn_->tls->async_shutdown(
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec) {
                                           if (id != self->req_id_ || !self->in_flight_) return;
                                           self->cancel_shutdown_deadline_();

                                           // Many servers do not follow TLS close_notify rules; treat EOF/truncated as non-fatal after read.
                                           if (ec &&
                                               ec != boost::asio::error::eof &&
                                               ec != ssl::error::stream_truncated) {
                                               self->emit_log_(LogLevel::DEBUG,
                                                               "[HTTPCLIENT] TLS shutdown error: " + ec.message());
                                           }

                                           // The response is complete; only an explicit cancel overrides it.
                                           if (self->cancelled_) self->final_ec_ = boost::asio::error::operation_aborted;

                                           self->finish_();
                                       }
            )
        );
    }

    void HttpClient::arm_deadline_() {
        deadline_.expires_after(opts_.request_timeout);
        auto self = shared_from_this();
        const auto id = req_id_;

        deadline_.async_wait(
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec) {
                                           if (ec) return; // canceled
                                           if (id != self->req_id_ || !self->in_flight_) return;

                                           // Abort the pending op; its handler reports timed_out via proceed_().
                                           self->deadline_hit_ = true;
                                           self->resolver_.cancel();
                                           if (self->conn_) close_socket_hard_(*self->conn_);
                                       }
            )
        );
    }

    void HttpClient::disarm_deadline_() {
        deadline_.cancel();
    }

    void HttpClient::arm_shutdown_deadline_() {
        shutdown_deadline_.expires_after(opts_.shutdown_timeout);
        auto self = shared_from_this();
        const auto id = req_id_;

        shutdown_deadline_.async_wait(
            boost::asio::bind_executor(strand_,
                                       [self, id](const boost::system::error_code &ec) {
                                           if (ec) return; // canceled
                                           if (id != self->req_id_ || !self->in_flight_) return;

                                           // Shutdown hangs: drop the socket so the pending shutdown completes.
                                           if (self->conn_) close_socket_hard_(*self->conn_);
                                       }
            )
        );
    }

    void HttpClient::cancel_shutdown_deadline_() {
        shutdown_deadline_.cancel();
    }
} // namespace jpoll
