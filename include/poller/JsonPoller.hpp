#pragma once

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include "abstract/HttpClient.hpp"
#include "abstract/Poller.hpp"
#include "poller/FetchError.hpp"
#include "poller/PollerConfig.hpp"
#include "poller/TickSchedule.hpp"
#include "utils/LogUtils.hpp"

namespace jpoll {
    template<class T>
    class JsonPollerBuilder;

    /**
     * @class JsonPoller
     *
     * @brief Fetches a JSON endpoint on a fixed cadence and decodes every body into T.
     *
     * T must be decodable by nlohmann::json::get<T>() (from_json / NLOHMANN_DEFINE_TYPE_*),
     * or be nlohmann::json itself.
     *
     * Loop (one strand, never more than one cycle in flight):
     *   await tick → GET → decode → handler(value, elapsed) → wait for handler → await next tick
     *   A failed fetch is logged and the loop goes straight back to awaiting the next tick.
     *   Ticks that pass while a cycle is still running are skipped, never replayed (see TickSchedule).
     *
     * Threading:
     *  - All callbacks run on the poller's strand over the caller's io_context.
     *  - start()/stop() may be called from any thread.
     */
    template<class T>
    class JsonPoller final : public IPoller, public std::enable_shared_from_this<JsonPoller<T> > {
    public:
        using clock = std::chrono::steady_clock;
        using FetchHandler = std::function<void(FetchResult<T>)>;
        using DataHandler = std::function<void(T, clock::duration)>;
        using DoneFn = std::function<void()>;
        /// Handler that finishes asynchronously: the loop resumes once `done` has been called.
        using AsyncDataHandler = std::function<void(T, clock::duration, DoneFn)>;

        /// Fluent builder with documented defaults; see JsonPollerBuilder.hpp.
        static JsonPollerBuilder<T> builder(std::string url);

        /// Direct construction over any IHttpClient (the builder uses HttpClient).
        static std::shared_ptr<JsonPoller> create(boost::asio::io_context &ioc,
                                                  std::shared_ptr<IHttpClient> client,
                                                  PollerConfig cfg) {
            return std::shared_ptr<JsonPoller>(new JsonPoller(ioc, std::move(client), std::move(cfg)));
        }

        JsonPoller(const JsonPoller &) = delete;

        JsonPoller &operator=(const JsonPoller &) = delete;

        [[nodiscard]] const std::string &url() const noexcept { return cfg_.url; }
        [[nodiscard]] std::chrono::milliseconds poll_interval() const noexcept { return cfg_.poll_interval; }
        [[nodiscard]] const PollerConfig &config() const noexcept { return cfg_; }

        void set_logger(LogFn fn) { logger_ = std::move(fn); }

        /**
         * @brief One GET + decode, independent of the loop. No retries.
         *
         * @param cb receives the decoded value or a FetchError (transport / http_status / decode);
         *           runs on the poller's strand.
         */
        void async_fetch_once(FetchHandler cb) {
            fetch_(std::move(cb));
        }

        /// Start the loop with a handler that completes synchronously. ERROR if already running.
        Status start(DataHandler on_data) {
            if (!on_data) return Status::ERROR;
            return start_async([on_data = std::move(on_data)](T value, clock::duration elapsed, DoneFn done) {
                on_data(std::move(value), elapsed);
                done();
            });
        }

        /// Start the loop with an asynchronous handler. ERROR if already running.
        Status start_async(AsyncDataHandler on_data) {
            if (!on_data) return Status::ERROR;
            if (running_.exchange(true)) return Status::ERROR;

            auto handler = std::make_shared<const AsyncDataHandler>(std::move(on_data));
            auto self = this->shared_from_this();
            boost::asio::dispatch(strand_, [self, handler = std::move(handler)]() mutable {
                if (!self->running_.load()) return;

                self->on_data_ = std::move(handler);
                const auto gen = ++self->gen_;
                self->schedule_.start(clock::now());
                self->wait_tick_(gen);
            });
            return Status::OK;
        }

        /**
         * @brief Stop the loop: cancel the tick timer and any in-flight request.
         *
         * No handler invocation happens for completions that arrive after stop().
         * Once stopped, the poller leaves no work on the io_context. May be restarted.
         */
        Status stop() override {
            if (!running_.exchange(false)) return Status::ERROR;

            auto self = this->shared_from_this();
            boost::asio::dispatch(strand_, [self] {
                ++self->gen_;
                self->timer_.cancel();
                self->client_->cancel();
            });
            return Status::OK;
        }

        [[nodiscard]] bool is_running() const override { return running_.load(); }

        [[nodiscard]] PollStats stats() const override {
            PollStats s;
            s.ticks = ticks_.load(std::memory_order_relaxed);
            s.fetch_ok = fetch_ok_.load(std::memory_order_relaxed);
            s.fetch_failed = fetch_failed_.load(std::memory_order_relaxed);
            s.ticks_skipped = ticks_skipped_.load(std::memory_order_relaxed);
            s.handler_exceptions = handler_exceptions_.load(std::memory_order_relaxed);
            return s;
        }

    private:
        JsonPoller(boost::asio::io_context &ioc, std::shared_ptr<IHttpClient> client, PollerConfig cfg)
            : client_(std::move(client)),
              cfg_(std::move(cfg)),
              strand_(ioc.get_executor()),
              timer_(ioc),
              schedule_(cfg_.poll_interval) {
        }

        /// Loop callbacks carry the generation they were armed under; stop()/restart bumps it.
        bool current_(std::uint64_t gen) const {
            return gen == gen_ && running_.load();
        }

        void wait_tick_(std::uint64_t gen) {
            auto self = this->shared_from_this();
            timer_.expires_at(schedule_.deadline());
            timer_.async_wait(boost::asio::bind_executor(strand_, [self, gen](const boost::system::error_code &ec) {
                if (ec || !self->current_(gen)) return;
                self->run_cycle_(gen);
            }));
        }

        void run_cycle_(std::uint64_t gen) {
            ticks_.fetch_add(1, std::memory_order_relaxed);

            auto self = this->shared_from_this();
            const auto started = clock::now();
            fetch_([self, gen, started](FetchResult<T> result) {
                if (!self->current_(gen)) return;

                if (auto *err = std::get_if<FetchError>(&result)) {
                    self->fetch_failed_.fetch_add(1, std::memory_order_relaxed);
                    self->emit_log_(LogLevel::ERROR, "[POLLER] Failed to fetch data: " + err->message());
                    self->next_tick_(gen);
                    return;
                }

                self->fetch_ok_.fetch_add(1, std::memory_order_relaxed);
                const auto elapsed = clock::now() - started;
                self->dispatch_data_(gen, std::get<0>(std::move(result)), elapsed);
            });
        }

        void dispatch_data_(std::uint64_t gen, T value, clock::duration elapsed) {
            auto self = this->shared_from_this();
            auto finished = std::make_shared<bool>(false); // strand-only

            DoneFn done = [self, gen, finished] {
                boost::asio::dispatch(self->strand_, [self, gen, finished] {
                    if (*finished) return;
                    *finished = true;
                    if (!self->current_(gen)) return;
                    self->next_tick_(gen);
                });
            };

            // Local copy: the handler may stop() or restart the poller from inside.
            const auto handler = on_data_;
            try {
                (*handler)(std::move(value), elapsed, done);
            } catch (const std::exception &e) {
                handler_exceptions_.fetch_add(1, std::memory_order_relaxed);
                emit_log_(LogLevel::ERROR, std::string("[POLLER] handler threw: ") + e.what());
                done();
            }
        }

        void next_tick_(std::uint64_t gen) {
            const auto before = schedule_.skipped();
            schedule_.next(clock::now());
            ticks_skipped_.fetch_add(schedule_.skipped() - before, std::memory_order_relaxed);
            wait_tick_(gen);
        }

        void fetch_(FetchHandler cb) {
            auto self = this->shared_from_this();
            client_->async_get(cfg_.url, [self, cb = std::move(cb)](boost::system::error_code ec,
                                                                     HttpResponse res) mutable {
                boost::asio::dispatch(self->strand_, [self, cb = std::move(cb), ec, res = std::move(res)]() mutable {
                    auto result = self->decode_(ec, std::move(res));
                    if (cb) cb(std::move(result));
                });
            });
        }

        FetchResult<T> decode_(boost::system::error_code ec, HttpResponse res) const {
            if (ec) {
                emit_log_(LogLevel::ERROR, "[POLLER] Request failed: " + ec.message());
                return FetchResult<T>{std::in_place_index<1>, FetchError::transport(ec)};
            }

            if (auto err = classify_status(res.status)) {
                emit_log_(LogLevel::ERROR, "[POLLER] HTTP error: " + err->detail);
                return FetchResult<T>{std::in_place_index<1>, std::move(*err)};
            }

            try {
                return FetchResult<T>{std::in_place_index<0>, nlohmann::json::parse(res.body).template get<T>()};
            } catch (const std::exception &e) {
                emit_log_(LogLevel::ERROR, std::string("[POLLER] JSON parse failed: ") + e.what());
                return FetchResult<T>{std::in_place_index<1>, FetchError::decode(e.what())};
            }
        }

        void emit_log_(LogLevel level, std::string_view msg) const {
            if (logger_) logger_(level, msg);
        }

    private:
        std::shared_ptr<IHttpClient> client_;
        const PollerConfig cfg_;

        boost::asio::strand<boost::asio::io_context::executor_type> strand_;
        boost::asio::steady_timer timer_;
        TickSchedule schedule_;

        std::shared_ptr<const AsyncDataHandler> on_data_;

        std::atomic<bool> running_{false};
        std::uint64_t gen_{0}; // strand-only

        std::atomic<std::uint64_t> ticks_{0};
        std::atomic<std::uint64_t> fetch_ok_{0};
        std::atomic<std::uint64_t> fetch_failed_{0};
        std::atomic<std::uint64_t> ticks_skipped_{0};
        std::atomic<std::uint64_t> handler_exceptions_{0};

        LogFn logger_{&log::stderr_sink};
    };
} // namespace jpoll
