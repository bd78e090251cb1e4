#include "poller/JsonPoller.hpp"
#include "mocks/mock_http_client.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <optional>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using ::testing::_;
using ::testing::AtLeast;
using ::testing::NiceMock;

namespace {
    struct Ping {
        int n{0};
    };

    void from_json(const nlohmann::json &j, Ping &p) {
        j.at("n").get_to(p.n);
    }

    using Poller = jpoll::JsonPoller<Ping>;
    using Clock = std::chrono::steady_clock;

    /// Completes a mocked request from the io_context, like the real client does.
    void reply_later(boost::asio::io_context &ioc, jpoll::IHttpClient::ResponseHandler cb,
                     boost::system::error_code ec, jpoll::HttpResponse res,
                     std::chrono::milliseconds delay = 0ms) {
        if (delay.count() == 0) {
            boost::asio::post(ioc, [cb = std::move(cb), ec, res = std::move(res)]() mutable {
                cb(ec, std::move(res));
            });
            return;
        }
        auto t = std::make_shared<boost::asio::steady_timer>(ioc, delay);
        t->async_wait([t, cb = std::move(cb), ec, res = std::move(res)](const boost::system::error_code &) mutable {
            cb(ec, std::move(res));
        });
    }

    jpoll::HttpResponse ok_body(int n) {
        jpoll::HttpResponse res;
        res.status = 200;
        res.body = R"({"n":)" + std::to_string(n) + "}";
        return res;
    }

    class PollLoopTest : public ::testing::Test {
    protected:
        boost::asio::io_context ioc;
        std::shared_ptr<NiceMock<jpoll::MockHttpClient> > client = std::make_shared<NiceMock<jpoll::MockHttpClient> >();

        std::shared_ptr<Poller> make_poller(std::chrono::milliseconds interval) {
            jpoll::PollerConfig cfg;
            cfg.url = "http://mock.local/ping";
            cfg.poll_interval = interval;
            auto p = Poller::create(ioc, client, cfg);
            p->set_logger(jpoll::log::null_sink());
            return p;
        }

        /// Every request succeeds with an increasing counter.
        void serve_counter(std::chrono::milliseconds delay = 0ms) {
            ON_CALL(*client, async_get(_, _))
                    .WillByDefault([this, delay, n = std::make_shared<int>(0)](const std::string &,
                                                                            jpoll::IHttpClient::ResponseHandler cb) {
                        reply_later(ioc, std::move(cb), {}, ok_body(++*n), delay);
                    });
        }
    };
}

TEST_F(PollLoopTest, FailedFetchesAreSkippedAndTheLoopContinues) {
    int calls = 0;
    ON_CALL(*client, async_get(_, _))
            .WillByDefault([this, &calls](const std::string &, jpoll::IHttpClient::ResponseHandler cb) {
                ++calls;
                if (calls % 2 == 0) {
                    reply_later(ioc, std::move(cb), boost::asio::error::connection_refused, {});
                } else {
                    reply_later(ioc, std::move(cb), {}, ok_body(calls));
                }
            });
    EXPECT_CALL(*client, cancel()).Times(AtLeast(1));

    auto poller = make_poller(10ms);
    std::vector<int> seen;
    ASSERT_EQ(poller->start([&](Ping p, Clock::duration elapsed) {
        EXPECT_GE(elapsed.count(), 0);
        seen.push_back(p.n);
        if (seen.size() == 3) poller->stop();
    }), jpoll::Status::OK);

    ioc.run_for(5s);

    EXPECT_EQ(seen, (std::vector<int>{1, 3, 5}));
    const auto s = poller->stats();
    EXPECT_EQ(s.fetch_ok, 3u);
    EXPECT_EQ(s.fetch_failed, 2u);
    EXPECT_EQ(s.ticks, 5u);
}

TEST_F(PollLoopTest, HttpErrorsAndBadPayloadsNeverReachTheHandler) {
    int calls = 0;
    ON_CALL(*client, async_get(_, _))
            .WillByDefault([this, &calls](const std::string &, jpoll::IHttpClient::ResponseHandler cb) {
                jpoll::HttpResponse res;
                switch (++calls) {
                    case 1: res.status = 503; res.body = R"({"n":1})"; break;
                    case 2: res.status = 200; res.body = "<html></html>"; break;
                    case 3: res.status = 200; res.body = R"({"n":"three"})"; break;
                    default: res = ok_body(calls); break;
                }
                reply_later(ioc, std::move(cb), {}, std::move(res));
            });

    auto poller = make_poller(5ms);
    std::vector<int> seen;
    poller->start([&](Ping p, Clock::duration) {
        seen.push_back(p.n);
        poller->stop();
    });
    ioc.run_for(5s);

    EXPECT_EQ(seen, (std::vector<int>{4}));
    EXPECT_EQ(poller->stats().fetch_failed, 3u);
}

TEST_F(PollLoopTest, SlowHandlerSkipsMissedTicks) {
    std::vector<Clock::time_point> fetch_starts;
    ON_CALL(*client, async_get(_, _))
            .WillByDefault([this, &fetch_starts](const std::string &, jpoll::IHttpClient::ResponseHandler cb) {
                fetch_starts.push_back(Clock::now());
                reply_later(ioc, std::move(cb), {}, ok_body(static_cast<int>(fetch_starts.size())));
            });

    auto poller = make_poller(50ms);
    std::atomic<int> in_handler{0};
    int calls = 0;
    poller->start([&](Ping, Clock::duration) {
        EXPECT_EQ(in_handler.fetch_add(1), 0);
        if (++calls == 1) std::this_thread::sleep_for(200ms);
        if (calls == 3) poller->stop();
        in_handler.fetch_sub(1);
    });
    ioc.run_for(5s);

    ASSERT_EQ(calls, 3);
    ASSERT_EQ(fetch_starts.size(), 3u);
    for (std::size_t i = 1; i < fetch_starts.size(); ++i) {
        EXPECT_GE(fetch_starts[i] - fetch_starts[i - 1], 25ms) << "burst between fetch " << i - 1 << " and " << i;
    }
    // The overrun spans several periods; they are dropped, not replayed.
    EXPECT_GE(fetch_starts[1] - fetch_starts[0], 200ms);
    EXPECT_GE(poller->stats().ticks_skipped, 3u);
}

TEST_F(PollLoopTest, AsyncHandlerHoldsTheLoopUntilDone) {
    bool pending = false;
    int fetches = 0;
    ON_CALL(*client, async_get(_, _))
            .WillByDefault([this, &pending, &fetches](const std::string &, jpoll::IHttpClient::ResponseHandler cb) {
                EXPECT_FALSE(pending) << "fetch issued while the handler was still running";
                reply_later(ioc, std::move(cb), {}, ok_body(++fetches));
            });

    auto poller = make_poller(5ms);
    int calls = 0;
    poller->start_async([&](Ping, Clock::duration, Poller::DoneFn done) {
        pending = true;
        if (++calls == 2) {
            poller->stop();
            pending = false;
            done();
            return;
        }
        auto t = std::make_shared<boost::asio::steady_timer>(ioc, 60ms);
        t->async_wait([t, &pending, done](const boost::system::error_code &) {
            pending = false;
            done();
            done(); // second call is ignored
        });
    });
    ioc.run_for(5s);

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(fetches, 2);
}

TEST_F(PollLoopTest, StopFromInsideTheHandler) {
    serve_counter();
    EXPECT_CALL(*client, cancel()).Times(AtLeast(1));

    auto poller = make_poller(10ms);
    int calls = 0;
    jpoll::Status stop_status = jpoll::Status::ERROR;
    poller->start([&](Ping, Clock::duration) {
        ++calls;
        stop_status = poller->stop();
    });
    ASSERT_TRUE(poller->is_running());

    ioc.run_for(5s);

    EXPECT_EQ(calls, 1);
    EXPECT_EQ(stop_status, jpoll::Status::OK);
    EXPECT_FALSE(poller->is_running());
    EXPECT_EQ(poller->stop(), jpoll::Status::ERROR);
    // run_for returned early: nothing of the poller is left on the io_context.
    EXPECT_TRUE(ioc.stopped());
}

TEST_F(PollLoopTest, HandlerExceptionIsCountedAndTheLoopContinues) {
    serve_counter();

    auto poller = make_poller(5ms);
    std::vector<int> seen;
    poller->start([&](Ping p, Clock::duration) {
        seen.push_back(p.n);
        if (p.n == 1) throw std::runtime_error("handler failure");
        poller->stop();
    });
    ioc.run_for(5s);

    EXPECT_EQ(seen, (std::vector<int>{1, 2}));
    EXPECT_EQ(poller->stats().handler_exceptions, 1u);
}

TEST_F(PollLoopTest, SecondStartIsRejected) {
    serve_counter();

    auto poller = make_poller(5ms);
    int calls = 0;
    EXPECT_EQ(poller->start([&](Ping, Clock::duration) {
        ++calls;
        poller->stop();
    }), jpoll::Status::OK);
    EXPECT_EQ(poller->start([](Ping, Clock::duration) {}), jpoll::Status::ERROR);
    EXPECT_EQ(poller->start(Poller::DataHandler{}), jpoll::Status::ERROR);

    ioc.run_for(5s);
    EXPECT_EQ(calls, 1);
}

TEST_F(PollLoopTest, CanRestartAfterStop) {
    serve_counter();

    auto poller = make_poller(5ms);
    int calls = 0;
    auto handler = [&](Ping, Clock::duration) {
        ++calls;
        poller->stop();
    };

    ASSERT_EQ(poller->start(handler), jpoll::Status::OK);
    ioc.run_for(5s);
    ASSERT_EQ(calls, 1);

    ioc.restart();
    ASSERT_EQ(poller->start(handler), jpoll::Status::OK);
    ioc.run_for(5s);
    EXPECT_EQ(calls, 2);
}

TEST_F(PollLoopTest, ElapsedCoversTheWholeFetch) {
    serve_counter(20ms);

    auto poller = make_poller(5ms);
    Clock::duration measured{};
    poller->start([&](Ping, Clock::duration elapsed) {
        measured = elapsed;
        poller->stop();
    });
    ioc.run_for(5s);

    EXPECT_GE(measured, 20ms);
}

TEST_F(PollLoopTest, FetchOnceRunsWithoutStartingTheLoop) {
    serve_counter();

    auto poller = make_poller(5ms);
    std::optional<jpoll::FetchResult<Ping> > out;
    poller->async_fetch_once([&](jpoll::FetchResult<Ping> r) { out = std::move(r); });
    ioc.run_for(5s);

    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(std::holds_alternative<Ping>(*out));
    EXPECT_EQ(std::get<Ping>(*out).n, 1);
    EXPECT_FALSE(poller->is_running());
    EXPECT_EQ(poller->stats().ticks, 0u);
}
