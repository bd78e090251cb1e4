#include "CmdLine.hpp"             // CmdOptions, parse_cmdline
#include "json_poller.hpp"         // JsonPoller, JsonPollerBuilder, FetchResult

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <variant>

using json = nlohmann::json;

int main(int argc, char **argv) {
    CmdOptions options;
    if (!parse_cmdline(argc, argv, options)) {
        // parse_cmdline already printed error/help on failure
        return 1;
    }

    if (options.show_help) {
        return 0;
    }

    if (options.verbose) jpoll::log::set_min_level(jpoll::LogLevel::DEBUG);

    // ---------------------------------------------------------------------
    // 1) Build the poller from CLI options
    // ---------------------------------------------------------------------
    boost::asio::io_context ioc;

    std::shared_ptr<jpoll::JsonPoller<json> > poller;
    try {
        poller = jpoll::JsonPoller<json>::builder(options.url)
                .poll_interval_ms(options.interval_ms)
                .request_timeout_ms(options.timeout_ms)
                .pool_max_idle_per_host(options.pool_max_idle)
                .pool_idle_timeout_secs(options.pool_idle_secs)
                .tcp_keepalive_secs(options.keepalive_secs)
                .build(ioc);
    } catch (const jpoll::ConstructionError &e) {
        std::cerr << "Failed to build poller: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "[POLL_JSON] Starting\n"
              << "  url         = " << poller->url() << "\n"
              << "  interval_ms = " << poller->poll_interval().count() << "\n"
              << "  timeout_ms  = " << poller->config().request_timeout.count() << "\n"
              << "  count       = " << (options.count == 0 ? std::string("<forever>") : std::to_string(options.count))
              << "\n";

    // ---------------------------------------------------------------------
    // 2) Single fetch
    // ---------------------------------------------------------------------
    if (options.once) {
        int rc = 1;
        poller->async_fetch_once([&rc](jpoll::FetchResult<json> result) {
            if (const auto *err = std::get_if<jpoll::FetchError>(&result)) {
                std::cerr << "fetch failed: " << err->message() << "\n";
                return;
            }
            std::cout << std::get<json>(result).dump() << "\n";
            rc = 0;
        });
        ioc.run();
        return rc;
    }

    // ---------------------------------------------------------------------
    // 3) Perpetual loop until signal or --count payloads
    // ---------------------------------------------------------------------
    boost::asio::signal_set signals(ioc, SIGINT, SIGTERM);
    signals.async_wait([&](const boost::system::error_code &ec, int) {
        if (ec) return;
        std::cerr << "[POLL_JSON] signal received, stopping\n";
        poller->stop();
    });

    std::uint64_t received = 0;
    const auto status = poller->start([&](json data, std::chrono::steady_clock::duration elapsed) {
        const auto ms = std::chrono::duration<double, std::milli>(elapsed).count();
        std::cout << data.dump() << "\t" << ms << "ms\n";

        if (options.count != 0 && ++received >= options.count) {
            poller->stop();
            signals.cancel();
        }
    });

    if (status != jpoll::Status::OK) {
        std::cerr << "start() failed\n";
        return 1;
    }

    ioc.run();

    const auto stats = poller->stats();
    std::cerr << "[POLL_JSON] ticks=" << stats.ticks
              << " ok=" << stats.fetch_ok
              << " failed=" << stats.fetch_failed
              << " skipped=" << stats.ticks_skipped
              << " handler_errors=" << stats.handler_exceptions << "\n";
    return 0;
}
