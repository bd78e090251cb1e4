#pragma once

#include "poller/PollerConfig.hpp"

#include <boost/program_options.hpp>
#include <cstdint>
#include <iostream>
#include <string>

struct CmdOptions {
    std::string url; // required
    std::uint64_t interval_ms{jpoll::kPollIntervalMs};
    std::uint64_t timeout_ms{jpoll::kRequestTimeoutMs};
    std::size_t pool_max_idle{jpoll::kPoolMaxIdlePerHost};
    std::uint64_t pool_idle_secs{jpoll::kPoolIdleTimeoutSecs};
    std::uint64_t keepalive_secs{jpoll::kTcpKeepaliveSecs};
    std::uint64_t count{0}; // stop after N payloads, 0 = forever
    bool once{false};
    bool verbose{false};

    bool show_help{false};
};

inline bool parse_cmdline(int argc, char **argv, CmdOptions &out) {
    namespace po = boost::program_options;

    po::options_description desc("Options");
    desc.add_options()
            ("help,h", "Show this help message")
            ("url,u", po::value<std::string>()->required(),
             "Endpoint to poll, e.g. https://httpbin.org/json")
            ("interval-ms,i", po::value<std::uint64_t>()->default_value(jpoll::kPollIntervalMs),
             "Time between fetch attempts")
            ("timeout-ms,t", po::value<std::uint64_t>()->default_value(jpoll::kRequestTimeoutMs),
             "Per-request deadline")
            ("pool-max-idle", po::value<std::size_t>()->default_value(jpoll::kPoolMaxIdlePerHost),
             "Idle connections kept per host (0 disables reuse)")
            ("pool-idle-secs", po::value<std::uint64_t>()->default_value(jpoll::kPoolIdleTimeoutSecs),
             "How long an idle pooled connection is kept")
            ("keepalive-secs", po::value<std::uint64_t>()->default_value(jpoll::kTcpKeepaliveSecs),
             "TCP keepalive idle time (0 disables)")
            ("count,n", po::value<std::uint64_t>()->default_value(0),
             "Stop after N payloads (0 = poll forever)")
            ("once", po::bool_switch(), "Single fetch, exit status reflects the outcome")
            ("verbose,v", po::bool_switch(), "Debug logging");

    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, desc), vm);

        if (vm.count("help")) {
            std::cout << "Usage: " << argv[0]
                    << " --url URL [--interval-ms N] [--timeout-ms N] [--count N] [--once]\n\n";
            std::cout << desc << "\n";
            out.show_help = true;
            return true;
        }

        // Enforce required options
        po::notify(vm);
    } catch (const po::error &e) {
        std::cerr << "Error parsing command line: " << e.what() << "\n\n";
        std::cerr << desc << "\n";
        return false;
    }

    out.url = vm["url"].as<std::string>();
    out.interval_ms = vm["interval-ms"].as<std::uint64_t>();
    out.timeout_ms = vm["timeout-ms"].as<std::uint64_t>();
    out.pool_max_idle = vm["pool-max-idle"].as<std::size_t>();
    out.pool_idle_secs = vm["pool-idle-secs"].as<std::uint64_t>();
    out.keepalive_secs = vm["keepalive-secs"].as<std::uint64_t>();
    out.count = vm["count"].as<std::uint64_t>();
    out.once = vm["once"].as<bool>();
    out.verbose = vm["verbose"].as<bool>();

    return true;
}
