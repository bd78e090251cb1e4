#include "utils/UrlUtils.hpp"

#include <boost/algorithm/string.hpp>

#include <algorithm>
#include <cctype>

namespace jpoll {
    std::string EndPoint::host_header() const {
        std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
        if (port != url::default_port(scheme)) h += ":" + port;
        return h;
    }

    std::string EndPoint::pool_key() const {
        return scheme + "://" + host + ":" + port;
    }

    namespace url {
        std::optional<EndPoint> parse(std::string_view raw) {
            const auto trimmed = boost::algorithm::trim_copy(std::string(raw));
            std::string_view s{trimmed};

            const auto sep = s.find("://");
            if (sep == std::string_view::npos || sep == 0) return std::nullopt;

            EndPoint ep;
            ep.scheme = boost::algorithm::to_lower_copy(std::string(s.substr(0, sep)));
            if (ep.scheme != "http" && ep.scheme != "https") return std::nullopt;
            s.remove_prefix(sep + 3);

            // Fragment never goes on the wire.
            if (const auto hash = s.find('#'); hash != std::string_view::npos) s = s.substr(0, hash);

            const auto path_start = s.find_first_of("/?");
            std::string_view authority = s.substr(0, path_start);
            std::string_view rest = path_start == std::string_view::npos ? std::string_view{} : s.substr(path_start);

            if (authority.find('@') != std::string_view::npos) return std::nullopt;
            if (authority.empty()) return std::nullopt;

            std::string_view port;
            if (authority.front() == '[') {
                const auto close = authority.find(']');
                if (close == std::string_view::npos) return std::nullopt;
                ep.host = std::string(authority.substr(1, close - 1));
                const auto tail = authority.substr(close + 1);
                if (!tail.empty()) {
                    if (tail.front() != ':') return std::nullopt;
                    port = tail.substr(1);
                }
            } else {
                const auto colon = authority.rfind(':');
                if (colon != std::string_view::npos) {
                    ep.host = std::string(authority.substr(0, colon));
                    port = authority.substr(colon + 1);
                } else {
                    ep.host = std::string(authority);
                }
            }

            if (ep.host.empty()) return std::nullopt;

            if (port.empty()) {
                ep.port = default_port(ep.scheme);
            } else {
                if (port.size() > 5) return std::nullopt;
                if (!std::all_of(port.begin(), port.end(), [](unsigned char c) { return std::isdigit(c); })) {
                    return std::nullopt;
                }
                const int value = std::stoi(std::string(port));
                if (value <= 0 || value > 65535) return std::nullopt;
                ep.port = std::to_string(value);
            }

            if (rest.empty()) {
                ep.target = "/";
            } else if (rest.front() == '?') {
                ep.target = "/" + std::string(rest);
            } else {
                ep.target = std::string(rest);
            }

            return ep;
        }
    }
} // namespace jpoll
