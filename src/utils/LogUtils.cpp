#include "utils/LogUtils.hpp"

#include <iostream>
#include <mutex>

namespace jpoll::log {
    namespace {
        std::mutex &sink_mutex() {
            static std::mutex m;
            return m;
        }
    }

    void stderr_sink(LogLevel level, std::string_view msg) {
        if (!enabled(level)) return;
        std::lock_guard<std::mutex> lock(sink_mutex());
        std::cerr << "[" << to_string(level) << "]" << msg << "\n";
    }
}
