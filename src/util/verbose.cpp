// src/util/verbose.cpp — Verbosity level and the trace sink.

#include <padist/util/verbose.hpp>

#include <atomic>
#include <iostream>
#include <mutex>

namespace padist::util {

    namespace {
        std::atomic<int> verbosity_level{0};
        std::mutex sink_mutex;
    } // namespace

    void set_verbosity(int level) noexcept {
        verbosity_level.store(level, std::memory_order_relaxed);
    }

    int verbosity() noexcept {
        return verbosity_level.load(std::memory_order_relaxed);
    }

    void verbose(int level, std::string_view message) {
        if (level > verbosity()) {
            return;
        }
        std::lock_guard<std::mutex> lock(sink_mutex);
        std::clog << "verbose " << level << ": " << message << '\n';
    }

} // namespace padist::util
