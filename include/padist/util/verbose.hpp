// include/padist/util/verbose.hpp — Leveled trace output on std::clog.

#pragma once

#include <format>
#include <string_view>
#include <utility>

namespace padist::util {

    // Process-wide; 0 silences every trace line.
    void set_verbosity(int level) noexcept;
    int verbosity() noexcept;

    void verbose(int level, std::string_view message);

    template <typename... Args>
    void verbose(int level, std::format_string<Args...> fmt, Args &&...args) {
        if (level > verbosity()) {
            return;
        }
        verbose(level, std::string_view(std::format(fmt, std::forward<Args>(args)...)));
    }

} // namespace padist::util
