#pragma once

#include "config.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <utility>

namespace anvil::log {

    namespace detail {
        inline std::atomic<log_level> current_level{log_level::info};
        inline std::mutex write_mutex{};

        template <typename... Args>
        void write(Args&&... args) {
            std::lock_guard lock{write_mutex};
            std::cerr << "[anvil] ";
            (std::cerr << ... << std::forward<Args>(args)) << '\n';
        }
    }  // namespace detail

    inline void set_level(log_level level) {
        detail::current_level.store(level, std::memory_order_relaxed);
    }

    inline log_level level() {
        return detail::current_level.load(std::memory_order_relaxed);
    }

    // always printed, including at log_level::quiet
    template <typename... Args>
    void error(Args&&... args) {
        detail::write("error: ", std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(Args&&... args) {
        if (level() != log_level::quiet) {
            detail::write("warning: ", std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void info(Args&&... args) {
        if (level() != log_level::quiet) {
            detail::write(std::forward<Args>(args)...);
        }
    }

    template <typename... Args>
    void verbose(Args&&... args) {
        if (level() == log_level::verbose) {
            detail::write(std::forward<Args>(args)...);
        }
    }

}  // namespace anvil::log
