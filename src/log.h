// Thread-safe stderr logging for skytest.
#pragma once

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <iterator>
#include <mutex>
#include <string_view>
#include <utility>

namespace skytest {

inline std::mutex &errs_mutex() {
    static std::mutex mu;
    return mu;
}

inline std::atomic<bool> &verbose_logging() {
    static std::atomic<bool> enabled{false};
    return enabled;
}

inline void set_verbose_logging(bool enabled) { verbose_logging().store(enabled, std::memory_order_relaxed); }

inline void log_err_raw(std::string_view message) {
    std::lock_guard<std::mutex> lock(errs_mutex());
    std::fwrite(message.data(), 1, message.size(), stderr);
    std::fflush(stderr);
}

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), "skytest: ");
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    buffer.push_back('\n');
    log_err_raw(std::string_view(buffer.data(), buffer.size()));
}

// Only emitted with -v.
template <typename... Args>
void log_info(fmt::format_string<Args...> format_string, Args &&...args) {
    if (!verbose_logging().load(std::memory_order_relaxed))
        return;
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    buffer.push_back('\n');
    log_err_raw(std::string_view(buffer.data(), buffer.size()));
}

} // namespace skytest
