/**
 * @file logger_adapter.hpp
 * @brief Process-wide logging facade over logger_system
 *
 * The decoder reports through logger_adapter::debug() and
 * logger_adapter::warn(). Until initialize() is called those calls only
 * perform a level check, so a host application that never configures
 * logging gets silent decoding.
 *
 * @code
 * logger_adapter::initialize({.min_level = log_level::debug});
 * auto image = imaging::decode_image(dataset);
 * logger_adapter::shutdown();
 * @endcode
 */

#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <viewer/compat/format.hpp>

namespace viewer::integration {

/**
 * @brief Severity threshold for decoder messages
 */
enum class log_level {
    debug = 0,
    info = 1,
    warn = 2,
    error = 3,
    off = 4
};

/**
 * @brief Settings applied by logger_adapter::initialize()
 */
struct logger_config {
    /// Messages below this level are dropped
    log_level min_level{log_level::info};

    /// Hand messages to a background writer thread
    bool async_mode{false};

    /// Queue size for async mode
    std::size_t buffer_size{8192};
};

/**
 * @brief Static logging interface, writing to the console
 *
 * Thread Safety: All methods are thread-safe.
 */
class logger_adapter {
public:
    /**
     * @brief Start console logging; a second call while running is ignored
     */
    static void initialize(const logger_config& config);

    /**
     * @brief Flush pending messages and stop logging
     */
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    /**
     * @return false while not initialized, for log_level::off, and below
     *         the configured minimum level
     */
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    template <typename... Args>
    static void debug(viewer::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::debug)) {
            write(log_level::debug, viewer::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

    template <typename... Args>
    static void warn(viewer::compat::format_string<Args...> fmt, Args&&... args) {
        if (is_level_enabled(log_level::warn)) {
            write(log_level::warn, viewer::compat::format(fmt, std::forward<Args>(args)...));
        }
    }

private:
    static void write(log_level level, const std::string& message);
};

}  // namespace viewer::integration
