/**
 * @file logger_adapter.cpp
 * @brief logger_adapter on top of kcenon::logger::logger
 */

#include <viewer/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>

#include <atomic>
#include <memory>
#include <mutex>

namespace viewer::integration {

namespace {

[[nodiscard]] auto to_logger_level(log_level level) noexcept -> kcenon::logger::log_level {
    switch (level) {
        case log_level::debug: return kcenon::logger::log_level::debug;
        case log_level::info: return kcenon::logger::log_level::info;
        case log_level::warn: return kcenon::logger::log_level::warn;
        case log_level::error: return kcenon::logger::log_level::error;
        case log_level::off: return kcenon::logger::log_level::off;
    }
    return kcenon::logger::log_level::off;
}

/// Logger shared by all decoder calls; null while not initialized
struct logger_state {
    std::mutex mutex;
    std::unique_ptr<kcenon::logger::logger> logger;
    std::atomic<bool> running{false};
    std::atomic<log_level> min_level{log_level::off};
};

auto state() -> logger_state& {
    static logger_state instance;
    return instance;
}

}  // namespace

void logger_adapter::initialize(const logger_config& config) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.running) {
        return;
    }

    s.logger = std::make_unique<kcenon::logger::logger>(config.async_mode, config.buffer_size);
    s.logger->set_min_level(to_logger_level(config.min_level));
    s.logger->add_writer(std::make_unique<kcenon::logger::console_writer>());
    s.logger->start();

    s.min_level = config.min_level;
    s.running = true;
}

void logger_adapter::shutdown() {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (!s.running) {
        return;
    }

    s.running = false;
    s.min_level = log_level::off;
    s.logger->flush();
    s.logger->stop();
    s.logger.reset();
}

auto logger_adapter::is_initialized() noexcept -> bool {
    return state().running.load();
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto& s = state();
    return s.running.load() && level != log_level::off &&
           static_cast<int>(level) >= static_cast<int>(s.min_level.load());
}

void logger_adapter::write(log_level level, const std::string& message) {
    auto& s = state();
    std::lock_guard lock(s.mutex);
    if (s.logger) {
        s.logger->log(to_logger_level(level), message);
    }
}

}  // namespace viewer::integration
