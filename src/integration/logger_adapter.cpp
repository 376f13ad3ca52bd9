/**
 * @file logger_adapter.cpp
 * @brief logger_system backed implementation of logger_adapter
 */

#include <dcmwire/integration/logger_adapter.hpp>

#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/interfaces/logger_types.h>
#include <kcenon/logger/writers/console_writer.h>
#include <kcenon/logger/writers/rotating_file_writer.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <vector>

namespace dcmwire::integration {

namespace {

constexpr std::size_t level_count = static_cast<std::size_t>(log_level::off) + 1;

auto to_backend(log_level level) -> kcenon::logger::log_level {
    using backend = kcenon::logger::log_level;
    switch (level) {
        case log_level::trace: return backend::trace;
        case log_level::debug: return backend::debug;
        case log_level::info:  return backend::info;
        case log_level::warn:  return backend::warn;
        case log_level::error: return backend::error;
        case log_level::fatal: return backend::fatal;
        case log_level::off:   break;
    }
    return backend::off;
}

/// Process-wide logging state, built on first use
struct logging_state {
    std::mutex lifecycle;
    std::atomic<bool> running{false};
    std::atomic<log_level> threshold{log_level::warn};
    logger_config config;
    std::unique_ptr<kcenon::logger::logger> backend;
    std::array<std::atomic<std::size_t>, level_count> counts{};

    ~logging_state() { stop(); }

    void stop() {
        std::lock_guard lock(lifecycle);
        if (!running.exchange(false)) {
            return;
        }
        if (backend) {
            backend->flush();
            backend->stop();
            backend.reset();
        }
    }
};

auto state() -> logging_state& {
    static logging_state instance;
    return instance;
}

thread_local std::vector<std::string> source_labels;

}  // namespace

// ============================================================================
// source_scope
// ============================================================================

logger_adapter::source_scope::source_scope(std::string label) {
    source_labels.push_back(std::move(label));
}

logger_adapter::source_scope::~source_scope() {
    if (!source_labels.empty()) {
        source_labels.pop_back();
    }
}

auto logger_adapter::current_source() -> std::string {
    return source_labels.empty() ? std::string{} : source_labels.back();
}

// ============================================================================
// Lifecycle
// ============================================================================

void logger_adapter::initialize(const logger_config& config) {
    auto& s = state();
    std::lock_guard lock(s.lifecycle);
    if (s.running.load()) {
        return;
    }

    if (config.enable_file) {
        std::filesystem::create_directories(config.log_directory);
    }

    auto backend = std::make_unique<kcenon::logger::logger>(config.async_mode,
                                                            config.buffer_size);
    backend->set_min_level(to_backend(config.min_level));
    if (config.enable_console) {
        backend->add_writer(std::make_unique<kcenon::logger::console_writer>());
    }
    if (config.enable_file) {
        backend->add_writer(std::make_unique<kcenon::logger::rotating_file_writer>(
            (config.log_directory / config.file_name).string(),
            config.max_file_size_mb * 1024 * 1024, config.max_files));
    }
    backend->start();

    s.config = config;
    s.threshold.store(config.min_level);
    s.backend = std::move(backend);
    for (auto& count : s.counts) {
        count.store(0);
    }
    s.running.store(true);
}

void logger_adapter::shutdown() { state().stop(); }

auto logger_adapter::is_initialized() noexcept -> bool { return state().running.load(); }

// ============================================================================
// Logging
// ============================================================================

void logger_adapter::log(log_level level, const std::string& message) {
    if (!is_level_enabled(level)) {
        return;
    }

    auto& s = state();
    std::lock_guard lock(s.lifecycle);
    if (!s.backend) {
        return;
    }
    s.counts[static_cast<std::size_t>(level)].fetch_add(1);

    if (s.config.tag_source && !source_labels.empty()) {
        s.backend->log(to_backend(level), "[" + source_labels.back() + "] " + message);
    } else {
        s.backend->log(to_backend(level), message);
    }
}

auto logger_adapter::is_level_enabled(log_level level) noexcept -> bool {
    const auto& s = state();
    return level != log_level::off && s.running.load() && level >= s.threshold.load();
}

void logger_adapter::flush() {
    auto& s = state();
    std::lock_guard lock(s.lifecycle);
    if (s.backend) {
        s.backend->flush();
    }
}

// ============================================================================
// Configuration
// ============================================================================

void logger_adapter::set_min_level(log_level level) {
    auto& s = state();
    std::lock_guard lock(s.lifecycle);
    s.threshold.store(level);
    s.config.min_level = level;
    if (s.backend) {
        s.backend->set_min_level(to_backend(level));
    }
}

auto logger_adapter::get_min_level() noexcept -> log_level { return state().threshold.load(); }

auto logger_adapter::get_config() -> logger_config {
    auto& s = state();
    std::lock_guard lock(s.lifecycle);
    return s.config;
}

auto logger_adapter::message_count(log_level level) noexcept -> std::size_t {
    if (level == log_level::off) {
        return 0;
    }
    return state().counts[static_cast<std::size_t>(level)].load();
}

void logger_adapter::reset_counts() noexcept {
    for (auto& count : state().counts) {
        count.store(0);
    }
}

auto logger_adapter::log_level_to_string(log_level level) -> std::string {
    static constexpr std::array<const char*, level_count> names{
        "TRACE", "DEBUG", "INFO", "WARN", "ERROR", "FATAL", "OFF"};
    return names[static_cast<std::size_t>(level)];
}

}  // namespace dcmwire::integration
