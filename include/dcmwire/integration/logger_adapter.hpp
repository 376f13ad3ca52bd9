/**
 * @file logger_adapter.hpp
 * @brief Routes dcmwire diagnostics into logger_system
 *
 * The stream reader, the frame splitter and the codec registry all report
 * through the static logger_adapter facade. Nothing is written until
 * initialize() runs, so an embedding application that never configures
 * logging gets a silent library.
 *
 * Messages logged while a source_scope is alive carry the label of the
 * stream being read, e.g. "[ct_series/0001.dcm] Unknown VR 'ZZ'".
 */

#pragma once

#include <dcmwire/compat/format.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>

namespace dcmwire::integration {

/// Severity of a diagnostic, in increasing order
enum class log_level { trace, debug, info, warn, error, fatal, off };

/**
 * @struct logger_config
 * @brief Where and how dcmwire diagnostics are written
 */
struct logger_config {
    /// Messages below this level are dropped before formatting
    log_level min_level{log_level::warn};

    bool enable_console{true};

    bool enable_file{false};

    /// Directory of the rotating log file, created on initialize()
    std::filesystem::path log_directory{"logs"};

    std::string file_name{"dcmwire.log"};

    /// Rotation threshold of the log file
    std::size_t max_file_size_mb{16};

    /// Rotated files kept besides the active one
    std::size_t max_files{4};

    /// Hand messages to a background writer thread
    bool async_mode{true};

    std::size_t buffer_size{8192};

    /// Prefix messages with the label of the active source_scope
    bool tag_source{true};
};

/**
 * @class logger_adapter
 * @brief Static logging facade shared by every dcmwire module
 *
 * Thread Safety: All methods are thread-safe. Source labels are kept per
 * thread, so parallel readers tag their own messages.
 *
 * @code
 * logger_config config;
 * config.min_level = log_level::debug;
 * logger_adapter::initialize(config);
 *
 * {
 *     logger_adapter::source_scope scope{"image.dcm"};
 *     logger_adapter::warn("Frame {} has no EOI marker", 3);
 * }
 *
 * logger_adapter::shutdown();
 * @endcode
 */
class logger_adapter {
public:
    /**
     * @class source_scope
     * @brief Labels the messages of the current thread while alive
     *
     * Scopes nest; the innermost label wins.
     */
    class source_scope {
    public:
        explicit source_scope(std::string label);
        ~source_scope();

        source_scope(const source_scope&) = delete;
        source_scope& operator=(const source_scope&) = delete;
    };

    /**
     * @brief Attach the configured writers and start logging
     *
     * A second call without shutdown() in between is ignored.
     */
    static void initialize(const logger_config& config);

    /// Flush pending messages and detach every writer
    static void shutdown();

    [[nodiscard]] static auto is_initialized() noexcept -> bool;

    template <typename... Args>
    static void trace(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void debug(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void info(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void warn(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void error(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    static void fatal(dcmwire::compat::format_string<Args...> fmt, Args&&... args) {
        emit(log_level::fatal, fmt, std::forward<Args>(args)...);
    }

    /// Log an already formatted message
    static void log(log_level level, const std::string& message);

    /// False for every level while the logger is not initialized
    [[nodiscard]] static auto is_level_enabled(log_level level) noexcept -> bool;

    static void flush();

    static void set_min_level(log_level level);

    [[nodiscard]] static auto get_min_level() noexcept -> log_level;

    [[nodiscard]] static auto get_config() -> logger_config;

    /// Label of the innermost source_scope on this thread, empty if none
    [[nodiscard]] static auto current_source() -> std::string;

    /**
     * @brief Messages accepted at @p level since initialize()
     *
     * Lets a caller tell whether a lenient read raised any warnings
     * without installing a handler.
     */
    [[nodiscard]] static auto message_count(log_level level) noexcept -> std::size_t;

    static void reset_counts() noexcept;

    [[nodiscard]] static auto log_level_to_string(log_level level) -> std::string;

private:
    template <typename... Args>
    static void emit(log_level level, dcmwire::compat::format_string<Args...> fmt,
                     Args&&... args) {
        if (is_level_enabled(level)) {
            log(level, dcmwire::compat::format(fmt, std::forward<Args>(args)...));
        }
    }
};

}  // namespace dcmwire::integration
