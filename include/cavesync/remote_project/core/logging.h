/**
 * @file logging.h
 * @brief Structured logging for remote_project
 *
 * Messages go to logger_system when REMOTE_PROJECT_USE_LOGGER_SYSTEM is on,
 * otherwise to stderr. Auth tokens and passwords are always redacted.
 */

#pragma once

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "cavesync/remote_project/config/feature_flags.h"

#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace cavesync::remote_project {

/**
 * @brief Log categories for remote_project
 */
struct log_category {
    static constexpr std::string_view session = "remote_project.session";
    static constexpr std::string_view lock = "remote_project.lock";
    static constexpr std::string_view transfer = "remote_project.transfer";
    static constexpr std::string_view http = "remote_project.http";
    static constexpr std::string_view retry = "remote_project.retry";
    static constexpr std::string_view client = "remote_project.client";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name ("debug", "WARN", ...)
 * @return Level, or nullopt for an unknown name
 */
inline std::optional<log_level> parse_log_level(std::string_view name) {
    std::string lower(name);
    for (auto& c : lower) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Credentials are masked unconditionally; paths are optional.
 */
struct masking_config {
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, "*", 4};
    }

    static masking_config none() {
        return {false, "*", 4};
    }
};

/**
 * @brief Redacts credentials and (optionally) local paths in log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = mask_credentials(input);
        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }
        return result;
    }

    /**
     * @brief Mask the directory part of a path, keeping the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    /**
     * @brief Keep the first visible_chars characters of a secret
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_credentials(const std::string& input) const -> std::string {
        static const std::regex token_pattern(
            R"(((?:Token|Bearer)\s+)([A-Za-z0-9._~+/=-]+))");
        static const std::regex password_pattern(
            R"(("password"\s*:\s*")([^"]*)("))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), token_pattern);
        std::sregex_iterator end;
        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += (*it)[1].str() + mask_secret((*it)[2].str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return std::regex_replace(result, password_pattern, "$1********$3");
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+)+|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

/**
 * @brief Structured context attached to a log line
 */
struct operation_log_context {
    std::string project_id;
    std::string instance;
    std::optional<int> http_status;
    std::optional<uint32_t> attempt;
    std::optional<uint32_t> max_attempts;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> nlohmann::json {
        auto obj = nlohmann::json::object();
        if (!project_id.empty()) obj["project_id"] = project_id;
        if (!instance.empty()) obj["instance"] = instance;
        if (http_status) obj["http_status"] = *http_status;
        if (attempt) obj["attempt"] = *attempt;
        if (max_attempts) obj["max_attempts"] = *max_attempts;
        if (bytes) obj["bytes"] = *bytes;
        if (duration_ms) obj["duration_ms"] = *duration_ms;
        if (error_message) {
            obj["error_message"] = masker ? masker->mask(*error_message) : *error_message;
        }
        return obj;
    }
};

/**
 * @brief One rendered log record
 *
 * message and context are stored already masked; the masker passed to
 * to_json() only applies to the source location.
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<operation_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json(const sensitive_info_masker* masker = nullptr) const
        -> std::string {
        nlohmann::json obj;
        obj["timestamp"] = timestamp;
        obj["level"] = std::string(log_level_to_string(level));
        obj["category"] = category;
        obj["message"] = message;

        if (context) {
            obj.update(context->to_json());
        }

        if (source_file) {
            nlohmann::json source;
            source["file"] = masker ? masker->mask_path(*source_file) : *source_file;
            if (source_line) source["line"] = *source_line;
            if (function_name) source["function"] = *function_name;
            obj["source"] = std::move(source);
        }

        return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
};

enum class log_output_format {
    text,
    json
};

class remote_project_logger;

remote_project_logger& get_logger();

/**
 * @brief Process-wide logger used by every remote_project component
 */
class remote_project_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view category,
                                            std::string_view message,
                                            const operation_log_context*)>;

    remote_project_logger() = default;
    ~remote_project_logger() = default;

    remote_project_logger(const remote_project_logger&) = delete;
    remote_project_logger& operator=(const remote_project_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when a client is built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void enable_json_output(bool enable = true) {
        set_output_format(enable ? log_output_format::json : log_output_format::text);
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a sink that sees every record (already masked)
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const operation_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked_message = current_masker.mask(std::string(message));
        std::optional<operation_log_context> masked_context;
        if (context) {
            masked_context = *context;
            if (masked_context->error_message) {
                masked_context->error_message =
                    current_masker.mask(*masked_context->error_message);
            }
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked_message,
                          masked_context ? &*masked_context : nullptr);
            }
        }

        std::string rendered;
        if (format == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = get_iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = masked_message;
            entry.context = masked_context;
            if (file) entry.source_file = file;
            if (line > 0) entry.source_line = line;
            if (function) entry.function_name = function;
            rendered = entry.to_json(&current_masker);
        } else {
            std::ostringstream oss;
            oss << get_timestamp() << " [" << log_level_to_string(level) << "] ["
                << category << "] " << masked_message;
            if (masked_context) {
                oss << " " << masked_context->to_json().dump();
            }
            rendered = oss.str();
        }

#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        output_to_stderr(rendered);
    }

    void flush() {
#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if REMOTE_PROJECT_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline remote_project_logger& get_logger() {
    static remote_project_logger instance;
    return instance;
}

#define RP_LOG(level, category, message) \
    cavesync::remote_project::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define RP_LOG_CTX(level, category, message, context) \
    cavesync::remote_project::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define RP_LOG_TRACE(category, message) \
    RP_LOG(cavesync::remote_project::log_level::trace, category, message)

#define RP_LOG_DEBUG(category, message) \
    RP_LOG(cavesync::remote_project::log_level::debug, category, message)

#define RP_LOG_INFO(category, message) \
    RP_LOG(cavesync::remote_project::log_level::info, category, message)

#define RP_LOG_WARN(category, message) \
    RP_LOG(cavesync::remote_project::log_level::warn, category, message)

#define RP_LOG_ERROR(category, message) \
    RP_LOG(cavesync::remote_project::log_level::error, category, message)

#define RP_LOG_FATAL(category, message) \
    RP_LOG(cavesync::remote_project::log_level::fatal, category, message)

#define RP_LOG_DEBUG_CTX(category, message, ctx) \
    RP_LOG_CTX(cavesync::remote_project::log_level::debug, category, message, ctx)

#define RP_LOG_INFO_CTX(category, message, ctx) \
    RP_LOG_CTX(cavesync::remote_project::log_level::info, category, message, ctx)

#define RP_LOG_WARN_CTX(category, message, ctx) \
    RP_LOG_CTX(cavesync::remote_project::log_level::warn, category, message, ctx)

#define RP_LOG_ERROR_CTX(category, message, ctx) \
    RP_LOG_CTX(cavesync::remote_project::log_level::error, category, message, ctx)

}  // namespace cavesync::remote_project
