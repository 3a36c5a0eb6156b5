/**
 * @file utilities.hpp
 * @brief Common utility functions for Hivemind
 *
 * Hivemind - Agent Coordination Bus
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Utility functions used throughout Hivemind:
 * - Logging and error reporting
 * - Wall-clock time and ISO-8601 timestamps
 * - String manipulation
 * - File I/O helpers
 */

#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hivemind {
namespace utilities {

/**
 * @brief Log levels for Hivemind logging
 */
enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * @brief Initialize logging system
 * @param log_file Path to log file (empty for stdout only)
 * @param level Minimum log level to output
 */
void initialize_logging(const std::string& log_file = "", LogLevel level = LogLevel::INFO);

/**
 * @brief Parse a log level name ("debug", "info", "warn", "error", "critical")
 * @param name Level name, case-insensitive
 * @return Parsed level, or std::nullopt for an unknown name
 */
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Log a message with specified level
 * @param level Log level
 * @param message Message to log
 */
void log(LogLevel level, const std::string& message);

void log_debug(const std::string& message);
void log_info(const std::string& message);
void log_warn(const std::string& message);
void log_error(const std::string& message);
void log_critical(const std::string& message);

// ============================================================================
// Time
// ============================================================================

/**
 * @brief Current wall-clock time in milliseconds since the Unix epoch
 */
int64_t now_ms();

/// Source of epoch milliseconds, injectable so tests can move time
using ClockFn = std::function<int64_t()>;

/**
 * @brief Format epoch milliseconds as ISO 8601 UTC with millisecond precision
 * @param epoch_ms Milliseconds since epoch
 * @return Formatted string (e.g., "2025-11-10T15:30:45.123Z")
 */
std::string format_timestamp_ms(int64_t epoch_ms);

/**
 * @brief Parse an ISO 8601 instant
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", optional fractional seconds, and either
 * "Z" or a "+HH:MM" / "-HH:MM" offset. A missing offset is read as UTC.
 *
 * @param text Timestamp text
 * @return Milliseconds since epoch, or std::nullopt if malformed
 */
std::optional<int64_t> parse_timestamp_ms(const std::string& text);

// ============================================================================
// File I/O
// ============================================================================

/**
 * @brief Read entire file into string
 * @param file_path Path to file
 * @return File contents or std::nullopt if error
 */
std::optional<std::string> read_file(const std::string& file_path);

/**
 * @brief Write string to file, creating parent directories
 * @param file_path Path to file
 * @param content Content to write
 * @return true if successful, false otherwise
 */
bool write_file(const std::string& file_path, const std::string& content);

// ============================================================================
// Strings
// ============================================================================

/**
 * @brief Split string by delimiter
 * @param str String to split
 * @param delimiter Delimiter character
 * @return Vector of split strings
 */
std::vector<std::string> split_string(const std::string& str, char delimiter);

/**
 * @brief Trim whitespace from string
 */
std::string trim_string(const std::string& str);

std::string to_lowercase(const std::string& str);

bool starts_with(const std::string& str, const std::string& prefix);

/**
 * @brief Zero-pad a non-negative integer to a fixed width
 * @param value Value to format
 * @param width Minimum number of digits
 * @return Padded decimal string (e.g., pad_number(42, 6) == "000042")
 */
std::string pad_number(int64_t value, size_t width);

/**
 * @brief Shorten a secret for log output
 * @return First few characters followed by "..."
 */
std::string redact(const std::string& secret);

// ============================================================================
// Environment
// ============================================================================

/**
 * @brief Get environment variable value
 * @param name Environment variable name
 * @param default_value Default value if not set
 * @return Environment variable value or default
 */
std::string get_env(const std::string& name, const std::string& default_value = "");

} // namespace utilities
} // namespace hivemind
