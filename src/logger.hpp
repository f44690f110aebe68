#pragma once

#ifdef DEBUG
#define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif
#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

#define LOG_TRACE(...)                                                         \
  SPDLOG_LOGGER_TRACE(::whohas::logger::get_instance(), __VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  SPDLOG_LOGGER_DEBUG(::whohas::logger::get_instance(), __VA_ARGS__)
#define LOG_INFO(...)                                                          \
  SPDLOG_LOGGER_INFO(::whohas::logger::get_instance(), __VA_ARGS__)
#define LOG_WARN(...)                                                          \
  SPDLOG_LOGGER_WARN(::whohas::logger::get_instance(), __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  SPDLOG_LOGGER_ERROR(::whohas::logger::get_instance(), __VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  SPDLOG_LOGGER_CRITICAL(::whohas::logger::get_instance(), __VA_ARGS__)

namespace whohas::logger {

enum class Level {
  trace = SPDLOG_LEVEL_TRACE,
  debug = SPDLOG_LEVEL_DEBUG,
  info = SPDLOG_LEVEL_INFO,
  warn = SPDLOG_LEVEL_WARN,
  error = SPDLOG_LEVEL_ERROR,
  critical = SPDLOG_LEVEL_CRITICAL,
  off = SPDLOG_LEVEL_OFF
};

/**
 * @brief Parse a level name as written in the configuration file
 *
 * @param name One of trace, debug, info, warn, error, critical, off
 * @return The matching level, or std::nullopt for an unknown name
 */
std::optional<Level> level_from_string(std::string_view name);

/**
 * @brief Initialize the logger with the given name and log file
 *
 * @param logger_name The name of the logger
 * @param log_file The file where the log will be stored
 *
 * @throws std::runtime_error if the logger was already initialized
 */
void init(const std::string &logger_name = "whohas",
          const std::filesystem::path &log_file = "./whohas.log");

/**
 * @brief Get the instance of the logger
 *
 * @return The instance of the logger
 */
spdlog::logger *get_instance();

/**
 * @brief Set the level of the logger
 *
 * @param level The level to set the logger to
 */
void set_level(Level level);

/**
 * @brief Enable or disable the console sink
 *
 * The console sink writes to stderr so log lines never interleave with the
 * report printed on stdout.
 *
 * @param enable If true, the logger will also log to stderr
 */
void enable_console(bool enable);

} // namespace whohas::logger
