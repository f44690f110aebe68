#include "logger.hpp"

#include <algorithm>
#include <array>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <stdexcept>
#include <utility>

namespace {

std::shared_ptr<spdlog::logger> global_logger{nullptr};
whohas::logger::Level global_level{whohas::logger::Level::info};
bool global_console_enabled{false};

} // namespace

namespace whohas::logger {

std::optional<Level> level_from_string(std::string_view name) {
  static constexpr std::array<std::pair<std::string_view, Level>, 7> levels{{
      {"trace", Level::trace},
      {"debug", Level::debug},
      {"info", Level::info},
      {"warn", Level::warn},
      {"error", Level::error},
      {"critical", Level::critical},
      {"off", Level::off},
  }};

  auto it = std::find_if(levels.begin(), levels.end(),
                         [&](const auto &entry) { return entry.first == name; });
  if (it == levels.end()) {
    return std::nullopt;
  }
  return it->second;
}

void init(const std::string &logger_name,
          const std::filesystem::path &log_file) {
  if (global_logger) {
    throw std::runtime_error("Logger already initialized");
  }

  if (global_level != Level::off) {
    auto log_level = static_cast<spdlog::level::level_enum>(global_level);

    auto file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string());
    file_sink->set_level(log_level);

    if (global_console_enabled) {
      auto console_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
      console_sink->set_level(log_level);

      global_logger = std::make_shared<spdlog::logger>(
          logger_name, spdlog::sinks_init_list{file_sink, console_sink});
    } else {
      global_logger = std::make_shared<spdlog::logger>(logger_name, file_sink);
    }
    global_logger->set_level(log_level);
  }
}

spdlog::logger *get_instance() {
  // Before init() every call goes to spdlog's default logger, so that library
  // code used from the tests never creates a log file behind their back
  if (!global_logger) {
    return spdlog::default_logger_raw();
  }
  return global_logger.get();
}

void set_level(Level level) {
  global_level = level;
  spdlog::set_level(static_cast<spdlog::level::level_enum>(level));
  if (global_logger) {
    global_logger->set_level(static_cast<spdlog::level::level_enum>(level));
  }
}

void enable_console(bool enable) {
  if (!global_logger) {
    global_console_enabled = enable;
    return;
  }

  if (global_console_enabled == enable) {
    return;
  }

  if (enable) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_sink_mt>();
    console_sink->set_level(
        static_cast<spdlog::level::level_enum>(global_level));
    global_logger->sinks().push_back(console_sink);
  } else {
    auto &sinks = global_logger->sinks();
    sinks.erase(
        std::remove_if(
            sinks.begin(), sinks.end(),
            [](const auto &sink) {
              return std::dynamic_pointer_cast<spdlog::sinks::stderr_sink_mt>(
                  sink);
            }),
        sinks.end());
  }

  global_console_enabled = enable;
}

} // namespace whohas::logger
