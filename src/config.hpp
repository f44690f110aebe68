#pragma once

#include "filter/address_list.hpp"
#include "filter/event_filter.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whohas::config {

inline constexpr std::string_view DEFAULT_DATABASE{"whohas.db"};

struct AnalysisConfig {
  std::filesystem::path output_database;
  std::vector<std::filesystem::path> ledgers{};
  std::vector<std::filesystem::path> captures{};
};

struct LogConfig {
  logger::Level level{logger::Level::info};
  std::filesystem::path file{"./whohas.log"};
  bool console{false};
};

struct Config {
  [[nodiscard]] filter::EventFilter make_filter() const {
    return filter::EventFilter(senders, targets);
  }

  // Capture interface; also used by the liveness prober
  std::string interface{};
  std::filesystem::path database{DEFAULT_DATABASE};

  std::size_t batch_size{5};
  std::size_t channel_capacity{4};

  bool resolve_names{false};
  bool check_liveness{false};
  unsigned probe_retry{0};
  std::chrono::milliseconds probe_timeout{1000};
  std::size_t enrichment_workers{4};

  std::string color_profile{"default"};

  std::optional<filter::AddressPolicy> senders{};
  std::optional<filter::AddressPolicy> targets{};

  std::optional<std::filesystem::path> report_file{};
  std::optional<std::filesystem::path> capture_file{};

  std::optional<AnalysisConfig> analysis{};
  LogConfig log{};
};

/**
 * @brief Build a configuration from a parsed JSON document
 *
 * Missing keys keep their defaults. Address list files named by the
 * configuration are read here.
 *
 * @throws ConfigurationError naming the offending key on a wrong type, an
 * out of range number, an unknown colour profile or a bad address entry
 * @throws FileNotFound if an address list file does not exist
 */
[[nodiscard]] Config from_json(const nlohmann::json &json);

/**
 * @brief Parse a JSON configuration document
 *
 * @throws ConfigurationError if the text is not valid JSON, or as from_json
 */
[[nodiscard]] Config parse(std::string_view text);

/**
 * @brief Read and parse a configuration file
 *
 * @throws FileNotFound if the file does not exist, or as parse
 */
[[nodiscard]] Config load(const std::filesystem::path &path);

} // namespace whohas::config
