#include "config.hpp"

#include "error.hpp"
#include "report/color_profile.hpp"
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace whohas::config {

namespace {

using json = nlohmann::json;

[[noreturn]] void invalid(std::string_view key, std::string_view reason) {
  throw ConfigurationError(
      fmt::format("Invalid configuration key '{}': {}", key, reason));
}

const json *find(const json &object, std::string_view key) {
  auto it = object.find(std::string{key});
  if (it == object.end() || it->is_null()) {
    return nullptr;
  }
  return &*it;
}

std::optional<bool> get_bool(const json &object, std::string_view key,
                             std::string_view name) {
  const auto *value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_boolean()) {
    invalid(name, "expected a boolean");
  }
  return value->get<bool>();
}

std::optional<std::string> get_string(const json &object, std::string_view key,
                                      std::string_view name) {
  const auto *value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_string()) {
    invalid(name, "expected a string");
  }
  return value->get<std::string>();
}

// Integer in [min, max]
std::optional<int64_t> get_integer(const json &object, std::string_view key,
                                   std::string_view name, int64_t min,
                                   int64_t max = std::numeric_limits<int>::max()) {
  const auto *value = find(object, key);
  if (!value) {
    return std::nullopt;
  }
  if (!value->is_number_integer()) {
    invalid(name, "expected an integer");
  }
  auto number = value->get<int64_t>();
  if (number < min || number > max) {
    invalid(name, fmt::format("{} is outside [{}, {}]", number, min, max));
  }
  return number;
}

std::vector<std::string> get_string_list(const json &object,
                                         std::string_view key,
                                         std::string_view name) {
  std::vector<std::string> items;
  const auto *value = find(object, key);
  if (!value) {
    return items;
  }
  if (!value->is_array()) {
    invalid(name, "expected an array of strings");
  }
  for (const auto &item : *value) {
    if (!item.is_string()) {
      invalid(name, "expected an array of strings");
    }
    items.push_back(item.get<std::string>());
  }
  return items;
}

std::vector<std::filesystem::path>
get_path_list(const json &object, std::string_view key, std::string_view name) {
  auto items = get_string_list(object, key, name);
  return std::vector<std::filesystem::path>(items.begin(), items.end());
}

const json *get_object(const json &object, std::string_view key) {
  const auto *value = find(object, key);
  if (value && !value->is_object()) {
    invalid(key, "expected an object");
  }
  return value;
}

filter::AddressList read_list(const json &object, std::string_view role,
                              std::string_view kind) {
  const auto key = fmt::format("{}.{}", role, kind);
  filter::AddressList list;
  try {
    list = filter::AddressList::from_entries(
        get_string_list(object, kind, key));
  } catch (const std::invalid_argument &e) {
    invalid(key, e.what());
  }

  const auto file_key = fmt::format("{}_file", kind);
  const auto file_name = fmt::format("{}.{}", role, file_key);
  if (auto file = get_string(object, file_key, file_name)) {
    try {
      list.merge(filter::AddressList::from_file(*file));
    } catch (const std::invalid_argument &e) {
      invalid(file_name, e.what());
    }
  }
  return list;
}

std::optional<filter::AddressPolicy> read_policy(const json &root,
                                                 std::string_view role) {
  const auto *object = get_object(root, role);
  if (!object) {
    return std::nullopt;
  }

  filter::AddressPolicy policy{.allow = read_list(*object, role, "allow"),
                               .deny = read_list(*object, role, "deny")};
  LOG_DEBUG("{} policy: {} allowed, {} denied networks", role,
            policy.allow.size(), policy.deny.size());
  if (policy.empty()) {
    return std::nullopt;
  }
  return policy;
}

AnalysisConfig read_analysis(const json &object) {
  AnalysisConfig analysis{};
  auto output = get_string(object, "output_database", "analysis.output_database");
  if (!output || output->empty()) {
    invalid("analysis.output_database", "an output database is required");
  }
  analysis.output_database = *output;
  analysis.ledgers = get_path_list(object, "ledgers", "analysis.ledgers");
  analysis.captures = get_path_list(object, "captures", "analysis.captures");
  return analysis;
}

LogConfig read_log(const json &object) {
  LogConfig log{};
  if (auto level = get_string(object, "level", "log.level")) {
    auto parsed = logger::level_from_string(*level);
    if (!parsed) {
      invalid("log.level", fmt::format("unknown level {}", *level));
    }
    log.level = *parsed;
  }
  if (auto file = get_string(object, "file", "log.file")) {
    log.file = *file;
  }
  if (auto console = get_bool(object, "console", "log.console")) {
    log.console = *console;
  }
  return log;
}

} // namespace

Config from_json(const json &root) {
  if (!root.is_object()) {
    throw ConfigurationError("The configuration must be a JSON object");
  }

  Config config{};

  if (auto interface = get_string(root, "interface", "interface")) {
    config.interface = *interface;
  }
  if (auto database = get_string(root, "database", "database")) {
    if (database->empty()) {
      invalid("database", "the path is empty");
    }
    config.database = *database;
  }

  if (auto batch_size = get_integer(root, "batch_size", "batch_size", 1)) {
    config.batch_size = static_cast<std::size_t>(*batch_size);
  }
  if (auto capacity =
          get_integer(root, "channel_capacity", "channel_capacity", 1)) {
    config.channel_capacity = static_cast<std::size_t>(*capacity);
  }
  if (auto workers =
          get_integer(root, "enrichment_workers", "enrichment_workers", 1, 256)) {
    config.enrichment_workers = static_cast<std::size_t>(*workers);
  }

  config.resolve_names =
      get_bool(root, "resolve_names", "resolve_names").value_or(false);
  config.check_liveness =
      get_bool(root, "check_liveness", "check_liveness").value_or(false);

  if (const auto *probe = get_object(root, "probe")) {
    if (auto retry = get_integer(*probe, "retry", "probe.retry", 0)) {
      config.probe_retry = static_cast<unsigned>(*retry);
    }
    if (auto timeout = get_integer(*probe, "timeout_ms", "probe.timeout_ms", 1)) {
      config.probe_timeout = std::chrono::milliseconds(*timeout);
    }
  }

  if (auto profile = get_string(root, "color_profile", "color_profile")) {
    const report::ColorProfiles profiles;
    if (!profiles.contains(*profile)) {
      invalid("color_profile",
              fmt::format("unknown profile {}; choose one of {}", *profile,
                          fmt::join(profiles.names(), ", ")));
    }
    config.color_profile = *profile;
  }

  config.senders = read_policy(root, "senders");
  config.targets = read_policy(root, "targets");

  if (auto report_file = get_string(root, "report_file", "report_file")) {
    config.report_file = *report_file;
  }
  if (auto capture_file = get_string(root, "capture_file", "capture_file")) {
    config.capture_file = *capture_file;
  }

  if (const auto *analysis = get_object(root, "analysis")) {
    config.analysis = read_analysis(*analysis);
  }
  if (const auto *log = get_object(root, "log")) {
    config.log = read_log(*log);
  }

  return config;
}

Config parse(std::string_view text) {
  const auto root = json::parse(text, nullptr, false);
  if (root.is_discarded()) {
    throw ConfigurationError("The configuration is not valid JSON");
  }
  return from_json(root);
}

Config load(const std::filesystem::path &path) {
  std::ifstream input(path);
  if (!input) {
    throw FileNotFound(path.string());
  }
  std::ostringstream contents;
  contents << input.rdbuf();
  return parse(contents.str());
}

} // namespace whohas::config
