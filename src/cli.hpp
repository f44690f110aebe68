#pragma once

#include "config.hpp"
#include "ledger/ledger.hpp"
#include "report/color_profile.hpp"
#include "report/report_builder.hpp"
#include <string_view>
#include <utility>

namespace whohas {

inline constexpr std::string_view USAGE{
    "Usage: whohas <capture|analyze|report> <config.json>"};

class Cli {
public:
  explicit Cli(config::Config config) : config_(std::move(config)) {}

  Cli() = delete;
  Cli(const Cli &) = delete;
  Cli &operator=(const Cli &) = delete;

  static bool is_command(std::string_view command);

  /**
   * @brief Run one command to completion
   *
   * @throws std::invalid_argument for an unknown command
   * @throws Error subclasses when the configuration, the ledger or the
   * capture source fail
   */
  void run(std::string_view command);

private:
  // Command handlers
  void handle_capture();
  void handle_analyze();
  void handle_report();

  report::ReportOptions report_options(bool liveness) const;

  // Print the report and mirror it to report_file
  void show_report(const ledger::Ledger &ledger, bool liveness,
                   bool clear_screen = false) const;

  config::Config config_;
  report::ColorProfiles profiles_{};
};

} // namespace whohas
