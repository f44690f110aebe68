#include "cli.hpp"

#include "capture/live_capture.hpp"
#include "capture/pcap_file.hpp"
#include "capture/producer.hpp"
#include "enrich/liveness_prober.hpp"
#include "enrich/reverse_resolver.hpp"
#include "error.hpp"
#include "ingest/pipeline.hpp"
#include "ingest/session.hpp"
#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <csignal>
#include <fmt/format.h>
#include <fstream>
#include <functional>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace whohas {

namespace {

constexpr std::string_view CLEAR_SCREEN{"\x1b[2J\x1b[H"};
constexpr std::string_view INITIALIZING_NOTICE{
    "- Initializing capture\n"
    "- This may take time depending on network traffic and filter "
    "configurations\n"};

std::atomic<bool> stop_requested{false};

void handle_stop_signal(int) { stop_requested.store(true); }

void install_stop_handlers() {
  stop_requested.store(false);

  struct sigaction action {};
  action.sa_handler = handle_stop_signal;
  sigemptyset(&action.sa_mask);
  // No SA_RESTART: a blocking poll() must wake up on the signal
  action.sa_flags = 0;
  if (sigaction(SIGINT, &action, nullptr) < 0 ||
      sigaction(SIGTERM, &action, nullptr) < 0) {
    LOG_WARN("Failed to install the stop signal handlers");
  }
}

ingest::PipelineOptions pipeline_options(const config::Config &config,
                                         bool liveness) {
  return ingest::PipelineOptions{
      .resolve_names = config.resolve_names,
      .check_liveness = liveness,
      .enrichment_workers = config.enrichment_workers,
      .enrichment_queue = config.enrichment_workers * 16};
}

enrich::ReverseLookup make_reverse_lookup(const config::Config &config) {
  if (!config.resolve_names) {
    return {};
  }
  return enrich::dns_reverse_lookup;
}

} // namespace

bool Cli::is_command(std::string_view command) {
  return command == "capture" || command == "analyze" || command == "report";
}

void Cli::run(std::string_view command) {
  const static auto str_to_cmd =
      std::unordered_map<std::string_view, void (Cli::*)()>{
          {"capture", &Cli::handle_capture},
          {"analyze", &Cli::handle_analyze},
          {"report", &Cli::handle_report},
      };

  if (auto it = str_to_cmd.find(command); it != str_to_cmd.end()) {
    LOG_INFO("Running {}", command);
    std::invoke(it->second, this);
  } else {
    throw std::invalid_argument(fmt::format("Invalid command: {}", command));
  }
}

report::ReportOptions Cli::report_options(bool liveness) const {
  return report::ReportOptions{.liveness = liveness,
                               .reverse_names = config_.resolve_names,
                               .profile = profiles_.find(config_.color_profile),
                               .filter = config_.make_filter()};
}

void Cli::show_report(const ledger::Ledger &ledger, bool liveness,
                      bool clear_screen) const {
  auto options = report_options(liveness);
  if (clear_screen) {
    std::cout << CLEAR_SCREEN;
  }
  std::cout << report::build_report(ledger, options) << std::flush;

  if (config_.report_file) {
    options.profile = nullptr;
    std::ofstream output(*config_.report_file, std::ios::trunc);
    if (!output) {
      throw Error(fmt::format("Failed to write the report to {}",
                              config_.report_file->string()));
    }
    output << report::build_report(ledger, options);
  }
}

void Cli::handle_capture() {
  if (config_.interface.empty()) {
    throw ConfigurationError("The capture command requires an interface");
  }

  ledger::Ledger ledger(config_.database);
  if (ledger.empty()) {
    std::cout << INITIALIZING_NOTICE << std::flush;
  } else {
    show_report(ledger, config_.check_liveness, true);
  }

  enrich::LivenessProbe probe{};
  if (config_.check_liveness) {
    probe = enrich::ArpProber(
        enrich::ProbeOptions{.interface = config_.interface,
                             .retry = config_.probe_retry,
                             .timeout = config_.probe_timeout});
  }
  ingest::IngestionPipeline pipeline(
      ledger, config_.make_filter(),
      pipeline_options(config_, config_.check_liveness),
      make_reverse_lookup(config_), probe);

  capture::LiveCapture source(config_.interface);

  std::optional<capture::PcapWriter> writer{};
  capture::FrameSink sink{};
  if (config_.capture_file) {
    writer.emplace(*config_.capture_file);
    sink = [&writer](const capture::Frame &frame) {
      writer->write(frame);
      writer->flush();
    };
  }

  capture::BatchChannel channel(config_.channel_capacity);
  capture::CaptureProducer producer(
      [&source](capture::Frame &frame, std::chrono::milliseconds timeout) {
        return source.read(frame, timeout);
      },
      config_.make_filter(), channel,
      capture::ProducerOptions{.batch_size = config_.batch_size}, sink);

  install_stop_handlers();
  producer.start();
  ingest::consume(
      producer, channel, pipeline, [] { return !stop_requested.load(); },
      [&] { show_report(ledger, config_.check_liveness, true); });

  const auto &stats = producer.stats();
  LOG_INFO("Capture stopped after {} accepted requests in {} batches",
           stats.accepted.load(), stats.batches.load());
}

void Cli::handle_analyze() {
  if (!config_.analysis) {
    throw ConfigurationError(
        "The analyze command requires an 'analysis' section");
  }
  const auto &analysis = *config_.analysis;

  const auto output = ingest::analyze(
      analysis.output_database, analysis.ledgers, analysis.captures,
      config_.make_filter(),
      ingest::AnalysisOptions{.resolve_names = config_.resolve_names,
                              .enrichment_workers = config_.enrichment_workers,
                              .batch_size = config_.batch_size,
                              .channel_capacity = config_.channel_capacity},
      make_reverse_lookup(config_));

  show_report(output, false);
}

void Cli::handle_report() {
  const ledger::Ledger ledger(config_.database, storage::OpenMode::existing);
  show_report(ledger, config_.check_liveness);
}

} // namespace whohas
