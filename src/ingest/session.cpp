#include "session.hpp"

#include "capture/pcap_file.hpp"
#include "error.hpp"
#include "ledger/merge.hpp"
#include "logger.hpp"
#include <chrono>
#include <fmt/format.h>
#include <scope_guard.hpp>
#include <system_error>
#include <utility>

namespace whohas::ingest {

namespace {

// How often the consumer checks keep_going while no batch arrives
constexpr std::chrono::milliseconds STOP_CHECK_INTERVAL{250};

void require_input(const std::filesystem::path &input,
                   const std::filesystem::path &output) {
  if (!std::filesystem::is_regular_file(input)) {
    throw FileNotFound(input.string());
  }
  std::error_code ec;
  if (std::filesystem::equivalent(input, output, ec)) {
    throw ConfigurationError(fmt::format(
        "Analysis input {} is also the output database", input.string()));
  }
}

} // namespace

void consume(capture::CaptureProducer &producer, capture::BatchChannel &channel,
             IngestionPipeline &pipeline,
             const std::function<bool()> &keep_going,
             const std::function<void()> &on_batch) {
  // Unblocks the producer if the consumer leaves early
  auto closer = scope_guard::make_scope_exit([&] {
    channel.close();
    producer.stop();
  });

  while (keep_going()) {
    auto batch = channel.receive_for(STOP_CHECK_INTERVAL);
    if (!batch) {
      if (channel.finished()) {
        break;
      }
      continue;
    }
    pipeline.ingest_batch(*batch);
    if (on_batch) {
      on_batch();
    }
  }

  channel.close();
  producer.stop();
  producer.rethrow_if_failed();
}

ledger::Ledger analyze(const std::filesystem::path &output,
                       const std::vector<std::filesystem::path> &ledgers,
                       const std::vector<std::filesystem::path> &captures,
                       const filter::EventFilter &filter,
                       const AnalysisOptions &options,
                       enrich::ReverseLookup reverse_lookup) {
  if (options.resolve_names && !reverse_lookup) {
    throw ConfigurationError(
        "Reverse name resolution is enabled but no resolver is configured");
  }

  // Fail before the output is replaced if an input is unusable
  for (const auto &path : ledgers) {
    require_input(path, output);
  }
  for (const auto &path : captures) {
    require_input(path, output);
  }

  ledger::Ledger result(output, storage::OpenMode::overwrite);

  for (const auto &path : ledgers) {
    const ledger::Ledger input(path, storage::OpenMode::existing);
    const auto summary = ledger::merge(result, input);
    LOG_INFO("Imported {}: {} transactions, {} requests", path.string(),
             summary.transactions, summary.requests);
  }

  // The pipeline drains its enrichment before result is handed out
  {
    IngestionPipeline pipeline(
        result, filter,
        PipelineOptions{.resolve_names = options.resolve_names,
                        .check_liveness = false,
                        .enrichment_workers = options.enrichment_workers,
                        .enrichment_queue = options.enrichment_workers * 16},
        std::move(reverse_lookup));

    for (const auto &path : captures) {
      capture::PcapReader reader(path);
      capture::BatchChannel channel(options.channel_capacity);
      capture::CaptureProducer producer(
          [&reader](capture::Frame &frame, std::chrono::milliseconds timeout) {
            return reader.read(frame, timeout);
          },
          filter, channel,
          capture::ProducerOptions{.batch_size = options.batch_size});

      producer.start();
      consume(producer, channel, pipeline, [] { return true; });
      LOG_INFO("Imported {}: {} frames, {} ARP requests accepted",
               path.string(), reader.frames_read(),
               producer.stats().accepted.load());
    }
  }

  return result;
}

} // namespace whohas::ingest
