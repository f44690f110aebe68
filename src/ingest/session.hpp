#pragma once

#include "capture/producer.hpp"
#include "enrich/reverse_resolver.hpp"
#include "filter/event_filter.hpp"
#include "ledger/ledger.hpp"
#include "pipeline.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <vector>

namespace whohas::ingest {

/**
 * @brief Drain every batch of a started producer into the pipeline
 *
 * The channel is closed and the producer stopped on every way out, so a
 * producer blocked on a full channel never outlives the call.
 *
 * @param keep_going Polled between batches; returning false stops the
 * producer and ends the loop
 * @param on_batch Called after each batch has been ingested and enriched
 *
 * @throws The error that ended the producer, if any
 */
void consume(capture::CaptureProducer &producer, capture::BatchChannel &channel,
             IngestionPipeline &pipeline,
             const std::function<bool()> &keep_going,
             const std::function<void()> &on_batch = {});

struct AnalysisOptions {
  // Liveness is never checked offline: the captured hosts may be long gone
  bool resolve_names{false};
  std::size_t enrichment_workers{4};
  std::size_t batch_size{5};
  std::size_t channel_capacity{4};
};

/**
 * @brief Build a fresh ledger out of earlier ledgers and capture files
 *
 * Every input is checked before output is touched. The ledgers are merged
 * first, in order, then each capture is replayed through the filter and an
 * ingestion pipeline.
 *
 * @param output The ledger file to create; an existing file is replaced
 * @param ledgers Ledger files to merge
 * @param captures pcap files to ingest
 * @param reverse_lookup Required when options.resolve_names is set
 * @return The output ledger
 *
 * @throws FileNotFound if an input is missing or not a regular file; output
 * is left as it was
 * @throws ConfigurationError if an input is the output file itself
 */
ledger::Ledger analyze(const std::filesystem::path &output,
                       const std::vector<std::filesystem::path> &ledgers,
                       const std::vector<std::filesystem::path> &captures,
                       const filter::EventFilter &filter,
                       const AnalysisOptions &options,
                       enrich::ReverseLookup reverse_lookup = {});

} // namespace whohas::ingest
