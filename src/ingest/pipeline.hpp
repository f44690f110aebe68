#pragma once

#include "enrich/liveness_prober.hpp"
#include "enrich/reverse_resolver.hpp"
#include "enrich/worker_pool.hpp"
#include "filter/event_filter.hpp"
#include "ledger/ledger.hpp"
#include "net/arp_frame.hpp"
#include <atomic>
#include <cstddef>
#include <memory>
#include <optional>
#include <span>

namespace whohas::ingest {

struct PipelineOptions {
  // Look up the reverse name of every new address
  bool resolve_names{false};
  // Probe every new target for liveness
  bool check_liveness{false};
  std::size_t enrichment_workers{4};
  std::size_t enrichment_queue{64};
};

struct PipelineStats {
  std::atomic<std::size_t> accepted{0};
  std::atomic<std::size_t> rejected{0};
  std::atomic<std::size_t> created_entities{0};
  std::atomic<std::size_t> lookups{0};
  std::atomic<std::size_t> probes{0};
};

/**
 * @brief Feeds ARP requests into a ledger
 *
 * For each event: apply the filter, get or create both entities, schedule
 * the enrichment of newly created ones, then count the transaction.
 * Enrichment runs on a worker pool and holds no ledger lock while it waits
 * on the network.
 */
class IngestionPipeline {
public:
  /**
   * @brief Build a pipeline writing to ledger
   *
   * @param ledger The ledger to update; must outlive the pipeline
   * @param filter The allow/deny filter applied to every event
   * @param options Which enrichments run
   * @param reverse_lookup Required when options.resolve_names is set
   * @param liveness_probe Required when options.check_liveness is set
   *
   * @throws ConfigurationError if an enabled enrichment has no service
   */
  IngestionPipeline(ledger::Ledger &ledger, filter::EventFilter filter,
                    PipelineOptions options,
                    enrich::ReverseLookup reverse_lookup = {},
                    enrich::LivenessProbe liveness_probe = {});

  /**
   * @brief Wait for the pending enrichment, then stop the workers
   */
  ~IngestionPipeline();

  IngestionPipeline(const IngestionPipeline &) = delete;
  IngestionPipeline &operator=(const IngestionPipeline &) = delete;

  /**
   * @brief Ingest a single event
   *
   * Enrichment scheduled by the event may still be running on return; call
   * drain() to wait for it.
   *
   * @return true if the filter accepted the event
   */
  bool ingest(const net::ArpEvent &event);

  /**
   * @brief Ingest a batch in order and wait for the enrichment it scheduled
   *
   * @return The number of accepted events
   */
  std::size_t ingest_batch(std::span<const net::ArpEvent> batch);

  /**
   * @brief Block until every scheduled enrichment has finished
   */
  void drain();

  const PipelineStats &stats() const { return stats_; }

private:
  void schedule_reverse_lookup(const ledger::AddressEntity &entity);
  void schedule_probe(const ledger::AddressEntity &entity);
  ledger::AddressEntity resolve(std::string_view address, bool is_target);

  ledger::Ledger &ledger_;
  filter::EventFilter filter_;
  PipelineOptions options_;
  enrich::ReverseLookup reverse_lookup_;
  enrich::LivenessProbe liveness_probe_;

  PipelineStats stats_{};
  // Created only when an enrichment is enabled
  std::unique_ptr<enrich::WorkerPool> workers_{};
};

} // namespace whohas::ingest
