#include "pipeline.hpp"

#include "error.hpp"
#include "logger.hpp"
#include <exception>
#include <string>
#include <utility>

namespace whohas::ingest {

IngestionPipeline::IngestionPipeline(ledger::Ledger &ledger,
                                     filter::EventFilter filter,
                                     PipelineOptions options,
                                     enrich::ReverseLookup reverse_lookup,
                                     enrich::LivenessProbe liveness_probe)
    : ledger_(ledger), filter_(std::move(filter)), options_(options),
      reverse_lookup_(std::move(reverse_lookup)),
      liveness_probe_(std::move(liveness_probe)) {
  if (options_.check_liveness && !liveness_probe_) {
    throw ConfigurationError(
        "Liveness checking is enabled but no capture interface is configured");
  }
  if (options_.resolve_names && !reverse_lookup_) {
    throw ConfigurationError(
        "Reverse name resolution is enabled but no resolver is configured");
  }

  if (options_.resolve_names || options_.check_liveness) {
    workers_ = std::make_unique<enrich::WorkerPool>(options_.enrichment_workers,
                                                    options_.enrichment_queue);
  }
}

IngestionPipeline::~IngestionPipeline() = default;

bool IngestionPipeline::ingest(const net::ArpEvent &event) {
  if (!filter_.accepts(event)) {
    ++stats_.rejected;
    LOG_TRACE("Rejected {} -> {}", event.sender, event.target);
    return false;
  }

  auto sender = resolve(event.sender, false);
  auto target = resolve(event.target, true);
  ledger_.transactions().record(sender, target);

  ++stats_.accepted;
  return true;
}

std::size_t IngestionPipeline::ingest_batch(
    std::span<const net::ArpEvent> batch) {
  std::size_t accepted = 0;
  for (const auto &event : batch) {
    if (ingest(event)) {
      ++accepted;
    }
  }
  drain();

  LOG_INFO("Ingested batch of {} events ({} accepted)", batch.size(),
           accepted);
  return accepted;
}

void IngestionPipeline::drain() {
  if (workers_) {
    workers_->wait_idle();
  }
}

ledger::AddressEntity IngestionPipeline::resolve(std::string_view address,
                                                 bool is_target) {
  auto [entity, created] = ledger_.registry().resolve_or_create(address);
  if (!created) {
    return entity;
  }

  // Only the call that created the entity enriches it, which makes both
  // lookups at-most-once per address
  ++stats_.created_entities;
  if (options_.resolve_names) {
    schedule_reverse_lookup(entity);
  }
  if (is_target && options_.check_liveness) {
    schedule_probe(entity);
  }
  return entity;
}

void IngestionPipeline::schedule_reverse_lookup(
    const ledger::AddressEntity &entity) {
  workers_->submit([this, id = entity.id, address = entity.value] {
    ++stats_.lookups;
    auto result = reverse_lookup_(address);
    if (!result) {
      LOG_DEBUG("No reverse name for {}: {}", address,
                enrich::to_str(result.status()));
      return;
    }
    ledger_.registry().add_reverse_name(id, *result);
    LOG_DEBUG("Reverse name of {} is {}", address, *result);
  });
}

void IngestionPipeline::schedule_probe(const ledger::AddressEntity &entity) {
  workers_->submit([this, id = entity.id, address = entity.value] {
    ++stats_.probes;
    // A failing probe still counts as the one attempt for this address
    auto result =
        enrich::Result<net::MacAddress>::failure(enrich::Status::Unknown);
    try {
      result = liveness_probe_(address);
    } catch (const std::exception &e) {
      LOG_WARN("Liveness probe of {} failed: {}", address, e.what());
    }

    std::optional<std::string> mac{};
    if (result) {
      mac = net::mac_to_string(*result);
    } else if (result.status() == enrich::Status::Socket) {
      LOG_WARN("{} could not be probed, it is recorded as unresponsive",
               address);
    } else {
      LOG_DEBUG("{} did not answer the liveness probe: {}", address,
                enrich::to_str(result.status()));
    }
    ledger_.registry().record_probe_result(id, mac);
  });
}

} // namespace whohas::ingest
