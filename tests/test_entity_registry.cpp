#include "ledger/ledger.hpp"
#include <doctest/doctest.h>
#include <atomic>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace entity_registry {
using namespace whohas::ledger;

TEST_CASE("Entity Registry::first resolve creates the entity") {
  auto ledger = Ledger::in_memory();
  auto [entity, created] = ledger.registry().resolve_or_create("10.0.0.1");

  CHECK(created);
  CHECK(entity.value == "10.0.0.1");
  CHECK_FALSE(entity.mac_address.has_value());
  CHECK_FALSE(entity.resolve_attempted);
  CHECK_FALSE(entity.is_unresponsive());
  CHECK(ledger.registry().size() == 1);
}

TEST_CASE("Entity Registry::repeated resolves return the same entity") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();

  auto first = registry.resolve_or_create("10.0.0.1");
  auto second = registry.resolve_or_create("10.0.0.1");
  auto other = registry.resolve_or_create("10.0.0.2");

  CHECK(first.created);
  CHECK_FALSE(second.created);
  CHECK(second.entity.id == first.entity.id);
  CHECK(other.entity.id != first.entity.id);
  CHECK(registry.size() == 2);
}

TEST_CASE("Entity Registry::empty address is rejected") {
  auto ledger = Ledger::in_memory();
  CHECK_THROWS_AS((void)ledger.registry().resolve_or_create(""),
                  std::invalid_argument);
  CHECK(ledger.registry().size() == 0);
}

TEST_CASE("Entity Registry::find by value and by id") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();
  auto created = registry.resolve_or_create("10.0.0.7").entity;

  auto by_value = registry.find("10.0.0.7");
  REQUIRE(by_value);
  CHECK(by_value->id == created.id);

  auto by_id = registry.find(created.id);
  REQUIRE(by_id);
  CHECK(by_id->value == "10.0.0.7");

  CHECK_FALSE(registry.find("10.0.0.8").has_value());
  CHECK_FALSE(registry.find(created.id + 100).has_value());
}

TEST_CASE("Entity Registry::probe result is recorded only once") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();
  auto entity = registry.resolve_or_create("10.0.0.1").entity;

  CHECK(registry.record_probe_result(entity.id, "aa:bb:cc:dd:ee:ff"));
  CHECK_FALSE(registry.record_probe_result(entity.id, std::nullopt));

  auto stored = registry.find(entity.id);
  REQUIRE(stored);
  CHECK(stored->resolve_attempted);
  CHECK(stored->mac_address == "aa:bb:cc:dd:ee:ff");
  CHECK_FALSE(stored->is_unresponsive());
}

TEST_CASE("Entity Registry::unanswered probe marks the entity unresponsive") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();
  auto entity = registry.resolve_or_create("10.0.0.9").entity;

  CHECK(registry.record_probe_result(entity.id, std::nullopt));

  auto stored = registry.find(entity.id);
  REQUIRE(stored);
  CHECK(stored->resolve_attempted);
  CHECK_FALSE(stored->mac_address.has_value());
  CHECK(stored->is_unresponsive());
}

TEST_CASE("Entity Registry::first reverse name is canonical") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();
  auto entity = registry.resolve_or_create("10.0.0.1").entity;

  CHECK_FALSE(registry.reverse_name(entity.id).has_value());
  CHECK(registry.add_reverse_name(entity.id, "gw.example.net"));
  CHECK_FALSE(registry.add_reverse_name(entity.id, "other.example.net"));
  CHECK(registry.reverse_name(entity.id) == "gw.example.net");
}

TEST_CASE("Entity Registry::concurrent creation happens exactly once") {
  auto ledger = Ledger::in_memory();
  auto &registry = ledger.registry();

  constexpr int THREADS = 8;
  constexpr int ADDRESSES = 40;
  std::atomic<int> created{0};
  std::vector<std::vector<entity_id_t>> ids(THREADS);

  std::vector<std::thread> threads;
  for (int t = 0; t < THREADS; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < ADDRESSES; ++i) {
        auto result =
            registry.resolve_or_create("10.1.0." + std::to_string(i));
        if (result.created) {
          ++created;
        }
        ids[t].push_back(result.entity.id);
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }

  CHECK(created.load() == ADDRESSES);
  CHECK(registry.size() == ADDRESSES);
  for (int t = 1; t < THREADS; ++t) {
    CHECK(ids[t] == ids[0]);
  }
  CHECK(std::set<entity_id_t>(ids[0].begin(), ids[0].end()).size() ==
        ADDRESSES);
}

} // namespace entity_registry
