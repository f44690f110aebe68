#include "capture/pcap_file.hpp"
#include "error.hpp"
#include "helpers.hpp"
#include "ingest/session.hpp"
#include <doctest/doctest.h>
#include <filesystem>
#include <vector>

namespace session {
using namespace whohas;
using namespace whohas::ingest;

void add(ledger::Ledger &ledger, std::string_view sender,
         std::string_view target, uint64_t count) {
  auto s = ledger.registry().resolve_or_create(sender).entity;
  auto t = ledger.registry().resolve_or_create(target).entity;
  ledger.transactions().add(s, t, count);
}

// A ledger file holding a single (sender, target) transaction
void make_ledger(const std::filesystem::path &path, std::string_view sender,
                 std::string_view target, uint64_t count) {
  ledger::Ledger ledger(path, storage::OpenMode::overwrite);
  add(ledger, sender, target, count);
}

uint64_t total_requests(const std::filesystem::path &path) {
  const ledger::Ledger ledger(path, storage::OpenMode::existing);
  uint64_t total = 0;
  for (const auto &row : ledger.transactions().rows()) {
    total += row.count;
  }
  return total;
}

TEST_CASE("Analysis::ledgers and captures are combined") {
  testing::TempDir dir;
  make_ledger(dir / "monday.db", "10.0.0.1", "10.0.0.2", 3);
  make_ledger(dir / "tuesday.db", "10.0.0.1", "10.0.0.2", 2);
  {
    capture::PcapWriter writer(dir / "wednesday.pcap");
    writer.write(testing::request_frame("10.0.0.1", "10.0.0.2"));
    writer.write(testing::request_frame("10.0.0.5", "10.0.0.6"));
    writer.write(testing::request_frame("10.0.0.9", "10.0.0.6"));
  }

  filter::AddressPolicy senders{};
  senders.deny.add("10.0.0.9");

  auto output = analyze(dir / "merged.db",
                        {dir / "monday.db", dir / "tuesday.db"},
                        {dir / "wednesday.pcap"},
                        filter::EventFilter(senders, std::nullopt),
                        AnalysisOptions{.batch_size = 2});

  auto rows = output.transactions().rows();
  REQUIRE(rows.size() == 2);
  CHECK(rows[0].sender.value == "10.0.0.1");
  CHECK(rows[0].count == 6);
  CHECK(rows[1].sender.value == "10.0.0.5");
  CHECK(rows[1].count == 1);
  CHECK_FALSE(output.registry().find("10.0.0.9").has_value());
}

TEST_CASE("Analysis::an unusable input leaves the output untouched") {
  testing::TempDir dir;
  const auto output = dir / "merged.db";
  make_ledger(output, "10.1.1.1", "10.1.1.2", 7);
  make_ledger(dir / "good.db", "10.0.0.1", "10.0.0.2", 3);
  std::filesystem::create_directory(dir / "folder");

  SUBCASE("directory given as a ledger") {
    CHECK_THROWS_AS((void)analyze(output, {dir / "good.db", dir / "folder"},
                                  {}, {}, {}),
                    FileNotFound);
  }
  SUBCASE("missing ledger") {
    CHECK_THROWS_AS((void)analyze(output, {dir / "good.db", dir / "gone.db"},
                                  {}, {}, {}),
                    FileNotFound);
  }
  SUBCASE("missing capture") {
    CHECK_THROWS_AS(
        (void)analyze(output, {dir / "good.db"}, {dir / "gone.pcap"}, {}, {}),
        FileNotFound);
  }
  SUBCASE("directory given as a capture") {
    CHECK_THROWS_AS(
        (void)analyze(output, {dir / "good.db"}, {dir / "folder"}, {}, {}),
        FileNotFound);
  }

  REQUIRE(std::filesystem::is_regular_file(output));
  CHECK(total_requests(output) == 7);
}

TEST_CASE("Analysis::the output cannot also be an input") {
  testing::TempDir dir;
  const auto output = dir / "merged.db";
  make_ledger(output, "10.1.1.1", "10.1.1.2", 4);

  CHECK_THROWS_AS((void)analyze(output, {output}, {}, {}, {}),
                  ConfigurationError);
  CHECK(total_requests(output) == 4);
}

TEST_CASE("Analysis::names without a resolver are rejected up front") {
  testing::TempDir dir;
  const auto output = dir / "merged.db";
  make_ledger(output, "10.1.1.1", "10.1.1.2", 4);

  CHECK_THROWS_AS((void)analyze(output, {}, {}, {},
                                AnalysisOptions{.resolve_names = true}),
                  ConfigurationError);
  CHECK(total_requests(output) == 4);
}

} // namespace session
