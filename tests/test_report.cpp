#include "ledger/ledger.hpp"
#include "report/color_profile.hpp"
#include "report/report_builder.hpp"
#include "report/table.hpp"
#include <doctest/doctest.h>
#include <algorithm>
#include <string>

namespace reporting {
using namespace whohas;
using namespace whohas::report;

struct Fixture {
  ledger::Ledger ledger = ledger::Ledger::in_memory();

  ledger::AddressEntity entity(std::string_view address) {
    return ledger.registry().resolve_or_create(address).entity;
  }

  void add(std::string_view sender, std::string_view target,
           uint64_t count = 1) {
    ledger.transactions().add(entity(sender), entity(target), count);
  }
};

TEST_CASE_FIXTURE(Fixture, "Report Builder::empty ledger shows a message") {
  CHECK(build_report(ledger, {}) == NO_RECORDS_MESSAGE);
  CHECK(build_report(ledger, {.liveness = true, .reverse_names = true}) ==
        NO_RECORDS_MESSAGE);
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::rows are grouped by sender") {
  add("10.0.0.1", "10.0.0.2");
  add("10.0.0.1", "10.0.0.2");
  add("10.0.0.1", "10.0.0.3");

  CHECK(build_report(ledger, {}) == "Sender    Target    ARP#\n"
                                    "--------  --------  ----\n"
                                    "10.0.0.1  10.0.0.2     2\n"
                                    "          10.0.0.3     1\n");
}

TEST_CASE_FIXTURE(Fixture,
                  "Report Builder::a sender's rows stay together") {
  add("10.0.0.1", "10.0.0.2", 5);
  add("10.0.0.3", "10.0.0.4", 3);
  add("10.0.0.1", "10.0.0.5", 1);

  auto groups = group_by_sender(ledger.transactions().rows());
  REQUIRE(groups.size() == 2);
  CHECK(groups[0].sender == "10.0.0.1");
  REQUIRE(groups[0].rows.size() == 2);
  CHECK(groups[0].rows[0].target.value == "10.0.0.2");
  CHECK(groups[0].rows[1].target.value == "10.0.0.5");
  CHECK(groups[1].sender == "10.0.0.3");

  CHECK(build_report(ledger, {}) == "Sender    Target    ARP#\n"
                                    "--------  --------  ----\n"
                                    "10.0.0.1  10.0.0.2     5\n"
                                    "          10.0.0.5     1\n"
                                    "10.0.0.3  10.0.0.4     3\n");
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::unresponsive targets are flagged") {
  add("10.0.0.1", "10.0.0.4");
  add("10.0.0.1", "10.0.0.5");
  ledger.registry().record_probe_result(entity("10.0.0.4").id, std::nullopt);
  ledger.registry().record_probe_result(entity("10.0.0.5").id,
                                        "02:00:00:00:00:05");

  CHECK(build_report(ledger, {.liveness = true}) ==
        "Sender    Target    TS  ARP#\n"
        "--------  --------  --  ----\n"
        "10.0.0.1  10.0.0.4  X      1\n"
        "          10.0.0.5         1\n");

  // Without liveness mode the column is gone
  CHECK(build_report(ledger, {}).find(" X ") == std::string::npos);
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::never probed is not stale") {
  add("10.0.0.1", "10.0.0.4");
  auto report = build_report(ledger, {.liveness = true});
  CHECK(report.find('X') == std::string::npos);
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::reverse names columns") {
  add("10.0.0.1", "10.0.0.2", 2);
  add("10.0.0.1", "10.0.0.3", 1);
  ledger.registry().add_reverse_name(entity("10.0.0.1").id, "a.lan");
  ledger.registry().add_reverse_name(entity("10.0.0.3").id, "c.lan");

  CHECK(build_report(ledger, {.reverse_names = true}) ==
        "Sender    Target    ARP#  Sender PTR  Target PTR\n"
        "--------  --------  ----  ----------  ----------\n"
        "10.0.0.1  10.0.0.2     2  a.lan\n"
        "          10.0.0.3     1              c.lan\n");
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::render-time filter narrows rows") {
  add("10.0.0.1", "10.0.0.2", 2);
  add("10.0.0.3", "10.0.0.2", 1);

  filter::AddressPolicy senders{};
  senders.allow.add("10.0.0.3/32");
  ReportOptions options{.filter = filter::EventFilter(senders, std::nullopt)};

  auto report = build_report(ledger, options);
  CHECK(report.find("10.0.0.1") == std::string::npos);
  CHECK(report.find("10.0.0.3") != std::string::npos);

  // The ledger itself is untouched
  CHECK(ledger.transactions().size() == 2);

  filter::AddressPolicy nobody{};
  nobody.deny.add("0.0.0.0/0");
  options.filter = filter::EventFilter(nobody, std::nullopt);
  CHECK(build_report(ledger, options) == NO_RECORDS_MESSAGE);
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::groups alternate styles") {
  add("10.0.0.1", "10.0.0.2", 3);
  add("10.0.0.3", "10.0.0.2", 2);
  add("10.0.0.5", "10.0.0.2", 1);

  const ColorProfiles profiles;
  const auto *profile = profiles.find("default");
  REQUIRE(profile != nullptr);
  auto report = build_report(ledger, {.profile = profile});

  const std::string header = "\x1b[38;5;254m\x1b[1mSender\x1b[0m";
  const std::string odd = "\x1b[38;5;244m10.0.0.1\x1b[0m";
  const std::string even = "\x1b[38;5;254m10.0.0.3\x1b[0m";
  const std::string third = "\x1b[38;5;244m10.0.0.5\x1b[0m";
  CHECK(report.rfind(header, 0) == 0);
  CHECK(report.find(odd) != std::string::npos);
  CHECK(report.find(even) != std::string::npos);
  CHECK(report.find(third) != std::string::npos);
}

TEST_CASE_FIXTURE(Fixture, "Report Builder::novelty profiles use an emoji") {
  add("10.0.0.1", "10.0.0.4");
  ledger.registry().record_probe_result(entity("10.0.0.4").id, std::nullopt);

  const ColorProfiles profiles;
  auto report =
      build_report(ledger, {.liveness = true, .profile = profiles.find("poo")});
  CHECK(report.find("\U0001F4A9") != std::string::npos);
  CHECK(report.find("X") == std::string::npos);
}

TEST_CASE("Color Profiles::known names") {
  const ColorProfiles profiles;

  CHECK(profiles.contains("disable"));
  CHECK(profiles.find("disable") == nullptr);
  CHECK_FALSE(profiles.contains("neon"));
  CHECK(profiles.find("neon") == nullptr);

  auto names = profiles.names();
  CHECK(names.size() == 10);
  for (const auto *name : {"default", "1337", "agent_orange", "evil", "cobalt",
                           "cupcake", "poo", "foxhound", "rhino"}) {
    INFO(name);
    REQUIRE(profiles.find(name) != nullptr);
    CHECK(profiles.find(name)->header.bold);
  }
  CHECK_FALSE(profiles.find("default")->stale_marker.has_value());
  CHECK(profiles.find("rhino")->stale_marker.has_value());
}

TEST_CASE("Color Profiles::styles wrap non-empty text only") {
  Style style{.color = 28};
  CHECK(style.apply("hi") == "\x1b[38;5;28mhi\x1b[0m");
  CHECK(style.apply("").empty());

  Style bold{.color = 9, .bold = true};
  CHECK(bold.apply("hi") == "\x1b[38;5;9m\x1b[1mhi\x1b[0m");
}

TEST_CASE("Table::display width counts emoji as two columns") {
  CHECK(display_width("") == 0);
  CHECK(display_width("10.0.0.1") == 8);
  CHECK(display_width("été") == 3);
  CHECK(display_width("\U0001F984") == 2);
  CHECK(display_width("a\U0001F98Ab") == 4);
}

TEST_CASE("Table::right-aligned columns and styled rows keep the layout") {
  Table table({{"Name"}, {"N", Align::Right}});
  table.add_row({"a", "10"});
  table.add_row({"bbbbb", "7"}, Style{.color = 1});

  auto text = table.render();
  CHECK(text == "Name    N\n"
                "-----  --\n"
                "a      10\n"
                "\x1b[38;5;1mbbbbb\x1b[0m   \x1b[38;5;1m7\x1b[0m\n");
}

TEST_CASE("Table::rows must match the columns") {
  Table table({{"A"}, {"B"}});
  CHECK_THROWS_AS(table.add_row({"only one"}), std::invalid_argument);
}

} // namespace reporting
