#include "capture/pcap_file.hpp"
#include "error.hpp"
#include "helpers.hpp"
#include "net/arp_frame.hpp"
#include <doctest/doctest.h>
#include <array>
#include <cstdint>
#include <fstream>
#include <vector>

namespace pcap_file {
using namespace whohas;
using namespace whohas::capture;

void write_bytes(const std::filesystem::path &path,
                 const std::vector<uint8_t> &bytes) {
  std::ofstream output(path, std::ios::binary | std::ios::trunc);
  output.write(reinterpret_cast<const char *>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
}

// Classic pcap global header, big-endian, nanosecond magic
std::vector<uint8_t> big_endian_header(uint32_t linktype) {
  return {0xa1, 0xb2, 0x3c, 0x4d, 0x00, 0x02, 0x00, 0x04,
          0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
          0x00, 0x00, 0xff, 0xff, 0x00, 0x00, 0x00,
          static_cast<uint8_t>(linktype)};
}

TEST_CASE("Pcap::written frames read back in order") {
  testing::TempDir dir;
  const auto path = dir / "capture.pcap";

  auto first = testing::request_frame("10.0.0.1", "10.0.0.2");
  first.timestamp = std::chrono::system_clock::time_point(
      std::chrono::seconds(1700000000) + std::chrono::microseconds(250));
  auto second = testing::request_frame("10.0.0.3", "10.0.0.4");
  {
    PcapWriter writer(path);
    writer.write(first);
    writer.write(second);
  }

  PcapReader reader(path);
  Frame frame{};
  REQUIRE(reader.read(frame) == ReadStatus::Frame);
  CHECK(frame.data == first.data);
  CHECK(frame.timestamp == first.timestamp);
  CHECK(frame.original_length == net::ARP_FRAME_SIZE);

  REQUIRE(reader.read(frame) == ReadStatus::Frame);
  CHECK(net::decode_request(frame.data).event->sender == "10.0.0.3");

  CHECK(reader.read(frame) == ReadStatus::EndOfInput);
  CHECK(reader.frames_read() == 2);
}

TEST_CASE("Pcap::writer appends to an existing capture") {
  testing::TempDir dir;
  const auto path = dir / "capture.pcap";
  {
    PcapWriter writer(path);
    writer.write(testing::request_frame("10.0.0.1", "10.0.0.2"));
  }
  {
    PcapWriter writer(path);
    writer.write(testing::request_frame("10.0.0.1", "10.0.0.3"));
  }

  PcapReader reader(path);
  Frame frame{};
  int frames = 0;
  while (reader.read(frame) == ReadStatus::Frame) {
    ++frames;
  }
  CHECK(frames == 2);
}

TEST_CASE("Pcap::flushed frames are readable while the writer stays open") {
  testing::TempDir dir;
  const auto path = dir / "live.pcap";

  PcapWriter writer(path);
  writer.write(testing::request_frame("10.0.0.1", "10.0.0.2"));
  writer.flush();

  PcapReader reader(path);
  Frame frame{};
  REQUIRE(reader.read(frame) == ReadStatus::Frame);
  CHECK(net::decode_request(frame.data).event->target == "10.0.0.2");
  CHECK(reader.read(frame) == ReadStatus::EndOfInput);
}

TEST_CASE("Pcap::writer refuses a file that is not a capture") {
  testing::TempDir dir;
  const auto path = dir / "notes.pcap";
  testing::write_text(path, "these are not packets, just some notes\n");
  CHECK_THROWS_AS(PcapWriter{path}, CaptureError);
}

TEST_CASE("Pcap::big-endian nanosecond captures are read") {
  testing::TempDir dir;
  const auto path = dir / "big.pcap";

  auto bytes = big_endian_header(PCAP_LINKTYPE_ETHERNET);
  auto frame_data = testing::request_frame("10.9.8.7", "10.9.8.1").data;
  // ts_sec = 1, ts_nsec = 500, incl_len = orig_len = 42
  const std::array<uint8_t, 16> record{0, 0, 0, 1, 0, 0, 0x01, 0xf4,
                                       0, 0, 0, 42, 0, 0, 0, 42};
  bytes.insert(bytes.end(), record.begin(), record.end());
  for (auto b : frame_data) {
    bytes.push_back(static_cast<uint8_t>(b));
  }
  write_bytes(path, bytes);

  PcapReader reader(path);
  Frame frame{};
  REQUIRE(reader.read(frame) == ReadStatus::Frame);
  CHECK(frame.data == frame_data);
  CHECK(frame.timestamp.time_since_epoch() ==
        std::chrono::seconds(1) + std::chrono::nanoseconds(500));
  CHECK(net::decode_request(frame.data).event->target == "10.9.8.1");
}

TEST_CASE("Pcap::missing file is not found") {
  testing::TempDir dir;
  CHECK_THROWS_AS(PcapReader(dir / "nope.pcap"), FileNotFound);
}

TEST_CASE("Pcap::malformed files are capture errors") {
  testing::TempDir dir;
  const auto path = dir / "bad.pcap";

  SUBCASE("too short") {
    write_bytes(path, {0xd4, 0xc3});
    CHECK_THROWS_AS(PcapReader{path}, CaptureError);
  }
  SUBCASE("wrong magic") {
    std::vector<uint8_t> bytes(24, 0);
    write_bytes(path, bytes);
    CHECK_THROWS_AS(PcapReader{path}, CaptureError);
  }
  SUBCASE("not Ethernet") {
    write_bytes(path, big_endian_header(113));
    CHECK_THROWS_AS(PcapReader{path}, CaptureError);
  }
  SUBCASE("truncated record") {
    auto bytes = big_endian_header(PCAP_LINKTYPE_ETHERNET);
    const std::array<uint8_t, 16> record{0, 0, 0, 1, 0, 0, 0, 0,
                                         0, 0, 0, 42, 0, 0, 0, 42};
    bytes.insert(bytes.end(), record.begin(), record.end());
    bytes.resize(bytes.size() + 10, 0);
    write_bytes(path, bytes);

    PcapReader reader(path);
    Frame frame{};
    CHECK_THROWS_AS(reader.read(frame), CaptureError);
  }
}

} // namespace pcap_file
