#include "pcap_file.hpp"

#include "error.hpp"
#include "logger.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <fmt/format.h>

namespace whohas::capture {

namespace {

constexpr int PCAP_DEFAULT_SNAPLEN = 65535;

} // namespace

PcapReader::PcapReader(const std::filesystem::path &path) : path_(path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw FileNotFound(path.string());
  }

  std::array<char, PCAP_ERRBUF_SIZE> errbuf{};
  // Nanosecond precision: tv_usec then holds nanoseconds for every file
  handle_.reset(pcap_open_offline_with_tstamp_precision(
      path.c_str(), PCAP_TSTAMP_PRECISION_NANO, errbuf.data()));
  if (!handle_) {
    throw CaptureError(fmt::format("{}: {}", path.string(), errbuf.data()));
  }

  if (auto linktype = pcap_datalink(handle_.get());
      linktype != PCAP_LINKTYPE_ETHERNET) {
    throw CaptureError(fmt::format(
        "{}: unsupported link type {}, only Ethernet captures can be read",
        path.string(), linktype));
  }

  LOG_DEBUG("Opened capture file {} (snaplen {})", path.string(),
            pcap_snapshot(handle_.get()));
}

ReadStatus PcapReader::read(Frame &frame, std::chrono::milliseconds) {
  pcap_pkthdr *header = nullptr;
  const u_char *data = nullptr;

  switch (pcap_next_ex(handle_.get(), &header, &data)) {
  case 1:
    break;
  case PCAP_ERROR_BREAK:
    return ReadStatus::EndOfInput;
  default:
    throw CaptureError(fmt::format("{}: bad record after {} frames: {}",
                                   path_.string(), frames_read_,
                                   pcap_geterr(handle_.get())));
  }

  const auto *bytes = reinterpret_cast<const std::byte *>(data);
  frame.data.assign(bytes, bytes + header->caplen);
  frame.timestamp = std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::seconds(header->ts.tv_sec) +
          std::chrono::nanoseconds(header->ts.tv_usec)));
  frame.original_length = header->len;

  ++frames_read_;
  return ReadStatus::Frame;
}

PcapWriter::PcapWriter(const std::filesystem::path &path) : path_(path) {
  handle_.reset(pcap_open_dead_with_tstamp_precision(
      PCAP_LINKTYPE_ETHERNET, PCAP_DEFAULT_SNAPLEN, PCAP_TSTAMP_PRECISION_MICRO));
  if (!handle_) {
    throw CaptureError("Failed to allocate a pcap handle");
  }

  dumper_.reset(pcap_dump_open_append(handle_.get(), path.c_str()));
  if (!dumper_) {
    throw CaptureError(fmt::format("Failed to open {} for writing: {}",
                                   path.string(), pcap_geterr(handle_.get())));
  }
}

void PcapWriter::write(const Frame &frame) {
  const auto since_epoch = frame.timestamp.time_since_epoch();
  const auto seconds =
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto micros =
      std::chrono::duration_cast<std::chrono::microseconds>(since_epoch -
                                                            seconds);
  const auto size = static_cast<bpf_u_int32>(frame.data.size());

  pcap_pkthdr header{};
  header.ts.tv_sec = static_cast<decltype(header.ts.tv_sec)>(seconds.count());
  header.ts.tv_usec = static_cast<decltype(header.ts.tv_usec)>(micros.count());
  header.caplen = size;
  header.len = std::max<bpf_u_int32>(frame.original_length, size);

  pcap_dump(reinterpret_cast<u_char *>(dumper_.get()), &header,
            reinterpret_cast<const u_char *>(frame.data.data()));
}

void PcapWriter::flush() {
  if (pcap_dump_flush(dumper_.get()) != 0) {
    throw CaptureError(fmt::format("Failed to write to {}", path_.string()));
  }
}

} // namespace whohas::capture
