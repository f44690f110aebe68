#pragma once

#include "frame.hpp"
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <pcap/pcap.h>

namespace whohas::capture {

inline constexpr int PCAP_LINKTYPE_ETHERNET{DLT_EN10MB};

/**
 * @brief Reads the frames of a pcap capture file through libpcap
 *
 * Timestamps keep nanosecond precision when the file has it. Only Ethernet
 * captures can be read.
 */
class PcapReader {
public:
  /**
   * @brief Open a capture file
   *
   * @throws FileNotFound if the file does not exist
   * @throws CaptureError if libpcap rejects the file or it is not Ethernet
   */
  explicit PcapReader(const std::filesystem::path &path);

  PcapReader(const PcapReader &) = delete;
  PcapReader &operator=(const PcapReader &) = delete;

  /**
   * @brief Read the next frame
   *
   * The timeout is ignored: a file never makes the caller wait.
   *
   * @return ReadStatus::Frame, or ReadStatus::EndOfInput after the last frame
   *
   * @throws CaptureError if a record is truncated or corrupt
   */
  ReadStatus read(Frame &frame,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds{0});

  std::size_t frames_read() const { return frames_read_; }

private:
  struct HandleCloser {
    void operator()(pcap_t *handle) const { pcap_close(handle); }
  };

  std::filesystem::path path_;
  std::unique_ptr<pcap_t, HandleCloser> handle_{};
  std::size_t frames_read_{0};
};

/**
 * @brief Appends Ethernet frames to a pcap file (microsecond timestamps)
 */
class PcapWriter {
public:
  /**
   * @brief Open a capture file for appending; libpcap writes the file header
   * when the file is new
   *
   * @throws CaptureError if the file cannot be opened or holds an
   * incompatible capture
   */
  explicit PcapWriter(const std::filesystem::path &path);

  PcapWriter(const PcapWriter &) = delete;
  PcapWriter &operator=(const PcapWriter &) = delete;

  void write(const Frame &frame);

  /**
   * @throws CaptureError if the buffered records cannot be written out
   */
  void flush();

private:
  struct HandleCloser {
    void operator()(pcap_t *handle) const { pcap_close(handle); }
  };
  struct DumperCloser {
    void operator()(pcap_dumper_t *dumper) const { pcap_dump_close(dumper); }
  };

  std::filesystem::path path_;
  // Declared before dumper_ so that the dumper closes first
  std::unique_ptr<pcap_t, HandleCloser> handle_{};
  std::unique_ptr<pcap_dumper_t, DumperCloser> dumper_{};
};

} // namespace whohas::capture
