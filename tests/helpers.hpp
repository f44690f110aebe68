#pragma once

#include "capture/frame.hpp"
#include "net/address.hpp"
#include "net/arp_frame.hpp"
#include <atomic>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>

namespace whohas::testing {

// A fresh directory under the system temp dir, removed with everything in it
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    path_ = std::filesystem::temp_directory_path() /
            ("whohas-test-" + std::to_string(rd()) + "-" +
             std::to_string(counter_++));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  std::filesystem::path operator/(std::string_view name) const {
    return path_ / name;
  }

  const std::filesystem::path &path() const { return path_; }

private:
  inline static std::atomic<unsigned> counter_{0};
  std::filesystem::path path_;
};

inline void write_text(const std::filesystem::path &path, std::string_view text) {
  std::ofstream output(path, std::ios::trunc);
  output << text;
}

inline constexpr net::MacAddress TEST_MAC{0x02, 0x00, 0x00, 0x00, 0x00, 0x01};

// A well-formed broadcast who-has from sender asking for target
inline capture::Frame request_frame(std::string_view sender,
                                    std::string_view target) {
  auto raw = net::build_request(TEST_MAC, *net::parse_ipv4(sender),
                                *net::parse_ipv4(target));
  capture::Frame frame{};
  frame.data.assign(raw.begin(), raw.end());
  frame.original_length = static_cast<uint32_t>(raw.size());
  return frame;
}

} // namespace whohas::testing
