#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whohas::report {

// 256-colour ANSI foreground, optionally bold
struct Style {
  [[nodiscard]] std::string apply(std::string_view text) const;

  uint8_t color{};
  bool bold{false};
};

struct ColorProfile {
  Style even;
  Style odd;
  Style header;
  // Shown in the liveness column for unresponsive targets instead of "X"
  std::optional<std::string> stale_marker{};
};

inline constexpr std::string_view DEFAULT_STALE_MARKER{"X"};
inline constexpr std::string_view DISABLED_PROFILE{"disable"};
inline constexpr std::string_view DEFAULT_PROFILE{"default"};

/**
 * @brief The named colour profiles a report can be styled with
 *
 * Built once and never modified afterwards. The "disable" profile is known
 * but maps to no style at all.
 */
class ColorProfiles {
public:
  ColorProfiles();

  /**
   * @brief Look up a profile by name
   *
   * @return nullptr for "disable" and for unknown names; use contains() to
   * tell them apart
   */
  const ColorProfile *find(std::string_view name) const;

  bool contains(std::string_view name) const;

  std::vector<std::string> names() const;

private:
  std::map<std::string, std::optional<ColorProfile>, std::less<>> profiles_;
};

} // namespace whohas::report
