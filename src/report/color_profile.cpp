#include "color_profile.hpp"

#include <fmt/format.h>
#include <utility>

namespace whohas::report {

namespace {

constexpr std::string_view BOLD{"\x1b[1m"};
constexpr std::string_view RESET{"\x1b[0m"};

ColorProfile make_profile(uint8_t even, uint8_t odd, uint8_t header,
                          std::optional<std::string> marker = std::nullopt) {
  return ColorProfile{.even = Style{.color = even},
                      .odd = Style{.color = odd},
                      .header = Style{.color = header, .bold = true},
                      .stale_marker = std::move(marker)};
}

} // namespace

std::string Style::apply(std::string_view text) const {
  if (text.empty()) {
    return {};
  }
  return fmt::format("\x1b[38;5;{}m{}{}{}", color, bold ? BOLD : "", text,
                     RESET);
}

ColorProfiles::ColorProfiles() {
  profiles_.emplace(DISABLED_PROFILE, std::nullopt);

  profiles_.emplace(DEFAULT_PROFILE, make_profile(254, 244, 254));
  profiles_.emplace("1337", make_profile(28, 118, 28));
  profiles_.emplace("agent_orange", make_profile(166, 179, 166));
  profiles_.emplace("evil", make_profile(124, 9, 9));
  profiles_.emplace("cobalt", make_profile(245, 26, 245));

  // Novelty profiles
  profiles_.emplace("cupcake", make_profile(104, 164, 104, "\U0001F984"));
  profiles_.emplace("poo", make_profile(136, 94, 136, "\U0001F4A9"));
  profiles_.emplace("foxhound", make_profile(166, 179, 166, "\U0001F98A"));
  profiles_.emplace("rhino", make_profile(254, 244, 254, "\U0001F98F"));
}

const ColorProfile *ColorProfiles::find(std::string_view name) const {
  auto it = profiles_.find(name);
  if (it == profiles_.end() || !it->second) {
    return nullptr;
  }
  return &*it->second;
}

bool ColorProfiles::contains(std::string_view name) const {
  return profiles_.find(name) != profiles_.end();
}

std::vector<std::string> ColorProfiles::names() const {
  std::vector<std::string> names;
  names.reserve(profiles_.size());
  for (const auto &[name, profile] : profiles_) {
    names.push_back(name);
  }
  return names;
}

} // namespace whohas::report
