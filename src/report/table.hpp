#pragma once

#include "color_profile.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace whohas::report {

enum class Align { Left, Right };

struct Column {
  std::string header;
  Align align{Align::Left};
};

/**
 * @brief Number of terminal columns text occupies
 *
 * Counts UTF-8 code points; pictographs (U+1F000 and above) take two columns.
 */
std::size_t display_width(std::string_view text);

/**
 * @brief A plain text table with optional per-row styling
 *
 * Columns are separated by two spaces and the header is underlined by a
 * dashed rule. Widths come from the unstyled text, so styling never shifts
 * the layout.
 */
class Table {
public:
  explicit Table(std::vector<Column> columns);

  /**
   * @throws std::invalid_argument if the row does not have one cell per column
   */
  void add_row(std::vector<std::string> cells,
               std::optional<Style> style = std::nullopt);

  std::string render(std::optional<Style> header_style = std::nullopt) const;

  std::size_t rows() const { return rows_.size(); }

private:
  struct Row {
    std::vector<std::string> cells;
    std::optional<Style> style;
  };

  void render_line(std::string &out, const std::vector<std::string> &cells,
                   const std::optional<Style> &style,
                   const std::vector<std::size_t> &widths) const;

  std::vector<Column> columns_;
  std::vector<Row> rows_{};
};

} // namespace whohas::report
