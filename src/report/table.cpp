#include "table.hpp"

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace whohas::report {

namespace {

constexpr std::string_view SEPARATOR{"  "};

// Length of the UTF-8 sequence introduced by lead, and its payload bits
std::pair<std::size_t, uint32_t> utf8_lead(unsigned char lead) {
  if (lead < 0x80) {
    return {1, lead};
  }
  if ((lead & 0xE0) == 0xC0) {
    return {2, lead & 0x1Fu};
  }
  if ((lead & 0xF0) == 0xE0) {
    return {3, lead & 0x0Fu};
  }
  if ((lead & 0xF8) == 0xF0) {
    return {4, lead & 0x07u};
  }
  // Stray continuation byte: count it as one column
  return {1, lead};
}

} // namespace

std::size_t display_width(std::string_view text) {
  std::size_t width = 0;
  std::size_t i = 0;
  while (i < text.size()) {
    auto [length, code_point] = utf8_lead(static_cast<unsigned char>(text[i]));
    for (std::size_t j = 1; j < length && i + j < text.size(); ++j) {
      code_point = (code_point << 6) |
                   (static_cast<unsigned char>(text[i + j]) & 0x3Fu);
    }
    width += code_point >= 0x1F000 ? 2 : 1;
    i += length;
  }
  return width;
}

Table::Table(std::vector<Column> columns) : columns_(std::move(columns)) {}

void Table::add_row(std::vector<std::string> cells, std::optional<Style> style) {
  if (cells.size() != columns_.size()) {
    throw std::invalid_argument("Table row does not match the column count");
  }
  rows_.push_back(Row{.cells = std::move(cells), .style = style});
}

std::string Table::render(std::optional<Style> header_style) const {
  std::vector<std::size_t> widths(columns_.size());
  std::vector<std::string> headers;
  headers.reserve(columns_.size());
  for (std::size_t i = 0; i < columns_.size(); ++i) {
    widths[i] = display_width(columns_[i].header);
    headers.push_back(columns_[i].header);
  }
  for (const auto &row : rows_) {
    for (std::size_t i = 0; i < row.cells.size(); ++i) {
      widths[i] = std::max(widths[i], display_width(row.cells[i]));
    }
  }

  std::string out;
  render_line(out, headers, header_style, widths);

  std::vector<std::string> rule;
  rule.reserve(widths.size());
  for (auto width : widths) {
    rule.emplace_back(width, '-');
  }
  render_line(out, rule, std::nullopt, widths);

  for (const auto &row : rows_) {
    render_line(out, row.cells, row.style, widths);
  }
  return out;
}

void Table::render_line(std::string &out, const std::vector<std::string> &cells,
                        const std::optional<Style> &style,
                        const std::vector<std::size_t> &widths) const {
  std::string line;
  for (std::size_t i = 0; i < cells.size(); ++i) {
    if (i != 0) {
      line += SEPARATOR;
    }
    const std::string padding(widths[i] - display_width(cells[i]), ' ');
    const std::string text = style ? style->apply(cells[i]) : cells[i];
    if (columns_[i].align == Align::Right) {
      line += padding;
      line += text;
    } else {
      line += text;
      line += padding;
    }
  }

  // Empty trailing cells would otherwise leave a run of blanks
  auto end = line.find_last_not_of(' ');
  line.erase(end == std::string::npos ? 0 : end + 1);
  out += line;
  out += '\n';
}

} // namespace whohas::report
