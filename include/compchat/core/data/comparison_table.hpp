// File: include/compchat/core/data/comparison_table.hpp
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Zero, one or several scalar values. Dates stay as their ISO text; the
// reasoning backend is told to parse them.
struct Cell {
  std::vector<std::string> values;

  [[nodiscard]] bool empty() const noexcept { return values.empty(); }
  [[nodiscard]] bool multi_valued() const noexcept { return values.size() > 1; }

  // Values joined with "; ". Empty cell renders as "".
  [[nodiscard]] std::string joined() const;
};

struct TableShape {
  std::size_t rows = 0;              // properties
  std::size_t cols = 0;              // items
  std::size_t filled_cells = 0;
  std::size_t multi_valued_cells = 0;
  std::size_t rendered_chars = 0;    // size of the full markdown rendering
};

// Rows are properties, columns are the compared items (contributions).
// Immutable once built; a session owns its copy for the whole query.
class ComparisonTable {
 public:
  ComparisonTable() = default;

  // Returns invalid_argument if the grid does not match the label counts.
  static Result<ComparisonTable> create(DatasetId id,
                                        std::string title,
                                        std::vector<std::string> row_labels,
                                        std::vector<std::string> column_labels,
                                        std::vector<std::vector<Cell>> cells);

  [[nodiscard]] const DatasetId& id() const noexcept { return id_; }
  [[nodiscard]] const std::string& title() const noexcept { return title_; }

  [[nodiscard]] std::size_t rows() const noexcept { return row_labels_.size(); }
  [[nodiscard]] std::size_t cols() const noexcept { return column_labels_.size(); }
  [[nodiscard]] bool empty() const noexcept { return rows() == 0 || cols() == 0; }

  [[nodiscard]] const std::vector<std::string>& row_labels() const noexcept { return row_labels_; }
  [[nodiscard]] const std::vector<std::string>& column_labels() const noexcept { return column_labels_; }

  [[nodiscard]] const Cell& at(std::size_t r, std::size_t c) const { return cells_.at(r).at(c); }

  // Lookup by labels; not_found if either label is missing.
  [[nodiscard]] Result<Cell> find(const std::string& row_label, const std::string& column_label) const;

  [[nodiscard]] TableShape shape() const;

  // Items become rows, properties become columns.
  [[nodiscard]] ComparisonTable transposed() const;

  // Markdown grid. max_rows == 0 renders every row.
  [[nodiscard]] std::string to_markdown(std::size_t max_rows = 0) const;

  // {item: {property: null | "v" | ["v1", "v2"]}}
  [[nodiscard]] nlohmann::json to_document() const;

 private:
  DatasetId id_;
  std::string title_;
  std::vector<std::string> row_labels_;
  std::vector<std::string> column_labels_;
  std::vector<std::vector<Cell>> cells_;  // [row][col]
};

// Read-only navigation over a structured document, in the shape of the
// list-keys / get-value tools a structured reasoning backend is given.
// Paths look like "/item/property"; "" or "/" is the root.
class DocumentView {
 public:
  DocumentView(nlohmann::json doc, std::size_t max_value_length);

  [[nodiscard]] std::size_t max_value_length() const noexcept { return max_value_length_; }
  [[nodiscard]] const nlohmann::json& document() const noexcept { return doc_; }

  // Keys of the object at `path`; invalid_argument if it is not an object.
  Result<std::vector<std::string>> list_keys(const std::string& path) const;

  // Serialized value at `path`, cut to max_value_length with a "..." suffix.
  Result<std::string> get_value(const std::string& path) const;

 private:
  Result<const nlohmann::json*> resolve(const std::string& path) const;

  nlohmann::json doc_;
  std::size_t max_value_length_;
};

}  // namespace compchat
