// File: src/core/data/comparison_table.cpp
#include "compchat/core/data/comparison_table.hpp"

#include <sstream>
#include <unordered_set>
#include <utility>

namespace compchat {
namespace {

// Pipes would break the markdown grid.
std::string escape_md(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '|') {
      out += "\\|";
    } else if (c == '\n') {
      out += ' ';
    } else {
      out += c;
    }
  }
  return out;
}

nlohmann::json cell_to_json(const Cell& c) {
  if (c.values.empty()) return nullptr;
  if (c.values.size() == 1) return c.values.front();
  return nlohmann::json(c.values);
}

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> parts;
  std::string cur;
  for (char c : path) {
    if (c == '/') {
      if (!cur.empty()) parts.push_back(cur);
      cur.clear();
    } else {
      cur += c;
    }
  }
  if (!cur.empty()) parts.push_back(cur);
  return parts;
}

// Largest n' <= n that does not split a UTF-8 sequence; requires n < s.size().
std::size_t utf8_boundary(const std::string& s, std::size_t n) {
  while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) --n;
  return n;
}

// Labels become document keys, so they must be unique along each axis.
Status check_unique(const DatasetId& id, const char* axis, const std::vector<std::string>& labels) {
  std::unordered_set<std::string> seen;
  for (const auto& l : labels) {
    if (!seen.insert(l).second) {
      return Status::invalid_argument("table '" + id + "': duplicate " + axis + " label '" + l + "'");
    }
  }
  return Status{};
}

}  // namespace

std::string Cell::joined() const {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) out += "; ";
    out += values[i];
  }
  return out;
}

Result<ComparisonTable> ComparisonTable::create(DatasetId id,
                                                std::string title,
                                                std::vector<std::string> row_labels,
                                                std::vector<std::string> column_labels,
                                                std::vector<std::vector<Cell>> cells) {
  if (cells.size() != row_labels.size()) {
    return Result<ComparisonTable>::err(Status::invalid_argument(
        "table '" + id + "': " + std::to_string(cells.size()) + " cell rows for " +
        std::to_string(row_labels.size()) + " row labels"));
  }
  for (std::size_t r = 0; r < cells.size(); ++r) {
    if (cells[r].size() != column_labels.size()) {
      return Result<ComparisonTable>::err(Status::invalid_argument(
          "table '" + id + "': row '" + row_labels[r] + "' has " +
          std::to_string(cells[r].size()) + " cells, expected " +
          std::to_string(column_labels.size())));
    }
  }
  const Status rows_st = check_unique(id, "row", row_labels);
  if (!rows_st.ok()) return Result<ComparisonTable>::err(rows_st);
  const Status cols_st = check_unique(id, "column", column_labels);
  if (!cols_st.ok()) return Result<ComparisonTable>::err(cols_st);

  ComparisonTable t;
  t.id_ = std::move(id);
  t.title_ = std::move(title);
  t.row_labels_ = std::move(row_labels);
  t.column_labels_ = std::move(column_labels);
  t.cells_ = std::move(cells);
  return Result<ComparisonTable>::ok(std::move(t));
}

Result<Cell> ComparisonTable::find(const std::string& row_label,
                                   const std::string& column_label) const {
  std::size_t r = rows();
  for (std::size_t i = 0; i < rows(); ++i) {
    if (row_labels_[i] == row_label) {
      r = i;
      break;
    }
  }
  if (r == rows()) return Result<Cell>::err(Status::not_found("no row '" + row_label + "'"));

  for (std::size_t c = 0; c < cols(); ++c) {
    if (column_labels_[c] == column_label) return Result<Cell>::ok(cells_[r][c]);
  }
  return Result<Cell>::err(Status::not_found("no column '" + column_label + "'"));
}

TableShape ComparisonTable::shape() const {
  TableShape s;
  s.rows = rows();
  s.cols = cols();
  for (const auto& row : cells_) {
    for (const auto& cell : row) {
      if (!cell.empty()) ++s.filled_cells;
      if (cell.multi_valued()) ++s.multi_valued_cells;
    }
  }
  s.rendered_chars = to_markdown().size();
  return s;
}

ComparisonTable ComparisonTable::transposed() const {
  ComparisonTable t;
  t.id_ = id_;
  t.title_ = title_;
  t.row_labels_ = column_labels_;
  t.column_labels_ = row_labels_;
  t.cells_.assign(cols(), std::vector<Cell>(rows()));
  for (std::size_t r = 0; r < rows(); ++r) {
    for (std::size_t c = 0; c < cols(); ++c) t.cells_[c][r] = cells_[r][c];
  }
  return t;
}

std::string ComparisonTable::to_markdown(std::size_t max_rows) const {
  std::ostringstream ss;

  ss << "| property |";
  for (const auto& col : column_labels_) ss << " " << escape_md(col) << " |";
  ss << "\n|---|";
  for (std::size_t c = 0; c < cols(); ++c) ss << "---|";
  ss << "\n";

  const std::size_t n = (max_rows == 0 || max_rows > rows()) ? rows() : max_rows;
  for (std::size_t r = 0; r < n; ++r) {
    ss << "| " << escape_md(row_labels_[r]) << " |";
    for (std::size_t c = 0; c < cols(); ++c) ss << " " << escape_md(cells_[r][c].joined()) << " |";
    ss << "\n";
  }
  return ss.str();
}

nlohmann::json ComparisonTable::to_document() const {
  // Same result as transposed() then keying by row, without the copy.
  nlohmann::json doc = nlohmann::json::object();
  for (std::size_t c = 0; c < cols(); ++c) {
    nlohmann::json item = nlohmann::json::object();
    for (std::size_t r = 0; r < rows(); ++r) item[row_labels_[r]] = cell_to_json(cells_[r][c]);
    doc[column_labels_[c]] = std::move(item);
  }
  return doc;
}

// -----------------------------
// DocumentView
// -----------------------------

DocumentView::DocumentView(nlohmann::json doc, std::size_t max_value_length)
    : doc_(std::move(doc)), max_value_length_(max_value_length) {}

Result<const nlohmann::json*> DocumentView::resolve(const std::string& path) const {
  const nlohmann::json* cur = &doc_;
  for (const auto& key : split_path(path)) {
    if (cur->is_object()) {
      const auto it = cur->find(key);
      if (it == cur->end()) {
        return Result<const nlohmann::json*>::err(Status::not_found("no key '" + key + "' in " + path));
      }
      cur = &(*it);
    } else if (cur->is_array()) {
      std::size_t idx = 0;
      try {
        idx = static_cast<std::size_t>(std::stoul(key));
      } catch (const std::exception&) {
        return Result<const nlohmann::json*>::err(
            Status::invalid_argument("array index expected, got '" + key + "' in " + path));
      }
      if (idx >= cur->size()) {
        return Result<const nlohmann::json*>::err(Status::not_found("index " + key + " out of range in " + path));
      }
      cur = &(*cur)[idx];
    } else {
      return Result<const nlohmann::json*>::err(
          Status::invalid_argument("cannot descend into a scalar at '" + key + "' in " + path));
    }
  }
  return Result<const nlohmann::json*>::ok(cur);
}

Result<std::vector<std::string>> DocumentView::list_keys(const std::string& path) const {
  auto node_r = resolve(path);
  if (!node_r.ok()) return Result<std::vector<std::string>>::err(node_r.status());
  const nlohmann::json* node = node_r.take_value();
  if (!node->is_object()) {
    return Result<std::vector<std::string>>::err(
        Status::invalid_argument("value at '" + path + "' is not a dict, get the value directly"));
  }

  std::vector<std::string> keys;
  keys.reserve(node->size());
  for (auto it = node->begin(); it != node->end(); ++it) keys.push_back(it.key());
  return Result<std::vector<std::string>>::ok(std::move(keys));
}

Result<std::string> DocumentView::get_value(const std::string& path) const {
  auto node_r = resolve(path);
  if (!node_r.ok()) return Result<std::string>::err(node_r.status());
  const nlohmann::json* node = node_r.take_value();

  std::string out = node->is_string()
                        ? node->get<std::string>()
                        : node->dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  if (max_value_length_ > 0 && out.size() > max_value_length_) {
    out.resize(utf8_boundary(out, max_value_length_));
    out += "...";
  }
  return Result<std::string>::ok(std::move(out));
}

}  // namespace compchat
