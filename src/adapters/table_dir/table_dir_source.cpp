// File: src/adapters/table_dir/table_dir_source.cpp
#include "compchat/adapters/table_dir/table_dir_source.hpp"

#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <yaml-cpp/yaml.h>

namespace compchat {
namespace {

Result<Cell> parse_cell(const YAML::Node& n) {
  Cell c;
  if (!n || n.IsNull()) return Result<Cell>::ok(c);
  if (n.IsScalar()) {
    c.values.push_back(n.as<std::string>());
    return Result<Cell>::ok(std::move(c));
  }
  if (n.IsSequence()) {
    for (std::size_t i = 0; i < n.size(); ++i) {
      if (!n[i].IsScalar()) {
        return Result<Cell>::err(Status::parse_error("multi-valued cell must hold scalars"));
      }
      c.values.push_back(n[i].as<std::string>());
    }
    return Result<Cell>::ok(std::move(c));
  }
  return Result<Cell>::err(Status::parse_error("cell must be null, a scalar or a sequence"));
}

bool is_safe_id(const DatasetId& id) {
  if (id.empty() || id == "." || id == "..") return false;
  return id.find('/') == std::string::npos && id.find('\\') == std::string::npos;
}

}  // namespace

TableDirSource::TableDirSource(TableDirSourceConfig cfg) : cfg_(std::move(cfg)) {}

Result<ComparisonTable> TableDirSource::load_file(const std::string& path, const DatasetId& id) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    return Result<ComparisonTable>::err(Status::parse_error("YAML parse error in " + path + ": " + e.what()));
  }

  try {
    if (!y["items"] || !y["items"].IsSequence()) {
      return Result<ComparisonTable>::err(Status::parse_error(path + ": 'items' must be a sequence"));
    }
    if (!y["properties"] || !y["properties"].IsSequence()) {
      return Result<ComparisonTable>::err(Status::parse_error(path + ": 'properties' must be a sequence"));
    }

    const auto items = y["items"].as<std::vector<std::string>>();
    const std::string title = y["title"] ? y["title"].as<std::string>() : std::string();

    std::vector<std::string> labels;
    std::vector<std::vector<Cell>> cells;
    const YAML::Node props = y["properties"];
    for (std::size_t r = 0; r < props.size(); ++r) {
      const YAML::Node p = props[r];
      if (!p["label"]) {
        return Result<ComparisonTable>::err(Status::parse_error(path + ": property " + std::to_string(r) + " has no label"));
      }
      labels.push_back(p["label"].as<std::string>());

      const YAML::Node values = p["values"];
      if (!values || !values.IsSequence()) {
        return Result<ComparisonTable>::err(
            Status::parse_error(path + ": property '" + labels.back() + "' needs a 'values' sequence"));
      }

      std::vector<Cell> row;
      for (std::size_t c = 0; c < values.size(); ++c) {
        auto cell_r = parse_cell(values[c]);
        if (!cell_r.ok()) {
          return Result<ComparisonTable>::err(Status::parse_error(
              path + ": property '" + labels.back() + "': " + cell_r.status().message()));
        }
        row.push_back(cell_r.take_value());
      }
      cells.push_back(std::move(row));
    }

    return ComparisonTable::create(id, title, std::move(labels), items, std::move(cells));
  } catch (const YAML::Exception& e) {
    return Result<ComparisonTable>::err(Status::parse_error("bad comparison in " + path + ": " + e.what()));
  }
}

Result<ComparisonTable> TableDirSource::fetch(const DatasetId& id) {
  namespace fs = std::filesystem;

  if (!is_safe_id(id)) {
    return Result<ComparisonTable>::err(Status::dataset_unavailable("invalid dataset id '" + id + "'"));
  }

  const std::string file = (fs::path(cfg_.path) / (id + ".yaml")).string();
  std::error_code ec;
  if (!fs::is_regular_file(file, ec)) {
    return Result<ComparisonTable>::err(Status::dataset_unavailable("no comparison '" + id + "' in " + cfg_.path));
  }

  auto table_r = load_file(file, id);
  if (!table_r.ok()) {
    return Result<ComparisonTable>::err(Status::dataset_unavailable(to_string(table_r.status())));
  }
  if (table_r->empty()) {
    return Result<ComparisonTable>::err(Status::dataset_unavailable("comparison '" + id + "' is empty"));
  }
  return table_r;
}

}  // namespace compchat
