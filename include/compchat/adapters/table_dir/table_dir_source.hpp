// File: include/compchat/adapters/table_dir/table_dir_source.hpp
#pragma once

#include <string>

#include "compchat/core/io/dataset_source.hpp"

namespace compchat {

struct TableDirSourceConfig {
  std::string path;  // directory holding <dataset_id>.yaml files
};

// Comparison tables stored one per YAML file:
//
//   id: cmp-1
//   title: Methods for X
//   items: [P1, P2, P3]
//   properties:
//     - label: method
//       values: [X, [X, Y], ~]     # ~ = empty cell, sequence = multi-valued
//
// Stateless between fetches, so concurrent queries are fine.
class TableDirSource final : public IDatasetSource {
 public:
  explicit TableDirSource(TableDirSourceConfig cfg);

  Result<ComparisonTable> fetch(const DatasetId& id) override;

  std::string name() const override { return "table_dir"; }

  // Parses one comparison file. Exposed for tooling and tests.
  static Result<ComparisonTable> load_file(const std::string& path, const DatasetId& id);

 private:
  TableDirSourceConfig cfg_;
};

}  // namespace compchat
