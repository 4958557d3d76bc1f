// File: include/compchat/core/io/dataset_source.hpp
#pragma once

#include <string>

#include "compchat/core/data/comparison_table.hpp"
#include "compchat/core/status.hpp"
#include "compchat/core/types.hpp"

namespace compchat {

// Source of comparison tables. Implementations must be safe to call from
// several queries at once.
class IDatasetSource {
 public:
  virtual ~IDatasetSource() = default;

  // Returns:
  //  - OK and a non-empty table
  //  - dataset_unavailable(...) if the source errors or has nothing for `id`
  virtual Result<ComparisonTable> fetch(const DatasetId& id) = 0;

  virtual std::string name() const = 0;
};

}  // namespace compchat
