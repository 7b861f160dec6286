#pragma once

#include <string>

#include "internal/model/index_operation.hpp"

namespace asyncquery::index {

struct IndexMetadata {
  std::string job_id;
  std::string application_id;
  bool        auto_refresh = false;
};

class IndexMetadataReader {
 public:
  virtual ~IndexMetadataReader() = default;

  // Throws util::NotFound when the index is unknown.
  virtual IndexMetadata GetIndexMetadata(const model::IndexOperation& operation) = 0;
};

class IndexStore {
 public:
  virtual ~IndexStore() = default;

  // Returns whether the store acknowledged the delete. Transport failures throw.
  virtual bool DeleteIndex(const std::string& index_name) = 0;
};

} // namespace asyncquery::index
