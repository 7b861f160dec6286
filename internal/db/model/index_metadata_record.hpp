#pragma once

#include <cstdint>
#include <string>

namespace asyncquery::db::model {

// Keyed by the Flint index name.
struct IndexMetadataRecord {
  std::string index_name;
  std::string datasource;
  std::string job_id;
  std::string application_id;
  bool        auto_refresh = false;

  uint64_t updated_at_ms = 0;
};

} // namespace asyncquery::db::model
