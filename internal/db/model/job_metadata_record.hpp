#pragma once

#include <cstdint>
#include <string>

namespace asyncquery::db::model {

/*
  Caller-side correlation of a query id to what dispatch returned.

  For session-scoped queries job_id holds the statement id.
*/
struct JobMetadataRecord {
  std::string query_id;
  std::string application_id;
  std::string job_id;
  bool        is_drop_index_op = false;
  std::string result_index;
  std::string session_id;
  std::string datasource;

  uint64_t created_at_ms = 0;
};

} // namespace asyncquery::db::model
