#pragma once

#include <cstdint>
#include <string>

namespace asyncquery::db::model {

/*
  Result document written by the remote program.

  Stored as JSON text:
    sqlite -> text
    memory -> string
*/
struct QueryResultRecord {
  std::string job_id;
  std::string query_id;
  std::string result_index;
  std::string document_json;

  uint64_t written_at_ms = 0;
};

} // namespace asyncquery::db::model
