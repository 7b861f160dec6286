#pragma once

#include <cstdint>
#include <string>

#include "asyncquery/v1/types.pb.h"

namespace asyncquery::db::model {

struct StatementRecord {
  std::string statement_id;
  std::string session_id;

  // Submission order within the session, starting at 0.
  uint64_t sequence = 0;

  asyncquery::v1::LangType       lang_type = asyncquery::v1::LANG_TYPE_UNSPECIFIED;
  std::string                    query;
  asyncquery::v1::StatementState state = asyncquery::v1::STATEMENT_STATE_UNSPECIFIED;
  std::string                    error;
  std::string                    result_index;

  uint64_t submit_time_ms = 0;
  uint64_t updated_at_ms  = 0;
};

} // namespace asyncquery::db::model
