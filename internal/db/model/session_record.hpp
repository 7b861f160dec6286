#pragma once

#include <cstdint>
#include <string>

#include "asyncquery/v1/types.pb.h"

namespace asyncquery::db::model {

/*
  Persistent session row.

  job_id is the remote job running the session-serving program.
*/
struct SessionRecord {
  std::string session_id;
  std::string datasource;
  std::string application_id;
  std::string job_id;

  asyncquery::v1::SessionState state = asyncquery::v1::SESSION_STATE_UNSPECIFIED;

  uint64_t created_at_ms     = 0;
  uint64_t last_heartbeat_ms = 0;
};

} // namespace asyncquery::db::model
