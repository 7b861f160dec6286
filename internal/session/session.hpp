#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/session/append_only_map.hpp"
#include "internal/session/statement.hpp"

namespace asyncquery::session {

struct QueryRequest {
  asyncquery::v1::LangType lang_type = asyncquery::v1::LANG_TYPE_SQL;
  std::string              query;
  std::string              result_index;
};

/*
  Interactive execution context backed by one remote job.

  Statements are appended, never removed. Submissions are serialized per
  session; lookups run concurrently with them.
*/
class Session {
 public:
  Session(db::model::SessionRecord record, std::shared_ptr<db::Repository> repository);

  Session(const Session&)            = delete;
  Session& operator=(const Session&) = delete;

  const std::string& Id() const {
    return id_;
  }
  const std::string& DataSource() const {
    return datasource_;
  }
  const std::string& ApplicationId() const {
    return application_id_;
  }
  const std::string& JobId() const {
    return job_id_;
  }

  model::SessionState State() const {
    return state_.load(std::memory_order_acquire);
  }

  uint64_t LastHeartbeatMs() const {
    return last_heartbeat_ms_.load(std::memory_order_relaxed);
  }

  // Persists a new WAITING statement and returns its id. Throws
  // util::InvalidState when the session is DEAD or FAIL.
  std::string Submit(const QueryRequest& request);

  // nullptr when no statement has that id.
  std::shared_ptr<Statement> Get(const std::string& statement_id) const;

  // Oldest WAITING statement, moved to RUNNING; nullptr when none.
  std::shared_ptr<Statement> ClaimNextWaiting();

  std::vector<std::shared_ptr<Statement>> Statements() const {
    return statements_.Snapshot();
  }

  // Applies a session transition. Returns false if it is not allowed from the
  // current state.
  bool TransitionTo(model::SessionState to);

  void Heartbeat();

  // Registers a statement loaded from the repository.
  void Adopt(db::model::StatementRecord record);

  db::model::SessionRecord Snapshot() const;

 private:
  void Persist();

  const std::string id_;
  const std::string datasource_;
  const std::string application_id_;
  const std::string job_id_;
  const uint64_t    created_at_ms_;

  std::atomic<model::SessionState> state_;
  std::atomic<uint64_t>            last_heartbeat_ms_;

  AppendOnlyMap<Statement> statements_;
  std::mutex               submit_mutex_;

  std::mutex                      persist_mutex_;
  std::shared_ptr<db::Repository> repository_;
};

} // namespace asyncquery::session
