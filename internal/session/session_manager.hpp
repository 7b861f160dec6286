#pragma once

#include <map>
#include <memory>
#include <string>

#include "internal/backend/job_client.hpp"
#include "internal/backend/submit_parameters.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/session/append_only_map.hpp"
#include "internal/session/session.hpp"

namespace asyncquery::session {

inline constexpr const char* kSessionIdTag     = "sid";
inline constexpr const char* kSessionBootQuery = "select 1";

struct CreateSessionRequest {
  std::string                        job_name;
  std::string                        application_id;
  std::string                        execution_role_arn;
  backend::SubmitParameters          parameters;
  std::map<std::string, std::string> tags;
  std::string                        result_index;
  std::string                        datasource_name;
};

/*
  Registry of live sessions.

  Sessions are created here (one remote job each), cached for the process
  lifetime and mirrored in the repository. The cache is rebuilt from the
  repository by HydrateCaches() and filled lazily on lookup misses.
*/
class SessionManager {
 public:
  SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<backend::JobClient> jobs);

  // Starts the session job and persists the session as NOT_STARTED.
  std::shared_ptr<Session> CreateSession(CreateSessionRequest request);

  // nullptr when no such session exists.
  std::shared_ptr<Session> GetSession(const std::string& session_id);

  // Loads every persisted session and its statements; returns how many were loaded.
  std::size_t HydrateCaches();

 private:
  std::shared_ptr<Session> Load(db::model::SessionRecord record, db::Transaction& tx);

  std::shared_ptr<db::Repository>     repository_;
  std::shared_ptr<backend::JobClient> jobs_;
  AppendOnlyMap<Session>              sessions_;
};

} // namespace asyncquery::session
