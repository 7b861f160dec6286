#include "session_manager.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace asyncquery::session {

using observability::IntField;
using observability::StringField;

SessionManager::SessionManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<backend::JobClient> jobs)
    : repository_(std::move(repository)), jobs_(std::move(jobs)) {
}

std::shared_ptr<Session> SessionManager::CreateSession(CreateSessionRequest request) {
  const auto session_id = util::NewId();

  request.parameters.WithSessionExecution(session_id, request.datasource_name);
  request.tags[kSessionIdTag] = session_id;

  backend::StartJobRequest start;
  start.query                = kSessionBootQuery;
  start.job_name             = request.job_name;
  start.application_id       = request.application_id;
  start.execution_role_arn   = request.execution_role_arn;
  start.submit_parameters    = request.parameters.ToString();
  start.tags                 = request.tags;
  start.structured_streaming = false;
  start.result_index         = request.result_index;

  const auto job_id = jobs_->StartJobRun(start);

  db::model::SessionRecord record;
  record.session_id        = session_id;
  record.datasource        = request.datasource_name;
  record.application_id    = request.application_id;
  record.job_id            = job_id;
  record.state             = asyncquery::v1::SESSION_STATE_NOT_STARTED;
  record.created_at_ms     = util::NowMillis();
  record.last_heartbeat_ms = record.created_at_ms;

  try {
    db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
      db::ThrowIfDbError(repository_->InsertSession(tx, record), "create session");
    });
  } catch (const std::exception& e) {
    ASYNCQUERY_LOG_ERROR("session persist failed; cancelling session job",
                         {StringField("session_id", session_id), StringField("job_id", job_id), StringField("error", e.what())});
    try {
      jobs_->CancelJobRun(request.application_id, job_id);
    } catch (const std::exception& cancel_error) {
      ASYNCQUERY_LOG_WARN("session job left running",
                          {StringField("session_id", session_id), StringField("job_id", job_id), StringField("error", cancel_error.what())});
    }
    throw;
  }

  auto session = sessions_.Insert(session_id, std::make_shared<Session>(std::move(record), repository_));
  ASYNCQUERY_LOG_INFO("session created",
                      {StringField("session_id", session_id), StringField("job_id", job_id), StringField("datasource", request.datasource_name)});
  return session;
}

std::shared_ptr<Session> SessionManager::GetSession(const std::string& session_id) {
  if (auto cached = sessions_.Find(session_id)) {
    return cached;
  }

  auto tx     = repository_->Begin();
  auto record = repository_->GetSession(*tx, session_id);
  if (!record.has_value()) {
    return nullptr;
  }
  auto session = Load(std::move(*record), *tx);
  tx->Commit();
  return session;
}

std::size_t SessionManager::HydrateCaches() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListSessions(*tx);
  for (auto& record : records) {
    Load(std::move(record), *tx);
  }
  tx->Commit();

  ASYNCQUERY_LOG_INFO("session cache hydrated", {IntField("sessions", static_cast<std::int64_t>(records.size()))});
  return records.size();
}

std::shared_ptr<Session> SessionManager::Load(db::model::SessionRecord record, db::Transaction& tx) {
  const auto session_id = record.session_id;
  auto       session    = std::make_shared<Session>(std::move(record), repository_);
  for (auto& statement : repository_->ListStatements(tx, session_id)) {
    session->Adopt(std::move(statement));
  }
  // A concurrent loader may have won; keep whichever entry is registered.
  return sessions_.Insert(session_id, std::move(session));
}

} // namespace asyncquery::session
