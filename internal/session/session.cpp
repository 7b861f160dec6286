#include "session.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace asyncquery::session {

using observability::IntField;
using observability::StringField;

Session::Session(db::model::SessionRecord record, std::shared_ptr<db::Repository> repository)
    : id_(std::move(record.session_id)),
      datasource_(std::move(record.datasource)),
      application_id_(std::move(record.application_id)),
      job_id_(std::move(record.job_id)),
      created_at_ms_(record.created_at_ms),
      state_(record.state),
      last_heartbeat_ms_(record.last_heartbeat_ms),
      repository_(std::move(repository)) {
}

std::string Session::Submit(const QueryRequest& request) {
  std::scoped_lock lock(submit_mutex_);

  const auto state = State();
  if (model::IsTerminal(state)) {
    throw util::InvalidState("session " + id_ + " is " + model::ToString(state) + "; cannot submit");
  }

  const auto now = util::NowMillis();

  db::model::StatementRecord record;
  record.statement_id   = util::NewId();
  record.session_id     = id_;
  record.sequence       = statements_.Size();
  record.lang_type      = request.lang_type;
  record.query          = request.query;
  record.state          = asyncquery::v1::STATEMENT_STATE_WAITING;
  record.result_index   = request.result_index;
  record.submit_time_ms = now;
  record.updated_at_ms  = now;

  // The row exists before the statement becomes claimable.
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->InsertStatement(tx, record), "submit statement");
  });

  const auto statement_id = record.statement_id;
  statements_.Insert(statement_id, std::make_shared<Statement>(std::move(record), repository_));

  ASYNCQUERY_LOG_INFO("statement submitted", {StringField("session_id", id_), StringField("statement_id", statement_id),
                                               IntField("sequence", static_cast<std::int64_t>(statements_.Size() - 1))});
  return statement_id;
}

std::shared_ptr<Statement> Session::Get(const std::string& statement_id) const {
  return statements_.Find(statement_id);
}

std::shared_ptr<Statement> Session::ClaimNextWaiting() {
  for (const auto& statement : statements_.Snapshot()) {
    if (statement->TryClaim()) {
      return statement;
    }
  }
  return nullptr;
}

bool Session::TransitionTo(model::SessionState to) {
  auto current = State();
  while (model::CanTransition(current, to)) {
    if (state_.compare_exchange_weak(current, to, std::memory_order_acq_rel, std::memory_order_acquire)) {
      Persist();
      ASYNCQUERY_LOG_INFO("session state changed", {StringField("session_id", id_), StringField("state", model::ToString(to))});
      return true;
    }
  }
  return false;
}

void Session::Heartbeat() {
  last_heartbeat_ms_.store(util::NowMillis(), std::memory_order_relaxed);
  Persist();
}

void Session::Adopt(db::model::StatementRecord record) {
  auto id = record.statement_id;
  statements_.Insert(id, std::make_shared<Statement>(std::move(record), repository_));
}

db::model::SessionRecord Session::Snapshot() const {
  db::model::SessionRecord record;
  record.session_id        = id_;
  record.datasource        = datasource_;
  record.application_id    = application_id_;
  record.job_id            = job_id_;
  record.state             = State();
  record.created_at_ms     = created_at_ms_;
  record.last_heartbeat_ms = LastHeartbeatMs();
  return record;
}

void Session::Persist() {
  std::scoped_lock lock(persist_mutex_);
  const auto       record = Snapshot();
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->UpdateSession(tx, record), "persist session " + id_);
  });
}

} // namespace asyncquery::session
