#include "statement.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace asyncquery::session {

using observability::StringField;

Statement::Statement(db::model::StatementRecord record, std::shared_ptr<db::Repository> repository)
    : id_(std::move(record.statement_id)),
      session_id_(std::move(record.session_id)),
      sequence_(record.sequence),
      lang_type_(record.lang_type),
      query_(std::move(record.query)),
      result_index_(std::move(record.result_index)),
      submit_time_ms_(record.submit_time_ms),
      state_(record.state),
      updated_at_ms_(record.updated_at_ms),
      error_(std::move(record.error)),
      repository_(std::move(repository)) {
}

std::string Statement::Error() const {
  std::scoped_lock lock(error_mutex_);
  return error_;
}

bool Statement::CompareAndSet(model::StatementState& expected, model::StatementState to) {
  if (!state_.compare_exchange_weak(expected, to, std::memory_order_acq_rel, std::memory_order_acquire)) {
    return false;
  }
  updated_at_ms_.store(util::NowMillis(), std::memory_order_relaxed);
  return true;
}

bool Statement::Cancel() {
  auto current = State();
  while (!model::IsTerminal(current)) {
    if (CompareAndSet(current, asyncquery::v1::STATEMENT_STATE_CANCELLED)) {
      Persist();
      ASYNCQUERY_LOG_INFO("statement cancelled", {StringField("statement_id", id_), StringField("session_id", session_id_)});
      return true;
    }
  }
  return false;
}

bool Statement::TryClaim() {
  auto current = State();
  while (current == asyncquery::v1::STATEMENT_STATE_WAITING) {
    if (CompareAndSet(current, asyncquery::v1::STATEMENT_STATE_RUNNING)) {
      Persist();
      return true;
    }
  }
  return false;
}

bool Statement::Transition(model::StatementState to, const std::string& error) {
  auto current = State();
  while (!model::IsTerminal(current)) {
    if (!model::CanTransition(current, to)) {
      throw util::InvalidState("statement " + id_ + ": cannot move from " + model::ToString(current) + " to " + model::ToString(to));
    }
    if (to == asyncquery::v1::STATEMENT_STATE_ERROR) {
      // Readers that observe ERROR block in Error() until the text is set.
      std::unique_lock lock(error_mutex_);
      if (!CompareAndSet(current, to)) continue;
      error_ = error;
      lock.unlock();
      Persist();
      return true;
    }
    if (CompareAndSet(current, to)) {
      Persist();
      return true;
    }
  }
  return false;
}

db::model::StatementRecord Statement::Snapshot() const {
  db::model::StatementRecord record;
  record.statement_id   = id_;
  record.session_id     = session_id_;
  record.sequence       = sequence_;
  record.lang_type      = lang_type_;
  record.query          = query_;
  record.state          = State();
  record.error          = Error();
  record.result_index   = result_index_;
  record.submit_time_ms = submit_time_ms_;
  record.updated_at_ms  = updated_at_ms_.load(std::memory_order_relaxed);
  return record;
}

void Statement::Persist() {
  // Snapshot under the lock so the last writer always stores the newest state.
  std::scoped_lock lock(persist_mutex_);
  const auto       record = Snapshot();
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    db::ThrowIfDbError(repository_->UpdateStatement(tx, record), "persist statement " + id_);
  });
}

} // namespace asyncquery::session
