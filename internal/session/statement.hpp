#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/model/state_machine.hpp"

namespace asyncquery::session {

/*
  One query submitted into a session.

  State lives in an atomic and moves only by compare-and-swap along the
  statement state machine. Every applied transition is written through to
  the repository.
*/
class Statement {
 public:
  Statement(db::model::StatementRecord record, std::shared_ptr<db::Repository> repository);

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  const std::string& Id() const {
    return id_;
  }
  const std::string& SessionId() const {
    return session_id_;
  }
  uint64_t Sequence() const {
    return sequence_;
  }
  asyncquery::v1::LangType Lang() const {
    return lang_type_;
  }
  const std::string& Query() const {
    return query_;
  }
  const std::string& ResultIndex() const {
    return result_index_;
  }

  model::StatementState State() const {
    return state_.load(std::memory_order_acquire);
  }

  std::string Error() const;

  // Moves to CANCELLED unless already terminal. Returns false (and changes
  // nothing) for a terminal statement.
  bool Cancel();

  // WAITING -> RUNNING for the session-serving program.
  bool TryClaim();

  // Applies a transition reported by the session-serving program. Returns
  // false when the statement is already terminal; throws util::InvalidState
  // for an illegal move out of a live state.
  bool Transition(model::StatementState to, const std::string& error = {});

  db::model::StatementRecord Snapshot() const;

 private:
  bool CompareAndSet(model::StatementState& expected, model::StatementState to);
  void Persist();

  const std::string              id_;
  const std::string              session_id_;
  const uint64_t                 sequence_;
  const asyncquery::v1::LangType lang_type_;
  const std::string              query_;
  const std::string              result_index_;
  const uint64_t                 submit_time_ms_;

  std::atomic<model::StatementState> state_;
  std::atomic<uint64_t>              updated_at_ms_;

  mutable std::mutex error_mutex_;
  std::string        error_;

  std::mutex                      persist_mutex_;
  std::shared_ptr<db::Repository> repository_;
};

} // namespace asyncquery::session
