#pragma once

#include <string>

#include "asyncquery/v1/types.pb.h"

namespace asyncquery::model {

using asyncquery::v1::SessionState;
using asyncquery::v1::StatementState;

// ---------------------------------------------------------------------
// Statement: WAITING -> RUNNING -> {SUCCESS, ERROR, CANCELLED}
//            WAITING -> CANCELLED
// ---------------------------------------------------------------------

constexpr bool IsTerminal(StatementState state) {
  return state == asyncquery::v1::STATEMENT_STATE_SUCCESS || state == asyncquery::v1::STATEMENT_STATE_ERROR ||
         state == asyncquery::v1::STATEMENT_STATE_CANCELLED;
}

constexpr bool CanTransition(StatementState from, StatementState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == asyncquery::v1::STATEMENT_STATE_CANCELLED) {
    return true;
  }

  switch (from) {
    case asyncquery::v1::STATEMENT_STATE_WAITING:
      return to == asyncquery::v1::STATEMENT_STATE_RUNNING;
    case asyncquery::v1::STATEMENT_STATE_RUNNING:
      return to == asyncquery::v1::STATEMENT_STATE_SUCCESS || to == asyncquery::v1::STATEMENT_STATE_ERROR;
    default:
      return false;
  }
}

// ---------------------------------------------------------------------
// Session: NOT_STARTED -> RUNNING -> {DEAD, FAIL}
//          NOT_STARTED -> {DEAD, FAIL}
// ---------------------------------------------------------------------

constexpr bool IsTerminal(SessionState state) {
  return state == asyncquery::v1::SESSION_STATE_DEAD || state == asyncquery::v1::SESSION_STATE_FAIL;
}

constexpr bool CanTransition(SessionState from, SessionState to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (from == asyncquery::v1::SESSION_STATE_NOT_STARTED) {
    return to == asyncquery::v1::SESSION_STATE_RUNNING || IsTerminal(to);
  }
  if (from == asyncquery::v1::SESSION_STATE_RUNNING) {
    return IsTerminal(to);
  }
  return false;
}

// Lower-case wire names ("waiting", "running", ...) reported in status documents.
std::string ToString(StatementState state);
std::string ToString(SessionState state);

}  // namespace asyncquery::model
