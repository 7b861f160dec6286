#include "state_machine.hpp"

namespace asyncquery::model {

std::string ToString(StatementState state) {
  switch (state) {
    case asyncquery::v1::STATEMENT_STATE_WAITING:
      return "waiting";
    case asyncquery::v1::STATEMENT_STATE_RUNNING:
      return "running";
    case asyncquery::v1::STATEMENT_STATE_SUCCESS:
      return "success";
    case asyncquery::v1::STATEMENT_STATE_ERROR:
      return "error";
    case asyncquery::v1::STATEMENT_STATE_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

std::string ToString(SessionState state) {
  switch (state) {
    case asyncquery::v1::SESSION_STATE_NOT_STARTED:
      return "not_started";
    case asyncquery::v1::SESSION_STATE_RUNNING:
      return "running";
    case asyncquery::v1::SESSION_STATE_DEAD:
      return "dead";
    case asyncquery::v1::SESSION_STATE_FAIL:
      return "fail";
    default:
      return "unspecified";
  }
}

}  // namespace asyncquery::model
