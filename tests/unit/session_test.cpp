#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/session/session.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace asyncquery::v1;
using asyncquery::session::QueryRequest;
using asyncquery::session::Session;

std::shared_ptr<Session> NewSession(const std::shared_ptr<asyncquery::db::Repository>& repository, const std::string& id = "session-1") {
  asyncquery::db::model::SessionRecord record;
  record.session_id     = id;
  record.datasource     = "my_glue";
  record.application_id = "app-1";
  record.job_id         = "job-1";
  record.state          = SESSION_STATE_NOT_STARTED;

  asyncquery::db::RunInTransaction(*repository, [&](asyncquery::db::Transaction& tx) {
    asyncquery::db::ThrowIfDbError(repository->InsertSession(tx, record), "insert session");
  });
  return std::make_shared<Session>(record, repository);
}

QueryRequest Query(const std::string& text) {
  return QueryRequest{LANG_TYPE_SQL, text, "query_execution_result"};
}

StatementState PersistedState(asyncquery::db::Repository& repository, const std::string& statement_id) {
  auto tx     = repository.Begin();
  auto record = repository.GetStatement(*tx, statement_id);
  tx->Commit();
  assert(record.has_value());
  return record->state;
}

void TestStateMachineTables() {
  using asyncquery::model::CanTransition;

  assert(CanTransition(STATEMENT_STATE_WAITING, STATEMENT_STATE_RUNNING));
  assert(CanTransition(STATEMENT_STATE_WAITING, STATEMENT_STATE_CANCELLED));
  assert(!CanTransition(STATEMENT_STATE_WAITING, STATEMENT_STATE_SUCCESS));
  assert(CanTransition(STATEMENT_STATE_RUNNING, STATEMENT_STATE_SUCCESS));
  assert(CanTransition(STATEMENT_STATE_RUNNING, STATEMENT_STATE_ERROR));
  assert(CanTransition(STATEMENT_STATE_RUNNING, STATEMENT_STATE_CANCELLED));
  assert(!CanTransition(STATEMENT_STATE_SUCCESS, STATEMENT_STATE_CANCELLED));
  assert(!CanTransition(STATEMENT_STATE_CANCELLED, STATEMENT_STATE_RUNNING));

  assert(CanTransition(SESSION_STATE_NOT_STARTED, SESSION_STATE_RUNNING));
  assert(CanTransition(SESSION_STATE_NOT_STARTED, SESSION_STATE_FAIL));
  assert(CanTransition(SESSION_STATE_RUNNING, SESSION_STATE_DEAD));
  assert(!CanTransition(SESSION_STATE_RUNNING, SESSION_STATE_NOT_STARTED));
  assert(!CanTransition(SESSION_STATE_DEAD, SESSION_STATE_RUNNING));

  assert(asyncquery::model::ToString(STATEMENT_STATE_WAITING) == "waiting");
  assert(asyncquery::model::ToString(STATEMENT_STATE_CANCELLED) == "cancelled");
}

void TestSubmitAssignsSequenceAndPersists() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  const auto first  = session->Submit(Query("SELECT 1"));
  const auto second = session->Submit(Query("SELECT 2"));
  assert(first != second);

  assert(session->Get(first)->Sequence() == 0);
  assert(session->Get(second)->Sequence() == 1);
  assert(session->Get(first)->State() == STATEMENT_STATE_WAITING);
  assert(session->Get("missing") == nullptr);
  assert(session->Statements().size() == 2);

  auto tx      = repository->Begin();
  auto records = repository->ListStatements(*tx, "session-1");
  tx->Commit();
  assert(records.size() == 2);
  assert(records[0].statement_id == first);
  assert(records[1].statement_id == second);
}

void TestClaimFollowsSubmissionOrder() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  const auto first  = session->Submit(Query("SELECT 1"));
  const auto second = session->Submit(Query("SELECT 2"));
  assert(session->Get(first)->Cancel());

  auto claimed = session->ClaimNextWaiting();
  assert(claimed && claimed->Id() == second);
  assert(claimed->State() == STATEMENT_STATE_RUNNING);
  assert(PersistedState(*repository, second) == STATEMENT_STATE_RUNNING);
  assert(session->ClaimNextWaiting() == nullptr);
}

void TestTerminalStatementIgnoresFurtherUpdates() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);
  auto statement  = session->Get(session->Submit(Query("SELECT 1")));

  assert(statement->TryClaim());
  assert(statement->Transition(STATEMENT_STATE_SUCCESS));
  assert(!statement->Cancel());
  assert(!statement->Transition(STATEMENT_STATE_ERROR, "late"));
  assert(statement->State() == STATEMENT_STATE_SUCCESS);
  assert(statement->Error().empty());
  assert(PersistedState(*repository, statement->Id()) == STATEMENT_STATE_SUCCESS);
}

void TestIllegalTransitionThrows() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);
  auto statement  = session->Get(session->Submit(Query("SELECT 1")));

  bool threw = false;
  try {
    (void)statement->Transition(STATEMENT_STATE_SUCCESS);
  } catch (const asyncquery::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(statement->State() == STATEMENT_STATE_WAITING);
}

void TestSubmitRejectedOnTerminalSession() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  assert(session->TransitionTo(SESSION_STATE_RUNNING));
  assert(session->TransitionTo(SESSION_STATE_DEAD));
  assert(!session->TransitionTo(SESSION_STATE_RUNNING));

  bool threw = false;
  try {
    (void)session->Submit(Query("SELECT 1"));
  } catch (const asyncquery::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(session->Statements().empty());

  auto tx     = repository->Begin();
  auto record = repository->GetSession(*tx, "session-1");
  tx->Commit();
  assert(record->state == SESSION_STATE_DEAD);
}

void TestCancelRacesWithClaimAndCompletion() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  constexpr int kStatements = 64;
  for (int i = 0; i < kStatements; ++i) {
    (void)session->Submit(Query("SELECT " + std::to_string(i)));
  }

  std::atomic<int> cancelled{0};
  std::atomic<int> completed{0};

  std::thread worker([&] {
    while (auto statement = session->ClaimNextWaiting()) {
      try {
        if (statement->Transition(STATEMENT_STATE_SUCCESS)) {
          ++completed;
        }
      } catch (const asyncquery::util::InvalidState&) {
        assert(false && "claimed statement must accept completion");
      }
    }
  });

  std::vector<std::thread> cancellers;
  for (int t = 0; t < 4; ++t) {
    cancellers.emplace_back([&] {
      for (const auto& statement : session->Statements()) {
        if (statement->Cancel()) {
          ++cancelled;
        }
      }
    });
  }

  worker.join();
  for (auto& thread : cancellers) {
    thread.join();
  }

  // Each statement ends in exactly one terminal state, decided by whichever CAS won.
  assert(cancelled.load() + completed.load() == kStatements);
  for (const auto& statement : session->Statements()) {
    const auto state = statement->State();
    assert(state == STATEMENT_STATE_CANCELLED || state == STATEMENT_STATE_SUCCESS);
    assert(PersistedState(*repository, statement->Id()) == state);
  }
}

void TestErrorTextVisibleWithErrorState() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  constexpr int kStatements = 32;
  for (int i = 0; i < kStatements; ++i) {
    (void)session->Submit(Query("SELECT " + std::to_string(i)));
  }

  for (int i = 0; i < kStatements; ++i) {
    auto statement = session->ClaimNextWaiting();
    assert(statement);
    const std::string error = "boom-" + std::to_string(i);

    std::thread reader([&] {
      while (statement->State() == STATEMENT_STATE_RUNNING) {
      }
      assert(statement->State() == STATEMENT_STATE_ERROR);
      assert(statement->Error() == error);
    });

    assert(statement->Transition(STATEMENT_STATE_ERROR, error));
    reader.join();
    assert(statement->Snapshot().error == error);
  }
}

void TestConcurrentSubmitsGetDistinctSequences() {
  auto repository = std::make_shared<asyncquery::db::memory::MemoryRepository>();
  auto session    = NewSession(repository);

  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 16; ++i) {
        (void)session->Submit(Query("SELECT 1"));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::set<uint64_t> sequences;
  for (const auto& statement : session->Statements()) {
    sequences.insert(statement->Sequence());
  }
  assert(sequences.size() == 128);
  assert(*sequences.rbegin() == 127);
}

} // namespace

int main() {
  TestStateMachineTables();
  TestSubmitAssignsSequenceAndPersists();
  TestClaimFollowsSubmissionOrder();
  TestTerminalStatementIgnoresFurtherUpdates();
  TestIllegalTransitionThrows();
  TestSubmitRejectedOnTerminalSession();
  TestCancelRacesWithClaimAndCompletion();
  TestErrorTextVisibleWithErrorState();
  TestConcurrentSubmitsGetDistinctSequences();

  std::cout << "async_query_unit_session: pass\n";
  return 0;
}
