#include <cassert>
#include <iostream>
#include <string>

#include "internal/dispatcher/drop_index_result.hpp"
#include "internal/dispatcher/query_dispatcher.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using asyncquery::dispatcher::DropIndexResult;
using asyncquery::testing::DispatcherHarness;
using asyncquery::testing::FakeIndexStore;
using asyncquery::testing::Field;
using asyncquery::testing::MakeConfig;

constexpr const char* kSkippingIndex = "flint_my_glue_default_http_logs_skipping_index";
constexpr const char* kDropSkipping  = "DROP SKIPPING INDEX ON my_glue.default.http_logs";

void RegisterIndex(DispatcherHarness& h, bool auto_refresh) {
  h.index_metadata->indexes[kSkippingIndex] = asyncquery::index::IndexMetadata{"refresh-job-7", "app-1", auto_refresh};
}

std::string DecodedStatus(const asyncquery::v1::DispatchQueryResponse& resp) {
  return DropIndexResult::FromJobId(resp.job_id()).Status();
}

// ------------------------------------------------------------------
// Drop index
// ------------------------------------------------------------------

void TestDropAutoRefreshIndexCancelsThenDeletes() {
  DispatcherHarness h;
  RegisterIndex(h, true);

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping));

  assert(resp.is_synthetic_op());
  assert(resp.result_index() == asyncquery::testing::kResultIndex);
  assert(h.jobs->cancelled.size() == 1);
  assert(h.jobs->cancelled[0] == "refresh-job-7");
  assert(h.index_store->deleted.size() == 1);
  assert(h.index_store->deleted[0] == kSkippingIndex);
  assert(h.jobs->started.empty());
  assert(DecodedStatus(resp) == DropIndexResult::kSuccess);
}

void TestDropManualRefreshIndexSkipsCancel() {
  DispatcherHarness h;
  RegisterIndex(h, false);

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping));

  assert(h.jobs->cancelled.empty());
  assert(h.index_store->deleted.size() == 1);
  assert(DecodedStatus(resp) == DropIndexResult::kSuccess);
}

void TestCancelFailureStillDeletes() {
  DispatcherHarness h;
  RegisterIndex(h, true);
  h.jobs->fail_cancel = true;

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping));

  assert(h.jobs->cancelled.size() == 1);
  assert(h.index_store->deleted.size() == 1);
  assert(DecodedStatus(resp) == DropIndexResult::kSuccess);
}

void TestDeleteFailureReportsFailed() {
  DispatcherHarness h;
  RegisterIndex(h, true);
  h.index_store->outcome = FakeIndexStore::Outcome::kThrows;

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping));

  assert(h.index_store->deleted.size() == 1);
  assert(DecodedStatus(resp) == DropIndexResult::kFailed);
}

void TestUnacknowledgedDeleteReportsFailed() {
  DispatcherHarness h;
  RegisterIndex(h, false);
  h.index_store->outcome = FakeIndexStore::Outcome::kUnacknowledged;

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping));
  assert(DecodedStatus(resp) == DropIndexResult::kFailed);
}

void TestDropUnknownIndexPropagatesNotFound() {
  DispatcherHarness h;

  bool threw = false;
  try {
    (void)h.dispatcher->Dispatch(h.Request(kDropSkipping));
  } catch (const asyncquery::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(h.index_store->deleted.empty());
  assert(h.jobs->cancelled.empty());
}

void TestDropFillsDatasourceFromRequest() {
  DispatcherHarness h;
  RegisterIndex(h, false);

  (void)h.dispatcher->Dispatch(h.Request("DROP SKIPPING INDEX ON default.http_logs"));
  assert(h.index_store->deleted.size() == 1);
  assert(h.index_store->deleted[0] == kSkippingIndex);
}

// ------------------------------------------------------------------
// Create index and batch
// ------------------------------------------------------------------

void TestCreateAutoRefreshIndexStartsStreamingJob() {
  DispatcherHarness h;

  const auto resp = h.dispatcher->Dispatch(
      h.Request("CREATE SKIPPING INDEX ON my_glue.default.http_logs (status VALUE_SET) WITH (auto_refresh = true)"));

  assert(!resp.is_synthetic_op());
  assert(resp.job_id() == "job-1");
  assert(resp.session_id().empty());
  assert(h.jobs->started.size() == 1);

  const auto& start = h.jobs->started[0];
  assert(start.job_name == "my_domain:index-query");
  assert(start.structured_streaming);
  assert(start.tags.at("cluster") == "my_domain");
  assert(start.tags.at("datasource") == "my_glue");
  assert(start.tags.at("index") == kSkippingIndex);
  assert(start.tags.at("table") == "http_logs");
  assert(start.tags.at("schema") == "default");
  assert(start.submit_parameters.find("--conf spark.flint.job.type=streaming") != std::string::npos);
  assert(start.submit_parameters.find("--class org.apache.spark.sql.FlintJob") != std::string::npos);
}

void TestCreateManualRefreshIndexIsNotStreaming() {
  DispatcherHarness h;

  (void)h.dispatcher->Dispatch(h.Request("CREATE INDEX status_idx ON my_glue.default.http_logs (status)"));

  const auto& start = h.jobs->started.at(0);
  assert(!start.structured_streaming);
  assert(start.tags.at("index") == "flint_my_glue_default_http_logs_status_idx_index");
  assert(start.submit_parameters.find("spark.flint.job.type") == std::string::npos);
}

void TestBatchQueryStartsNonIndexJob() {
  DispatcherHarness h;

  const auto resp = h.dispatcher->Dispatch(h.Request("SELECT * FROM my_glue.default.http_logs LIMIT 10"));

  assert(resp.job_id() == "job-1");
  assert(!resp.is_synthetic_op());
  assert(resp.session_id().empty());

  const auto& start = h.jobs->started.at(0);
  assert(start.job_name == "my_domain:non-index-query");
  assert(start.tags.size() == 2);
  assert(!start.structured_streaming);
  assert(start.result_index == asyncquery::testing::kResultIndex);
  assert(start.submit_parameters.find("spark.sql.catalog.my_glue=org.opensearch.sql.FlintDelegatingSessionCatalog") != std::string::npos);
}

void TestPplIsNeverIndexRouted() {
  DispatcherHarness h;
  RegisterIndex(h, true);

  const auto resp = h.dispatcher->Dispatch(h.Request(kDropSkipping, asyncquery::v1::LANG_TYPE_PPL));

  assert(!resp.is_synthetic_op());
  assert(h.index_store->deleted.empty());
  assert(h.jobs->started.at(0).job_name == "my_domain:non-index-query");
}

void TestUnknownDatasourceIsRejected() {
  DispatcherHarness h;
  auto              request = h.Request("SELECT 1");
  request.set_datasource("missing");

  bool threw = false;
  try {
    (void)h.dispatcher->Dispatch(request);
  } catch (const asyncquery::util::NotFound&) {
    threw = true;
  }
  assert(threw);
  assert(h.jobs->started.empty());
}

void TestUnauthorizedRequesterIsRejected() {
  DispatcherHarness h(MakeConfig(false, true));
  auto              request = h.Request("SELECT 1");
  request.add_requester_roles("other_role");

  bool threw = false;
  try {
    (void)h.dispatcher->Dispatch(request);
  } catch (const asyncquery::util::PermissionDenied&) {
    threw = true;
  }
  assert(threw);
  assert(h.jobs->started.empty());

  request.add_requester_roles("query_role");
  (void)h.dispatcher->Dispatch(request);
  assert(h.jobs->started.size() == 1);
}

// ------------------------------------------------------------------
// Sessions
// ------------------------------------------------------------------

void TestSessionQueryCreatesSessionAndStatement() {
  DispatcherHarness h(MakeConfig(true));

  const auto resp = h.dispatcher->Dispatch(h.Request("SELECT 1"));

  assert(!resp.session_id().empty());
  assert(h.jobs->started.size() == 1);
  const auto& start = h.jobs->started[0];
  assert(start.query == "select 1");
  assert(start.tags.at("sid") == resp.session_id());
  assert(start.submit_parameters.find("--class org.apache.spark.sql.FlintREPL") != std::string::npos);
  assert(start.submit_parameters.find("spark.flint.job.sessionId=" + resp.session_id()) != std::string::npos);
  assert(start.submit_parameters.find("spark.flint.job.requestIndex=.query_execution_request_my_glue") != std::string::npos);

  auto session = h.sessions->GetSession(resp.session_id());
  assert(session);
  auto statement = session->Get(resp.job_id());
  assert(statement);
  assert(statement->State() == asyncquery::v1::STATEMENT_STATE_WAITING);
  assert(statement->Query() == "SELECT 1");
}

void TestSessionReuseSubmitsWithoutNewJob() {
  DispatcherHarness h(MakeConfig(true));

  const auto first   = h.dispatcher->Dispatch(h.Request("SELECT 1"));
  auto       request = h.Request("SELECT 2");
  request.set_session_id(first.session_id());
  const auto second = h.dispatcher->Dispatch(request);

  assert(h.jobs->started.size() == 1);
  assert(second.session_id() == first.session_id());
  assert(second.job_id() != first.job_id());

  auto session = h.sessions->GetSession(first.session_id());
  assert(session->Get(second.job_id())->Sequence() == 1);
}

void TestUnknownSessionIdIsNotFound() {
  DispatcherHarness h(MakeConfig(true));
  auto              request = h.Request("SELECT 1");
  request.set_session_id("no-such-session");

  bool threw = false;
  try {
    (void)h.dispatcher->Dispatch(request);
  } catch (const asyncquery::util::NotFound& e) {
    threw = std::string(e.what()) == "no session found. no-such-session";
  }
  assert(threw);
  assert(h.jobs->started.empty());
}

void TestIndexQueriesBypassSessions() {
  DispatcherHarness h(MakeConfig(true));

  const auto resp = h.dispatcher->Dispatch(h.Request("CREATE SKIPPING INDEX ON my_glue.default.http_logs (status VALUE_SET)"));
  assert(resp.session_id().empty());
  assert(h.jobs->started.at(0).job_name == "my_domain:index-query");
}

// ------------------------------------------------------------------
// Status and cancel
// ------------------------------------------------------------------

asyncquery::v1::AsyncQueryJobMetadata Metadata(const asyncquery::v1::DispatchQueryResponse& resp) {
  asyncquery::v1::AsyncQueryJobMetadata metadata;
  metadata.set_query_id(resp.job_id());
  metadata.set_application_id("app-1");
  metadata.set_job_id(resp.job_id());
  metadata.set_is_drop_index_op(resp.is_synthetic_op());
  metadata.set_result_index(resp.result_index());
  metadata.set_session_id(resp.session_id());
  return metadata;
}

void TestDropIndexStatusComesFromTheId() {
  DispatcherHarness h;
  RegisterIndex(h, false);
  const auto metadata = Metadata(h.dispatcher->Dispatch(h.Request(kDropSkipping)));

  const auto doc = h.dispatcher->GetQueryResponse(metadata);
  assert(Field(doc, "status") == "SUCCESS");
  assert(doc.fields().at("data").struct_value().fields().at("applicationId").string_value() == "fakeDropIndexApplicationId");
  assert(h.jobs->get_calls == 0);

  assert(h.dispatcher->CancelJob(metadata) == metadata.job_id());
  assert(h.jobs->cancelled.empty());
}

void TestBatchStatusFallsBackToJobState() {
  DispatcherHarness h;
  h.jobs->job_state   = "PENDING";
  const auto metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  const auto doc = h.dispatcher->GetQueryResponse(metadata);
  assert(Field(doc, "status") == "PENDING");
  assert(Field(doc, "error").empty());
  assert(h.jobs->get_calls == 1);
}

void TestResultDocumentOverridesJobState() {
  DispatcherHarness h;
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  google::protobuf::Struct document;
  (*document.mutable_fields())["status"].set_string_value("FAILED");
  (*document.mutable_fields())["error"].set_string_value("table not found");
  h.results->Put(metadata.job_id(), document);

  const auto doc = h.dispatcher->GetQueryResponse(metadata);
  assert(Field(doc, "status") == "FAILED");
  assert(Field(doc, "error") == "table not found");
  assert(doc.fields().count("data") == 1);
  assert(h.jobs->get_calls == 0);
}

void TestResultDocumentWithoutStatusReportsFailed() {
  DispatcherHarness h;
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));
  h.results->Put(metadata.job_id(), google::protobuf::Struct());

  const auto doc = h.dispatcher->GetQueryResponse(metadata);
  assert(Field(doc, "status") == "FAILED");
  assert(Field(doc, "error").empty());
}

void TestSessionStatusFollowsStatement() {
  DispatcherHarness h(MakeConfig(true));
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  assert(Field(h.dispatcher->GetQueryResponse(metadata), "status") == "waiting");

  auto statement = h.sessions->GetSession(metadata.session_id())->ClaimNextWaiting();
  assert(statement && statement->Id() == metadata.job_id());
  assert(statement->Transition(asyncquery::v1::STATEMENT_STATE_ERROR, "syntax error"));

  const auto doc = h.dispatcher->GetQueryResponse(metadata);
  assert(Field(doc, "status") == "error");
  assert(Field(doc, "error") == "syntax error");
  assert(h.jobs->get_calls == 0);
}

void TestCancelSessionStatementIsIdempotent() {
  DispatcherHarness h(MakeConfig(true));
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  assert(h.dispatcher->CancelJob(metadata) == metadata.job_id());
  auto statement = h.sessions->GetSession(metadata.session_id())->Get(metadata.job_id());
  assert(statement->State() == asyncquery::v1::STATEMENT_STATE_CANCELLED);

  assert(h.dispatcher->CancelJob(metadata) == metadata.job_id());
  assert(statement->State() == asyncquery::v1::STATEMENT_STATE_CANCELLED);
  assert(h.jobs->cancelled.empty());
}

void TestCancelCompletedStatementKeepsSuccess() {
  DispatcherHarness h(MakeConfig(true));
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  auto statement = h.sessions->GetSession(metadata.session_id())->ClaimNextWaiting();
  assert(statement && statement->Id() == metadata.job_id());
  assert(statement->Transition(asyncquery::v1::STATEMENT_STATE_SUCCESS));

  assert(h.dispatcher->CancelJob(metadata) == metadata.job_id());
  assert(statement->State() == asyncquery::v1::STATEMENT_STATE_SUCCESS);
  assert(Field(h.dispatcher->GetQueryResponse(metadata), "status") == "success");
  assert(h.jobs->cancelled.empty());
}

void TestCancelUnknownStatementIsNotFound() {
  DispatcherHarness h(MakeConfig(true));
  auto              metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));
  metadata.set_job_id("missing-statement");

  bool threw = false;
  try {
    (void)h.dispatcher->CancelJob(metadata);
  } catch (const asyncquery::util::NotFound& e) {
    threw = std::string(e.what()) == "no statement found. missing-statement";
  }
  assert(threw);
}

void TestCancelBatchJobCallsBackend() {
  DispatcherHarness h;
  const auto        metadata = Metadata(h.dispatcher->Dispatch(h.Request("SELECT 1")));

  assert(h.dispatcher->CancelJob(metadata) == "job-1");
  assert(h.jobs->cancelled.size() == 1);
}

} // namespace

int main() {
  TestDropAutoRefreshIndexCancelsThenDeletes();
  TestDropManualRefreshIndexSkipsCancel();
  TestCancelFailureStillDeletes();
  TestDeleteFailureReportsFailed();
  TestUnacknowledgedDeleteReportsFailed();
  TestDropUnknownIndexPropagatesNotFound();
  TestDropFillsDatasourceFromRequest();

  TestCreateAutoRefreshIndexStartsStreamingJob();
  TestCreateManualRefreshIndexIsNotStreaming();
  TestBatchQueryStartsNonIndexJob();
  TestPplIsNeverIndexRouted();
  TestUnknownDatasourceIsRejected();
  TestUnauthorizedRequesterIsRejected();

  TestSessionQueryCreatesSessionAndStatement();
  TestSessionReuseSubmitsWithoutNewJob();
  TestUnknownSessionIdIsNotFound();
  TestIndexQueriesBypassSessions();

  TestDropIndexStatusComesFromTheId();
  TestBatchStatusFallsBackToJobState();
  TestResultDocumentOverridesJobState();
  TestResultDocumentWithoutStatusReportsFailed();
  TestSessionStatusFollowsStatement();
  TestCancelSessionStatementIsIdempotent();
  TestCancelCompletedStatementKeepsSuccess();
  TestCancelUnknownStatementIsNotFound();
  TestCancelBatchJobCallsBackend();

  std::cout << "async_query_unit_query_dispatcher: pass\n";
  return 0;
}
