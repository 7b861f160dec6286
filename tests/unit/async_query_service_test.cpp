#include <cassert>
#include <iostream>
#include <string>

#include "internal/dispatcher/drop_index_result.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using namespace asyncquery::v1;
using asyncquery::testing::Field;
using asyncquery::testing::kResultIndex;
using asyncquery::testing::MakeConfig;
using asyncquery::testing::ServiceHarness;

template <typename Error, typename Fn>
std::string ExpectThrow(Fn&& fn) {
  try {
    fn();
  } catch (const Error& e) {
    return e.what();
  }
  assert(false && "expected exception");
  return {};
}

void WriteResult(ServiceHarness& h, const std::string& job_id, const std::string& query_id, const std::string& status) {
  WriteResultRequest req;
  req.set_job_id(job_id);
  req.set_query_id(query_id);
  req.set_result_index(kResultIndex);
  auto& fields = *req.mutable_document()->mutable_fields();
  fields["status"].set_string_value(status);
  fields["schema"].mutable_list_value()->add_values()->set_string_value("count");
  h.worker->WriteResult(req);
}

void TestRequestValidation() {
  ServiceHarness h;

  assert(ExpectThrow<asyncquery::util::InvalidArgument>([&] { (void)h.Submit(""); }) == "Query can't be null or empty.");

  CreateAsyncQueryRequest req;
  req.set_query("SELECT 1");
  req.set_lang_type(LANG_TYPE_SQL);
  assert(ExpectThrow<asyncquery::util::InvalidArgument>([&] { (void)h.async_query->CreateAsyncQuery(req); }) ==
         "Datasource can't be null or empty.");

  (void)ExpectThrow<asyncquery::util::InvalidArgument>([&] { (void)h.Submit("SELECT 1", "", LANG_TYPE_UNSPECIFIED); });
  assert(h.jobs->started.empty());
}

void TestBatchQueryLifecycle() {
  ServiceHarness h;

  const auto created = h.Submit("SELECT count(*) FROM my_glue.default.http_logs");
  assert(created.query_id() == "job-1");
  assert(created.session_id().empty());

  auto pending = h.Results(created.query_id());
  assert(pending.status() == "RUNNING");
  assert(pending.error().empty());

  WriteResult(h, "job-1", "", "SUCCESS");

  auto done = h.Results(created.query_id());
  assert(done.status() == "SUCCESS");
  const auto& data = done.document().fields().at("data").struct_value().fields();
  assert(data.at("schema").list_value().values(0).string_value() == "count");

  CancelAsyncQueryRequest cancel;
  cancel.set_query_id(created.query_id());
  assert(h.async_query->CancelAsyncQuery(cancel).cancelled_id() == "job-1");
  assert(h.jobs->cancelled.size() == 1);
}

void TestUnknownQueryId() {
  ServiceHarness h;
  assert(ExpectThrow<asyncquery::util::NotFound>([&] { (void)h.Results("missing"); }) == "QueryId: missing not found");
  (void)ExpectThrow<asyncquery::util::InvalidArgument>([&] { (void)h.Results(""); });
}

void TestDropIndexLifecycle() {
  ServiceHarness h;

  RegisterIndexRequest reg;
  reg.set_index_name("flint_my_glue_default_http_logs_skipping_index");
  reg.set_datasource("my_glue");
  reg.set_job_id("refresh-1");
  reg.set_application_id("app-1");
  reg.set_auto_refresh(true);
  h.worker->RegisterIndex(reg);

  const auto created = h.Submit("DROP SKIPPING INDEX ON my_glue.default.http_logs");
  assert(asyncquery::dispatcher::DropIndexResult::FromJobId(created.query_id()).Succeeded());
  assert(h.jobs->cancelled.size() == 1 && h.jobs->cancelled[0] == "refresh-1");
  assert(h.jobs->started.empty());

  const auto results = h.Results(created.query_id());
  assert(results.status() == "SUCCESS");
  assert(Field(results.document().fields().at("data").struct_value(), "applicationId") == "fakeDropIndexApplicationId");

  CancelAsyncQueryRequest cancel;
  cancel.set_query_id(created.query_id());
  assert(h.async_query->CancelAsyncQuery(cancel).cancelled_id() == created.query_id());
  assert(h.jobs->cancelled.size() == 1);

  // The metadata is gone, so a second drop cannot resolve the index.
  (void)ExpectThrow<asyncquery::util::NotFound>([&] { (void)h.Submit("DROP SKIPPING INDEX ON my_glue.default.http_logs"); });
}

void TestSessionQueryLifecycle() {
  ServiceHarness h(MakeConfig(true));

  const auto first = h.Submit("SELECT 1");
  assert(!first.session_id().empty());
  assert(h.Results(first.query_id()).status() == "waiting");

  const auto second = h.Submit("SELECT 2", first.session_id());
  assert(second.session_id() == first.session_id());
  assert(h.jobs->started.size() == 1);

  WriteResult(h, "", first.query_id(), "SUCCESS");
  assert(h.Results(first.query_id()).status() == "SUCCESS");

  CancelAsyncQueryRequest cancel;
  cancel.set_query_id(second.query_id());
  assert(h.async_query->CancelAsyncQuery(cancel).cancelled_id() == second.query_id());
  assert(h.Results(second.query_id()).status() == "cancelled");

  // Cancelling again changes nothing.
  assert(h.async_query->CancelAsyncQuery(cancel).cancelled_id() == second.query_id());
}

void TestUnknownSessionIsNotFound() {
  ServiceHarness h(MakeConfig(true));
  assert(ExpectThrow<asyncquery::util::NotFound>([&] { (void)h.Submit("SELECT 1", "missing"); }) == "no session found. missing");
}

} // namespace

int main() {
  TestRequestValidation();
  TestBatchQueryLifecycle();
  TestUnknownQueryId();
  TestDropIndexLifecycle();
  TestSessionQueryLifecycle();
  TestUnknownSessionIsNotFound();

  std::cout << "async_query_unit_async_query_service: pass\n";
  return 0;
}
