#include <cassert>
#include <iostream>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/db/api/transaction.hpp"
#include "internal/grpc/async_query_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using asyncquery::testing::MakeConfig;
using asyncquery::testing::ServiceHarness;

void TestExceptionMapping() {
  using asyncquery::grpc::ToStatus;
  using namespace asyncquery::util;

  assert(ToStatus(NotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(ToStatus(PermissionDenied("x")).error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
  assert(ToStatus(AlreadyExists("x")).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
  assert(ToStatus(InvalidState("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(ToStatus(BackendError("x")).error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(ToStatus(asyncquery::db::TransactionConflict("x")).error_code() == ::grpc::StatusCode::ABORTED);
  assert(ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
  assert(ToStatus(NotFound("QueryId: q not found")).error_message() == "QueryId: q not found");
}

void TestEmptyQueryReturnsInvalidArgument() {
  ServiceHarness                     h;
  asyncquery::grpc::AsyncQueryServer server(h.async_query);

  asyncquery::v1::CreateAsyncQueryRequest req;
  req.set_datasource("my_glue");
  req.set_lang_type(asyncquery::v1::LANG_TYPE_SQL);
  asyncquery::v1::CreateAsyncQueryResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.CreateAsyncQuery(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnauthorizedReturnsPermissionDenied() {
  ServiceHarness                     h(MakeConfig(false, true));
  asyncquery::grpc::AsyncQueryServer server(h.async_query);

  asyncquery::v1::CreateAsyncQueryRequest req;
  req.set_query("SELECT 1");
  req.set_datasource("my_glue");
  req.set_lang_type(asyncquery::v1::LANG_TYPE_SQL);
  req.add_requester_roles("guest");
  asyncquery::v1::CreateAsyncQueryResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  const auto status = server.CreateAsyncQuery(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::PERMISSION_DENIED);
}

void TestMissingQueryReturnsNotFound() {
  ServiceHarness                     h;
  asyncquery::grpc::AsyncQueryServer server(h.async_query);

  asyncquery::v1::GetAsyncQueryResultsRequest req;
  req.set_query_id("missing");
  asyncquery::v1::GetAsyncQueryResultsResponse resp;
  ::grpc::ServerContext                        grpc_ctx;

  const auto status = server.GetAsyncQueryResults(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestSubmitOk() {
  ServiceHarness                     h;
  asyncquery::grpc::AsyncQueryServer server(h.async_query);

  asyncquery::v1::CreateAsyncQueryRequest req;
  req.set_query("SELECT 1");
  req.set_datasource("my_glue");
  req.set_lang_type(asyncquery::v1::LANG_TYPE_PPL);
  asyncquery::v1::CreateAsyncQueryResponse resp;
  ::grpc::ServerContext                    grpc_ctx;

  assert(server.CreateAsyncQuery(&grpc_ctx, &req, &resp).ok());
  assert(resp.query_id() == "job-1");
}

void TestWorkerStatusCodes() {
  ServiceHarness                 h(MakeConfig(true));
  asyncquery::grpc::WorkerServer server(h.worker);

  {
    asyncquery::v1::FetchStatementRequest req;
    req.set_session_id("missing");
    asyncquery::v1::FetchStatementResponse resp;
    ::grpc::ServerContext                  grpc_ctx;
    assert(server.FetchStatement(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
  }

  const auto created = h.Submit("SELECT 1");
  {
    asyncquery::v1::UpdateStatementRequest req;
    req.set_session_id(created.session_id());
    req.set_statement_id(created.query_id());
    req.set_state(asyncquery::v1::STATEMENT_STATE_SUCCESS);
    asyncquery::v1::UpdateStatementResponse resp;
    ::grpc::ServerContext                   grpc_ctx;
    assert(server.UpdateStatement(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  }
  {
    asyncquery::v1::WriteResultRequest req;
    asyncquery::v1::WriteResultResponse resp;
    ::grpc::ServerContext               grpc_ctx;
    assert(server.WriteResult(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  }
}

} // namespace

int main() {
  TestExceptionMapping();
  TestEmptyQueryReturnsInvalidArgument();
  TestUnauthorizedReturnsPermissionDenied();
  TestMissingQueryReturnsNotFound();
  TestSubmitOk();
  TestWorkerStatusCodes();

  std::cout << "async_query_unit_grpc_status: pass\n";
  return 0;
}
