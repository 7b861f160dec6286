#pragma once

#include "asyncquery/v1/async_query_service.pb.h"
#include "asyncquery/v1/dispatch.pb.h"
#include "service_context.hpp"

namespace asyncquery::service {

/*
  Caller-facing async query API.

  Fills execution settings from config, dispatches, and keeps the job
  metadata needed to answer later status and cancel calls by query id.
*/
class AsyncQueryService {
public:
  explicit AsyncQueryService(ServiceContext ctx);

  asyncquery::v1::CreateAsyncQueryResponse
  CreateAsyncQuery(const asyncquery::v1::CreateAsyncQueryRequest& req);

  asyncquery::v1::GetAsyncQueryResultsResponse
  GetAsyncQueryResults(const asyncquery::v1::GetAsyncQueryResultsRequest& req);

  asyncquery::v1::CancelAsyncQueryResponse
  CancelAsyncQuery(const asyncquery::v1::CancelAsyncQueryRequest& req);

private:
  asyncquery::v1::AsyncQueryJobMetadata LoadMetadata(const std::string& query_id);

  ServiceContext ctx_;
};

}
