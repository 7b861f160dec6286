#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "asyncquery/v1.hpp"
#include "internal/service/async_query_service.hpp"

namespace asyncquery::grpc {

class AsyncQueryServer final : public asyncquery::v1::AsyncQueryService::Service {
public:
  explicit AsyncQueryServer(std::shared_ptr<asyncquery::service::AsyncQueryService> svc);

  ::grpc::Status CreateAsyncQuery(::grpc::ServerContext*,
                                  const asyncquery::v1::CreateAsyncQueryRequest*,
                                  asyncquery::v1::CreateAsyncQueryResponse*) override;

  ::grpc::Status GetAsyncQueryResults(::grpc::ServerContext*,
                                      const asyncquery::v1::GetAsyncQueryResultsRequest*,
                                      asyncquery::v1::GetAsyncQueryResultsResponse*) override;

  ::grpc::Status CancelAsyncQuery(::grpc::ServerContext*,
                                  const asyncquery::v1::CancelAsyncQueryRequest*,
                                  asyncquery::v1::CancelAsyncQueryResponse*) override;

private:
  std::shared_ptr<asyncquery::service::AsyncQueryService> service_;
};

}
