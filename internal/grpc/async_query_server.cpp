#include "async_query_server.hpp"
#include "grpc_error.hpp"

namespace asyncquery::grpc {

AsyncQueryServer::AsyncQueryServer(std::shared_ptr<asyncquery::service::AsyncQueryService> svc)
    : service_(std::move(svc)) {}

::grpc::Status AsyncQueryServer::CreateAsyncQuery(::grpc::ServerContext*,
                                                  const asyncquery::v1::CreateAsyncQueryRequest* req,
                                                  asyncquery::v1::CreateAsyncQueryResponse* resp) {
  try {
    *resp = service_->CreateAsyncQuery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AsyncQueryServer::GetAsyncQueryResults(::grpc::ServerContext*,
                                                      const asyncquery::v1::GetAsyncQueryResultsRequest* req,
                                                      asyncquery::v1::GetAsyncQueryResultsResponse* resp) {
  try {
    *resp = service_->GetAsyncQueryResults(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AsyncQueryServer::CancelAsyncQuery(::grpc::ServerContext*,
                                                  const asyncquery::v1::CancelAsyncQueryRequest* req,
                                                  asyncquery::v1::CancelAsyncQueryResponse* resp) {
  try {
    *resp = service_->CancelAsyncQuery(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
