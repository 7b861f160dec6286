#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <optional>
#include <string>

#include "asyncquery/v1.hpp"

using namespace asyncquery::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  asyncqueryctl <addr> submit <datasource> <sql|ppl> <query> [session_id] [role...]\n"
            << "  asyncqueryctl <addr> status <query_id>\n"
            << "  asyncqueryctl <addr> cancel <query_id>\n";
}

static std::optional<LangType> ParseLang(const std::string& value) {
  if (value == "sql") {
    return LANG_TYPE_SQL;
  }
  if (value == "ppl") {
    return LANG_TYPE_PPL;
  }
  return std::nullopt;
}

int main(int argc, char** argv) {
  if (argc < 4) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = AsyncQueryService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "submit") {
    if (argc < 6) {
      Usage();
      return 1;
    }

    auto lang = ParseLang(argv[4]);
    if (!lang.has_value()) {
      std::cerr << "unsupported lang: " << argv[4] << "\n";
      return 1;
    }

    CreateAsyncQueryRequest req;
    req.set_datasource(argv[3]);
    req.set_lang_type(lang.value());
    req.set_query(argv[5]);
    if (argc >= 7) {
      req.set_session_id(argv[6]);
    }
    for (int i = 7; i < argc; ++i) {
      req.add_requester_roles(argv[i]);
    }

    CreateAsyncQueryResponse resp;

    auto status = stub->CreateAsyncQuery(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "query_id=" << resp.query_id() << "\n";
    if (!resp.session_id().empty()) {
      std::cout << "session_id=" << resp.session_id() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "status") {
    GetAsyncQueryResultsRequest req;
    req.set_query_id(argv[3]);

    GetAsyncQueryResultsResponse resp;

    auto status = stub->GetAsyncQueryResults(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "status=" << resp.status() << "\n";
    if (!resp.error().empty()) {
      std::cout << "error=" << resp.error() << "\n";
    }

    std::string json;
    if (google::protobuf::util::MessageToJsonString(resp.document(), &json).ok()) {
      std::cout << json << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "cancel") {
    CancelAsyncQueryRequest req;
    req.set_query_id(argv[3]);

    CancelAsyncQueryResponse resp;

    auto status = stub->CancelAsyncQuery(&ctx, req, &resp);

    if (!status.ok()) {
      std::cerr << status.error_message() << "\n";
      return 2;
    }

    std::cout << "cancelled=" << resp.cancelled_id() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
