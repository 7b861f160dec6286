#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include <grpcpp/grpcpp.h>

#include "internal/backend/grpc_job_client.hpp"
#include "internal/datasource/data_source_service.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/dispatcher/query_dispatcher.hpp"
#include "internal/grpc/async_query_server.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/index/index_catalog.hpp"
#include "internal/observability/logging.hpp"
#include "internal/response/repository_result_reader.hpp"
#include "internal/service/async_query_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/session/session_manager.hpp"
#include "internal/sql/query_classifier.hpp"
#if ASYNCQUERY_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace asyncquery::factory {

using namespace asyncquery;
using observability::IntField;
using observability::StringField;

std::shared_ptr<db::Repository> BuildRepository(const asyncquery::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if ASYNCQUERY_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->ApplySchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const asyncquery::runtime::config::RuntimeConfig& config) {
  Application app;

  const auto& engine = config.execution_engine();
  if (engine.job_runner_endpoint().empty()) {
    throw std::runtime_error("execution_engine.job_runner_endpoint is required");
  }

  // ------------------------------------------------------------------
  // Storage and backend
  // ------------------------------------------------------------------
  auto repository = BuildRepository(config);
  app.repository  = repository;

  auto channel = ::grpc::CreateChannel(engine.job_runner_endpoint(), ::grpc::InsecureChannelCredentials());
  auto jobs    = std::make_shared<backend::GrpcJobClient>(channel);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto index_catalog = std::make_shared<index::IndexCatalog>(repository);
  auto sessions      = std::make_shared<session::SessionManager>(repository, jobs);
  const auto loaded  = sessions->HydrateCaches();

  dispatcher::DispatcherContext dctx;
  dctx.jobs             = jobs;
  dctx.data_sources     = std::make_shared<datasource::ConfigDataSourceService>(config);
  dctx.authorizer       = std::make_shared<datasource::RoleBasedAuthorizer>(config.security());
  dctx.results          = std::make_shared<response::RepositoryResultReader>(repository);
  dctx.index_metadata   = index_catalog;
  dctx.index_store      = index_catalog;
  dctx.classifier       = std::make_shared<sql::FlintQueryClassifier>();
  dctx.sessions         = sessions;
  dctx.submit           = config.submit();
  dctx.sessions_enabled = config.sessions().enabled();

  auto query_dispatcher = std::make_shared<dispatcher::QueryDispatcher>(std::move(dctx));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.dispatcher       = query_dispatcher;
  ctx.sessions         = sessions;
  ctx.index_catalog    = index_catalog;
  ctx.repository       = repository;
  ctx.execution_engine = engine;

  auto async_query_service = std::make_shared<service::AsyncQueryService>(ctx);
  auto worker_service      = std::make_shared<service::WorkerService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::AsyncQueryServer>(async_query_service));
  app.grpc_services.push_back(std::make_unique<grpc::WorkerServer>(worker_service));

  ASYNCQUERY_LOG_INFO("application built", {StringField("job_runner", engine.job_runner_endpoint()),
                                            IntField("sessions_loaded", static_cast<int64_t>(loaded)),
                                            StringField("store", config.database().has_sqlite() ? "sqlite" : "memory")});
  return app;
}

} // namespace asyncquery::factory
