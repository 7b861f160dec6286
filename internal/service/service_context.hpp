#pragma once

#include <memory>

#include "config/config.pb.h"

namespace asyncquery::dispatcher { class QueryDispatcher; }
namespace asyncquery::session { class SessionManager; }
namespace asyncquery::index { class IndexCatalog; }
namespace asyncquery::db { class Repository; }

namespace asyncquery::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<asyncquery::dispatcher::QueryDispatcher> dispatcher;
  std::shared_ptr<asyncquery::session::SessionManager> sessions;
  std::shared_ptr<asyncquery::index::IndexCatalog> index_catalog;
  std::shared_ptr<asyncquery::db::Repository> repository;

  asyncquery::runtime::config::ExecutionEngineConfig execution_engine;
};

}
