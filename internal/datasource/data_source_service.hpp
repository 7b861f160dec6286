#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/datasource/data_source_metadata.hpp"

namespace asyncquery::datasource {

class DataSourceService {
 public:
  virtual ~DataSourceService() = default;

  // Throws util::NotFound for unknown names.
  virtual DataSourceMetadata GetRawDataSourceMetadata(const std::string& name) const = 0;
};

class DataSourceAuthorizer {
 public:
  virtual ~DataSourceAuthorizer() = default;

  // Throws util::PermissionDenied when the requester may not use the data source.
  virtual void Authorize(const DataSourceMetadata& metadata, const std::vector<std::string>& requester_roles) const = 0;
};

/*
  Data sources declared in the runtime config.

  A data source without its own result index uses
  execution_engine.default_result_index.
*/
class ConfigDataSourceService final : public DataSourceService {
 public:
  static constexpr const char* kDefaultResultIndex = "query_execution_result";

  explicit ConfigDataSourceService(const runtime::config::RuntimeConfig& config);

  DataSourceMetadata GetRawDataSourceMetadata(const std::string& name) const override;

 private:
  std::unordered_map<std::string, DataSourceMetadata> data_sources_;
};

/*
  Admin roles see every data source. Everyone else needs at least one role in
  the data source's allowed_roles. Disabled security lets everything through.
*/
class RoleBasedAuthorizer final : public DataSourceAuthorizer {
 public:
  static constexpr const char* kDefaultAdminRole = "all_access";

  explicit RoleBasedAuthorizer(const runtime::config::SecurityConfig& config);

  void Authorize(const DataSourceMetadata& metadata, const std::vector<std::string>& requester_roles) const override;

 private:
  bool                            enabled_;
  std::unordered_set<std::string> admin_roles_;
};

} // namespace asyncquery::datasource
