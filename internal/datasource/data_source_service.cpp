#include "data_source_service.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace asyncquery::datasource {

ConfigDataSourceService::ConfigDataSourceService(const runtime::config::RuntimeConfig& config) {
  std::string fallback_index = config.execution_engine().default_result_index();
  if (fallback_index.empty()) {
    fallback_index = kDefaultResultIndex;
  }

  for (const auto& entry : config.data_sources()) {
    if (entry.name().empty()) {
      throw util::InvalidArgument("data source name is required");
    }

    DataSourceMetadata metadata;
    metadata.name         = entry.name();
    metadata.connector    = entry.connector();
    metadata.result_index = entry.result_index().empty() ? fallback_index : entry.result_index();
    metadata.allowed_roles.assign(entry.allowed_roles().begin(), entry.allowed_roles().end());
    metadata.properties.insert(entry.properties().begin(), entry.properties().end());

    if (!data_sources_.emplace(metadata.name, std::move(metadata)).second) {
      throw util::AlreadyExists("duplicate data source: " + entry.name());
    }
  }
}

DataSourceMetadata ConfigDataSourceService::GetRawDataSourceMetadata(const std::string& name) const {
  const auto it = data_sources_.find(name);
  if (it == data_sources_.end()) {
    throw util::NotFound("DataSource with name " + name + " doesn't exist.");
  }
  return it->second;
}

RoleBasedAuthorizer::RoleBasedAuthorizer(const runtime::config::SecurityConfig& config) : enabled_(config.enabled()) {
  admin_roles_.insert(config.admin_roles().begin(), config.admin_roles().end());
  if (admin_roles_.empty()) {
    admin_roles_.insert(kDefaultAdminRole);
  }
}

void RoleBasedAuthorizer::Authorize(const DataSourceMetadata& metadata, const std::vector<std::string>& requester_roles) const {
  if (!enabled_) {
    return;
  }

  for (const auto& role : requester_roles) {
    if (admin_roles_.contains(role)) {
      return;
    }
    if (std::find(metadata.allowed_roles.begin(), metadata.allowed_roles.end(), role) != metadata.allowed_roles.end()) {
      return;
    }
  }

  throw util::PermissionDenied("User is not authorized to access datasource " + metadata.name + ". User should be mapped to any of the roles in " +
                               "the data source's allowed roles for successful access.");
}

} // namespace asyncquery::datasource
