#pragma once

#include <map>
#include <string>
#include <vector>

namespace asyncquery::datasource {

// Connector properties read by the submit parameter builder.
inline constexpr const char* kGlueRoleArnProperty       = "glue.auth.role_arn";
inline constexpr const char* kIndexStoreUriProperty     = "glue.indexstore.opensearch.uri";
inline constexpr const char* kIndexStoreAuthProperty    = "glue.indexstore.opensearch.auth";
inline constexpr const char* kIndexStoreRegionProperty  = "glue.indexstore.opensearch.region";

struct DataSourceMetadata {
  std::string                        name;
  std::string                        connector;
  std::string                        result_index;
  std::vector<std::string>           allowed_roles;
  std::map<std::string, std::string> properties;
};

} // namespace asyncquery::datasource
