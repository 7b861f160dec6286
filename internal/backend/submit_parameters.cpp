#include "submit_parameters.hpp"

#include <algorithm>

namespace asyncquery::backend {

namespace {

constexpr const char* kFlintCatalog = "org.opensearch.sql.FlintDelegatingSessionCatalog";

struct IndexStoreUri {
  std::string scheme = "http";
  std::string host;
  std::string port;
};

// scheme://host[:port][/path]
IndexStoreUri ParseIndexStoreUri(const std::string& uri) {
  IndexStoreUri parsed;
  std::string   rest = uri;

  const auto scheme_end = rest.find("://");
  if (scheme_end != std::string::npos) {
    parsed.scheme = rest.substr(0, scheme_end);
    rest          = rest.substr(scheme_end + 3);
  }

  const auto path_start = rest.find('/');
  if (path_start != std::string::npos) {
    rest.resize(path_start);
  }

  const auto colon = rest.rfind(':');
  if (colon != std::string::npos) {
    parsed.host = rest.substr(0, colon);
    parsed.port = rest.substr(colon + 1);
  } else {
    parsed.host = rest;
    parsed.port = parsed.scheme == "https" ? "443" : "80";
  }
  return parsed;
}

} // namespace

SubmitParameters::SubmitParameters(const runtime::config::SubmitConfig& config)
    : class_name_(config.default_class_name().empty() ? kDefaultClassName : config.default_class_name()) {
  // proto maps iterate in unspecified order
  std::vector<std::pair<std::string, std::string>> defaults(config.default_conf().begin(), config.default_conf().end());
  std::sort(defaults.begin(), defaults.end());
  for (auto& [key, value] : defaults) {
    SetConf(key, std::move(value));
  }
}

SubmitParameters& SubmitParameters::WithClassName(std::string class_name) {
  class_name_ = std::move(class_name);
  return *this;
}

SubmitParameters& SubmitParameters::WithDataSource(const datasource::DataSourceMetadata& metadata) {
  SetConf("spark.sql.catalog." + metadata.name, kFlintCatalog);

  const auto property = [&](const char* key) -> std::optional<std::string> {
    const auto it = metadata.properties.find(key);
    if (it == metadata.properties.end()) return std::nullopt;
    return it->second;
  };

  if (auto role_arn = property(datasource::kGlueRoleArnProperty)) {
    SetConf("spark.emr-serverless.driverEnv.ASSUME_ROLE_CREDENTIALS_ROLE_ARN", *role_arn);
    SetConf("spark.executorEnv.ASSUME_ROLE_CREDENTIALS_ROLE_ARN", *role_arn);
    SetConf("spark.hive.metastore.glue.role.arn", *role_arn);
  }

  if (auto uri = property(datasource::kIndexStoreUriProperty)) {
    const auto parsed = ParseIndexStoreUri(*uri);
    SetConf("spark.datasource.flint.host", parsed.host);
    SetConf("spark.datasource.flint.port", parsed.port);
    SetConf("spark.datasource.flint.scheme", parsed.scheme);
  }

  if (auto auth = property(datasource::kIndexStoreAuthProperty)) {
    SetConf("spark.datasource.flint.auth", *auth);
  }
  if (auto region = property(datasource::kIndexStoreRegionProperty)) {
    SetConf("spark.datasource.flint.region", *region);
  }
  return *this;
}

SubmitParameters& SubmitParameters::WithStructuredStreaming(bool streaming) {
  if (streaming) {
    SetConf(kJobTypeKey, kJobTypeStreaming);
  }
  return *this;
}

SubmitParameters& SubmitParameters::WithSessionExecution(const std::string& session_id, const std::string& datasource_name) {
  SetConf(kSessionIdKey, session_id);
  SetConf(kRequestIndexKey, kRequestIndexPrefix + datasource_name);
  return *this;
}

SubmitParameters& SubmitParameters::WithExtraParameters(std::string extra) {
  extra_parameters_ = std::move(extra);
  return *this;
}

void SubmitParameters::SetConf(const std::string& key, std::string value) {
  const auto it = std::find_if(conf_.begin(), conf_.end(), [&](const auto& entry) { return entry.first == key; });
  if (it != conf_.end()) {
    it->second = std::move(value);
    return;
  }
  conf_.emplace_back(key, std::move(value));
}

std::optional<std::string> SubmitParameters::Conf(const std::string& key) const {
  const auto it = std::find_if(conf_.begin(), conf_.end(), [&](const auto& entry) { return entry.first == key; });
  if (it == conf_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string SubmitParameters::ToString() const {
  std::string out = " --class " + class_name_;
  for (const auto& [key, value] : conf_) {
    out += " --conf " + key + "=" + value;
  }
  if (!extra_parameters_.empty()) {
    out += " " + extra_parameters_;
  }
  return out;
}

} // namespace asyncquery::backend
