#include <cassert>
#include <iostream>
#include <string>

#include "internal/backend/submit_parameters.hpp"
#include "internal/datasource/data_source_metadata.hpp"

namespace {

using asyncquery::backend::SubmitParameters;

asyncquery::datasource::DataSourceMetadata Glue(const std::string& uri) {
  asyncquery::datasource::DataSourceMetadata metadata;
  metadata.name                                                        = "my_glue";
  metadata.properties[asyncquery::datasource::kGlueRoleArnProperty]   = "arn:glue";
  metadata.properties[asyncquery::datasource::kIndexStoreUriProperty] = uri;
  metadata.properties[asyncquery::datasource::kIndexStoreAuthProperty] = "awssigv4";
  return metadata;
}

void TestDefaultsComeFromConfig() {
  asyncquery::runtime::config::SubmitConfig config;
  (*config.mutable_default_conf())["spark.b"] = "2";
  (*config.mutable_default_conf())["spark.a"] = "1";

  SubmitParameters parameters(config);
  assert(parameters.ClassName() == "org.apache.spark.sql.FlintJob");
  assert(parameters.ToString() == " --class org.apache.spark.sql.FlintJob --conf spark.a=1 --conf spark.b=2");

  config.set_default_class_name("com.example.Main");
  assert(SubmitParameters(config).ClassName() == "com.example.Main");
}

void TestDataSourceConf() {
  SubmitParameters parameters{asyncquery::runtime::config::SubmitConfig()};
  parameters.WithDataSource(Glue("https://search-domain.us-west-2.es.amazonaws.com:443"));

  assert(parameters.Conf("spark.sql.catalog.my_glue") == "org.opensearch.sql.FlintDelegatingSessionCatalog");
  assert(parameters.Conf("spark.hive.metastore.glue.role.arn") == "arn:glue");
  assert(parameters.Conf("spark.datasource.flint.host") == "search-domain.us-west-2.es.amazonaws.com");
  assert(parameters.Conf("spark.datasource.flint.port") == "443");
  assert(parameters.Conf("spark.datasource.flint.scheme") == "https");
  assert(parameters.Conf("spark.datasource.flint.auth") == "awssigv4");
  assert(!parameters.Conf("spark.datasource.flint.region").has_value());
}

void TestUriWithoutPortUsesSchemeDefault() {
  SubmitParameters parameters{asyncquery::runtime::config::SubmitConfig()};
  parameters.WithDataSource(Glue("http://localhost/ignored/path"));
  assert(parameters.Conf("spark.datasource.flint.host") == "localhost");
  assert(parameters.Conf("spark.datasource.flint.port") == "80");
  assert(parameters.Conf("spark.datasource.flint.scheme") == "http");
}

void TestSessionAndStreamingConf() {
  SubmitParameters parameters{asyncquery::runtime::config::SubmitConfig()};
  parameters.WithStructuredStreaming(false);
  assert(!parameters.Conf("spark.flint.job.type").has_value());

  parameters.WithStructuredStreaming(true).WithSessionExecution("sid-1", "my_glue");
  assert(parameters.Conf("spark.flint.job.type") == "streaming");
  assert(parameters.Conf("spark.flint.job.sessionId") == "sid-1");
  assert(parameters.Conf("spark.flint.job.requestIndex") == ".query_execution_request_my_glue");
}

void TestSetConfReplacesInPlaceAndExtrasGoLast() {
  SubmitParameters parameters{asyncquery::runtime::config::SubmitConfig()};
  parameters.SetConf("k1", "a");
  parameters.SetConf("k2", "b");
  parameters.SetConf("k1", "c");
  parameters.WithClassName("Main").WithExtraParameters("--conf extra=1");

  assert(parameters.ToString() == " --class Main --conf k1=c --conf k2=b --conf extra=1");
}

} // namespace

int main() {
  TestDefaultsComeFromConfig();
  TestDataSourceConf();
  TestUriWithoutPortUsesSchemeDefault();
  TestSessionAndStreamingConf();
  TestSetConfReplacesInPlaceAndExtrasGoLast();

  std::cout << "async_query_unit_submit_parameters: pass\n";
  return 0;
}
