#include "factory.hpp"

#include "internal/remote/curl_http_client.hpp"

namespace keysync::factory {

sync::SyncOptions MakeSyncOptions(const keysync::runtime::config::RuntimeConfig& config) {
  sync::SyncOptions options;
  options.graphql_endpoint          = config.remote().graphql_endpoint();
  options.metadata_url              = config.remote().metadata_url();
  options.create_parent_directories = config.store().mkdir();
  options.store.busy_timeout_ms     = config.store().busy_timeout_ms();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const keysync::runtime::config::RuntimeConfig& config) {
  Application app;

  remote::CurlOptions curl;
  curl.user_agent         = config.remote().user_agent();
  curl.connect_timeout_ms = config.remote().connect_timeout_ms();
  curl.request_timeout_ms = config.remote().request_timeout_ms();

  app.http_client  = std::make_unique<remote::CurlHttpClient>(std::move(curl));
  app.synchronizer = std::make_unique<sync::Synchronizer>(*app.http_client, MakeSyncOptions(config));

  return app;
}

} // namespace keysync::factory
