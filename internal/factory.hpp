#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/remote/http_client.hpp"
#include "internal/sync/synchronizer.hpp"

namespace keysync::factory {

/*
  Application

  Owns everything a run needs. The synchronizer holds a reference to the
  HTTP client, so both live and die together here.
*/
struct Application {
  std::unique_ptr<remote::HttpClient> http_client;
  std::unique_ptr<sync::Synchronizer> synchronizer;
};

/*
  Build

  Composition root: the ONLY place that knows the concrete transport.
*/
Application Build(const keysync::runtime::config::RuntimeConfig& config);

// Maps the runtime config onto the synchronizer's options.
sync::SyncOptions MakeSyncOptions(const keysync::runtime::config::RuntimeConfig& config);

} // namespace keysync::factory
