#include "internal/factory.hpp"

#include <memory>

#include "internal/config/settings.hpp"
#include "internal/core/timeout_sweeper.hpp"
#include "internal/core/transfer_orchestrator.hpp"
#include "internal/grpc/download_server.hpp"
#include "internal/grpc/tunnel_server.hpp"
#include "internal/ingest/ingest_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/download_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"

namespace fetchgate::factory {

using namespace fetchgate;

/*
    Build full application dependency graph
*/
Application Build(const fetchgate::runtime::config::RuntimeConfig& config) {
  Application app;
  const auto  settings = config::ResolveTransferSettings(config);

  // ------------------------------------------------------------------
  // Artifact storage
  // ------------------------------------------------------------------
  auto store = std::make_shared<storage::DiskArtifactStore>(settings.download_dir);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  app.registry   = std::make_shared<registry::ConnectionRegistry>();
  app.dispatcher = std::make_shared<ingest::IngestDispatcher>(settings.ingest_shards, settings.ingest_queue_depth);
  app.dispatcher->Start();

  app.orchestrator = std::make_shared<core::TransferOrchestrator>(settings, app.registry, store, app.dispatcher);

  // ------------------------------------------------------------------
  // Timeout sweeper
  // ------------------------------------------------------------------
  app.sweeper = std::make_shared<core::TimeoutSweeper>(app.orchestrator, settings.sweep_interval);
  app.sweeper->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.registry     = app.registry;
  ctx.orchestrator = app.orchestrator;

  auto download_service = std::make_shared<service::DownloadService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::TunnelServer>(app.registry, app.orchestrator));
  app.grpc_services.push_back(std::make_unique<grpc::DownloadServer>(download_service));

  FETCHGATE_LOG_INFO("Transfer settings", {observability::StringField("download_dir", store->Root().string()),
                                           observability::UintField("chunk_size_bytes", settings.chunk_size_bytes),
                                           observability::IntField("inactivity_timeout_ms", settings.inactivity_timeout.count()),
                                           observability::BoolField("allow_concurrent_per_agent", settings.allow_concurrent_per_agent),
                                           observability::UintField("ingest_shards", settings.ingest_shards)});
  return app;
}

void Application::Stop() {
  if (sweeper) sweeper->Stop();
  if (dispatcher) {
    dispatcher->Drain();
    dispatcher->Stop();
  }
}

} // namespace fetchgate::factory
