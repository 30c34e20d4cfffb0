#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/core/transfer_orchestrator.hpp"
#include "internal/grpc/download_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/ingest/ingest_dispatcher.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/service/download_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "support/fakes.hpp"

namespace {

using namespace fetchgate::v1;

struct ServerFixture {
  std::shared_ptr<fetchgate::registry::ConnectionRegistry> registry;
  std::shared_ptr<fetchgate::ingest::IngestDispatcher>     dispatcher;
  std::shared_ptr<fetchgate::core::TransferOrchestrator>   orchestrator;
  std::unique_ptr<fetchgate::grpc::DownloadServer>         server;

  explicit ServerFixture(bool allow_concurrent = true) {
    fetchgate::core::TransferSettings settings;
    settings.allow_concurrent_per_agent = allow_concurrent;

    registry   = std::make_shared<fetchgate::registry::ConnectionRegistry>();
    dispatcher = std::make_shared<fetchgate::ingest::IngestDispatcher>(1, 4);
    dispatcher->Start();
    orchestrator = std::make_shared<fetchgate::core::TransferOrchestrator>(settings, registry,
                                                                           std::make_shared<fetchgate::testing::MemoryArtifactStore>(), dispatcher);

    fetchgate::service::ServiceContext ctx;
    ctx.registry     = registry;
    ctx.orchestrator = orchestrator;
    server           = std::make_unique<fetchgate::grpc::DownloadServer>(std::make_shared<fetchgate::service::DownloadService>(ctx));
  }

  ~ServerFixture() {
    server.reset();
    orchestrator.reset();
    dispatcher->Stop();
  }

  ::grpc::Status Start(const std::string& client_id, const std::string& file_path, StartDownloadResponse* resp) {
    StartDownloadRequest req;
    req.set_client_id(client_id);
    req.set_file_path(file_path);
    ::grpc::ServerContext grpc_ctx;
    return server->StartDownload(&grpc_ctx, &req, resp);
  }
};

void TestExceptionMapping() {
  using namespace fetchgate::util;
  assert(fetchgate::grpc::ToStatus(AgentNotConnected("x")).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(fetchgate::grpc::ToStatus(AgentBusy("x")).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
  assert(fetchgate::grpc::ToStatus(TransferNotFound("x")).error_code() == ::grpc::StatusCode::NOT_FOUND);
  assert(fetchgate::grpc::ToStatus(InvalidArgument("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
  assert(fetchgate::grpc::ToStatus(ProtocolViolation("x")).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);

  const auto internal = fetchgate::grpc::ToStatus(std::runtime_error("disk on fire"));
  assert(internal.error_code() == ::grpc::StatusCode::INTERNAL);
  assert(internal.error_message() == "disk on fire");
}

void TestStartForDisconnectedClientReturnsFailedPrecondition() {
  ServerFixture         fixture;
  StartDownloadResponse resp;
  const auto            status = fixture.Start("edge-9", "/tmp/x", &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
  assert(status.error_message() == "client edge-9 is not connected");
}

void TestStartWithoutClientIdReturnsInvalidArgument() {
  ServerFixture         fixture;
  StartDownloadResponse resp;
  assert(fixture.Start("", "/tmp/x", &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestStartUsesDefaultFilePath() {
  ServerFixture fixture;
  fixture.registry->Register(std::make_shared<fetchgate::testing::FakeAgentConnection>("edge-1", "s1"));

  StartDownloadResponse resp;
  assert(fixture.Start("edge-1", "", &resp).ok());
  assert(!resp.download_id().empty());
  assert(resp.status() == TRANSFER_STATUS_PENDING);

  GetDownloadRequest req;
  req.set_download_id(resp.download_id());
  Download              download;
  ::grpc::ServerContext grpc_ctx;
  assert(fixture.server->GetDownload(&grpc_ctx, &req, &download).ok());
  assert(download.file_path() == fetchgate::service::kDefaultFilePath);
  assert(download.client_id() == "edge-1");
  assert(!download.has_error());
}

void TestBusyClientReturnsResourceExhausted() {
  ServerFixture fixture(false);
  fixture.registry->Register(std::make_shared<fetchgate::testing::FakeAgentConnection>("edge-1", "s1"));

  StartDownloadResponse resp;
  assert(fixture.Start("edge-1", "/a", &resp).ok());
  assert(fixture.Start("edge-1", "/b", &resp).error_code() == ::grpc::StatusCode::RESOURCE_EXHAUSTED);
}

void TestGetAndCancelUnknownDownloadReturnNotFound() {
  ServerFixture fixture;

  GetDownloadRequest get;
  get.set_download_id("missing");
  Download              download;
  ::grpc::ServerContext get_ctx;
  assert(fixture.server->GetDownload(&get_ctx, &get, &download).error_code() == ::grpc::StatusCode::NOT_FOUND);

  CancelDownloadRequest cancel;
  cancel.set_download_id("missing");
  ::grpc::ServerContext cancel_ctx;
  assert(fixture.server->CancelDownload(&cancel_ctx, &cancel, &download).error_code() == ::grpc::StatusCode::NOT_FOUND);

  GetDownloadRequest    empty;
  ::grpc::ServerContext empty_ctx;
  assert(fixture.server->GetDownload(&empty_ctx, &empty, &download).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestHealthAndListClients() {
  ServerFixture fixture;
  fixture.registry->Register(std::make_shared<fetchgate::testing::FakeAgentConnection>("edge-b", "s1"));
  fixture.registry->Register(std::make_shared<fetchgate::testing::FakeAgentConnection>("edge-a", "s2"));

  StartDownloadResponse started;
  assert(fixture.Start("edge-a", "/a", &started).ok());

  HealthRequest         health_req;
  HealthResponse        health;
  ::grpc::ServerContext health_ctx;
  assert(fixture.server->Health(&health_ctx, &health_req, &health).ok());
  assert(health.status() == "healthy");
  assert(health.connected_clients() == 2);
  assert(health.active_downloads() == 1);
  assert(health.total_downloads() == 1);

  ListClientsRequest    list_req;
  ListClientsResponse   list;
  ::grpc::ServerContext list_ctx;
  assert(fixture.server->ListClients(&list_ctx, &list_req, &list).ok());
  assert(list.clients_size() == 2);
  assert(list.clients(0).client_id() == "edge-a");
  assert(list.clients(0).liveness() == LIVENESS_CONNECTED);
}

void TestCancelReturnsFailedRecord() {
  ServerFixture fixture;
  fixture.registry->Register(std::make_shared<fetchgate::testing::FakeAgentConnection>("edge-1", "s1"));

  StartDownloadResponse started;
  assert(fixture.Start("edge-1", "/a", &started).ok());

  CancelDownloadRequest req;
  req.set_download_id(started.download_id());
  Download              download;
  ::grpc::ServerContext grpc_ctx;
  assert(fixture.server->CancelDownload(&grpc_ctx, &req, &download).ok());
  assert(download.status() == TRANSFER_STATUS_FAILED);
  assert(download.failure() == FAILURE_REASON_CANCELLED);
  assert(download.error() == "cancelled");
}

} // namespace

int main() {
  TestExceptionMapping();
  TestStartForDisconnectedClientReturnsFailedPrecondition();
  TestStartWithoutClientIdReturnsInvalidArgument();
  TestStartUsesDefaultFilePath();
  TestBusyClientReturnsResourceExhausted();
  TestGetAndCancelUnknownDownloadReturnNotFound();
  TestHealthAndListClients();
  TestCancelReturnsFailedRecord();
  std::cout << "grpc_status_test: pass\n";
  return 0;
}
