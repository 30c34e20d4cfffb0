#include "internal/service/download_service.hpp"

#include <chrono>
#include <string_view>

#include "internal/core/transfer_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace fetchgate::service {

using namespace fetchgate::v1;

namespace {

template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view subject, Fn&& fn) {
  fetchgate::observability::SpanScope span(route);
  if (!subject.empty()) {
    span.SetAttribute("fetchgate.subject", subject);
  }

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto result = fn();
    fetchgate::observability::Metrics::Instance().RecordRequest(route, true);
    fetchgate::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    return result;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    FETCHGATE_LOG_ERROR("RPC failed", {fetchgate::observability::StringField("route", route), fetchgate::observability::StringField("error", ex.what()),
                                       fetchgate::observability::StringField("subject", subject)});
    fetchgate::observability::Metrics::Instance().RecordRequest(route, false);
    fetchgate::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    throw;
  }
}

Liveness ToProto(registry::Liveness liveness) {
  switch (liveness) {
    case registry::Liveness::kConnected:
      return LIVENESS_CONNECTED;
    case registry::Liveness::kDisconnected:
      return LIVENESS_DISCONNECTED;
  }
  return LIVENESS_UNSPECIFIED;
}

} // namespace

TransferStatus ToProto(model::TransferStatus status) {
  switch (status) {
    case model::TransferStatus::kPending:
      return TRANSFER_STATUS_PENDING;
    case model::TransferStatus::kDispatched:
      return TRANSFER_STATUS_DISPATCHED;
    case model::TransferStatus::kInProgress:
      return TRANSFER_STATUS_IN_PROGRESS;
    case model::TransferStatus::kCompleted:
      return TRANSFER_STATUS_COMPLETED;
    case model::TransferStatus::kFailed:
      return TRANSFER_STATUS_FAILED;
    case model::TransferStatus::kUnspecified:
      break;
  }
  return TRANSFER_STATUS_UNSPECIFIED;
}

FailureReason ToProto(model::FailureReason reason) {
  switch (reason) {
    case model::FailureReason::kNone:
      return FAILURE_REASON_NONE;
    case model::FailureReason::kProtocolViolation:
      return FAILURE_REASON_PROTOCOL_VIOLATION;
    case model::FailureReason::kInactivityTimeout:
      return FAILURE_REASON_INACTIVITY_TIMEOUT;
    case model::FailureReason::kAgentDisconnected:
      return FAILURE_REASON_AGENT_DISCONNECTED;
    case model::FailureReason::kConnectionReplaced:
      return FAILURE_REASON_CONNECTION_REPLACED;
    case model::FailureReason::kArtifactWriteFailure:
      return FAILURE_REASON_ARTIFACT_WRITE_FAILURE;
    case model::FailureReason::kAgentAborted:
      return FAILURE_REASON_AGENT_ABORTED;
    case model::FailureReason::kCancelled:
      return FAILURE_REASON_CANCELLED;
    case model::FailureReason::kDispatchFailed:
      return FAILURE_REASON_DISPATCH_FAILED;
  }
  return FAILURE_REASON_NONE;
}

Download ToProto(const model::TransferSnapshot& snapshot) {
  Download download;
  download.set_id(snapshot.id);
  download.set_client_id(snapshot.agent_id);
  download.set_file_path(snapshot.source_path);
  download.set_artifact_path(snapshot.artifact_path);
  download.set_status(ToProto(snapshot.status));
  download.set_chunks_received(snapshot.chunks_received);
  download.set_bytes_received(snapshot.bytes_received);
  if (snapshot.declared_total_bytes) {
    download.set_total_size(*snapshot.declared_total_bytes);
  }
  download.set_failure(ToProto(snapshot.failure));
  if (snapshot.error) {
    download.set_error(*snapshot.error);
  }
  *download.mutable_created_at() = util::ToProto(snapshot.created_at);
  if (snapshot.completed_at) {
    *download.mutable_completed_at() = util::ToProto(*snapshot.completed_at);
  }
  return download;
}

DownloadService::DownloadService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

HealthResponse DownloadService::Health(const HealthRequest&) {
  return ObserveRpc("DownloadService.Health", "", [&] {
    HealthResponse resp;
    resp.set_status("healthy");
    resp.set_connected_clients(ctx_.registry->Size());

    const auto transfers = ctx_.orchestrator->List();
    uint64_t   active    = 0;
    for (const auto& transfer : transfers) {
      if (!model::IsTerminal(transfer.status)) {
        ++active;
      }
    }
    resp.set_active_downloads(active);
    resp.set_total_downloads(transfers.size());
    return resp;
  });
}

ListClientsResponse DownloadService::ListClients(const ListClientsRequest&) {
  return ObserveRpc("DownloadService.ListClients", "", [&] {
    ListClientsResponse resp;
    for (const auto& agent : ctx_.registry->List()) {
      auto* client = resp.add_clients();
      client->set_client_id(agent.agent_id);
      client->set_liveness(ToProto(agent.liveness));
      *client->mutable_connected_at() = util::ToProto(agent.connected_at);
      *client->mutable_last_seen()    = util::ToProto(agent.last_seen);
    }
    return resp;
  });
}

StartDownloadResponse DownloadService::StartDownload(const StartDownloadRequest& req) {
  return ObserveRpc("DownloadService.StartDownload", req.client_id(), [&] {
    if (req.client_id().empty()) {
      throw fetchgate::util::InvalidArgument("start download: missing client_id");
    }
    const auto file_path = req.file_path().empty() ? std::string(kDefaultFilePath) : req.file_path();

    auto snapshot = ctx_.orchestrator->Create(req.client_id(), file_path);

    StartDownloadResponse resp;
    resp.set_download_id(snapshot.id);
    resp.set_status(ToProto(snapshot.status));
    return resp;
  });
}

Download DownloadService::GetDownload(const GetDownloadRequest& req) {
  return ObserveRpc("DownloadService.GetDownload", req.download_id(), [&] {
    if (req.download_id().empty()) {
      throw fetchgate::util::InvalidArgument("get download: missing download_id");
    }
    return ToProto(ctx_.orchestrator->Status(req.download_id()));
  });
}

Download DownloadService::CancelDownload(const CancelDownloadRequest& req) {
  return ObserveRpc("DownloadService.CancelDownload", req.download_id(), [&] {
    if (req.download_id().empty()) {
      throw fetchgate::util::InvalidArgument("cancel download: missing download_id");
    }
    return ToProto(ctx_.orchestrator->Cancel(req.download_id()));
  });
}

} // namespace fetchgate::service
