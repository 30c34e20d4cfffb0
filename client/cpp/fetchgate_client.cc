#include "fetchgate_client.h"

#include <grpcpp/grpcpp.h>

#include <string_view>
#include <thread>

namespace fetchgate::client {

namespace {

arrow::Status GrpcToArrow(const grpc::Status& status, std::string_view action) {
  switch (status.error_code()) {
    case grpc::StatusCode::OK:
      return arrow::Status::OK();
    case grpc::StatusCode::NOT_FOUND:
      return arrow::Status::KeyError(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::INVALID_ARGUMENT:
      return arrow::Status::Invalid(std::string(action), " failed: ", status.error_message());
    case grpc::StatusCode::CANCELLED:
      return arrow::Status::Cancelled(std::string(action), " failed: ", status.error_message());
    default:
      return arrow::Status::IOError(std::string(action), " failed: ", status.error_message());
  }
}

bool IsTerminal(fetchgate::v1::TransferStatus status) {
  return status == fetchgate::v1::TRANSFER_STATUS_COMPLETED || status == fetchgate::v1::TRANSFER_STATUS_FAILED;
}

} // namespace

DownloadClient::DownloadClient(std::shared_ptr<grpc::Channel> channel) : stub_(fetchgate::v1::DownloadService::NewStub(std::move(channel))) {
}

arrow::Result<fetchgate::v1::HealthResponse> DownloadClient::Health() const {
  fetchgate::v1::HealthRequest  req;
  fetchgate::v1::HealthResponse resp;
  grpc::ClientContext           ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->Health(&ctx, req, &resp), "Health"));
  return resp;
}

arrow::Result<fetchgate::v1::ListClientsResponse> DownloadClient::ListClients() const {
  fetchgate::v1::ListClientsRequest  req;
  fetchgate::v1::ListClientsResponse resp;
  grpc::ClientContext                ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->ListClients(&ctx, req, &resp), "ListClients"));
  return resp;
}

arrow::Result<fetchgate::v1::StartDownloadResponse> DownloadClient::StartDownload(const std::string& client_id, const std::string& file_path) const {
  fetchgate::v1::StartDownloadRequest req;
  req.set_client_id(client_id);
  req.set_file_path(file_path);

  fetchgate::v1::StartDownloadResponse resp;
  grpc::ClientContext                  ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->StartDownload(&ctx, req, &resp), "StartDownload"));
  return resp;
}

arrow::Result<fetchgate::v1::Download> DownloadClient::GetDownload(const std::string& download_id) const {
  fetchgate::v1::GetDownloadRequest req;
  req.set_download_id(download_id);

  fetchgate::v1::Download resp;
  grpc::ClientContext     ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->GetDownload(&ctx, req, &resp), "GetDownload"));
  return resp;
}

arrow::Result<fetchgate::v1::Download> DownloadClient::CancelDownload(const std::string& download_id) const {
  fetchgate::v1::CancelDownloadRequest req;
  req.set_download_id(download_id);

  fetchgate::v1::Download resp;
  grpc::ClientContext     ctx;
  ARROW_RETURN_NOT_OK(GrpcToArrow(stub_->CancelDownload(&ctx, req, &resp), "CancelDownload"));
  return resp;
}

arrow::Result<fetchgate::v1::Download> DownloadClient::WaitForDownload(const std::string& download_id, std::chrono::milliseconds poll_interval,
                                                                        std::chrono::milliseconds timeout, const ProgressCallback& on_progress) const {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (true) {
    ARROW_ASSIGN_OR_RAISE(auto download, GetDownload(download_id));
    if (on_progress) on_progress(download);
    if (IsTerminal(download.status())) return download;

    if (timeout.count() > 0 && std::chrono::steady_clock::now() + poll_interval > deadline) {
      return arrow::Status::IOError("WaitForDownload failed: download ", download_id, " still running after ", timeout.count(), " ms");
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

} // namespace fetchgate::client
