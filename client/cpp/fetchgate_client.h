#pragma once

#include <arrow/result.h>
#include <arrow/status.h>
#include <grpcpp/channel.h>

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "fetchgate/v1/download_service.grpc.pb.h"

namespace fetchgate::client {

class DownloadClient {
 public:
  using ProgressCallback = std::function<void(const fetchgate::v1::Download&)>;

  explicit DownloadClient(std::shared_ptr<grpc::Channel> channel);

  arrow::Result<fetchgate::v1::HealthResponse> Health() const;

  arrow::Result<fetchgate::v1::ListClientsResponse> ListClients() const;

  // Empty file_path lets the server pick its default.
  arrow::Result<fetchgate::v1::StartDownloadResponse> StartDownload(const std::string& client_id, const std::string& file_path = {}) const;

  arrow::Result<fetchgate::v1::Download> GetDownload(const std::string& download_id) const;

  arrow::Result<fetchgate::v1::Download> CancelDownload(const std::string& download_id) const;

  // Polls until the download is completed or failed, or until timeout
  // elapses (zero waits forever). on_progress sees every polled record.
  arrow::Result<fetchgate::v1::Download> WaitForDownload(const std::string& download_id, std::chrono::milliseconds poll_interval,
                                                          std::chrono::milliseconds timeout = std::chrono::milliseconds::zero(),
                                                          const ProgressCallback& on_progress = {}) const;

 private:
  std::unique_ptr<fetchgate::v1::DownloadService::Stub> stub_;
};

} // namespace fetchgate::client
