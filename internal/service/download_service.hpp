#pragma once

#include "fetchgate/v1/download_service.pb.h"
#include "internal/model/transfer.hpp"
#include "internal/service/service_context.hpp"

namespace fetchgate::service {

// Path requested when StartDownload names no file.
inline constexpr const char* kDefaultFilePath = "$HOME/file_to_download.txt";

class DownloadService {
 public:
  explicit DownloadService(ServiceContext ctx);

  fetchgate::v1::HealthResponse        Health(const fetchgate::v1::HealthRequest& req);
  fetchgate::v1::ListClientsResponse   ListClients(const fetchgate::v1::ListClientsRequest& req);
  fetchgate::v1::StartDownloadResponse StartDownload(const fetchgate::v1::StartDownloadRequest& req);
  fetchgate::v1::Download              GetDownload(const fetchgate::v1::GetDownloadRequest& req);
  fetchgate::v1::Download              CancelDownload(const fetchgate::v1::CancelDownloadRequest& req);

 private:
  ServiceContext ctx_;
};

fetchgate::v1::TransferStatus ToProto(model::TransferStatus status);
fetchgate::v1::FailureReason  ToProto(model::FailureReason reason);
fetchgate::v1::Download       ToProto(const model::TransferSnapshot& snapshot);

} // namespace fetchgate::service
