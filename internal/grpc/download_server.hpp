#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fetchgate/v1/download_service.grpc.pb.h"
#include "internal/service/download_service.hpp"

namespace fetchgate::grpc {

class DownloadServer final : public fetchgate::v1::DownloadService::Service {
 public:
  explicit DownloadServer(std::shared_ptr<fetchgate::service::DownloadService> svc);

  ::grpc::Status Health(::grpc::ServerContext*, const fetchgate::v1::HealthRequest*, fetchgate::v1::HealthResponse*) override;
  ::grpc::Status ListClients(::grpc::ServerContext*, const fetchgate::v1::ListClientsRequest*, fetchgate::v1::ListClientsResponse*) override;
  ::grpc::Status StartDownload(::grpc::ServerContext*, const fetchgate::v1::StartDownloadRequest*, fetchgate::v1::StartDownloadResponse*) override;
  ::grpc::Status GetDownload(::grpc::ServerContext*, const fetchgate::v1::GetDownloadRequest*, fetchgate::v1::Download*) override;
  ::grpc::Status CancelDownload(::grpc::ServerContext*, const fetchgate::v1::CancelDownloadRequest*, fetchgate::v1::Download*) override;

 private:
  std::shared_ptr<fetchgate::service::DownloadService> service_;
};

} // namespace fetchgate::grpc
