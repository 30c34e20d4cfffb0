#include "internal/grpc/download_server.hpp"

#include "internal/grpc/grpc_error.hpp"

namespace fetchgate::grpc {

using namespace fetchgate::v1;

DownloadServer::DownloadServer(std::shared_ptr<fetchgate::service::DownloadService> svc) : service_(std::move(svc)) {
}

::grpc::Status DownloadServer::Health(::grpc::ServerContext*, const HealthRequest* req, HealthResponse* resp) {
  try {
    *resp = service_->Health(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::ListClients(::grpc::ServerContext*, const ListClientsRequest* req, ListClientsResponse* resp) {
  try {
    *resp = service_->ListClients(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::StartDownload(::grpc::ServerContext*, const StartDownloadRequest* req, StartDownloadResponse* resp) {
  try {
    *resp = service_->StartDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::GetDownload(::grpc::ServerContext*, const GetDownloadRequest* req, Download* resp) {
  try {
    *resp = service_->GetDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DownloadServer::CancelDownload(::grpc::ServerContext*, const CancelDownloadRequest* req, Download* resp) {
  try {
    *resp = service_->CancelDownload(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace fetchgate::grpc
