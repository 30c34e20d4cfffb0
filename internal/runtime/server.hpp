#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace fetchgate::runtime {

class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  void Start();
  void Wait();

  // Gives in-flight calls up to grace to finish, then cancels them.
  void Stop(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

  // Port actually bound; useful with "host:0".
  int BoundPort() const {
    return bound_port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           bound_port_ = 0;
};

} // namespace fetchgate::runtime
