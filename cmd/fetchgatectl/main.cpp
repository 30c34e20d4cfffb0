#include <grpcpp/grpcpp.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iostream>
#include <string>

#include "client/cpp/fetchgate_client.h"
#include "fetchgate/v1.hpp"

using namespace fetchgate::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fetchgatectl <addr> health\n"
            << "  fetchgatectl <addr> clients\n"
            << "  fetchgatectl <addr> download <client_id> [file_path] [--no-wait]\n"
            << "  fetchgatectl <addr> status <download_id>\n"
            << "  fetchgatectl <addr> cancel <download_id>\n";
}

static std::string StatusName(TransferStatus status) {
  std::string name = TransferStatus_Name(status);
  const std::string prefix = "TRANSFER_STATUS_";
  if (name.rfind(prefix, 0) == 0) name = name.substr(prefix.size());
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return name;
}

static std::string FormatTime(const google::protobuf::Timestamp& ts) {
  if (ts.seconds() == 0 && ts.nanos() == 0) return "-";
  std::time_t secs = static_cast<std::time_t>(ts.seconds());
  std::tm     tm{};
  gmtime_r(&secs, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static void PrintDownload(const Download& d) {
  std::cout << "id: " << d.id() << "\n"
            << "client_id: " << d.client_id() << "\n"
            << "file_path: " << d.file_path() << "\n"
            << "artifact_path: " << d.artifact_path() << "\n"
            << "status: " << StatusName(d.status()) << "\n"
            << "chunks_received: " << d.chunks_received() << "\n"
            << "bytes_received: " << d.bytes_received() << "\n";
  if (d.has_total_size()) std::cout << "total_size: " << d.total_size() << "\n";
  if (d.has_error()) std::cout << "error: " << d.error() << " (" << FailureReason_Name(d.failure()) << ")\n";
  std::cout << "created_at: " << FormatTime(d.created_at()) << "\n"
            << "completed_at: " << FormatTime(d.completed_at()) << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string addr = argv[1];
  const std::string cmd  = argv[2];

  fetchgate::client::DownloadClient client(grpc::CreateChannel(addr, grpc::InsecureChannelCredentials()));

  // ------------------------------------------------------------
  // health
  // ------------------------------------------------------------
  if (cmd == "health") {
    auto result = client.Health();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    std::cout << "status: " << result->status() << "\n"
              << "connected_clients: " << result->connected_clients() << "\n"
              << "active_downloads: " << result->active_downloads() << "\n"
              << "total_downloads: " << result->total_downloads() << "\n";
    return 0;
  }

  // ------------------------------------------------------------
  // clients
  // ------------------------------------------------------------
  if (cmd == "clients") {
    auto result = client.ListClients();
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    if (result->clients().empty()) {
      std::cout << "no clients connected\n";
      return 0;
    }
    for (const auto& c : result->clients()) {
      std::cout << c.client_id() << "  " << Liveness_Name(c.liveness()) << "  connected_at=" << FormatTime(c.connected_at())
                << "  last_seen=" << FormatTime(c.last_seen()) << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------
  // download
  // ------------------------------------------------------------
  if (cmd == "download") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    std::string client_id = argv[3];
    std::string file_path;
    bool        wait = true;
    for (int i = 4; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--no-wait") {
        wait = false;
      } else {
        file_path = arg;
      }
    }

    auto started = client.StartDownload(client_id, file_path);
    if (!started.ok()) {
      std::cerr << started.status().ToString() << "\n";
      return 2;
    }
    std::cout << "Download started: " << started->download_id() << "\n";
    if (!wait) return 0;

    auto finished = client.WaitForDownload(started->download_id(), std::chrono::seconds(2), std::chrono::milliseconds::zero(),
                                           [](const Download& d) {
                                             std::cout << "Status: " << StatusName(d.status()) << " (chunks: " << d.chunks_received() << ")\n";
                                           });
    if (!finished.ok()) {
      std::cerr << finished.status().ToString() << "\n";
      return 2;
    }
    if (finished->status() == TRANSFER_STATUS_COMPLETED) {
      std::cout << "Download completed! File saved to: " << finished->artifact_path() << "\n"
                << "Size: " << finished->bytes_received() << " bytes\n";
      return 0;
    }
    std::cerr << "Download failed: " << finished->error() << "\n";
    return 3;
  }

  // ------------------------------------------------------------
  // status / cancel
  // ------------------------------------------------------------
  if (cmd == "status" || cmd == "cancel") {
    if (argc < 4) {
      Usage();
      return 1;
    }
    auto result = cmd == "status" ? client.GetDownload(argv[3]) : client.CancelDownload(argv[3]);
    if (!result.ok()) {
      std::cerr << result.status().ToString() << "\n";
      return 2;
    }
    PrintDownload(*result);
    return 0;
  }

  Usage();
  return 1;
}
