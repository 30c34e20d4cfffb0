#include "internal/agent/agent_client.hpp"

#include <algorithm>
#include <memory>
#include <thread>

#include "fetchgate/v1/tunnel.grpc.pb.h"
#include "internal/agent/artifact_sender.hpp"
#include "internal/agent/path_expansion.hpp"
#include "internal/ingest/ingest_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/tunnel/codec.hpp"

namespace fetchgate::agent {

using namespace fetchgate::v1;
using observability::StringField;
using observability::UintField;

namespace {

using TunnelStream = ::grpc::ClientReaderWriter<AgentMessage, ServerMessage>;

constexpr std::size_t kSendQueueDepth = 64;

void SendFile(ChunkSink& sink, const TransferRequest& request, std::uint64_t chunk_size) {
  const auto path = ExpandPath(request.source_path());
  FETCHGATE_LOG_INFO("Sending file", {StringField("transfer_id", request.transfer_id()), StringField("path", path)});

  ArtifactSender sender(chunk_size);
  auto           result = sender.Send(request.transfer_id(), path, sink);
  if (result.ok) {
    FETCHGATE_LOG_INFO("File sent", {StringField("transfer_id", request.transfer_id()), UintField("chunks", result.chunks),
                                     UintField("bytes", result.bytes)});
  } else {
    FETCHGATE_LOG_WARN("File transfer aborted", {StringField("transfer_id", request.transfer_id()), StringField("error", result.error)});
  }
}

// Serializes writes from the transfer and heartbeat threads onto the stream.
class StreamSink final : public ChunkSink {
 public:
  explicit StreamSink(TunnelStream* stream) : stream_(stream) {
  }

  bool Write(const AgentMessage& message) override {
    std::lock_guard lock(mutex_);
    if (closed_) return false;
    if (!stream_->Write(message)) {
      closed_ = true;
      return false;
    }
    return true;
  }

  void Close() {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }

 private:
  std::mutex    mutex_;
  TunnelStream* stream_;
  bool          closed_ = false;
};

} // namespace

AgentClient::AgentClient(AgentOptions options) : options_(std::move(options)) {
}

AgentClient::~AgentClient() {
  Stop();
}

void AgentClient::Run() {
  while (running_) {
    RunOnce();
    if (!running_) break;

    FETCHGATE_LOG_INFO("Reconnecting", {StringField("server", options_.server_address),
                                        observability::IntField("delay_ms", options_.reconnect_delay.count())});
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.reconnect_delay, [&] { return !running_; });
  }
}

bool AgentClient::RunOnce() {
  auto channel = ::grpc::CreateChannel(options_.server_address, ::grpc::InsecureChannelCredentials());
  auto stub    = AgentTunnel::NewStub(channel);

  ::grpc::ClientContext context;
  {
    std::lock_guard lock(mutex_);
    if (!running_) return false;
    active_context_ = &context;
  }

  auto       stream = stub->Connect(&context);
  StreamSink sink(stream.get());

  // Keyed by transfer id; Stop() runs whatever is still queued against the
  // closed sink, which fails fast.
  ingest::IngestDispatcher senders(options_.send_workers, kSendQueueDepth);
  senders.Start();

  std::thread              heartbeat;
  bool                     accepted = false;
  std::atomic<bool>        session_open{true};
  std::mutex               heartbeat_mutex;
  std::condition_variable  heartbeat_cv;

  if (sink.Write(tunnel::MakeRegister(options_.agent_id))) {
    heartbeat = std::thread([&] {
      std::unique_lock lock(heartbeat_mutex);
      while (session_open) {
        heartbeat_cv.wait_for(lock, options_.heartbeat_interval, [&] { return !session_open.load(); });
        if (!session_open) break;
        if (!sink.Write(tunnel::MakeHeartbeat())) break;
      }
    });

    auto          chunk_size = options_.chunk_size_bytes;
    ServerMessage message;
    while (stream->Read(&message)) {
      switch (message.body_case()) {
        case ServerMessage::kRegistered: {
          accepted = true;
          registered_ = true;
          if (message.registered().chunk_size_bytes() > 0) {
            chunk_size = std::min(chunk_size, message.registered().chunk_size_bytes());
          }
          FETCHGATE_LOG_INFO("Registered with server", {StringField("agent_id", options_.agent_id),
                                                        StringField("session_id", message.registered().session_id()),
                                                        UintField("chunk_size_bytes", chunk_size)});
          break;
        }
        case ServerMessage::kTransferRequest: {
          const auto transfer_id = message.transfer_request().transfer_id();
          auto       request     = message.transfer_request();
          auto       size_limit  = request.chunk_size_bytes() > 0 ? std::min(chunk_size, request.chunk_size_bytes()) : chunk_size;
          if (!senders.Post(transfer_id, [&sink, request = std::move(request), size_limit] { SendFile(sink, request, size_limit); })) {
            FETCHGATE_LOG_WARN("Dropping transfer request", {StringField("transfer_id", transfer_id)});
          }
          break;
        }
        case ServerMessage::BODY_NOT_SET:
          break;
      }
    }
  }

  sink.Close();
  {
    std::lock_guard lock(heartbeat_mutex);
    session_open = false;
  }
  heartbeat_cv.notify_all();
  if (heartbeat.joinable()) heartbeat.join();
  senders.Stop();

  {
    std::lock_guard lock(mutex_);
    active_context_ = nullptr;
  }
  registered_ = false;

  auto status = stream->Finish();
  if (!status.ok() && running_) {
    FETCHGATE_LOG_WARN("Tunnel closed", {StringField("server", options_.server_address), StringField("error", status.error_message())});
  } else {
    FETCHGATE_LOG_INFO("Tunnel closed", {StringField("server", options_.server_address)});
  }
  return accepted;
}

void AgentClient::Stop() {
  std::lock_guard lock(mutex_);
  running_ = false;
  if (active_context_ != nullptr) {
    active_context_->TryCancel();
  }
  cv_.notify_all();
}

} // namespace fetchgate::agent
