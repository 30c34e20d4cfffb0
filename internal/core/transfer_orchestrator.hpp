#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "fetchgate/v1/tunnel.pb.h"
#include "internal/core/reassembler.hpp"
#include "internal/core/transfer_settings.hpp"
#include "internal/model/transfer.hpp"
#include "internal/util/time.hpp"

namespace fetchgate::ingest {
class IngestDispatcher;
}
namespace fetchgate::registry {
class ConnectionRegistry;
struct LivenessEvent;
}
namespace fetchgate::storage {
class ArtifactStore;
}

namespace fetchgate::core {

/*
  Owns every transfer from creation to its terminal state.

  Control calls (Create, Status, List, Cancel) run on gRPC handler threads.
  Tunnel events (OnChunk, OnAbort, liveness changes) arrive on tunnel reader
  threads. Neither mutates a transfer directly: each mutation is posted to the
  ingest shard that owns the transfer id and applied there, one at a time.
*/
class TransferOrchestrator {
 public:
  TransferOrchestrator(TransferSettings settings, std::shared_ptr<registry::ConnectionRegistry> registry,
                       std::shared_ptr<storage::ArtifactStore> store, std::shared_ptr<ingest::IngestDispatcher> dispatcher);
  ~TransferOrchestrator();

  TransferOrchestrator(const TransferOrchestrator&)            = delete;
  TransferOrchestrator& operator=(const TransferOrchestrator&) = delete;

  model::TransferSnapshot              Create(const std::string& agent_id, const std::string& source_path);
  model::TransferSnapshot              Status(const std::string& transfer_id) const;
  std::vector<model::TransferSnapshot> List() const;

  // Waits until the cancel was applied and returns the resulting record.
  model::TransferSnapshot Cancel(const std::string& transfer_id);

  void OnChunk(const std::string& agent_id, const std::string& session_id, fetchgate::v1::Chunk chunk);
  void OnAbort(const std::string& agent_id, const std::string& session_id, const fetchgate::v1::Abort& abort);
  void OnLivenessChange(const registry::LivenessEvent& event);

  // Posts a timeout check for every unfinished transfer past its deadline.
  // A pending transfer past its deadline has a tunnel write that never
  // returned. Returns the number of checks posted.
  std::size_t SweepTimeouts(util::SteadyTimePoint now);

  void Drain();

  const TransferSettings& Settings() const {
    return settings_;
  }

 private:
  // Mutable state of one transfer. Only the owning shard touches it after
  // creation.
  struct TransferState {
    model::TransferSnapshot      record;
    std::unique_ptr<Reassembler> reassembler;
    util::SteadyTimePoint        deadline{};
  };
  using StatePtr = std::shared_ptr<TransferState>;

  struct Published {
    model::TransferSnapshot snapshot;
    util::SteadyTimePoint   deadline{};
  };

  StatePtr Find(const std::string& transfer_id) const;
  bool     HasActiveTransfer(const std::string& agent_id) const;
  void     Publish(const TransferState& state);
  void     Publish(const model::TransferSnapshot& snapshot, util::SteadyTimePoint deadline);
  void     FailSession(const std::string& agent_id, const std::string& session_id, model::FailureReason reason);

  // Shard side
  void ApplyDispatch(TransferState& state, bool written);
  void MarkDispatched(TransferState& state);
  void ApplyChunk(TransferState& state, const std::string& session_id, const fetchgate::v1::Chunk& chunk);
  void ApplyAbort(TransferState& state, const std::string& session_id, const std::string& error);
  void ApplyTimeout(TransferState& state, util::SteadyTimePoint now);
  bool Advance(TransferState& state, model::TransferStatus next);
  void Fail(TransferState& state, model::FailureReason reason, std::string message);
  void Complete(TransferState& state);

  TransferSettings                              settings_;
  std::shared_ptr<registry::ConnectionRegistry> registry_;
  std::shared_ptr<storage::ArtifactStore>       store_;
  std::shared_ptr<ingest::IngestDispatcher>     dispatcher_;

  // Serializes the busy check with the insert in Create.
  std::mutex create_mutex_;

  mutable std::mutex                                index_mutex_;
  std::unordered_map<std::string, StatePtr>         transfers_;
  std::unordered_multimap<std::string, std::string> by_agent_;

  // Snapshot cache consistency model:
  // - Status/List read only from this cache and never wait for a shard.
  // - A shard republishes the record after every mutation it applies, so a
  //   reader sees each transfer at some state it actually passed through.
  // - Create publishes the pending record before writing the request.
  mutable std::shared_mutex                  snapshot_mutex_;
  std::unordered_map<std::string, Published> snapshots_;
};

} // namespace fetchgate::core
