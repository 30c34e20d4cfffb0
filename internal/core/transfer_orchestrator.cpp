#include "internal/core/transfer_orchestrator.hpp"

#include <exception>
#include <future>
#include <optional>
#include <stdexcept>
#include <utility>

#include "internal/ingest/ingest_dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/storage/artifact_store.hpp"
#include "internal/tunnel/codec.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fetchgate::core {

using observability::StringField;
using observability::UintField;

TransferOrchestrator::TransferOrchestrator(TransferSettings settings, std::shared_ptr<registry::ConnectionRegistry> registry,
                                           std::shared_ptr<storage::ArtifactStore> store, std::shared_ptr<ingest::IngestDispatcher> dispatcher)
    : settings_(std::move(settings)), registry_(std::move(registry)), store_(std::move(store)), dispatcher_(std::move(dispatcher)) {
  registry_->SetListener([this](const registry::LivenessEvent& event) { OnLivenessChange(event); });
}

TransferOrchestrator::~TransferOrchestrator() {
  registry_->SetListener(nullptr);
  dispatcher_->Drain();
}

// ---------------------------------------------------------------------------
// Control side
// ---------------------------------------------------------------------------

model::TransferSnapshot TransferOrchestrator::Create(const std::string& agent_id, const std::string& source_path) {
  if (agent_id.empty()) {
    throw util::InvalidArgument("client_id is required");
  }
  if (source_path.empty()) {
    throw util::InvalidArgument("file_path is required");
  }

  auto connection = registry_->Lookup(agent_id);
  if (!connection) {
    throw util::AgentNotConnected("client " + agent_id + " is not connected");
  }

  auto state = std::make_shared<TransferState>();
  auto& rec  = state->record;
  rec.id     = util::NewId();
  rec.agent_id    = agent_id;
  rec.source_path = source_path;
  rec.session_id  = connection->SessionId();
  rec.status      = model::TransferStatus::kPending;
  rec.created_at  = util::Now();
  rec.last_activity_at = rec.created_at;
  state->deadline      = util::SteadyNow() + settings_.inactivity_timeout;

  try {
    rec.artifact_path = store_->Resolve(agent_id, rec.id, source_path).string();
  } catch (const std::invalid_argument& e) {
    throw util::InvalidArgument(e.what());
  }

  // Copied before the record becomes visible to shards.
  auto snapshot = rec;

  {
    std::lock_guard create_lock(create_mutex_);
    if (!settings_.allow_concurrent_per_agent && HasActiveTransfer(agent_id)) {
      throw util::AgentBusy("client " + agent_id + " already has a transfer in flight");
    }

    {
      std::lock_guard lock(index_mutex_);
      transfers_.emplace(snapshot.id, state);
      by_agent_.emplace(agent_id, snapshot.id);
    }
    Publish(snapshot, state->deadline);
  }

  FETCHGATE_LOG_INFO("Transfer created", {StringField("transfer_id", snapshot.id), StringField("agent_id", agent_id),
                                          StringField("source_path", source_path), StringField("artifact_path", snapshot.artifact_path)});

  if (!dispatcher_->Running()) {
    // No shard owns the state anymore.
    Fail(*state, model::FailureReason::kDispatchFailed, "dispatch failed: server is shutting down");
    return state->record;
  }

  // The tunnel write runs on the caller's thread so a tunnel stuck on flow
  // control never occupies a shard. A write that never returns is failed by
  // the sweeper once the pending deadline passes.
  const bool written = connection->Send(tunnel::MakeTransferRequest(snapshot.id, snapshot.source_path, settings_.chunk_size_bytes));

  auto posted = dispatcher_->Post(snapshot.id, [this, state, written] { ApplyDispatch(*state, written); });
  if (!posted) {
    FETCHGATE_LOG_WARN("Dropping dispatch during shutdown", {StringField("transfer_id", snapshot.id)});
  }
  return snapshot;
}

model::TransferSnapshot TransferOrchestrator::Status(const std::string& transfer_id) const {
  std::shared_lock lock(snapshot_mutex_);
  auto             it = snapshots_.find(transfer_id);
  if (it == snapshots_.end()) {
    throw util::TransferNotFound("download " + transfer_id + " not found");
  }
  return it->second.snapshot;
}

std::vector<model::TransferSnapshot> TransferOrchestrator::List() const {
  std::vector<model::TransferSnapshot> result;
  std::shared_lock                     lock(snapshot_mutex_);
  result.reserve(snapshots_.size());
  for (const auto& [id, published] : snapshots_) {
    result.push_back(published.snapshot);
  }
  return result;
}

model::TransferSnapshot TransferOrchestrator::Cancel(const std::string& transfer_id) {
  auto state = Find(transfer_id);
  if (!state) {
    throw util::TransferNotFound("download " + transfer_id + " not found");
  }

  std::promise<void> applied;
  auto               done   = applied.get_future();
  auto               posted = dispatcher_->Post(transfer_id, [this, state, &applied] {
    try {
      Fail(*state, model::FailureReason::kCancelled, std::string(model::DefaultMessage(model::FailureReason::kCancelled)));
      applied.set_value();
    } catch (...) {
      applied.set_exception(std::current_exception());
    }
  });
  if (posted) {
    done.get();
  }
  return Status(transfer_id);
}

// ---------------------------------------------------------------------------
// Tunnel side
// ---------------------------------------------------------------------------

void TransferOrchestrator::OnChunk(const std::string& agent_id, const std::string& session_id, fetchgate::v1::Chunk chunk) {
  auto state = Find(chunk.transfer_id());
  if (!state) {
    FETCHGATE_LOG_WARN("Dropping chunk for unknown transfer",
                       {StringField("transfer_id", chunk.transfer_id()), StringField("agent_id", agent_id), UintField("sequence", chunk.sequence())});
    return;
  }
  if (state->record.agent_id != agent_id) {
    FETCHGATE_LOG_WARN("Dropping chunk from foreign agent", {StringField("transfer_id", chunk.transfer_id()), StringField("agent_id", agent_id),
                                                             StringField("owner", state->record.agent_id)});
    return;
  }

  auto shared_chunk = std::make_shared<const fetchgate::v1::Chunk>(std::move(chunk));
  auto posted       = dispatcher_->Post(shared_chunk->transfer_id(),
                                        [this, state, session_id, shared_chunk] { ApplyChunk(*state, session_id, *shared_chunk); });
  if (!posted) {
    FETCHGATE_LOG_WARN("Dropping chunk during shutdown", {StringField("transfer_id", shared_chunk->transfer_id())});
  }
}

void TransferOrchestrator::OnAbort(const std::string& agent_id, const std::string& session_id, const fetchgate::v1::Abort& abort) {
  auto state = Find(abort.transfer_id());
  if (!state || state->record.agent_id != agent_id) {
    FETCHGATE_LOG_WARN("Dropping abort for unknown transfer", {StringField("transfer_id", abort.transfer_id()), StringField("agent_id", agent_id)});
    return;
  }

  auto posted = dispatcher_->Post(abort.transfer_id(), [this, state, session_id, error = abort.error()] { ApplyAbort(*state, session_id, error); });
  if (!posted) {
    FETCHGATE_LOG_WARN("Dropping abort during shutdown", {StringField("transfer_id", abort.transfer_id())});
  }
}

void TransferOrchestrator::OnLivenessChange(const registry::LivenessEvent& event) {
  switch (event.kind) {
    case registry::LivenessEvent::Kind::kConnected:
      break;
    case registry::LivenessEvent::Kind::kReplaced:
      FailSession(event.agent_id, event.session_id, model::FailureReason::kConnectionReplaced);
      break;
    case registry::LivenessEvent::Kind::kDisconnected:
      FailSession(event.agent_id, event.session_id, model::FailureReason::kAgentDisconnected);
      break;
  }
}

std::size_t TransferOrchestrator::SweepTimeouts(util::SteadyTimePoint now) {
  std::vector<std::string> expired;
  {
    std::shared_lock lock(snapshot_mutex_);
    for (const auto& [id, published] : snapshots_) {
      if (!model::IsTerminal(published.snapshot.status) && published.deadline <= now) {
        expired.push_back(id);
      }
    }
  }

  std::size_t posted = 0;
  for (const auto& id : expired) {
    auto state = Find(id);
    if (state && dispatcher_->Post(id, [this, state, now] { ApplyTimeout(*state, now); })) {
      ++posted;
    }
  }
  return posted;
}

void TransferOrchestrator::Drain() {
  dispatcher_->Drain();
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

TransferOrchestrator::StatePtr TransferOrchestrator::Find(const std::string& transfer_id) const {
  std::lock_guard lock(index_mutex_);
  auto            it = transfers_.find(transfer_id);
  return it == transfers_.end() ? nullptr : it->second;
}

bool TransferOrchestrator::HasActiveTransfer(const std::string& agent_id) const {
  std::vector<std::string> ids;
  {
    std::lock_guard lock(index_mutex_);
    auto [begin, end] = by_agent_.equal_range(agent_id);
    for (auto it = begin; it != end; ++it) {
      ids.push_back(it->second);
    }
  }

  std::shared_lock lock(snapshot_mutex_);
  for (const auto& id : ids) {
    auto it = snapshots_.find(id);
    if (it != snapshots_.end() && !model::IsTerminal(it->second.snapshot.status)) {
      return true;
    }
  }
  return false;
}

void TransferOrchestrator::Publish(const TransferState& state) {
  Publish(state.record, state.deadline);
}

void TransferOrchestrator::Publish(const model::TransferSnapshot& snapshot, util::SteadyTimePoint deadline) {
  std::unique_lock lock(snapshot_mutex_);
  snapshots_[snapshot.id] = Published{snapshot, deadline};
}

void TransferOrchestrator::FailSession(const std::string& agent_id, const std::string& session_id, model::FailureReason reason) {
  std::vector<StatePtr> states;
  {
    std::lock_guard lock(index_mutex_);
    auto [begin, end] = by_agent_.equal_range(agent_id);
    for (auto it = begin; it != end; ++it) {
      auto found = transfers_.find(it->second);
      if (found != transfers_.end() && found->second->record.session_id == session_id) {
        states.push_back(found->second);
      }
    }
  }

  for (const auto& state : states) {
    const auto& id = state->record.id;
    if (!dispatcher_->Post(id, [this, state, reason] { Fail(*state, reason, std::string(model::DefaultMessage(reason))); })) {
      FETCHGATE_LOG_WARN("Dropping liveness failure during shutdown", {StringField("transfer_id", id)});
    }
  }
}

// ---------------------------------------------------------------------------
// Shard side
// ---------------------------------------------------------------------------

void TransferOrchestrator::ApplyDispatch(TransferState& state, bool written) {
  auto& rec = state.record;
  // Already terminal, or an earlier chunk showed the request arrived.
  if (rec.status != model::TransferStatus::kPending) {
    return;
  }

  if (!written) {
    Fail(state, model::FailureReason::kDispatchFailed, "dispatch failed: tunnel write failed");
    return;
  }

  MarkDispatched(state);
}

void TransferOrchestrator::MarkDispatched(TransferState& state) {
  auto& rec = state.record;
  Advance(state, model::TransferStatus::kDispatched);
  state.deadline = util::SteadyNow() + settings_.inactivity_timeout;
  Publish(state);

  FETCHGATE_LOG_INFO("Transfer dispatched", {StringField("transfer_id", rec.id), StringField("agent_id", rec.agent_id),
                                             StringField("session_id", rec.session_id)});
}

void TransferOrchestrator::ApplyChunk(TransferState& state, const std::string& session_id, const fetchgate::v1::Chunk& chunk) {
  auto& rec = state.record;
  if (model::IsTerminal(rec.status)) {
    FETCHGATE_LOG_DEBUG("Ignoring chunk for finished transfer",
                        {StringField("transfer_id", rec.id), StringField("status", model::ToString(rec.status)), UintField("sequence", chunk.sequence())});
    return;
  }
  if (session_id != rec.session_id) {
    FETCHGATE_LOG_WARN("Dropping chunk from stale session", {StringField("transfer_id", rec.id), StringField("session_id", session_id)});
    return;
  }
  if (rec.status == model::TransferStatus::kPending) {
    // The request was written but its dispatch is still queued behind this
    // chunk; the agent only learns the id from the request.
    MarkDispatched(state);
  }

  try {
    tunnel::ValidateChunk(chunk, settings_.chunk_size_bytes);
  } catch (const util::ProtocolViolation& e) {
    Fail(state, model::FailureReason::kProtocolViolation, std::string("protocol violation: ") + e.what());
    return;
  }

  if (chunk.sequence() != rec.chunks_received + 1) {
    Fail(state, model::FailureReason::kProtocolViolation,
         "protocol violation: expected chunk " + std::to_string(rec.chunks_received + 1) + ", got " + std::to_string(chunk.sequence()));
    return;
  }

  if (!state.reassembler) {
    state.reassembler = std::make_unique<Reassembler>(store_, rec.artifact_path, settings_.fsync_on_complete);
  }

  std::optional<std::uint64_t> declared;
  if (chunk.has_total_bytes()) {
    declared = chunk.total_bytes();
  }

  auto result = state.reassembler->Accept(chunk.sequence(), chunk.payload(), chunk.is_last(), declared);
  if (result.outcome == Reassembler::Outcome::kRejected) {
    const auto prefix = result.reason == model::FailureReason::kArtifactWriteFailure ? "artifact write failure: " : "protocol violation: ";
    Fail(state, result.reason, prefix + result.message);
    return;
  }

  if (rec.status == model::TransferStatus::kDispatched) {
    Advance(state, model::TransferStatus::kInProgress);
  }
  rec.chunks_received += 1;
  rec.bytes_received += chunk.payload().size();
  rec.last_activity_at = util::Now();
  if (declared) {
    rec.declared_total_bytes = declared;
  }
  state.deadline = util::SteadyNow() + settings_.inactivity_timeout;
  observability::Metrics::Instance().AddBytesReceived(chunk.payload().size());

  if (result.outcome == Reassembler::Outcome::kCompleted) {
    Complete(state);
    return;
  }

  Publish(state);
  FETCHGATE_LOG_DEBUG("Chunk applied", {StringField("transfer_id", rec.id), UintField("sequence", chunk.sequence()),
                                        UintField("bytes_received", rec.bytes_received)});
}

void TransferOrchestrator::ApplyAbort(TransferState& state, const std::string& session_id, const std::string& error) {
  if (model::IsTerminal(state.record.status) || session_id != state.record.session_id) {
    return;
  }
  Fail(state, model::FailureReason::kAgentAborted, error.empty() ? std::string(model::DefaultMessage(model::FailureReason::kAgentAborted)) : error);
}

void TransferOrchestrator::ApplyTimeout(TransferState& state, util::SteadyTimePoint now) {
  auto& rec = state.record;
  if (model::IsTerminal(rec.status) || now < state.deadline) {
    return;
  }

  if (rec.status == model::TransferStatus::kPending) {
    Fail(state, model::FailureReason::kDispatchFailed, "dispatch failed: tunnel write timed out");
    // Cancelling the stream releases the blocked write.
    auto connection = registry_->Lookup(rec.agent_id);
    if (connection && connection->SessionId() == rec.session_id) {
      connection->Close("dispatch write stalled");
    }
    return;
  }

  Fail(state, model::FailureReason::kInactivityTimeout, std::string(model::DefaultMessage(model::FailureReason::kInactivityTimeout)));
}

bool TransferOrchestrator::Advance(TransferState& state, model::TransferStatus next) {
  if (!model::CanTransition(state.record.status, next)) {
    FETCHGATE_LOG_ERROR("Rejected transfer state change", {StringField("transfer_id", state.record.id),
                                                           StringField("from", model::ToString(state.record.status)),
                                                           StringField("to", model::ToString(next))});
    return false;
  }
  state.record.status = next;
  return true;
}

void TransferOrchestrator::Fail(TransferState& state, model::FailureReason reason, std::string message) {
  auto& rec = state.record;
  if (model::IsTerminal(rec.status)) {
    return;
  }

  if (state.reassembler) {
    state.reassembler->Abandon();
    state.reassembler.reset();
  }

  Advance(state, model::TransferStatus::kFailed);
  rec.failure          = reason;
  rec.error            = std::move(message);
  rec.last_activity_at = util::Now();
  Publish(state);

  observability::Metrics::Instance().RecordTransferOutcome(model::ToString(rec.status), model::ToString(reason));
  FETCHGATE_LOG_WARN("Transfer failed", {StringField("transfer_id", rec.id), StringField("agent_id", rec.agent_id),
                                         StringField("reason", model::ToString(reason)), StringField("error", *rec.error),
                                         UintField("chunks_received", rec.chunks_received)});
}

void TransferOrchestrator::Complete(TransferState& state) {
  auto& rec = state.record;
  state.reassembler.reset();

  Advance(state, model::TransferStatus::kCompleted);
  rec.completed_at = util::Now();
  Publish(state);

  observability::Metrics::Instance().RecordTransferOutcome(model::ToString(rec.status), model::ToString(rec.failure));
  FETCHGATE_LOG_INFO("Transfer completed", {StringField("transfer_id", rec.id), StringField("agent_id", rec.agent_id),
                                            StringField("artifact_path", rec.artifact_path), UintField("chunks", rec.chunks_received),
                                            UintField("bytes", rec.bytes_received)});
}

} // namespace fetchgate::core
