#include "internal/tunnel/codec.hpp"

#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace fetchgate::tunnel {

void ValidateRegister(const fetchgate::v1::RegisterAgent& registration) {
  try {
    storage::common::ValidatePathComponent(registration.agent_id(), "agent id");
  } catch (const std::invalid_argument& e) {
    throw util::InvalidArgument(e.what());
  }
}

void ValidateChunk(const fetchgate::v1::Chunk& chunk, std::uint64_t max_payload_bytes) {
  if (chunk.transfer_id().empty()) {
    throw util::ProtocolViolation("chunk without transfer id");
  }
  if (chunk.sequence() == 0) {
    throw util::ProtocolViolation("chunk sequence numbers start at 1");
  }
  if (chunk.payload().size() > max_payload_bytes) {
    throw util::ProtocolViolation("chunk " + std::to_string(chunk.sequence()) + " carries " + std::to_string(chunk.payload().size()) +
                                  " bytes, limit is " + std::to_string(max_payload_bytes));
  }
  if (chunk.payload().empty() && !chunk.is_last()) {
    throw util::ProtocolViolation("empty chunk " + std::to_string(chunk.sequence()) + " before end of stream");
  }
}

fetchgate::v1::ServerMessage MakeRegistered(const std::string& session_id, std::uint64_t chunk_size_bytes) {
  fetchgate::v1::ServerMessage message;
  auto*                        registered = message.mutable_registered();
  registered->set_session_id(session_id);
  registered->set_chunk_size_bytes(chunk_size_bytes);
  return message;
}

fetchgate::v1::ServerMessage MakeTransferRequest(const std::string& transfer_id, const std::string& source_path, std::uint64_t chunk_size_bytes) {
  fetchgate::v1::ServerMessage message;
  auto*                        request = message.mutable_transfer_request();
  request->set_transfer_id(transfer_id);
  request->set_source_path(source_path);
  request->set_chunk_size_bytes(chunk_size_bytes);
  return message;
}

fetchgate::v1::AgentMessage MakeRegister(const std::string& agent_id) {
  fetchgate::v1::AgentMessage message;
  auto*                       registration = message.mutable_register_agent();
  registration->set_agent_id(agent_id);
  registration->set_agent_version(std::string(kAgentVersion));
  return message;
}

fetchgate::v1::AgentMessage MakeChunk(const std::string& transfer_id, std::uint64_t sequence, std::string_view payload, bool is_last,
                                      std::optional<std::uint64_t> total_bytes) {
  fetchgate::v1::AgentMessage message;
  auto*                       chunk = message.mutable_chunk();
  chunk->set_transfer_id(transfer_id);
  chunk->set_sequence(sequence);
  chunk->set_payload(payload.data(), payload.size());
  chunk->set_is_last(is_last);
  if (total_bytes) {
    chunk->set_total_bytes(*total_bytes);
  }
  return message;
}

fetchgate::v1::AgentMessage MakeAbort(const std::string& transfer_id, const std::string& error) {
  fetchgate::v1::AgentMessage message;
  auto*                       abort = message.mutable_abort();
  abort->set_transfer_id(transfer_id);
  abort->set_error(error);
  return message;
}

fetchgate::v1::AgentMessage MakeHeartbeat() {
  fetchgate::v1::AgentMessage message;
  message.mutable_heartbeat();
  return message;
}

} // namespace fetchgate::tunnel
