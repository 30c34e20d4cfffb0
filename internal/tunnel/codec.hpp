#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "fetchgate/v1/tunnel.pb.h"

namespace fetchgate::tunnel {

inline constexpr std::string_view kAgentVersion = "fetchgate-agent/0.1.0";

// Throws util::InvalidArgument.
void ValidateRegister(const fetchgate::v1::RegisterAgent& registration);

/*
  Structural checks on a single chunk. Ordering is enforced by the
  reassembler, not here.

    - transfer_id non-empty
    - sequence >= 1
    - payload no larger than max_payload_bytes
    - empty payload only on the final chunk

  Throws util::ProtocolViolation.
*/
void ValidateChunk(const fetchgate::v1::Chunk& chunk, std::uint64_t max_payload_bytes);

fetchgate::v1::ServerMessage MakeRegistered(const std::string& session_id, std::uint64_t chunk_size_bytes);
fetchgate::v1::ServerMessage MakeTransferRequest(const std::string& transfer_id, const std::string& source_path, std::uint64_t chunk_size_bytes);

fetchgate::v1::AgentMessage MakeRegister(const std::string& agent_id);
fetchgate::v1::AgentMessage MakeChunk(const std::string& transfer_id, std::uint64_t sequence, std::string_view payload, bool is_last,
                                      std::optional<std::uint64_t> total_bytes);
fetchgate::v1::AgentMessage MakeAbort(const std::string& transfer_id, const std::string& error);
fetchgate::v1::AgentMessage MakeHeartbeat();

} // namespace fetchgate::tunnel
