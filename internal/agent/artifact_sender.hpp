#pragma once

#include <cstdint>
#include <string>

#include "fetchgate/v1/tunnel.pb.h"

namespace fetchgate::agent {

// Destination for the messages of one transfer. Implementations serialize
// writes coming from concurrent transfers.
class ChunkSink {
 public:
  virtual ~ChunkSink() = default;

  // false once the tunnel is gone
  virtual bool Write(const fetchgate::v1::AgentMessage& message) = 0;
};

struct SendResult {
  bool          ok     = false;
  std::uint64_t chunks = 0;
  std::uint64_t bytes  = 0;
  std::string   error;
};

/*
  Streams one local file as a sequence of chunks.

  Sequences start at 1, the last chunk carries is_last and the file size.
  An empty file is sent as one empty final chunk. A file that cannot be read
  produces an Abort with the error text.
*/
class ArtifactSender {
 public:
  explicit ArtifactSender(std::uint64_t chunk_size_bytes);

  SendResult Send(const std::string& transfer_id, const std::string& path, ChunkSink& sink) const;

 private:
  std::uint64_t chunk_size_bytes_;
};

} // namespace fetchgate::agent
