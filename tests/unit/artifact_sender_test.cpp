#include "internal/agent/artifact_sender.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/agent/path_expansion.hpp"

namespace {

using fetchgate::agent::ArtifactSender;
using fetchgate::agent::ChunkSink;

class RecordingSink final : public ChunkSink {
 public:
  bool Write(const fetchgate::v1::AgentMessage& message) override {
    if (closed_after_ >= 0 && static_cast<int>(messages.size()) >= closed_after_) return false;
    messages.push_back(message);
    return true;
  }

  void CloseAfter(int count) {
    closed_after_ = count;
  }

  std::vector<fetchgate::v1::AgentMessage> messages;

 private:
  int closed_after_ = -1;
};

std::filesystem::path WriteFile(const std::string& name, const std::string& content) {
  const auto dir = std::filesystem::temp_directory_path() / "fetchgate_sender_tests";
  std::filesystem::create_directories(dir);
  const auto    path = dir / name;
  std::ofstream out(path, std::ios::binary);
  out << content;
  return path;
}

void TestFileIsSplitIntoSequencedChunks() {
  const auto path = WriteFile("ten.bin", "0123456789");

  RecordingSink sink;
  auto          result = ArtifactSender(4).Send("t1", path.string(), sink);
  assert(result.ok);
  assert(result.chunks == 3);
  assert(result.bytes == 10);

  assert(sink.messages.size() == 3);
  const auto& first = sink.messages[0].chunk();
  assert(first.transfer_id() == "t1");
  assert(first.sequence() == 1);
  assert(first.payload() == "0123");
  assert(!first.is_last());
  assert(!first.has_total_bytes());

  const auto& last = sink.messages[2].chunk();
  assert(last.sequence() == 3);
  assert(last.payload() == "89");
  assert(last.is_last());
  assert(last.has_total_bytes() && last.total_bytes() == 10);
}

void TestExactMultipleEndsOnFullChunk() {
  const auto path = WriteFile("eight.bin", "abcdefgh");

  RecordingSink sink;
  auto          result = ArtifactSender(4).Send("t2", path.string(), sink);
  assert(result.ok);
  assert(sink.messages.size() == 2);
  assert(sink.messages[1].chunk().payload() == "efgh");
  assert(sink.messages[1].chunk().is_last());
}

void TestEmptyFileSendsOneEmptyFinalChunk() {
  const auto path = WriteFile("empty.bin", "");

  RecordingSink sink;
  auto          result = ArtifactSender(4).Send("t3", path.string(), sink);
  assert(result.ok);
  assert(sink.messages.size() == 1);
  const auto& chunk = sink.messages[0].chunk();
  assert(chunk.sequence() == 1);
  assert(chunk.payload().empty());
  assert(chunk.is_last());
  assert(chunk.total_bytes() == 0);
}

void TestMissingFileSendsAbort() {
  RecordingSink sink;
  auto          result = ArtifactSender(4).Send("t4", "/nonexistent/fetchgate/file.txt", sink);
  assert(!result.ok);
  assert(sink.messages.size() == 1);
  assert(sink.messages[0].has_abort());
  assert(sink.messages[0].abort().transfer_id() == "t4");
  assert(sink.messages[0].abort().error().find("file not found") != std::string::npos);
}

void TestDirectorySendsAbort() {
  RecordingSink sink;
  auto          result = ArtifactSender(4).Send("t5", std::filesystem::temp_directory_path().string(), sink);
  assert(!result.ok);
  assert(sink.messages.size() == 1);
  assert(sink.messages[0].has_abort());
}

void TestClosedTunnelStopsSending() {
  const auto path = WriteFile("closed.bin", "0123456789");

  RecordingSink sink;
  sink.CloseAfter(1);
  auto result = ArtifactSender(4).Send("t6", path.string(), sink);
  assert(!result.ok);
  assert(result.error == "tunnel closed");
  assert(sink.messages.size() == 1);
}

void TestPathExpansion() {
  setenv("HOME", "/home/edge", 1);
  setenv("FETCHGATE_TEST_DIR", "/srv/data", 1);
  unsetenv("FETCHGATE_TEST_UNSET");

  using fetchgate::agent::ExpandPath;
  assert(ExpandPath("~/file_to_download.txt") == "/home/edge/file_to_download.txt");
  assert(ExpandPath("~") == "/home/edge");
  assert(ExpandPath("$HOME/file_to_download.txt") == "/home/edge/file_to_download.txt");
  assert(ExpandPath("${FETCHGATE_TEST_DIR}/x.log") == "/srv/data/x.log");
  assert(ExpandPath("$FETCHGATE_TEST_UNSET/x") == "$FETCHGATE_TEST_UNSET/x");
  assert(ExpandPath("/plain/path") == "/plain/path");
  assert(ExpandPath("~other/x") == "~other/x");
}

} // namespace

int main() {
  TestFileIsSplitIntoSequencedChunks();
  TestExactMultipleEndsOnFullChunk();
  TestEmptyFileSendsOneEmptyFinalChunk();
  TestMissingFileSendsAbort();
  TestDirectorySendsAbort();
  TestClosedTunnelStopsSending();
  TestPathExpansion();
  std::cout << "artifact_sender_test: pass\n";
  return 0;
}
