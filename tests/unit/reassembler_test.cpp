#include "internal/core/reassembler.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/disk_artifact_store.hpp"
#include "support/fakes.hpp"

namespace {

using fetchgate::core::Reassembler;
using fetchgate::model::FailureReason;
using fetchgate::testing::MemoryArtifactStore;
using Outcome = Reassembler::Outcome;

constexpr const char* kPath = "/memory/edge-1_t1_data.bin";

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestInOrderChunksComplete() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  assert(reassembler.Accept(1, "hello ", false, std::nullopt).outcome == Outcome::kApplied);
  assert(reassembler.Accept(2, "wide ", false, std::nullopt).outcome == Outcome::kApplied);
  auto last = reassembler.Accept(3, "world", true, 16);
  assert(last.outcome == Outcome::kCompleted);
  assert(reassembler.BytesWritten() == 16);
  assert(reassembler.IsClosed());

  auto published = store->Published();
  assert(published.at(kPath) == "hello wide world");
  assert(store->Abandoned().empty());
}

void TestGapIsRejectedWithoutWriting() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  assert(reassembler.Accept(1, "abc", false, std::nullopt).outcome == Outcome::kApplied);
  auto result = reassembler.Accept(3, "xyz", false, std::nullopt);
  assert(result.outcome == Outcome::kRejected);
  assert(result.reason == FailureReason::kProtocolViolation);
  assert(result.message == "expected chunk 2, got 3");
  assert(reassembler.IsClosed());

  assert(store->Published().empty());
  assert(store->Abandoned().at(kPath) == "abc");
}

void TestDuplicateIsRejected() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  reassembler.Accept(1, "abc", false, std::nullopt);
  auto result = reassembler.Accept(1, "abc", false, std::nullopt);
  assert(result.outcome == Outcome::kRejected);
  assert(result.reason == FailureReason::kProtocolViolation);
}

void TestChunkAfterCloseIsRejected() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  assert(reassembler.Accept(1, "abc", true, 3).outcome == Outcome::kCompleted);
  auto result = reassembler.Accept(2, "def", true, std::nullopt);
  assert(result.outcome == Outcome::kRejected);
  assert(store->Published().at(kPath) == "abc");
}

void TestDeclaredTotalMismatchIsRejected() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  reassembler.Accept(1, "abcd", false, std::nullopt);
  auto result = reassembler.Accept(2, "ef", true, 10);
  assert(result.outcome == Outcome::kRejected);
  assert(result.reason == FailureReason::kProtocolViolation);
  assert(store->Published().empty());
  assert(store->Abandoned().at(kPath) == "abcd");
}

void TestEmptyFinalChunkPublishesEmptyArtifact() {
  auto        store = std::make_shared<MemoryArtifactStore>();
  Reassembler reassembler(store, kPath, false);

  assert(reassembler.Accept(1, "", true, 0).outcome == Outcome::kCompleted);
  assert(store->Published().at(kPath).empty());
}

void TestWriteFailureIsReported() {
  auto store = std::make_shared<MemoryArtifactStore>();
  store->FailAppendsAfter(4);
  Reassembler reassembler(store, kPath, false);

  assert(reassembler.Accept(1, "abcd", false, std::nullopt).outcome == Outcome::kApplied);
  auto result = reassembler.Accept(2, "e", false, std::nullopt);
  assert(result.outcome == Outcome::kRejected);
  assert(result.reason == FailureReason::kArtifactWriteFailure);
  assert(result.message == "no space left on device");
}

void TestDestructionAbandonsOpenWriter() {
  auto store = std::make_shared<MemoryArtifactStore>();
  {
    Reassembler reassembler(store, kPath, false);
    reassembler.Accept(1, "partial", false, std::nullopt);
  }
  assert(store->Published().empty());
  assert(store->Abandoned().at(kPath) == "partial");
}

void TestDiskStagesThenPublishes() {
  const auto root = std::filesystem::temp_directory_path() / "fetchgate_reassembler_test";
  std::filesystem::remove_all(root);

  auto store    = std::make_shared<fetchgate::storage::DiskArtifactStore>(root);
  auto artifact = store->Resolve("edge-1", "t1", "/var/log/app.log");
  assert(artifact == root / "edge-1_t1_app.log");

  {
    Reassembler reassembler(store, artifact, true);
    assert(reassembler.Accept(1, "line one\n", false, std::nullopt).outcome == Outcome::kApplied);
    assert(std::filesystem::exists(fetchgate::storage::common::StagingPath(artifact)));
    assert(!std::filesystem::exists(artifact));
    assert(reassembler.Accept(2, "line two\n", true, 18).outcome == Outcome::kCompleted);
  }

  assert(std::filesystem::exists(artifact));
  assert(!std::filesystem::exists(fetchgate::storage::common::StagingPath(artifact)));
  assert(ReadFile(artifact) == "line one\nline two\n");

  // A failed transfer never shows up at its final path.
  auto broken = store->Resolve("edge-1", "t2", "app.log");
  {
    Reassembler reassembler(store, broken, false);
    reassembler.Accept(1, "half", false, std::nullopt);
    reassembler.Accept(5, "late", false, std::nullopt);
  }
  assert(!std::filesystem::exists(broken));
  assert(ReadFile(fetchgate::storage::common::StagingPath(broken)) == "half");

  std::filesystem::remove_all(root);
}

} // namespace

int main() {
  TestInOrderChunksComplete();
  TestGapIsRejectedWithoutWriting();
  TestDuplicateIsRejected();
  TestChunkAfterCloseIsRejected();
  TestDeclaredTotalMismatchIsRejected();
  TestEmptyFinalChunkPublishesEmptyArtifact();
  TestWriteFailureIsReported();
  TestDestructionAbandonsOpenWriter();
  TestDiskStagesThenPublishes();
  std::cout << "reassembler_test: pass\n";
  return 0;
}
