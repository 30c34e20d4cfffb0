#include "internal/ingest/ingest_dispatcher.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using fetchgate::ingest::IngestDispatcher;

void TestTasksForOneKeyRunInOrder() {
  IngestDispatcher dispatcher(4, 2);
  dispatcher.Start();

  std::mutex       mutex;
  std::vector<int> seen;
  for (int i = 0; i < 200; ++i) {
    assert(dispatcher.Post("transfer-a", [&, i] {
      std::lock_guard lock(mutex);
      seen.push_back(i);
    }));
  }
  dispatcher.Drain();

  assert(seen.size() == 200);
  for (int i = 0; i < 200; ++i) {
    assert(seen[i] == i);
  }
  dispatcher.Stop();
}

void TestKeyAlwaysMapsToSameShard() {
  IngestDispatcher dispatcher(8, 4);
  assert(dispatcher.ShardCount() == 8);
  const auto shard = dispatcher.ShardFor("transfer-42");
  for (int i = 0; i < 10; ++i) {
    assert(dispatcher.ShardFor("transfer-42") == shard);
  }
  assert(shard < 8);
}

void TestZeroShardsFallsBackToOne() {
  IngestDispatcher dispatcher(0, 1);
  assert(dispatcher.ShardCount() == 1);
}

void TestConcurrentProducersOnManyKeys() {
  IngestDispatcher dispatcher(4, 8);
  dispatcher.Start();

  std::atomic<int>         executed{0};
  std::vector<std::thread> producers;
  for (int p = 0; p < 4; ++p) {
    producers.emplace_back([&, p] {
      for (int i = 0; i < 100; ++i) {
        dispatcher.Post("key-" + std::to_string(p * 100 + i), [&executed] { executed.fetch_add(1); });
      }
    });
  }
  for (auto& producer : producers) producer.join();
  dispatcher.Drain();

  assert(executed.load() == 400);
  dispatcher.Stop();
}

void TestThrowingTaskDoesNotKillShard() {
  IngestDispatcher dispatcher(1, 4);
  dispatcher.Start();

  std::atomic<bool> ran{false};
  dispatcher.Post("k", [] { throw std::runtime_error("boom"); });
  dispatcher.Post("k", [&ran] { ran = true; });
  dispatcher.Drain();

  assert(ran.load());
  dispatcher.Stop();
}

void TestPostAfterStopIsRefused() {
  IngestDispatcher dispatcher(2, 2);
  dispatcher.Start();
  dispatcher.Stop();
  assert(!dispatcher.Post("k", [] {}));
}

} // namespace

int main() {
  TestTasksForOneKeyRunInOrder();
  TestKeyAlwaysMapsToSameShard();
  TestZeroShardsFallsBackToOne();
  TestConcurrentProducersOnManyKeys();
  TestThrowingTaskDoesNotKillShard();
  TestPostAfterStopIsRefused();
  std::cout << "ingest_dispatcher_test: pass\n";
  return 0;
}
