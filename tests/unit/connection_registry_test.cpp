#include "internal/registry/connection_registry.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <vector>

#include "support/fakes.hpp"

namespace {

using fetchgate::registry::ConnectionRegistry;
using fetchgate::registry::LivenessEvent;
using fetchgate::testing::FakeAgentConnection;

struct RecordingListener {
  std::vector<LivenessEvent> events;

  void Attach(ConnectionRegistry& registry) {
    registry.SetListener([this](const LivenessEvent& event) { events.push_back(event); });
  }
};

void TestRegisterAndLookup() {
  ConnectionRegistry registry;
  RecordingListener  listener;
  listener.Attach(registry);

  auto conn     = std::make_shared<FakeAgentConnection>("edge-1", "s1");
  auto previous = registry.Register(conn);
  assert(previous == nullptr);
  assert(registry.Lookup("edge-1") == conn);
  assert(registry.Lookup("edge-2") == nullptr);
  assert(registry.Size() == 1);

  assert(listener.events.size() == 1);
  assert(listener.events[0].kind == LivenessEvent::Kind::kConnected);
  assert(listener.events[0].session_id == "s1");
}

void TestReplacementClosesOldConnection() {
  ConnectionRegistry registry;
  RecordingListener  listener;
  listener.Attach(registry);

  auto first  = std::make_shared<FakeAgentConnection>("edge-1", "s1");
  auto second = std::make_shared<FakeAgentConnection>("edge-1", "s2");
  registry.Register(first);
  auto previous = registry.Register(second);

  assert(previous == first);
  assert(first->IsClosed());
  assert(first->CloseReason() == "connection replaced");
  assert(!second->IsClosed());
  assert(registry.Lookup("edge-1") == second);
  assert(registry.Size() == 1);

  assert(listener.events.size() == 3);
  assert(listener.events[1].kind == LivenessEvent::Kind::kReplaced);
  assert(listener.events[1].session_id == "s1");
  assert(listener.events[2].kind == LivenessEvent::Kind::kConnected);
  assert(listener.events[2].session_id == "s2");
}

void TestStaleDeregisterKeepsSuccessor() {
  ConnectionRegistry registry;
  registry.Register(std::make_shared<FakeAgentConnection>("edge-1", "s1"));
  auto second = std::make_shared<FakeAgentConnection>("edge-1", "s2");
  registry.Register(second);

  assert(!registry.Deregister("edge-1", "s1"));
  assert(registry.Lookup("edge-1") == second);

  assert(registry.Deregister("edge-1", "s2"));
  assert(registry.Lookup("edge-1") == nullptr);
  assert(registry.Size() == 0);
  assert(!registry.Deregister("edge-1", "s2"));
}

void TestDeregisterEmitsDisconnected() {
  ConnectionRegistry registry;
  RecordingListener  listener;
  listener.Attach(registry);

  registry.Register(std::make_shared<FakeAgentConnection>("edge-1", "s1"));
  registry.Deregister("edge-1", "s1");

  assert(listener.events.size() == 2);
  assert(listener.events[1].kind == LivenessEvent::Kind::kDisconnected);
  assert(listener.events[1].agent_id == "edge-1");
}

void TestListIsSortedAndTouchUpdatesLastSeen() {
  ConnectionRegistry registry;
  registry.Register(std::make_shared<FakeAgentConnection>("zeta", "s1"));
  registry.Register(std::make_shared<FakeAgentConnection>("alpha", "s2"));

  auto before = registry.List();
  assert(before.size() == 2);
  assert(before[0].agent_id == "alpha");
  assert(before[1].agent_id == "zeta");
  assert(before[0].liveness == fetchgate::registry::Liveness::kConnected);

  registry.Touch("alpha", "s2");
  registry.Touch("alpha", "wrong-session");
  auto after = registry.List();
  assert(after[0].last_seen >= before[0].last_seen);
  assert(after[0].connected_at == before[0].connected_at);
}

void TestCloseAllClosesEveryTunnel() {
  ConnectionRegistry registry;
  auto               a = std::make_shared<FakeAgentConnection>("a", "s1");
  auto               b = std::make_shared<FakeAgentConnection>("b", "s2");
  registry.Register(a);
  registry.Register(b);

  registry.CloseAll("server shutting down");
  assert(a->IsClosed());
  assert(b->IsClosed());
}

} // namespace

int main() {
  TestRegisterAndLookup();
  TestReplacementClosesOldConnection();
  TestStaleDeregisterKeepsSuccessor();
  TestDeregisterEmitsDisconnected();
  TestListIsSortedAndTouchUpdatesLastSeen();
  TestCloseAllClosesEveryTunnel();
  std::cout << "connection_registry_test: pass\n";
  return 0;
}
