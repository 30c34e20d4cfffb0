#include "internal/model/state_machine.hpp"

#include <cassert>
#include <iostream>

#include "internal/model/transfer.hpp"

namespace {

using fetchgate::model::CanTransition;
using fetchgate::model::FailureReason;
using fetchgate::model::IsTerminal;
using fetchgate::model::TransferStatus;

void TestForwardTransitions() {
  assert(CanTransition(TransferStatus::kPending, TransferStatus::kDispatched));
  assert(CanTransition(TransferStatus::kDispatched, TransferStatus::kInProgress));
  assert(CanTransition(TransferStatus::kInProgress, TransferStatus::kInProgress));
  assert(CanTransition(TransferStatus::kInProgress, TransferStatus::kCompleted));
  assert(CanTransition(TransferStatus::kPending, TransferStatus::kFailed));
  assert(CanTransition(TransferStatus::kDispatched, TransferStatus::kFailed));
  assert(CanTransition(TransferStatus::kInProgress, TransferStatus::kFailed));
}

void TestNoBackwardOrSkippingTransitions() {
  assert(!CanTransition(TransferStatus::kDispatched, TransferStatus::kPending));
  assert(!CanTransition(TransferStatus::kInProgress, TransferStatus::kDispatched));
  assert(!CanTransition(TransferStatus::kPending, TransferStatus::kInProgress));
  assert(!CanTransition(TransferStatus::kPending, TransferStatus::kCompleted));
  assert(!CanTransition(TransferStatus::kDispatched, TransferStatus::kCompleted));
}

void TestTerminalStatesAreFinal() {
  for (auto to : {TransferStatus::kPending, TransferStatus::kDispatched, TransferStatus::kInProgress, TransferStatus::kCompleted,
                  TransferStatus::kFailed}) {
    assert(!CanTransition(TransferStatus::kCompleted, to));
    assert(!CanTransition(TransferStatus::kFailed, to));
  }
  assert(IsTerminal(TransferStatus::kCompleted));
  assert(IsTerminal(TransferStatus::kFailed));
  assert(!IsTerminal(TransferStatus::kInProgress));
}

void TestNames() {
  assert(fetchgate::model::ToString(TransferStatus::kInProgress) == "in_progress");
  assert(fetchgate::model::ToString(FailureReason::kProtocolViolation) == "ProtocolViolation");
  assert(fetchgate::model::DefaultMessage(FailureReason::kAgentDisconnected) == "agent disconnected");
}

} // namespace

int main() {
  TestForwardTransitions();
  TestNoBackwardOrSkippingTransitions();
  TestTerminalStatesAreFinal();
  TestNames();
  std::cout << "state_machine_test: pass\n";
  return 0;
}
