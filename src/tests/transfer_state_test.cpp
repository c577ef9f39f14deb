#include <gtest/gtest.h>
#include <sstream>
#include "transfer/transfer_state.hpp"

using namespace ftecho::transfer;
using State = TransferState::State;

class TransferStateTest : public ::testing::Test {
protected:
  TransferState state;

  // Helper to walk a chain of states, expecting each step to succeed
  void walk(std::initializer_list<State> chain) {
    for (State next : chain) {
      ASSERT_TRUE(state.transition_to(next))
        << "Transition to " << next << " rejected from " << state.get_state_string();
    }
  }
};

TEST_F(TransferStateTest, StartsIdle) {
  EXPECT_TRUE(state.is_idle());
  EXPECT_EQ(state.get_state(), State::IDLE);
}

TEST_F(TransferStateTest, ListCycle) {
  walk({State::RESPONDING, State::IDLE});
  EXPECT_TRUE(state.is_idle());
}

TEST_F(TransferStateTest, GetCycle) {
  walk({State::RESOLVING_FILE, State::STREAMING_OUT, State::FINALIZING, State::IDLE});
}

TEST_F(TransferStateTest, PutCycle) {
  walk({State::AWAITING_READY, State::RECEIVING_DATA, State::VERIFYING, State::COMMITTED, State::IDLE});
}

TEST_F(TransferStateTest, SkippingStepsRejected) {
  EXPECT_FALSE(state.transition_to(State::STREAMING_OUT));
  EXPECT_FALSE(state.transition_to(State::COMMITTED));
  EXPECT_EQ(state.get_state(), State::IDLE);

  walk({State::AWAITING_READY});
  EXPECT_FALSE(state.transition_to(State::COMMITTED));
  EXPECT_FALSE(state.transition_to(State::STREAMING_OUT));
  EXPECT_EQ(state.get_state(), State::AWAITING_READY);
}

TEST_F(TransferStateTest, FailureReturnsToIdleFromAnyStep) {
  const State mid_operation[] = {
    State::RESPONDING, State::RESOLVING_FILE, State::STREAMING_OUT, State::FINALIZING,
    State::AWAITING_READY, State::RECEIVING_DATA, State::VERIFYING, State::COMMITTED
  };
  for (State from : mid_operation) {
    EXPECT_TRUE(TransferState::is_valid_transition(from, State::IDLE)) << from;
  }
}

TEST_F(TransferStateTest, ClosingIsTerminal) {
  walk({State::CLOSING});
  EXPECT_FALSE(state.transition_to(State::IDLE));
  EXPECT_FALSE(state.transition_to(State::RESPONDING));
  EXPECT_EQ(state.get_state(), State::CLOSING);

  state.reset();
  EXPECT_TRUE(state.is_idle());
}

TEST_F(TransferStateTest, OnlyIdleStartsOperations) {
  walk({State::RESOLVING_FILE});
  EXPECT_FALSE(state.transition_to(State::AWAITING_READY));
  EXPECT_FALSE(state.transition_to(State::CLOSING));
}

TEST_F(TransferStateTest, StreamOutput) {
  std::ostringstream out;
  out << State::RECEIVING_DATA;
  EXPECT_EQ(out.str(), "RECEIVING_DATA");
}
