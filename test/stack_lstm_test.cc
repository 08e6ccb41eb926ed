#include "stack_lstm.h"

#include <stdexcept>
#include <vector>
#include <gtest/gtest.h>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "dynet/lstm.h"
#include "dynet/model.h"
#include "dynet/tensor.h"

namespace {

const unsigned kInputDim = 4;
const unsigned kHiddenDim = 3;

class StackLSTMTest : public ::testing::Test {
 protected:
  StackLSTMTest() : lstm(1, kInputDim, kHiddenDim, model) {}

  void SetUp() override {
    lstm.new_graph(cg);
    initial_state.push_back(vec(kHiddenDim, 0.f));   // cell
    initial_state.push_back(vec(kHiddenDim, 0.25f)); // hidden
    empty = vec(kHiddenDim, -1.f);
  }

  dynet::Expression vec(unsigned dim, float x) {
    return dynet::input(cg, dynet::Dim({ dim }), std::vector<float>(dim, x));
  }

  dynet::Expression word(float x) { return vec(kInputDim, x); }

  std::vector<float> values(const dynet::Expression& e) {
    return dynet::as_vector(cg.get_value(e));
  }

  StackLSTM make_stack() { return StackLSTM(lstm, kInputDim, initial_state, empty); }

  dynet::ParameterCollection model;
  dynet::LSTMBuilder lstm;
  dynet::ComputationGraph cg;
  std::vector<dynet::Expression> initial_state;
  dynet::Expression empty;
};

TEST_F(StackLSTMTest, StartsWithOnlyTheRoot) {
  StackLSTM stack = make_stack();
  EXPECT_EQ(0u, stack.size());
  EXPECT_TRUE(stack.empty());
  EXPECT_TRUE(stack.element_from_top(0).is_root());
  EXPECT_EQ("Root", stack.str());
}

TEST_F(StackLSTMTest, SizeCountsPushesMinusPops) {
  StackLSTM stack = make_stack();
  stack.push(word(0.1f), Element::token(0, "a"));
  stack.push(word(0.2f), Element::token(1, "b"));
  stack.push(word(0.3f), Element::token(2, "c"));
  EXPECT_EQ(3u, stack.size());

  stack.pop();
  EXPECT_EQ(2u, stack.size());
  stack.push(word(0.4f), Element::token(3, "d"));
  stack.pop();
  stack.pop();
  EXPECT_EQ(1u, stack.size());
  stack.pop();
  EXPECT_EQ(0u, stack.size());
  EXPECT_THROW(stack.pop(), std::runtime_error);
  EXPECT_EQ(0u, stack.size());
  EXPECT_TRUE(stack.element_from_top(0).is_root());
}

TEST_F(StackLSTMTest, ElementFromTop) {
  StackLSTM stack = make_stack();
  stack.push(word(0.1f), Element::nonterminal(0, "S"));
  stack.push(word(0.2f), Element::token(1, "the"));
  EXPECT_EQ(Element::token(1, "the"), stack.element_from_top(0));
  EXPECT_EQ(Element::nonterminal(0, "S"), stack.element_from_top(1));
  EXPECT_TRUE(stack.element_from_top(2).is_root());
  EXPECT_THROW(stack.element_from_top(3), std::out_of_range);
  EXPECT_EQ("Root->(S->the", stack.str());
}

TEST_F(StackLSTMTest, PopReturnsEmbeddingAndElement) {
  StackLSTM stack = make_stack();
  stack.push(word(0.5f), Element::token(4, "dog"));
  std::vector<float> top = values(stack.embedding());

  std::pair<dynet::Expression, Element> popped = stack.pop();
  EXPECT_EQ(Element::token(4, "dog"), popped.second);
  std::vector<float> got = values(popped.first);
  ASSERT_EQ(kHiddenDim, got.size());
  for (unsigned i = 0; i < kHiddenDim; ++i) { EXPECT_FLOAT_EQ(top[i], got[i]); }
}

TEST_F(StackLSTMTest, EmbeddingOfEmptyStackIsTheEmptyVector) {
  StackLSTM stack = make_stack();
  std::vector<float> got = values(stack.embedding());
  ASSERT_EQ(kHiddenDim, got.size());
  for (float x : got) { EXPECT_FLOAT_EQ(-1.f, x); }

  stack.push(word(0.5f), Element::token(0, "a"));
  std::vector<float> pushed = values(stack.embedding());
  ASSERT_EQ(kHiddenDim, pushed.size());
  // tanh-bounded LSTM output, never the -1 marker everywhere.
  bool all_marker = true;
  for (float x : pushed) { all_marker = all_marker && (x == -1.f); }
  EXPECT_FALSE(all_marker);

  stack.pop();
  got = values(stack.embedding());
  for (float x : got) { EXPECT_FLOAT_EQ(-1.f, x); }
}

TEST_F(StackLSTMTest, PushRejectsWrongDimension) {
  StackLSTM stack = make_stack();
  EXPECT_THROW(stack.push(vec(kInputDim + 1, 0.f), Element::token(0, "a")),
               std::invalid_argument);
  EXPECT_EQ(0u, stack.size());
}

TEST_F(StackLSTMTest, RejectsBadInitialState) {
  std::vector<dynet::Expression> none;
  EXPECT_THROW(StackLSTM stack(lstm, kInputDim, none, empty), std::invalid_argument);

  std::vector<dynet::Expression> odd = { vec(kHiddenDim, 0.f) };
  EXPECT_THROW(StackLSTM stack(lstm, kInputDim, odd, empty), std::invalid_argument);

  StackLSTM stack = make_stack();
  EXPECT_EQ(0u, stack.size());
}

TEST_F(StackLSTMTest, CopyIsIndependent) {
  StackLSTM stack = make_stack();
  stack.push(word(0.1f), Element::token(0, "a"));
  stack.push(word(0.2f), Element::token(1, "b"));
  std::vector<float> before = values(stack.embedding());

  StackLSTM other = stack.copy();
  other.pop();
  other.push(word(0.3f), Element::token(2, "c"));
  other.push(word(0.4f), Element::token(3, "d"));

  EXPECT_EQ(2u, stack.size());
  EXPECT_EQ(Element::token(1, "b"), stack.element_from_top(0));
  EXPECT_EQ("Root->a->b", stack.str());
  std::vector<float> after = values(stack.embedding());
  for (unsigned i = 0; i < kHiddenDim; ++i) { EXPECT_FLOAT_EQ(before[i], after[i]); }

  EXPECT_EQ(3u, other.size());
  EXPECT_EQ("Root->a->c->d", other.str());

  // and the other way round.
  stack.pop();
  stack.pop();
  EXPECT_EQ(3u, other.size());
  EXPECT_EQ(Element::token(3, "d"), other.element_from_top(0));
}

TEST_F(StackLSTMTest, BranchesFromTheSameFrameAgree) {
  StackLSTM stack = make_stack();
  stack.push(word(0.1f), Element::token(0, "a"));

  StackLSTM left = stack.copy();
  StackLSTM right = stack.copy();
  left.push(word(0.7f), Element::token(1, "x"));
  right.push(word(0.7f), Element::token(1, "x"));

  std::vector<float> l = values(left.embedding());
  std::vector<float> r = values(right.embedding());
  for (unsigned i = 0; i < kHiddenDim; ++i) { EXPECT_FLOAT_EQ(l[i], r[i]); }

  // popping back to the shared frame restores its summary.
  std::vector<float> shared = values(stack.embedding());
  left.pop();
  std::vector<float> restored = values(left.embedding());
  for (unsigned i = 0; i < kHiddenDim; ++i) { EXPECT_FLOAT_EQ(shared[i], restored[i]); }
}

}  // namespace
