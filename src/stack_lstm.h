#ifndef STACK_LSTM_H
#define STACK_LSTM_H

#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "dynet/rnn.h"
#include "element.h"

// Frames are immutable and shared between copies.
class StackLSTM {
public:
  struct Frame {
    Frame(const dynet::RNNPointer& state,
          const dynet::Expression& embedding,
          const Element& element) :
      state(state), embedding(embedding), element(element) {}

    const dynet::RNNPointer state;
    const dynet::Expression embedding;
    const Element element;
  };

  typedef std::shared_ptr<const Frame> FramePtr;

  // initial_state: cells of every layer, then hiddens. Starts a new sequence
  // on `lstm`, invalidating other stacks built on it.
  StackLSTM(dynet::RNNBuilder& lstm,
            unsigned input_dim,
            const std::vector<dynet::Expression>& initial_state,
            const dynet::Expression& empty);

  void push(const dynet::Expression& expr, const Element& element);

  std::pair<dynet::Expression, Element> pop();

  dynet::Expression embedding() const;

  // 0 is the top.
  const Element& element_from_top(unsigned index) const;

  unsigned size() const { return frames.size() - 1; }
  bool empty() const { return size() == 0; }

  StackLSTM copy() const { return StackLSTM(*this); }

  std::string str() const;

private:
  dynet::RNNBuilder* lstm;
  unsigned input_dim;
  dynet::Expression empty_embedding;
  std::vector<FramePtr> frames;
};

#endif  //  end for STACK_LSTM_H
