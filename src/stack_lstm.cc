#include "stack_lstm.h"
#include <sstream>
#include <stdexcept>
#include <boost/assert.hpp>

StackLSTM::StackLSTM(dynet::RNNBuilder& lstm,
                     unsigned input_dim,
                     const std::vector<dynet::Expression>& initial_state,
                     const dynet::Expression& empty) :
  lstm(&lstm),
  input_dim(input_dim),
  empty_embedding(empty) {
  BOOST_ASSERT(input_dim > 0);
  if (initial_state.empty() || initial_state.size() % 2 != 0) {
    std::ostringstream oss;
    oss << "StackLSTM: expected cell and hidden states of every layer, got "
      << initial_state.size() << " expressions.";
    throw std::invalid_argument(oss.str());
  }
  lstm.start_new_sequence(initial_state);
  // the hidden state of the last layer.
  frames.push_back(std::make_shared<const Frame>(lstm.state(), initial_state.back(), Element::root()));
}

void StackLSTM::push(const dynet::Expression& expr, const Element& element) {
  unsigned rows = expr.dim().rows();
  if (rows != input_dim) {
    std::ostringstream oss;
    oss << "StackLSTM::push: expected input of dimension " << input_dim
      << ", got " << rows << ".";
    throw std::invalid_argument(oss.str());
  }
  const dynet::RNNPointer& prev = frames.back()->state;
  dynet::Expression h = lstm->add_input(prev, expr);
  frames.push_back(std::make_shared<const Frame>(lstm->state(), h, element));
}

std::pair<dynet::Expression, Element> StackLSTM::pop() {
  if (empty()) {
    throw std::runtime_error("StackLSTM::pop: cannot pop the root frame.");
  }
  FramePtr top = frames.back();
  frames.pop_back();
  return std::make_pair(top->embedding, top->element);
}

dynet::Expression StackLSTM::embedding() const {
  if (empty()) { return empty_embedding; }
  return frames.back()->embedding;
}

const Element& StackLSTM::element_from_top(unsigned index) const {
  if (index >= frames.size()) {
    std::ostringstream oss;
    oss << "StackLSTM::element_from_top: index " << index
      << " out of range for a stack of size " << size() << ".";
    throw std::out_of_range(oss.str());
  }
  return frames[frames.size() - 1 - index]->element;
}

std::string StackLSTM::str() const {
  std::ostringstream oss;
  for (unsigned i = 0; i < frames.size(); ++i) {
    if (i > 0) { oss << "->"; }
    oss << frames[i]->element;
  }
  return oss.str();
}
