#include "composition.h"
#include <sstream>
#include <stdexcept>

void CompositionFunction::check_inputs(const std::vector<dynet::Expression>& exprs) const {
  if (exprs.empty()) {
    throw std::invalid_argument("CompositionFunction: nothing to compose, the nonterminal is missing.");
  }
  for (unsigned i = 0; i < exprs.size(); ++i) {
    unsigned rows = exprs[i].dim().rows();
    if (rows != dim) {
      std::ostringstream oss;
      oss << "CompositionFunction: input #" << i << " has dimension " << rows
        << ", expected " << dim << ".";
      throw std::invalid_argument(oss.str());
    }
  }
}

BiLSTMComposition::BiLSTMComposition(dynet::ParameterCollection& m,
                                     unsigned dim,
                                     bool trainable) :
  CompositionFunction(dim, trainable),
  fwd_lstm(1, dim, dim, m),
  rev_lstm(1, dim, dim, m),
  projection(m, dim * 2, dim, trainable) {
}

void BiLSTMComposition::new_graph(dynet::ComputationGraph& cg) {
  fwd_lstm.new_graph(cg);
  rev_lstm.new_graph(cg);
  projection.new_graph(cg);
}

std::vector<dynet::Expression> BiLSTMComposition::get_params() {
  std::vector<dynet::Expression> ret;
  for (auto & layer : fwd_lstm.param_vars) { for (auto & e : layer) { ret.push_back(e); } }
  for (auto & layer : rev_lstm.param_vars) { for (auto & e : layer) { ret.push_back(e); } }
  for (auto & e : projection.get_params()) { ret.push_back(e); }
  return ret;
}

dynet::Expression BiLSTMComposition::compose(const std::vector<dynet::Expression>& exprs) {
  check_inputs(exprs);
  unsigned n_children = exprs.size() - 1;
  const dynet::Expression & nonterminal = exprs.back();

  fwd_lstm.start_new_sequence();
  rev_lstm.start_new_sequence();
  fwd_lstm.add_input(nonterminal);
  rev_lstm.add_input(nonterminal);
  for (unsigned i = 0; i < n_children; ++i) {
    // exprs[0] is the rightmost child.
    fwd_lstm.add_input(exprs[n_children - i - 1]);
    rev_lstm.add_input(exprs[i]);
  }
  dynet::Expression c = dynet::concatenate({ fwd_lstm.back(), rev_lstm.back() });
  return dynet::tanh(projection.get_output(c));
}

void BiLSTMComposition::set_dropout(float rate) {
  fwd_lstm.set_dropout(rate);
  rev_lstm.set_dropout(rate);
}

void BiLSTMComposition::disable_dropout() {
  fwd_lstm.disable_dropout();
  rev_lstm.disable_dropout();
}

SummationComposition::SummationComposition(dynet::ParameterCollection& m,
                                           unsigned dim,
                                           bool trainable) :
  CompositionFunction(dim, trainable),
  projection(m, dim, dim, trainable) {
}

void SummationComposition::new_graph(dynet::ComputationGraph& cg) {
  projection.new_graph(cg);
}

std::vector<dynet::Expression> SummationComposition::get_params() {
  return projection.get_params();
}

dynet::Expression SummationComposition::compose(const std::vector<dynet::Expression>& exprs) {
  check_inputs(exprs);
  return dynet::tanh(projection.get_output(dynet::sum(exprs)));
}
