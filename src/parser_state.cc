#include "parser_state.h"
#include <boost/assert.hpp>

RnngParserModel::RnngParserModel(dynet::ParameterCollection& m,
                                 unsigned n_layers,
                                 unsigned dim_lstm,
                                 unsigned dim_action) :
  buffer_lstm(n_layers, dim_lstm, dim_lstm, m),
  stack_lstm(n_layers, dim_lstm, dim_lstm, m),
  action_lstm(n_layers, dim_action, dim_lstm, m),
  p_empty_buffer(m.add_parameters({ dim_lstm })),
  p_empty_stack(m.add_parameters({ dim_lstm })),
  p_empty_action(m.add_parameters({ dim_lstm })),
  n_layers(n_layers), dim_lstm(dim_lstm), dim_action(dim_action) {
  BOOST_ASSERT(n_layers > 0);
  for (unsigned i = 0; i < n_layers * 2; ++i) {
    p_init.push_back(m.add_parameters({ dim_lstm }));
  }
}

void RnngParserModel::new_graph(dynet::ComputationGraph& cg) {
  buffer_lstm.new_graph(cg);
  stack_lstm.new_graph(cg);
  action_lstm.new_graph(cg);

  empty_buffer = dynet::parameter(cg, p_empty_buffer);
  empty_stack = dynet::parameter(cg, p_empty_stack);
  empty_action = dynet::parameter(cg, p_empty_action);

  init.clear();
  for (auto & p : p_init) { init.push_back(dynet::parameter(cg, p)); }
}

std::vector<dynet::Expression> RnngParserModel::get_params() {
  std::vector<dynet::Expression> ret;
  for (auto & layer : buffer_lstm.param_vars) { for (auto & e : layer) { ret.push_back(e); } }
  for (auto & layer : stack_lstm.param_vars) { for (auto & e : layer) { ret.push_back(e); } }
  for (auto & layer : action_lstm.param_vars) { for (auto & e : layer) { ret.push_back(e); } }
  ret.push_back(empty_buffer);
  ret.push_back(empty_stack);
  ret.push_back(empty_action);
  for (auto & e : init) { ret.push_back(e); }
  return ret;
}

void RnngParserModel::set_dropout(float rate) {
  buffer_lstm.set_dropout(rate);
  stack_lstm.set_dropout(rate);
  action_lstm.set_dropout(rate);
}

void RnngParserModel::disable_dropout() {
  buffer_lstm.disable_dropout();
  stack_lstm.disable_dropout();
  action_lstm.disable_dropout();
}

RnngParserState::RnngParserState(RnngParserModel& model) :
  buffer_lstm(model.buffer_lstm, model.dim_lstm, model.initial_state(), model.empty_buffer),
  stack_lstm(model.stack_lstm, model.dim_lstm, model.initial_state(), model.empty_stack),
  action_lstm(model.action_lstm, model.dim_action, model.initial_state(), model.empty_action),
  num_open_nt(0),
  found_unsupported(false),
  neg_prob(0.f) {
}

RnngParserState::RnngParserState(const StackLSTM& buffer,
                                 const StackLSTM& stack,
                                 const StackLSTM& action) :
  buffer_lstm(buffer),
  stack_lstm(stack),
  action_lstm(action),
  num_open_nt(0),
  found_unsupported(false),
  neg_prob(0.f) {
}

bool RnngParserState::finished() const {
  return stack_lstm.size() == 1 && buffer_lstm.size() == 0;
}

RnngParserState RnngParserState::branch(unsigned action,
                                        const dynet::Expression& scores,
                                        float log_prob) const {
  RnngParserState ret(*this);
  ret.predicted_actions_idx.push_back(action);
  ret.action_scores.push_back(scores);
  ret.neg_prob -= log_prob;
  return ret;
}

int RnngParserState::compare(const RnngParserState& other) const {
  if (neg_prob < other.neg_prob) { return -1; }
  if (neg_prob > other.neg_prob) { return 1; }
  return 0;
}

bool operator<(const RnngParserState& x, const RnngParserState& y) {
  return x.compare(y) < 0;
}

bool operator>(const RnngParserState& x, const RnngParserState& y) {
  return x.compare(y) > 0;
}

bool operator==(const RnngParserState& x, const RnngParserState& y) {
  return x.compare(y) == 0;
}

bool operator!=(const RnngParserState& x, const RnngParserState& y) {
  return x.compare(y) != 0;
}
