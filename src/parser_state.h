#ifndef PARSER_STATE_H
#define PARSER_STATE_H

#include <vector>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "dynet/lstm.h"
#include "dynet/model.h"
#include "stack_lstm.h"

struct RnngParserModel {
  dynet::LSTMBuilder buffer_lstm;
  dynet::LSTMBuilder stack_lstm;
  dynet::LSTMBuilder action_lstm;

  dynet::Parameter p_empty_buffer;
  dynet::Parameter p_empty_stack;
  dynet::Parameter p_empty_action;
  std::vector<dynet::Parameter> p_init;  // cells of every layer, then hiddens
  dynet::Expression empty_buffer;
  dynet::Expression empty_stack;
  dynet::Expression empty_action;
  std::vector<dynet::Expression> init;

  unsigned n_layers, dim_lstm, dim_action;

  RnngParserModel(dynet::ParameterCollection& m,
                  unsigned n_layers,
                  unsigned dim_lstm,
                  unsigned dim_action);

  void new_graph(dynet::ComputationGraph& cg);

  const std::vector<dynet::Expression>& initial_state() const { return init; }

  std::vector<dynet::Expression> get_params();

  void set_dropout(float rate);
  void disable_dropout();
};

struct RnngParserState {
  StackLSTM buffer_lstm;
  StackLSTM stack_lstm;
  StackLSTM action_lstm;

  std::vector<unsigned> predicted_actions_idx;
  std::vector<dynet::Expression> action_scores;

  unsigned num_open_nt;
  std::vector<bool> is_open_nt;
  bool found_unsupported;

  // Negative cumulative log-probability, smaller is better.
  float neg_prob;

  // Call model.new_graph() first.
  explicit RnngParserState(RnngParserModel& model);

  RnngParserState(const StackLSTM& buffer,
                  const StackLSTM& stack,
                  const StackLSTM& action);

  bool finished() const;

  RnngParserState copy() const { return RnngParserState(*this); }

  RnngParserState branch(unsigned action,
                         const dynet::Expression& scores,
                         float log_prob) const;

  int compare(const RnngParserState& other) const;
};

bool operator<(const RnngParserState& x, const RnngParserState& y);
bool operator>(const RnngParserState& x, const RnngParserState& y);
bool operator==(const RnngParserState& x, const RnngParserState& y);
bool operator!=(const RnngParserState& x, const RnngParserState& y);

#endif  //  end for PARSER_STATE_H
