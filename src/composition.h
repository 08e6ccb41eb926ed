#ifndef COMPOSITION_H
#define COMPOSITION_H

#include <vector>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "dynet/lstm.h"
#include "dynet/model.h"
#include "layer.h"

// Input in stack-pop order, e.g. [barks, dog, the, S] for "(S the dog barks)".
struct CompositionFunction : public LayerI {
  unsigned dim;

  CompositionFunction(unsigned dim, bool trainable=true) : LayerI(trainable), dim(dim) {}

  virtual dynet::Expression compose(const std::vector<dynet::Expression>& exprs) = 0;

  virtual void set_dropout(float rate) {}
  virtual void disable_dropout() {}

protected:
  // Throw std::invalid_argument on an empty list or a size mismatch.
  void check_inputs(const std::vector<dynet::Expression>& exprs) const;
};

struct BiLSTMComposition : public CompositionFunction {
  dynet::LSTMBuilder fwd_lstm;
  dynet::LSTMBuilder rev_lstm;
  DenseLayer projection;

  BiLSTMComposition(dynet::ParameterCollection& model,
                    unsigned dim,
                    bool trainable=true);

  void new_graph(dynet::ComputationGraph& cg) override;
  std::vector<dynet::Expression> get_params() override;
  dynet::Expression compose(const std::vector<dynet::Expression>& exprs) override;

  void set_dropout(float rate) override;
  void disable_dropout() override;
};

// tanh(W * sum(x) + B), order-insensitive.
struct SummationComposition : public CompositionFunction {
  DenseLayer projection;

  SummationComposition(dynet::ParameterCollection& model,
                       unsigned dim,
                       bool trainable=true);

  void new_graph(dynet::ComputationGraph& cg) override;
  std::vector<dynet::Expression> get_params() override;
  dynet::Expression compose(const std::vector<dynet::Expression>& exprs) override;
};

#endif  //  end for COMPOSITION_H
