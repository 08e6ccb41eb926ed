#ifndef LAYER_H
#define LAYER_H

#include <vector>
#include "dynet/dynet.h"
#include "dynet/expr.h"
#include "dynet/model.h"

struct LayerI {
  bool trainable;
  LayerI(bool trainable) : trainable(trainable) {}
  virtual ~LayerI() {}
  // Bind the parameters to the graph.
  virtual void new_graph(dynet::ComputationGraph& cg) = 0;
  virtual std::vector<dynet::Expression> get_params() = 0;
};

// W * x + B
struct DenseLayer : public LayerI {
  dynet::Parameter p_W, p_B;
  dynet::Expression W, B;

  DenseLayer(dynet::ParameterCollection& model,
             unsigned dim_input,
             unsigned dim_output,
             bool trainable=true);
  void new_graph(dynet::ComputationGraph& cg) override;
  std::vector<dynet::Expression> get_params() override;
  dynet::Expression get_output(const dynet::Expression& expr);
};

#endif  //  end for LAYER_H
