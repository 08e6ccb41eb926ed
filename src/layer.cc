#include "layer.h"
#include <boost/assert.hpp>

DenseLayer::DenseLayer(dynet::ParameterCollection& m,
                       unsigned dim_input,
                       unsigned dim_output,
                       bool trainable) :
  LayerI(trainable),
  p_W(m.add_parameters({ dim_output, dim_input })),
  p_B(m.add_parameters({ dim_output, 1 })) {
  BOOST_ASSERT(dim_input > 0 && dim_output > 0);
}

void DenseLayer::new_graph(dynet::ComputationGraph& cg) {
  if (trainable) {
    W = dynet::parameter(cg, p_W);
    B = dynet::parameter(cg, p_B);
  } else {
    W = dynet::const_parameter(cg, p_W);
    B = dynet::const_parameter(cg, p_B);
  }
}

std::vector<dynet::Expression> DenseLayer::get_params() {
  std::vector<dynet::Expression> ret = { W, B };
  return ret;
}

dynet::Expression DenseLayer::get_output(const dynet::Expression& expr) {
  return dynet::affine_transform({ B, W, expr });
}
