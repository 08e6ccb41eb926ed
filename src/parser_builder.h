#ifndef PARSER_BUILDER_H
#define PARSER_BUILDER_H

#include <memory>
#include <string>
#include "dynet/model.h"
#include "parser_state.h"
#include "composition.h"
#include <boost/program_options.hpp>

namespace po = boost::program_options;

struct ParserStateBuilder {
  enum COMPOSITION_TYPE { kBiLSTM, kSummation };

  dynet::ParameterCollection & model;
  COMPOSITION_TYPE composition_type;
  float dropout;
  std::unique_ptr<RnngParserModel> parser_model;
  std::unique_ptr<CompositionFunction> composer;

  static po::options_description get_options();

  ParserStateBuilder(const po::variables_map & conf,
                     dynet::ParameterCollection & model);

  void new_graph(dynet::ComputationGraph & cg);

  RnngParserState build();

  void set_dropout();
  void disable_dropout();
};

#endif  //  end for PARSER_BUILDER_H
