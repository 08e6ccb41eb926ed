#include "parser_builder.h"
#include "logging.h"
#include <stdexcept>

po::options_description ParserStateBuilder::get_options() {
  po::options_description cmd("Parser state settings.");
  cmd.add_options()
    ("layers", po::value<unsigned>()->default_value(2), "The number of layers in the stack LSTMs.")
    ("lstm_dim", po::value<unsigned>()->default_value(32), "The dimension of the stack LSTMs, their inputs and the composition.")
    ("action_dim", po::value<unsigned>()->default_value(20), "The dimension for action.")
    ("composition", po::value<std::string>()->default_value("bilstm"), "The composition function [bilstm|sum].")
    ("dropout", po::value<float>()->default_value(0.f), "The dropout rate.")
    ;
  return cmd;
}

ParserStateBuilder::ParserStateBuilder(const po::variables_map & conf,
                                       dynet::ParameterCollection & model) :
  model(model),
  dropout(conf["dropout"].as<float>()) {
  unsigned n_layers = conf["layers"].as<unsigned>();
  unsigned dim_lstm = conf["lstm_dim"].as<unsigned>();
  unsigned dim_action = conf["action_dim"].as<unsigned>();

  std::string composition_name = conf["composition"].as<std::string>();
  if (composition_name == "bilstm") {
    composition_type = kBiLSTM;
  } else if (composition_name == "sum") {
    composition_type = kSummation;
  } else {
    _ERROR << "RNNG:: Unknown composition function: " << composition_name;
    throw std::invalid_argument("Unknown composition function: " + composition_name);
  }

  parser_model.reset(new RnngParserModel(model, n_layers, dim_lstm, dim_action));
  if (composition_type == kBiLSTM) {
    composer.reset(new BiLSTMComposition(model, dim_lstm));
  } else {
    composer.reset(new SummationComposition(model, dim_lstm));
  }
  _INFO << "RNNG:: composition: " << composition_name;
  _INFO << "RNNG:: layers = " << n_layers << ", lstm_dim = " << dim_lstm
    << ", action_dim = " << dim_action;
}

void ParserStateBuilder::new_graph(dynet::ComputationGraph & cg) {
  parser_model->new_graph(cg);
  composer->new_graph(cg);
}

RnngParserState ParserStateBuilder::build() {
  return RnngParserState(*parser_model);
}

void ParserStateBuilder::set_dropout() {
  if (dropout > 0.f) {
    parser_model->set_dropout(dropout);
    composer->set_dropout(dropout);
  }
}

void ParserStateBuilder::disable_dropout() {
  parser_model->disable_dropout();
  composer->disable_dropout();
}
