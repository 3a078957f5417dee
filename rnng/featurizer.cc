#include "rnng/featurizer.h"

using namespace std;
using namespace cnn;
using namespace cnn::expr;

namespace rnng {

LSTMFeaturizer::LSTMFeaturizer(Model* model, const ModelDimensions& dims, unsigned vocab_size, unsigned nt_size) :
    hidden_dim(dims.hidden_dim),
    stack_lstm(dims.layers, dims.lstm_input_dim, dims.hidden_dim, model),
    buffer_lstm(dims.layers, dims.lstm_input_dim, dims.hidden_dim, model),
    action_lstm(dims.layers, dims.action_dim, dims.hidden_dim, model),
    p_w(model->add_lookup_parameters(vocab_size, {dims.input_dim})),
    p_nt(model->add_lookup_parameters(nt_size, {dims.lstm_input_dim})),
    p_a(model->add_lookup_parameters(2 + nt_size, {dims.action_dim})), // SHIFT/GEN, REDUCE, one per NT(X)
    p_w2l(model->add_parameters({dims.lstm_input_dim, dims.input_dim})),
    p_ib(model->add_parameters({dims.lstm_input_dim})),
    p_stack_guard(model->add_parameters({dims.lstm_input_dim})),
    p_buffer_guard(model->add_parameters({dims.lstm_input_dim})),
    p_action_start(model->add_parameters({dims.action_dim})),
    hg(nullptr) {}

void LSTMFeaturizer::new_graph(ComputationGraph* hg) {
  this->hg = hg;
  stack_lstm.new_graph(*hg);
  buffer_lstm.new_graph(*hg);
  action_lstm.new_graph(*hg);
  stack_lstm.disable_dropout();
  buffer_lstm.disable_dropout();
  action_lstm.disable_dropout();
  w2l = parameter(*hg, p_w2l);
  ib = parameter(*hg, p_ib);
}

Expression LSTMFeaturizer::word_embedding(int word) {
  Expression w = lookup(*hg, p_w, (unsigned) word);
  return rectify(affine_transform({ib, w2l, w}));
}

Expression LSTMFeaturizer::nonterminal_embedding(int label) {
  return lookup(*hg, p_nt, (unsigned) label);
}

Expression LSTMFeaturizer::action_embedding(const Action& action) {
  return lookup(*hg, p_a, (unsigned) action.code());
}

Expression LSTMFeaturizer::guard(Sequence sequence) {
  switch (sequence) {
    case Sequence::kStack:
      return parameter(*hg, p_stack_guard);
    case Sequence::kBuffer:
      return parameter(*hg, p_buffer_guard);
    default:
      return parameter(*hg, p_action_start);
  }
}

LSTMBuilder& LSTMFeaturizer::builder(Sequence sequence) {
  switch (sequence) {
    case Sequence::kStack:
      return stack_lstm;
    case Sequence::kBuffer:
      return buffer_lstm;
    default:
      return action_lstm;
  }
}

Encoding LSTMFeaturizer::start(Sequence sequence, const Expression& guard) {
  LSTMBuilder& lstm = builder(sequence);
  lstm.start_new_sequence();
  Expression output = lstm.add_input(guard);
  return Encoding(lstm.state(), output);
}

Encoding LSTMFeaturizer::extend(Sequence sequence, const Encoding& previous, const Expression& input) {
  LSTMBuilder& lstm = builder(sequence);
  Expression output = lstm.add_input(previous.position, input);
  return Encoding(lstm.state(), output);
}

} // namespace rnng
