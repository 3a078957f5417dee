#include "rnng/scorer.h"

#include <limits>

using namespace std;
using namespace cnn;
using namespace cnn::expr;

namespace rnng {

namespace {
const VariableIndex kNoState = (VariableIndex) numeric_limits<unsigned>::max();
}

MLPScorer::MLPScorer(Model* model, unsigned state_dim, unsigned hidden_dim, unsigned nt_size) :
    p_pbias(model->add_parameters({hidden_dim})),
    p_S(model->add_parameters({hidden_dim, state_dim})),
    p_abias(model->add_parameters({kNumActionIndices})),
    p_p2a(model->add_parameters({kNumActionIndices, hidden_dim})),
    p_lbias(model->add_parameters({nt_size})),
    p_p2l(model->add_parameters({nt_size, hidden_dim})),
    last_state(kNoState) {}

void MLPScorer::new_graph(ComputationGraph* hg) {
  pbias = parameter(*hg, p_pbias);
  S = parameter(*hg, p_S);
  abias = parameter(*hg, p_abias);
  p2a = parameter(*hg, p_p2a);
  lbias = parameter(*hg, p_lbias);
  p2l = parameter(*hg, p_p2l);
  last_state = kNoState;
}

Expression MLPScorer::hidden(const Expression& state) {
  if (last_state != state.i) {
    last_hidden = rectify(affine_transform({pbias, S, state}));
    last_state = state.i;
  }
  return last_hidden;
}

Expression MLPScorer::action_logits(const Expression& state) {
  return affine_transform({abias, p2a, hidden(state)});
}

Expression MLPScorer::label_logits(const Expression& state) {
  return affine_transform({lbias, p2l, hidden(state)});
}

GenerativeMLPScorer::GenerativeMLPScorer(Model* model, unsigned state_dim, unsigned hidden_dim, unsigned nt_size,
                                         unsigned vocab_size) :
    base(model, state_dim, hidden_dim, nt_size),
    p_wbias(model->add_parameters({vocab_size})),
    p_p2w(model->add_parameters({vocab_size, hidden_dim})) {}

void GenerativeMLPScorer::new_graph(ComputationGraph* hg) {
  base.new_graph(hg);
  wbias = parameter(*hg, p_wbias);
  p2w = parameter(*hg, p_p2w);
}

Expression GenerativeMLPScorer::action_logits(const Expression& state) {
  return base.action_logits(state);
}

Expression GenerativeMLPScorer::label_logits(const Expression& state) {
  return base.label_logits(state);
}

Expression GenerativeMLPScorer::word_logits(const Expression& state) {
  return affine_transform({wbias, p2w, base.hidden(state)});
}

} // namespace rnng
