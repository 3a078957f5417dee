#include "rnng/composer.h"

using namespace std;
using namespace cnn;
using namespace cnn::expr;

namespace rnng {

BiLSTMComposer::BiLSTMComposer(Model* model, unsigned layers, unsigned dim) :
    const_lstm_fwd(layers, dim, dim, model),
    const_lstm_rev(layers, dim, dim, model),
    p_cbias(model->add_parameters({dim})),
    p_cW(model->add_parameters({dim, dim * 2})) {}

void BiLSTMComposer::new_graph(ComputationGraph* hg) {
  const_lstm_fwd.new_graph(*hg);
  const_lstm_rev.new_graph(*hg);
  const_lstm_fwd.disable_dropout();
  const_lstm_rev.disable_dropout();
  cbias = parameter(*hg, p_cbias);
  cW = parameter(*hg, p_cW);
}

Expression BiLSTMComposer::compose(const Expression& label, const vector<Expression>& children) {
  const_lstm_fwd.start_new_sequence();
  const_lstm_rev.start_new_sequence();
  const_lstm_fwd.add_input(label);
  const_lstm_rev.add_input(label);
  unsigned nchildren = children.size();
  for (unsigned i = 0; i < nchildren; ++i) {
    const_lstm_fwd.add_input(children[i]);
    const_lstm_rev.add_input(children[nchildren - i - 1]);
  }
  Expression cfwd = const_lstm_fwd.back();
  Expression crev = const_lstm_rev.back();
  Expression c = concatenate({cfwd, crev});
  return rectify(affine_transform({cbias, cW, c}));
}

} // namespace rnng
