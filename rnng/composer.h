#ifndef RNNG_COMPOSER_H_
#define RNNG_COMPOSER_H_

#include <vector>

#include "cnn/cnn.h"
#include "cnn/expr.h"
#include "cnn/lstm.h"
#include "cnn/model.h"

namespace rnng {

// Collapses a reduced constituent into one vector. Must accept a single child.
class Composer {
public:
  virtual ~Composer() {}

  virtual void new_graph(cnn::ComputationGraph* hg) = 0;

  virtual cnn::expr::Expression compose(const cnn::expr::Expression& label,
                                        const std::vector<cnn::expr::Expression>& children) = 0;
};

// forward and backward LSTMs over [label, children...], then an affine
// layer and a ReLU over both final states
class BiLSTMComposer : public Composer {
public:
  BiLSTMComposer(cnn::Model* model, unsigned layers, unsigned dim);

  void new_graph(cnn::ComputationGraph* hg) override;

  cnn::expr::Expression compose(const cnn::expr::Expression& label,
                                const std::vector<cnn::expr::Expression>& children) override;

private:
  cnn::LSTMBuilder const_lstm_fwd;
  cnn::LSTMBuilder const_lstm_rev;
  cnn::Parameters* p_cbias;
  cnn::Parameters* p_cW;

  cnn::expr::Expression cbias, cW;
};

} // namespace rnng

#endif
