#ifndef RNNG_SCORER_H_
#define RNNG_SCORER_H_

#include "cnn/cnn.h"
#include "cnn/expr.h"
#include "cnn/model.h"

#include "rnng/featurizer.h"

namespace rnng {

// Maps a parser state representation to unnormalized scores. action_logits
// has kNumActionIndices entries, label_logits one per nonterminal.
class Scorer {
public:
  virtual ~Scorer() {}

  virtual void new_graph(cnn::ComputationGraph* hg) = 0;

  virtual cnn::expr::Expression action_logits(const cnn::expr::Expression& state) = 0;
  virtual cnn::expr::Expression label_logits(const cnn::expr::Expression& state) = 0;
};

// scorer of a generative parser, which also predicts the next word
class GenerativeScorer : public Scorer {
public:
  virtual cnn::expr::Expression word_logits(const cnn::expr::Expression& state) = 0;
};

// one ReLU hidden layer shared by the output heads
class MLPScorer : public Scorer {
public:
  MLPScorer(cnn::Model* model, unsigned state_dim, unsigned hidden_dim, unsigned nt_size);

  void new_graph(cnn::ComputationGraph* hg) override;

  cnn::expr::Expression action_logits(const cnn::expr::Expression& state) override;
  cnn::expr::Expression label_logits(const cnn::expr::Expression& state) override;

  cnn::expr::Expression hidden(const cnn::expr::Expression& state);

private:
  cnn::Parameters* p_pbias; // parser state bias
  cnn::Parameters* p_S; // state representation to hidden
  cnn::Parameters* p_abias; // action bias
  cnn::Parameters* p_p2a; // hidden to action
  cnn::Parameters* p_lbias; // label bias
  cnn::Parameters* p_p2l; // hidden to label

  cnn::expr::Expression pbias, S, abias, p2a, lbias, p2l;

  // hidden layer of the last state scored, reused by the other heads
  cnn::VariableIndex last_state;
  cnn::expr::Expression last_hidden;
};

class GenerativeMLPScorer : public GenerativeScorer {
public:
  GenerativeMLPScorer(cnn::Model* model, unsigned state_dim, unsigned hidden_dim, unsigned nt_size, unsigned vocab_size);

  void new_graph(cnn::ComputationGraph* hg) override;

  cnn::expr::Expression action_logits(const cnn::expr::Expression& state) override;
  cnn::expr::Expression label_logits(const cnn::expr::Expression& state) override;
  cnn::expr::Expression word_logits(const cnn::expr::Expression& state) override;

private:
  MLPScorer base;
  cnn::Parameters* p_wbias; // word bias
  cnn::Parameters* p_p2w; // hidden to word

  cnn::expr::Expression wbias, p2w;
};

} // namespace rnng

#endif
