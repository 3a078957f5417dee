#ifndef RNNG_IMPL_TEST_COMPONENTS_H_
#define RNNG_IMPL_TEST_COMPONENTS_H_

#include <vector>

#include "cnn/cnn.h"
#include "cnn/expr.h"

#include "rnng/composer.h"
#include "rnng/featurizer.h"
#include "rnng/scorer.h"

// Parameter-free stand-ins for the neural components: every embedding and
// encoding is the constant 1-vector [0] and the scorers return fixed logits
// whatever the state, so decoder behavior depends only on the transition
// system and the logits chosen by a test.

class ConstantFeaturizer : public rnng::Featurizer {
public:
  ConstantFeaturizer() : hg(nullptr) {}

  void new_graph(cnn::ComputationGraph* hg) override { this->hg = hg; }

  cnn::expr::Expression word_embedding(int) override { return zero(); }
  cnn::expr::Expression nonterminal_embedding(int) override { return zero(); }
  cnn::expr::Expression action_embedding(const rnng::Action&) override { return zero(); }
  cnn::expr::Expression guard(rnng::Sequence) override { return zero(); }

  rnng::Encoding start(rnng::Sequence, const cnn::expr::Expression& guard) override {
    return rnng::Encoding(cnn::NULL_RNN_POINTER, guard);
  }

  rnng::Encoding extend(rnng::Sequence, const rnng::Encoding&, const cnn::expr::Expression& input) override {
    return rnng::Encoding(cnn::NULL_RNN_POINTER, input);
  }

  unsigned representation_dim() const override { return 3; }

private:
  cnn::expr::Expression zero() { return cnn::expr::input(*hg, cnn::Dim({1}), std::vector<float>{0.0f}); }

  cnn::ComputationGraph* hg;
};

// the composition of a constituent is its label's embedding
class LabelComposer : public rnng::Composer {
public:
  void new_graph(cnn::ComputationGraph*) override {}

  cnn::expr::Expression compose(const cnn::expr::Expression& label,
                                const std::vector<cnn::expr::Expression>&) override {
    return label;
  }
};

class FixedScorer : public rnng::Scorer {
public:
  FixedScorer(const std::vector<float>& action_scores, const std::vector<float>& label_scores)
      : action_scores(action_scores), label_scores(label_scores), hg(nullptr) {}

  void new_graph(cnn::ComputationGraph* hg) override { this->hg = hg; }

  cnn::expr::Expression action_logits(const cnn::expr::Expression&) override {
    return cnn::expr::input(*hg, cnn::Dim({(unsigned) action_scores.size()}), action_scores);
  }

  cnn::expr::Expression label_logits(const cnn::expr::Expression&) override {
    return cnn::expr::input(*hg, cnn::Dim({(unsigned) label_scores.size()}), label_scores);
  }

private:
  std::vector<float> action_scores;
  std::vector<float> label_scores;
  cnn::ComputationGraph* hg;
};

class FixedGenerativeScorer : public rnng::GenerativeScorer {
public:
  FixedGenerativeScorer(const std::vector<float>& action_scores, const std::vector<float>& label_scores,
                        const std::vector<float>& word_scores)
      : base(action_scores, label_scores), word_scores(word_scores), hg(nullptr) {}

  void new_graph(cnn::ComputationGraph* hg) override {
    base.new_graph(hg);
    this->hg = hg;
  }

  cnn::expr::Expression action_logits(const cnn::expr::Expression& state) override {
    return base.action_logits(state);
  }

  cnn::expr::Expression label_logits(const cnn::expr::Expression& state) override {
    return base.label_logits(state);
  }

  cnn::expr::Expression word_logits(const cnn::expr::Expression&) override {
    return cnn::expr::input(*hg, cnn::Dim({(unsigned) word_scores.size()}), word_scores);
  }

private:
  FixedScorer base;
  std::vector<float> word_scores;
  cnn::ComputationGraph* hg;
};

#endif
