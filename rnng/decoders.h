#ifndef RNNG_DECODERS_H_
#define RNNG_DECODERS_H_

#include <string>
#include <vector>

#include "cnn/cnn.h"
#include "cnn/expr.h"

#include "rnng/actions.h"
#include "rnng/composer.h"
#include "rnng/featurizer.h"
#include "rnng/oracle.h"
#include "rnng/parser-state.h"
#include "rnng/samples.h"
#include "rnng/scorer.h"
#include "rnng/tree.h"

namespace rnng {

struct Derivation {
  Derivation() : log_prob(0), sample_log_prob(0) {}

  std::vector<Action> actions;
  TreePtr tree;
  double log_prob; // under the model
  double sample_log_prob; // under the distribution the actions were drawn from
  std::vector<std::string> words; // the parsed or generated sentence
};

// log_softmax over `size` entries with everything outside `valid` at -inf
cnn::expr::Expression log_softmax_constrained(const cnn::expr::Expression& logits,
                                              const std::vector<unsigned>& valid, unsigned size);

// Shared plumbing of all decoders: a new graph per sentence, the initial
// state, and the masked distributions of the three output heads.
class Decoder {
public:
  Decoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
          unsigned max_open_nts = kMaxOpenNonterminals);
  // generative parsing: GEN replaces SHIFT and words are scored too
  Decoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, GenerativeScorer* scorer,
          unsigned max_open_nts = kMaxOpenNonterminals);
  virtual ~Decoder() {}

  bool is_generative() const { return word_scorer != nullptr; }

  // prepares every component for hg and returns the initial state; sentence
  // is null only for unconditional generation
  ParserState process_input(cnn::ComputationGraph* hg, const Sentence* sentence);

  // log p(y|x), or log p(x,y) for a generative decoder, of a complete
  // derivation (SHIFT or GEN form to match). MalformedOracleError unless it
  // is legal and finishes exactly at its last action.
  double score(cnn::ComputationGraph* hg, const Sentence& sentence, const std::vector<Action>& actions,
               unsigned sentence_index);

protected:
  cnn::expr::Expression action_log_probs(const cnn::expr::Expression& repr, const std::vector<unsigned>& valid);
  cnn::expr::Expression label_log_probs(const cnn::expr::Expression& repr);
  cnn::expr::Expression word_log_probs(const cnn::expr::Expression& repr);

  // action for a slot of the action distribution plus its label or word
  Action make_action(unsigned index, int choice) const;

  Vocabulary* vocab;
  Featurizer* featurizer;
  Composer* composer;
  Scorer* scorer;
  GenerativeScorer* word_scorer; // null for discriminative decoders
  unsigned max_open_nts;
  std::vector<unsigned> all_labels;
  std::vector<unsigned> all_words;
};

// decoders that follow a single derivation, one choice per step
class StepwiseDecoder : public Decoder {
public:
  StepwiseDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                  unsigned max_open_nts);
  StepwiseDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, GenerativeScorer* scorer,
                  unsigned max_open_nts);

protected:
  Derivation run(cnn::ComputationGraph* hg, const Sentence* sentence);

  // picks one of `candidates` given log-probabilities over `size` outcomes and
  // adds its log-probability under the distribution drawn from to *sample_log_prob
  virtual unsigned choose(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates,
                          unsigned size, double* sample_log_prob) = 0;

  unsigned argmax(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates,
                  double* sample_log_prob);
  unsigned sample(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates, unsigned size,
                  float alpha, double* sample_log_prob);
};

class GreedyDecoder : public StepwiseDecoder {
public:
  GreedyDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                unsigned max_open_nts = kMaxOpenNonterminals);

  Derivation decode(cnn::ComputationGraph* hg, const Sentence& sentence);

protected:
  unsigned choose(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates,
                  unsigned size, double* sample_log_prob) override;
};

// ancestral sampling from the model, flattened by alpha (probs^alpha, renormalized)
class SamplingDecoder : public StepwiseDecoder {
public:
  SamplingDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                  float alpha = 1.0f, unsigned max_open_nts = kMaxOpenNonterminals);

  Derivation decode(cnn::ComputationGraph* hg, const Sentence& sentence);

  // independent draws, each on its own computation graph
  std::vector<Derivation> sample(const Sentence& sentence, unsigned count);

protected:
  unsigned choose(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates,
                  unsigned size, double* sample_log_prob) override;

private:
  float alpha;
};

// synchronous beam search: every step expands all beams and keeps the global
// top beam_size successors; finished states leave the beam
class BeamSearchDecoder : public Decoder {
public:
  BeamSearchDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                    unsigned beam_size, unsigned max_open_nts = kMaxOpenNonterminals);

  // finished derivations, best first
  std::vector<Derivation> decode(cnn::ComputationGraph* hg, const Sentence& sentence);

private:
  unsigned beam_size;
};

// samples trees together with their words from a generative model
class GenerativeSamplingDecoder : public StepwiseDecoder {
public:
  GenerativeSamplingDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer,
                            GenerativeScorer* scorer, float alpha = 1.0f,
                            unsigned max_open_nts = kMaxOpenNonterminals);

  Derivation generate(cnn::ComputationGraph* hg);

protected:
  unsigned choose(const cnn::expr::Expression& log_probs, const std::vector<unsigned>& candidates,
                  unsigned size, double* sample_log_prob) override;

private:
  float alpha;
};

struct ScoredSample {
  TreePtr tree;
  std::vector<Action> actions; // SHIFT form
  double proposal_log_prob; // log q(y|x)
  double joint_log_prob; // log p(x,y) under the generative model
};

// Scores proposal trees with a generative model to estimate the MAP tree and
// the sentence probability p(x). Proposals come from a sampling decoder or
// from a sample file.
class GenerativeImportanceSamplingDecoder : public Decoder {
public:
  static const unsigned kDefaultSamples = 100;

  GenerativeImportanceSamplingDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer,
                                      GenerativeScorer* scorer, unsigned num_samples = kDefaultSamples,
                                      unsigned max_open_nts = kMaxOpenNonterminals);

  void set_proposal(SamplingDecoder* proposal) { this->proposal = proposal; }
  void set_proposal_samples(const ProposalSamples* samples) { proposal_samples = samples; }

  // num_samples proposals, each scored under the generative model. must not
  // be called while another computation graph is alive.
  std::vector<ScoredSample> scored_samples(const Sentence& sentence, unsigned sentence_index,
                                           bool remove_duplicates = false);

  ScoredSample map_tree(const Sentence& sentence, unsigned sentence_index);
  double log_probability(const Sentence& sentence, unsigned sentence_index);
  double perplexity(const Sentence& sentence, unsigned sentence_index);

  // first occurrence of each distinct tree
  static std::vector<ScoredSample> remove_duplicates(const std::vector<ScoredSample>& samples);

  // highest log p(x,y) among distinct trees
  static ScoredSample map_estimate(const std::vector<ScoredSample>& samples);

  // log mean_i exp(log p(x,y_i) - log q(y_i|x)); repeated samples all count
  static double log_probability_estimate(const std::vector<ScoredSample>& samples);

private:
  std::vector<ScoredSample> draw(const Sentence& sentence, unsigned sentence_index);

  // MalformedOracleError unless the leaves are the sentence's words, where a
  // word outside the vocabulary may appear as UNK
  void check_leaves(const Tree& tree, const Sentence& sentence, unsigned sentence_index) const;

  unsigned num_samples;
  SamplingDecoder* proposal;
  const ProposalSamples* proposal_samples;
};

} // namespace rnng

#endif
