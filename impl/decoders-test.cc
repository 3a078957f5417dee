#include <assert.h>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "cnn/cnn.h"
#include "cnn/init.h"

#include "rnng/decoders.h"
#include "rnng/errors.h"
#include "rnng/oracle.h"
#include "rnng/parser-state.h"
#include "rnng/samples.h"
#include "test-components.h"

using namespace std;
using namespace rnng;

namespace {

bool close(double a, double b) {
  return fabs(a - b) < 1e-4;
}

struct Fixture {
  Fixture() {
    sentence = vocab.make_sentence({"The", "cat", "sleeps"});
    S = vocab.nonterminals.Convert("S");
    NP = vocab.nonterminals.Convert("NP");
    VP = vocab.nonterminals.Convert("VP");
    vocab.freeze();
  }

  // NT(S) NT(NP) SHIFT SHIFT REDUCE NT(VP) SHIFT REDUCE REDUCE
  vector<Action> gold() const {
    return {vocab.open_action(S), vocab.open_action(NP), Action::shift(), Action::shift(), Action::reduce(),
            vocab.open_action(VP), Action::shift(), Action::reduce(), Action::reduce()};
  }

  Vocabulary vocab;
  Sentence sentence;
  int S, NP, VP;
  ConstantFeaturizer featurizer;
  LabelComposer composer;
};

void test_greedy_prefers_highest_action() {
  Fixture f;
  FixedScorer scorer({3, 2, 1}, {1, 0, 0});
  GreedyDecoder greedy(&f.vocab, &f.featurizer, &f.composer, &scorer);
  cnn::ComputationGraph hg;
  Derivation d = greedy.decode(&hg, f.sentence);
  assert(d.tree->linearize() == "(S The cat sleeps)");
  assert(d.actions.size() == 5);
  assert(d.actions.front() == f.vocab.open_action(f.S));
  assert(d.actions.back() == Action::reduce());
  double expected = (1 - log(exp(1.0) + 2)) + 3 * (3 - log(exp(3.0) + exp(1.0)));
  assert(close(d.log_prob, expected));
  assert(close(d.sample_log_prob, expected));
  assert(d.words == f.sentence.words);
}

void test_greedy_breaks_ties_to_lowest_index() {
  Fixture f;
  FixedScorer scorer({0, 0, 0}, {0, 0, 0});
  GreedyDecoder greedy(&f.vocab, &f.featurizer, &f.composer, &scorer);
  cnn::ComputationGraph hg;
  Derivation d = greedy.decode(&hg, f.sentence);
  assert(d.tree->linearize() == "(S The cat sleeps)");
}

void test_beam_of_one_matches_greedy() {
  Fixture f;
  FixedScorer scorer({1, 2, 0.5f}, {0, 2, 1});
  Derivation greedy_result;
  {
    GreedyDecoder greedy(&f.vocab, &f.featurizer, &f.composer, &scorer);
    cnn::ComputationGraph hg;
    greedy_result = greedy.decode(&hg, f.sentence);
  }
  BeamSearchDecoder beam(&f.vocab, &f.featurizer, &f.composer, &scorer, 1);
  cnn::ComputationGraph hg;
  vector<Derivation> beams = beam.decode(&hg, f.sentence);
  assert(!beams.empty());
  assert(beams.front().actions == greedy_result.actions);
  assert(close(beams.front().log_prob, greedy_result.log_prob));
}

void test_beam_results_are_sorted_and_rescore() {
  Fixture f;
  FixedScorer scorer({1, 0.5f, 0}, {0.3f, 0.2f, 0.1f});
  vector<Derivation> beams;
  {
    BeamSearchDecoder beam(&f.vocab, &f.featurizer, &f.composer, &scorer, 4);
    cnn::ComputationGraph hg;
    beams = beam.decode(&hg, f.sentence);
  }
  assert(!beams.empty());
  Decoder rescorer(&f.vocab, &f.featurizer, &f.composer, &scorer);
  for (unsigned i = 0; i < beams.size(); ++i) {
    if (i > 0) assert(beams[i - 1].log_prob >= beams[i].log_prob);
    assert(beams[i].tree->leaves() == f.sentence.words);
    cnn::ComputationGraph hg;
    assert(close(rescorer.score(&hg, f.sentence, beams[i].actions, 0), beams[i].log_prob));
  }
}

void test_forced_scoring() {
  Fixture f;
  FixedScorer scorer({0, 0, 0}, {0, 0, 0});
  Decoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer);
  {
    cnn::ComputationGraph hg;
    double lp = decoder.score(&hg, f.sentence, f.gold(), 0);
    assert(close(lp, -5 * log(3.0) - 4 * log(2.0)));
  }

  vector<Action> unfinished = f.gold();
  unfinished.pop_back();
  bool thrown = false;
  try {
    cnn::ComputationGraph hg;
    decoder.score(&hg, f.sentence, unfinished, 7);
  } catch (MalformedOracleError& e) {
    thrown = true;
    assert(e.sentence_index == 7);
  }
  assert(thrown);

  thrown = false;
  try {
    cnn::ComputationGraph hg;
    decoder.score(&hg, f.sentence, {Action::reduce()}, 3);
  } catch (MalformedOracleError& e) {
    thrown = true;
    assert(e.sentence_index == 3);
  }
  assert(thrown);
}

void test_sampling() {
  Fixture f;
  FixedScorer scorer({0.5f, 0.2f, 0}, {0, 0, 0});
  SamplingDecoder sampler(&f.vocab, &f.featurizer, &f.composer, &scorer);
  vector<Derivation> samples = sampler.sample(f.sentence, 10);
  assert(samples.size() == 10);
  Decoder rescorer(&f.vocab, &f.featurizer, &f.composer, &scorer);
  for (const Derivation& d : samples) {
    assert(d.tree->leaves() == f.sentence.words);
    // untempered: sampled from the model itself
    assert(close(d.sample_log_prob, d.log_prob));
    cnn::ComputationGraph hg;
    assert(close(rescorer.score(&hg, f.sentence, d.actions, 0), d.log_prob));
  }
}

void test_generative_sampling() {
  Fixture f;
  FixedGenerativeScorer scorer({1, 2, 0}, {0, 0, 0}, {0, 0, 0, 0});
  GenerativeSamplingDecoder generator(&f.vocab, &f.featurizer, &f.composer, &scorer);
  for (unsigned i = 0; i < 10; ++i) {
    cnn::ComputationGraph hg;
    Derivation d = generator.generate(&hg);
    assert(!d.words.empty());
    assert(d.tree->leaves() == d.words);
    assert(close(d.sample_log_prob, d.log_prob));

    ParserState state(ParserState::Mode::kGenerative, nullptr);
    for (const Action& action : d.actions) {
      assert(action.type != ActionType::kShift);
      state = state.perform_action(action);
    }
    assert(state.is_finished());
    assert(state.tree()->linearize() == d.tree->linearize());
  }
}

void test_generative_forced_scoring() {
  Fixture f;
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  Decoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer);
  assert(decoder.is_generative());
  cnn::ComputationGraph hg;
  double lp = decoder.score(&hg, f.sentence, to_generative(f.sentence, f.gold(), 0), 0);
  assert(close(lp, -5 * log(3.0) - 10 * log(2.0)));
}

void test_importance_sampling_with_one_tree() {
  Fixture f;
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  ProposalSamples samples;
  for (unsigned i = 0; i < 4; ++i)
    samples.add({0, 0.0, parse_bracketed("(S (NP The cat) (VP sleeps))", false)});

  GenerativeImportanceSamplingDecoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer, 4);
  decoder.set_proposal_samples(&samples);
  // a proposal that puts all its mass on one tree recovers the exact joint
  double exact = -5 * log(3.0) - 10 * log(2.0);
  assert(close(decoder.log_probability(f.sentence, 0), exact));
  assert(close(decoder.perplexity(f.sentence, 0), exp(-exact / 3)));

  ScoredSample best = decoder.map_tree(f.sentence, 0);
  assert(best.tree->linearize() == "(S (NP The cat) (VP sleeps))");
  assert(close(best.joint_log_prob, exact));
  assert(decoder.scored_samples(f.sentence, 0).size() == 4);
  assert(decoder.scored_samples(f.sentence, 0, true).size() == 1);
}

void test_importance_sampling_with_proposal_decoder() {
  Fixture f;
  FixedScorer proposal_scorer({0, 0, 0}, {0, 0, 0});
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  SamplingDecoder proposal(&f.vocab, &f.featurizer, &f.composer, &proposal_scorer, 0.8f);
  GenerativeImportanceSamplingDecoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer, 5);
  decoder.set_proposal(&proposal);
  vector<ScoredSample> samples = decoder.scored_samples(f.sentence, 0);
  assert(samples.size() == 5);
  for (const ScoredSample& sample : samples) {
    assert(sample.tree->leaves() == f.sentence.words);
    assert(sample.joint_log_prob < 0);
    assert(sample.proposal_log_prob <= 0);
  }
}

void test_proposal_trees_take_the_sentence_words() {
  Fixture f;
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  Sentence purrs = f.vocab.make_sentence({"The", "cat", "purrs"});
  ProposalSamples samples;
  samples.add({0, 0.0, parse_bracketed("(S (NP The cat) (VP UNK))", false)});
  GenerativeImportanceSamplingDecoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer, 1);
  decoder.set_proposal_samples(&samples);
  ScoredSample best = decoder.map_tree(purrs, 0);
  assert(best.tree->linearize() == "(S (NP The cat) (VP purrs))");
  assert(best.tree->leaves() == purrs.words);
  assert(close(best.joint_log_prob, -5 * log(3.0) - 10 * log(2.0)));
}

void test_proposal_trees_over_other_words_are_rejected() {
  Fixture f;
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  ProposalSamples samples;
  samples.add({0, -1.0, parse_bracketed("(S (NP A dog) (VP barks))", false)});
  samples.add({1, -1.0, parse_bracketed("(S (NP The cat) (VP UNK))", false)});
  samples.add({2, -1.0, parse_bracketed("(S (NP The cat) (VP sleeps) (ADVP now))", false)});
  GenerativeImportanceSamplingDecoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer, 1);
  decoder.set_proposal_samples(&samples);
  // the third word is in the vocabulary, so UNK does not stand for it
  for (unsigned index = 0; index < 3; ++index) {
    bool thrown = false;
    try {
      decoder.map_tree(f.sentence, index);
    } catch (MalformedOracleError& e) {
      thrown = true;
      assert(e.sentence_index == index);
    }
    assert(thrown);
  }
}

void test_missing_proposal_samples() {
  Fixture f;
  FixedGenerativeScorer scorer({0, 0, 0}, {0, 0, 0}, {0, 0, 0, 0});
  ProposalSamples samples;
  samples.add({0, -1.0, parse_bracketed("(S (NP The cat) (VP sleeps))", false)});
  GenerativeImportanceSamplingDecoder decoder(&f.vocab, &f.featurizer, &f.composer, &scorer, 2);
  decoder.set_proposal_samples(&samples);
  bool thrown = false;
  try {
    decoder.scored_samples(f.sentence, 0);
  } catch (SampleCountMismatchError& e) {
    thrown = true;
    assert(e.requested == 2);
    assert(e.available == 1);
  }
  assert(thrown);
}

void test_estimators() {
  TreePtr a = parse_bracketed("(S (NP The cat) (VP sleeps))", false);
  TreePtr b = parse_bracketed("(S The cat sleeps)", false);
  vector<ScoredSample> samples{
      {a, {}, -2.0, -1.0},
      {a, {}, -2.0, -1.0},
      {b, {}, -1.0, -3.0}};

  // repeated samples all count towards p(x)
  double expected = log(2 * exp(1.0) + exp(-2.0)) - log(3.0);
  assert(close(GenerativeImportanceSamplingDecoder::log_probability_estimate(samples), expected));

  assert(GenerativeImportanceSamplingDecoder::remove_duplicates(samples).size() == 2);
  ScoredSample best = GenerativeImportanceSamplingDecoder::map_estimate(samples);
  assert(best.tree == a);

  // large weights do not overflow
  vector<ScoredSample> extreme{{a, {}, -2000.0, -1000.0}, {b, {}, -2000.0, -1000.0}};
  assert(close(GenerativeImportanceSamplingDecoder::log_probability_estimate(extreme), 1000.0));
}

} // namespace

int main(int argc, char** argv) {
  cnn::Initialize(argc, argv);
  test_greedy_prefers_highest_action();
  test_greedy_breaks_ties_to_lowest_index();
  test_beam_of_one_matches_greedy();
  test_beam_results_are_sorted_and_rescore();
  test_forced_scoring();
  test_sampling();
  test_generative_sampling();
  test_generative_forced_scoring();
  test_importance_sampling_with_one_tree();
  test_importance_sampling_with_proposal_decoder();
  test_proposal_trees_take_the_sentence_words();
  test_proposal_trees_over_other_words_are_rejected();
  test_missing_proposal_samples();
  test_estimators();
  cerr << "decoders-test passed" << endl;
  return 0;
}
