#include <assert.h>
#include <cmath>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/archive/binary_oarchive.hpp>
#include <boost/filesystem.hpp>

#include "cnn/cnn.h"
#include "cnn/expr.h"
#include "cnn/init.h"

#include "rnng/decoders.h"
#include "rnng/errors.h"
#include "rnng/model.h"
#include "rnng/oracle.h"
#include "rnng/parser-state.h"

using namespace std;
using namespace rnng;

// Decoders over small randomly initialized LSTM models. Nothing here depends
// on the weights, only on every path computing the same function of them.

namespace {

bool close(double a, double b, double tolerance = 1e-3) {
  return fabs(a - b) < tolerance;
}

bool close(const vector<float>& a, const vector<float>& b) {
  if (a.size() != b.size()) return false;
  for (unsigned i = 0; i < a.size(); ++i)
    if (!close(a[i], b[i], 1e-5)) return false;
  return true;
}

ModelDimensions tiny() {
  ModelDimensions dims;
  dims.layers = 1;
  dims.input_dim = 2;
  dims.lstm_input_dim = 3;
  dims.hidden_dim = 4;
  dims.action_dim = 2;
  return dims;
}

struct Fixture {
  Fixture() {
    sentence = vocab.make_sentence({"The", "cat", "sleeps"});
    S = vocab.open_action(vocab.nonterminals.Convert("S"));
    NP = vocab.open_action(vocab.nonterminals.Convert("NP"));
    VP = vocab.open_action(vocab.nonterminals.Convert("VP"));
    vocab.freeze();
  }

  vector<Action> gold() const {
    return {S, NP, Action::shift(), Action::shift(), Action::reduce(), VP, Action::shift(), Action::reduce(),
            Action::reduce()};
  }

  Vocabulary vocab;
  Sentence sentence;
  Action S, NP, VP;
};

vector<float> representation_after(Decoder* decoder, const Sentence& sentence, const vector<Action>& actions) {
  cnn::ComputationGraph hg;
  ParserState state = decoder->process_input(&hg, &sentence);
  for (const Action& action : actions)
    state = state.perform_action(action);
  return cnn::as_vector(state.representation().value());
}

void test_beam_search() {
  Fixture f;
  DiscriminativeModel model(tiny(), f.vocab);

  Derivation greedy_result;
  {
    GreedyDecoder greedy(&f.vocab, &model.featurizer, &model.composer, &model.scorer);
    cnn::ComputationGraph hg;
    greedy_result = greedy.decode(&hg, f.sentence);
  }
  assert(greedy_result.tree->leaves() == f.sentence.words);

  vector<Derivation> best;
  {
    BeamSearchDecoder beam(&f.vocab, &model.featurizer, &model.composer, &model.scorer, 1);
    cnn::ComputationGraph hg;
    best = beam.decode(&hg, f.sentence);
  }
  assert(!best.empty());
  assert(best.front().actions == greedy_result.actions);
  assert(close(best.front().log_prob, greedy_result.log_prob));

  vector<Derivation> beams;
  {
    BeamSearchDecoder beam(&f.vocab, &model.featurizer, &model.composer, &model.scorer, 3);
    cnn::ComputationGraph hg;
    beams = beam.decode(&hg, f.sentence);
  }
  assert(!beams.empty());
  Decoder rescorer(&f.vocab, &model.featurizer, &model.composer, &model.scorer);
  for (unsigned i = 0; i < beams.size(); ++i) {
    if (i > 0) assert(beams[i - 1].log_prob >= beams[i].log_prob);
    cnn::ComputationGraph hg;
    assert(close(rescorer.score(&hg, f.sentence, beams[i].actions, 0), beams[i].log_prob));
  }
}

// states forked from one prefix and extended differently encode the same as
// replaying each full prefix on its own
void test_forked_states_keep_their_encodings() {
  Fixture f;
  DiscriminativeModel model(tiny(), f.vocab);
  Decoder decoder(&f.vocab, &model.featurizer, &model.composer, &model.scorer);

  vector<Action> prefix{f.S, Action::shift()};
  vector<Action> shifts = prefix;
  shifts.push_back(Action::shift());
  shifts.push_back(Action::shift());
  vector<Action> opens = prefix;
  opens.push_back(f.NP);
  opens.push_back(Action::shift());
  opens.push_back(Action::reduce());

  vector<float> forked_shifts, forked_opens, forked_prefix;
  {
    cnn::ComputationGraph hg;
    ParserState state = decoder.process_input(&hg, &f.sentence);
    for (const Action& action : prefix)
      state = state.perform_action(action);
    ParserState a = state.perform_action(Action::shift());
    ParserState b = state.perform_action(f.NP);
    // interleave the two branches
    a = a.perform_action(Action::shift());
    b = b.perform_action(Action::shift());
    b = b.perform_action(Action::reduce());
    forked_shifts = cnn::as_vector(a.representation().value());
    forked_opens = cnn::as_vector(b.representation().value());
    forked_prefix = cnn::as_vector(state.representation().value());
  }

  assert(close(forked_shifts, representation_after(&decoder, f.sentence, shifts)));
  assert(close(forked_opens, representation_after(&decoder, f.sentence, opens)));
  assert(close(forked_prefix, representation_after(&decoder, f.sentence, prefix)));
  assert(!close(forked_shifts, forked_opens));
}

void test_generative_model() {
  Fixture f;
  DiscriminativeModel proposal_model(tiny(), f.vocab);
  GenerativeModel model(tiny(), f.vocab);
  Decoder decoder(&f.vocab, &model.featurizer, &model.composer, &model.scorer);
  assert(decoder.is_generative());

  vector<Action> gen_gold = to_generative(f.sentence, f.gold(), 0);
  double joint;
  {
    cnn::ComputationGraph hg;
    joint = decoder.score(&hg, f.sentence, gen_gold, 0);
  }
  assert(joint < 0);
  {
    cnn::ComputationGraph hg;
    assert(close(decoder.score(&hg, f.sentence, gen_gold, 0), joint, 1e-6));
  }

  SamplingDecoder proposal(&f.vocab, &proposal_model.featurizer, &proposal_model.composer, &proposal_model.scorer,
                           0.8f);
  GenerativeImportanceSamplingDecoder importance(&f.vocab, &model.featurizer, &model.composer, &model.scorer, 4);
  importance.set_proposal(&proposal);
  vector<ScoredSample> samples = importance.scored_samples(f.sentence, 0);
  assert(samples.size() == 4);
  for (const ScoredSample& sample : samples) {
    assert(sample.tree->leaves() == f.sentence.words);
    cnn::ComputationGraph hg;
    double rescored = decoder.score(&hg, f.sentence, to_generative(f.sentence, sample.actions, 0), 0);
    assert(close(sample.joint_log_prob, rescored));
  }
  assert(std::isfinite(GenerativeImportanceSamplingDecoder::log_probability_estimate(samples)));
}

void test_load() {
  Fixture f;
  DiscriminativeModel trained(tiny(), f.vocab);
  string path = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path()).string();
  {
    ofstream out(path.c_str());
    boost::archive::binary_oarchive oa(out);
    oa << trained.model;
  }

  DiscriminativeModel loaded(tiny(), f.vocab);
  loaded.load(path, false);
  boost::filesystem::remove(path);

  Decoder original(&f.vocab, &trained.featurizer, &trained.composer, &trained.scorer);
  Decoder reloaded(&f.vocab, &loaded.featurizer, &loaded.composer, &loaded.scorer);
  double expected, actual;
  {
    cnn::ComputationGraph hg;
    expected = original.score(&hg, f.sentence, f.gold(), 0);
  }
  {
    cnn::ComputationGraph hg;
    actual = reloaded.score(&hg, f.sentence, f.gold(), 0);
  }
  assert(close(expected, actual, 1e-6));

  bool thrown = false;
  try {
    loaded.load(path, false);
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);
  assert(model_path("models") == (boost::filesystem::path("models") / "model.bin").string());
}

} // namespace

int main(int argc, char** argv) {
  cnn::Initialize(argc, argv);
  test_beam_search();
  test_forked_states_keep_their_encodings();
  test_generative_model();
  test_load();
  cerr << "model-test passed" << endl;
  return 0;
}
