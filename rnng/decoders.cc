#include "rnng/decoders.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_map>
#include <unordered_set>

#include <boost/functional/hash.hpp>

#include "rnng/errors.h"
#include "rnng/utils.h"

using namespace std;
using namespace cnn;
using namespace cnn::expr;

namespace rnng {

Expression log_softmax_constrained(const Expression& logits, const vector<unsigned>& valid, unsigned size) {
  vector<float> mask(size, -numeric_limits<float>::infinity());
  for (unsigned i : valid)
    mask[i] = 0;
  return log_softmax(logits + input(*logits.pg, Dim({size}), mask));
}

Decoder::Decoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                 unsigned max_open_nts) :
    vocab(vocab),
    featurizer(featurizer),
    composer(composer),
    scorer(scorer),
    word_scorer(nullptr),
    max_open_nts(max_open_nts) {
  for (unsigned i = 0; i < (unsigned) vocab->nonterminals.size(); ++i)
    all_labels.push_back(i);
}

Decoder::Decoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, GenerativeScorer* scorer,
                 unsigned max_open_nts) :
    Decoder(vocab, featurizer, composer, static_cast<Scorer*>(scorer), max_open_nts) {
  word_scorer = scorer;
  for (unsigned i = 0; i < (unsigned) vocab->terminals.size(); ++i)
    all_words.push_back(i);
}

ParserState Decoder::process_input(ComputationGraph* hg, const Sentence* sentence) {
  featurizer->new_graph(hg);
  composer->new_graph(hg);
  scorer->new_graph(hg);
  ParserState::Mode mode = is_generative() ? ParserState::Mode::kGenerative : ParserState::Mode::kDiscriminative;
  return ParserState(mode, sentence, featurizer, composer, max_open_nts);
}

Expression Decoder::action_log_probs(const Expression& repr, const vector<unsigned>& valid) {
  return log_softmax_constrained(scorer->action_logits(repr), valid, kNumActionIndices);
}

Expression Decoder::label_log_probs(const Expression& repr) {
  return log_softmax(scorer->label_logits(repr));
}

Expression Decoder::word_log_probs(const Expression& repr) {
  return log_softmax(word_scorer->word_logits(repr));
}

Action Decoder::make_action(unsigned index, int choice) const {
  switch (index) {
    case kShiftIndex:
      return is_generative() ? vocab->gen_action(choice) : Action::shift();
    case kReduceIndex:
      return Action::reduce();
    case kOpenIndex:
      return vocab->open_action(choice);
    default:
      BOOST_THROW_EXCEPTION(Error("no action has index " + to_string(index)));
  }
}

double Decoder::score(ComputationGraph* hg, const Sentence& sentence, const vector<Action>& actions,
                      unsigned sentence_index) {
  ParserState state = process_input(hg, &sentence);
  vector<Expression> log_probs;
  for (unsigned i = 0; i < actions.size(); ++i) {
    const Action& action = actions[i];
    if (!state.is_legal(action)) {
      BOOST_THROW_EXCEPTION(MalformedOracleError("illegal action " + action.to_string() + " at position " +
                                                 to_string(i), sentence_index));
    }
    Expression repr = state.representation();
    Expression adist = action_log_probs(repr, state.valid_action_indices());
    log_probs.push_back(pick(adist, action.index()));
    if (action.type == ActionType::kOpen)
      log_probs.push_back(pick(label_log_probs(repr), action.id));
    else if (action.type == ActionType::kGen)
      log_probs.push_back(pick(word_log_probs(repr), action.id));
    state = state.perform_action(action);
  }
  if (!state.is_finished())
    BOOST_THROW_EXCEPTION(MalformedOracleError("derivation ends before the parse is finished", sentence_index));
  Expression total = sum(log_probs);
  return as_scalar(total.value());
}

StepwiseDecoder::StepwiseDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                                 unsigned max_open_nts) :
    Decoder(vocab, featurizer, composer, scorer, max_open_nts) {}

StepwiseDecoder::StepwiseDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer,
                                 GenerativeScorer* scorer, unsigned max_open_nts) :
    Decoder(vocab, featurizer, composer, scorer, max_open_nts) {}

Derivation StepwiseDecoder::run(ComputationGraph* hg, const Sentence* sentence) {
  ParserState state = process_input(hg, sentence);
  Derivation derivation;
  vector<Expression> log_probs;
  while (!state.is_finished()) {
    vector<unsigned> valid = state.valid_action_indices();
    if (valid.empty())
      BOOST_THROW_EXCEPTION(Error("parser state has no legal action"));
    Expression repr = state.representation();
    Expression adist = action_log_probs(repr, valid);
    unsigned index = choose(adist, valid, kNumActionIndices, &derivation.sample_log_prob);
    log_probs.push_back(pick(adist, index));

    int choice = -1;
    if (index == kOpenIndex) {
      Expression ldist = label_log_probs(repr);
      choice = choose(ldist, all_labels, all_labels.size(), &derivation.sample_log_prob);
      log_probs.push_back(pick(ldist, choice));
    } else if (index == kGenIndex && is_generative()) {
      Expression wdist = word_log_probs(repr);
      if (sentence)
        choice = sentence->raw[state.words_consumed()];
      else
        choice = choose(wdist, all_words, all_words.size(), &derivation.sample_log_prob);
      log_probs.push_back(pick(wdist, choice));
    }
    state = state.perform_action(make_action(index, choice));
  }

  Expression total = sum(log_probs);
  derivation.log_prob = as_scalar(total.value());
  derivation.actions = state.get_history().actions();
  derivation.tree = state.tree();
  if (is_generative())
    derivation.words = state.get_terminal().words();
  else
    derivation.words = sentence->words;
  return derivation;
}

unsigned StepwiseDecoder::argmax(const Expression& log_probs, const vector<unsigned>& candidates,
                                 double* sample_log_prob) {
  vector<float> dist = as_vector(log_probs.value());
  unsigned best = candidates[0];
  for (unsigned c : candidates)
    if (dist[c] > dist[best])
      best = c;
  *sample_log_prob += dist[best];
  return best;
}

unsigned StepwiseDecoder::sample(const Expression& log_probs, const vector<unsigned>& candidates, unsigned size,
                                 float alpha, double* sample_log_prob) {
  Expression tempered = log_probs;
  if (alpha != 1.0f)
    tempered = log_softmax_constrained(log_probs * alpha, candidates, size);
  vector<float> dist = as_vector(tempered.value());
  double p = rand01();
  unsigned w = 0;
  for (; w < candidates.size(); ++w) {
    p -= exp(dist[candidates[w]]);
    if (p < 0.0) break;
  }
  if (w == candidates.size()) w--;
  *sample_log_prob += dist[candidates[w]];
  return candidates[w];
}

GreedyDecoder::GreedyDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                             unsigned max_open_nts) :
    StepwiseDecoder(vocab, featurizer, composer, scorer, max_open_nts) {}

Derivation GreedyDecoder::decode(ComputationGraph* hg, const Sentence& sentence) {
  return run(hg, &sentence);
}

unsigned GreedyDecoder::choose(const Expression& log_probs, const vector<unsigned>& candidates, unsigned size,
                               double* sample_log_prob) {
  return argmax(log_probs, candidates, sample_log_prob);
}

SamplingDecoder::SamplingDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer, Scorer* scorer,
                                 float alpha, unsigned max_open_nts) :
    StepwiseDecoder(vocab, featurizer, composer, scorer, max_open_nts),
    alpha(alpha) {}

Derivation SamplingDecoder::decode(ComputationGraph* hg, const Sentence& sentence) {
  return run(hg, &sentence);
}

vector<Derivation> SamplingDecoder::sample(const Sentence& sentence, unsigned count) {
  vector<Derivation> samples;
  for (unsigned i = 0; i < count; ++i) {
    ComputationGraph hg;
    samples.push_back(decode(&hg, sentence));
  }
  return samples;
}

unsigned SamplingDecoder::choose(const Expression& log_probs, const vector<unsigned>& candidates, unsigned size,
                                 double* sample_log_prob) {
  return StepwiseDecoder::sample(log_probs, candidates, size, alpha, sample_log_prob);
}

GenerativeSamplingDecoder::GenerativeSamplingDecoder(Vocabulary* vocab, Featurizer* featurizer,
                                                     Composer* composer, GenerativeScorer* scorer, float alpha,
                                                     unsigned max_open_nts) :
    StepwiseDecoder(vocab, featurizer, composer, scorer, max_open_nts),
    alpha(alpha) {}

Derivation GenerativeSamplingDecoder::generate(ComputationGraph* hg) {
  return run(hg, nullptr);
}

unsigned GenerativeSamplingDecoder::choose(const Expression& log_probs, const vector<unsigned>& candidates,
                                           unsigned size, double* sample_log_prob) {
  return sample(log_probs, candidates, size, alpha, sample_log_prob);
}

namespace {

struct Beam {
  Beam(const ParserState& state, double log_prob) : state(state), log_prob(log_prob) {}

  ParserState state;
  double log_prob;
};

struct Successor {
  unsigned parent;
  Action action;
  double log_prob;
};

// indices of `candidates` by descending score, earlier candidates first on ties
vector<unsigned> rank(const vector<float>& scores, const vector<unsigned>& candidates, unsigned limit) {
  vector<unsigned> ranked(candidates);
  stable_sort(ranked.begin(), ranked.end(), [&](unsigned a, unsigned b) { return scores[a] > scores[b]; });
  if (ranked.size() > limit)
    ranked.resize(limit);
  return ranked;
}

} // namespace

BeamSearchDecoder::BeamSearchDecoder(Vocabulary* vocab, Featurizer* featurizer, Composer* composer,
                                     Scorer* scorer, unsigned beam_size, unsigned max_open_nts) :
    Decoder(vocab, featurizer, composer, scorer, max_open_nts),
    beam_size(beam_size) {
  if (beam_size == 0)
    BOOST_THROW_EXCEPTION(Error("beam size must be positive"));
}

vector<Derivation> BeamSearchDecoder::decode(ComputationGraph* hg, const Sentence& sentence) {
  vector<Beam> beams;
  beams.push_back(Beam(process_input(hg, &sentence), 0));
  vector<Beam> finished;

  while (!beams.empty()) {
    vector<Successor> successors;
    for (unsigned b = 0; b < beams.size(); ++b) {
      const ParserState& state = beams[b].state;
      vector<unsigned> valid = state.valid_action_indices();
      if (valid.empty())
        BOOST_THROW_EXCEPTION(Error("parser state has no legal action"));
      Expression repr = state.representation();
      vector<float> adist = as_vector(action_log_probs(repr, valid).value());
      vector<unsigned> ranked = rank(adist, valid, beam_size);
      for (unsigned index : ranked) {
        double log_prob = beams[b].log_prob + adist[index];
        if (index != kOpenIndex) {
          successors.push_back({b, make_action(index, -1), log_prob});
          continue;
        }
        // OPEN takes the slots its sibling actions leave free
        vector<float> ldist = as_vector(label_log_probs(repr).value());
        unsigned label_limit = beam_size - ranked.size() + 1;
        for (unsigned label : rank(ldist, all_labels, label_limit))
          successors.push_back({b, vocab->open_action(label), log_prob + ldist[label]});
      }
    }

    stable_sort(successors.begin(), successors.end(),
                [](const Successor& a, const Successor& b) { return a.log_prob > b.log_prob; });
    if (successors.size() > beam_size)
      successors.resize(beam_size);

    vector<Beam> next;
    for (const Successor& successor : successors) {
      Beam child(beams[successor.parent].state.perform_action(successor.action), successor.log_prob);
      if (child.state.is_finished())
        finished.push_back(child);
      else
        next.push_back(child);
    }
    beams.swap(next);
  }

  stable_sort(finished.begin(), finished.end(), [](const Beam& a, const Beam& b) { return a.log_prob > b.log_prob; });
  vector<Derivation> derivations;
  for (const Beam& beam : finished) {
    Derivation derivation;
    derivation.actions = beam.state.get_history().actions();
    derivation.tree = beam.state.tree();
    derivation.log_prob = beam.log_prob;
    derivation.sample_log_prob = beam.log_prob;
    derivation.words = sentence.words;
    derivations.push_back(derivation);
  }
  return derivations;
}

const unsigned GenerativeImportanceSamplingDecoder::kDefaultSamples;

GenerativeImportanceSamplingDecoder::GenerativeImportanceSamplingDecoder(Vocabulary* vocab, Featurizer* featurizer,
                                                                         Composer* composer,
                                                                         GenerativeScorer* scorer,
                                                                         unsigned num_samples,
                                                                         unsigned max_open_nts) :
    Decoder(vocab, featurizer, composer, scorer, max_open_nts),
    num_samples(num_samples),
    proposal(nullptr),
    proposal_samples(nullptr) {}

void GenerativeImportanceSamplingDecoder::check_leaves(const Tree& tree, const Sentence& sentence,
                                                       unsigned sentence_index) const {
  vector<string> leaves = tree.leaves();
  if (leaves.size() != sentence.size()) {
    BOOST_THROW_EXCEPTION(MalformedOracleError("proposal tree has " + std::to_string(leaves.size()) +
                                               " words, the sentence " + std::to_string(sentence.size()),
                                               sentence_index));
  }
  bool has_unk = vocab->terminals.Contains(kUNK);
  for (unsigned i = 0; i < leaves.size(); ++i) {
    if (leaves[i] == sentence.words[i]) continue;
    if (has_unk && leaves[i] == kUNK && sentence.raw[i] == vocab->terminals.Convert(kUNK)) continue;
    BOOST_THROW_EXCEPTION(MalformedOracleError("proposal tree word " + leaves[i] + " does not match " +
                                               sentence.words[i] + " at position " + std::to_string(i),
                                               sentence_index));
  }
}

vector<ScoredSample> GenerativeImportanceSamplingDecoder::draw(const Sentence& sentence, unsigned sentence_index) {
  vector<ScoredSample> drawn;
  if (proposal_samples) {
    for (const ProposalSample& sample : proposal_samples->samples_for(sentence_index, num_samples)) {
      check_leaves(*sample.tree, sentence, sentence_index);
      vector<Action> actions = extract_actions(*sample.tree, vocab, sentence_index);
      // file trees may carry UNK leaves; rebuild over the sentence's own words
      drawn.push_back({replay(sentence, actions, sentence_index), actions, sample.log_prob, 0});
    }
  } else if (proposal) {
    for (const Derivation& derivation : proposal->sample(sentence, num_samples))
      drawn.push_back({derivation.tree, derivation.actions, derivation.sample_log_prob, 0});
  } else {
    BOOST_THROW_EXCEPTION(Error("importance sampling needs a proposal decoder or proposal samples"));
  }
  return drawn;
}

vector<ScoredSample> GenerativeImportanceSamplingDecoder::scored_samples(const Sentence& sentence,
                                                                         unsigned sentence_index,
                                                                         bool remove_duplicates) {
  vector<ScoredSample> samples = draw(sentence, sentence_index);
  unordered_map<vector<int>, double, boost::hash<vector<int>>> cache;
  for (ScoredSample& sample : samples) {
    vector<int> key = action_codes(sample.actions);
    auto it = cache.find(key);
    if (it == cache.end()) {
      ComputationGraph hg;
      double joint = score(&hg, sentence, to_generative(sentence, sample.actions, sentence_index), sentence_index);
      it = cache.insert(make_pair(key, joint)).first;
    }
    sample.joint_log_prob = it->second;
  }
  if (remove_duplicates)
    return GenerativeImportanceSamplingDecoder::remove_duplicates(samples);
  return samples;
}

ScoredSample GenerativeImportanceSamplingDecoder::map_tree(const Sentence& sentence, unsigned sentence_index) {
  return map_estimate(scored_samples(sentence, sentence_index));
}

double GenerativeImportanceSamplingDecoder::log_probability(const Sentence& sentence, unsigned sentence_index) {
  return log_probability_estimate(scored_samples(sentence, sentence_index));
}

double GenerativeImportanceSamplingDecoder::perplexity(const Sentence& sentence, unsigned sentence_index) {
  return exp(-log_probability(sentence, sentence_index) / sentence.size());
}

vector<ScoredSample> GenerativeImportanceSamplingDecoder::remove_duplicates(const vector<ScoredSample>& samples) {
  vector<ScoredSample> unique;
  unordered_set<string> seen;
  for (const ScoredSample& sample : samples)
    if (seen.insert(sample.tree->linearize()).second)
      unique.push_back(sample);
  return unique;
}

ScoredSample GenerativeImportanceSamplingDecoder::map_estimate(const vector<ScoredSample>& samples) {
  vector<ScoredSample> unique = remove_duplicates(samples);
  if (unique.empty())
    BOOST_THROW_EXCEPTION(Error("no samples to take the MAP tree from"));
  // first of the best on ties
  unsigned best = 0;
  for (unsigned i = 1; i < unique.size(); ++i)
    if (unique[i].joint_log_prob > unique[best].joint_log_prob)
      best = i;
  return unique[best];
}

double GenerativeImportanceSamplingDecoder::log_probability_estimate(const vector<ScoredSample>& samples) {
  if (samples.empty())
    BOOST_THROW_EXCEPTION(Error("no samples to estimate the sentence probability from"));
  vector<double> weights;
  for (const ScoredSample& sample : samples)
    weights.push_back(sample.joint_log_prob - sample.proposal_log_prob);
  return utils::logsumexp(weights) - log((double) samples.size());
}

} // namespace rnng
