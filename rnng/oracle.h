#ifndef RNNG_ORACLE_H_
#define RNNG_ORACLE_H_

#include <string>
#include <vector>

#include "cnn/dict.h"

#include "rnng/actions.h"
#include "rnng/tree.h"

namespace rnng {

extern const std::string kUNK;

// a sentence seen both as vocabulary ids and as surface tokens
struct Sentence {
  size_t size() const { return raw.size(); }

  std::vector<int> raw; // terminal ids, UNK for words outside the vocabulary
  std::vector<std::string> words; // surface tokens, used for output
  std::vector<std::string> tags; // POS tags, empty when unknown
};

// Terminal and nonterminal dictionaries. Grows while loading training data,
// then freeze() maps unseen words to UNK.
class Vocabulary {
public:
  Vocabulary() : frozen(false) {}

  void freeze();
  bool is_frozen() const { return frozen; }

  Sentence make_sentence(const std::vector<std::string>& words,
                         const std::vector<std::string>& tags = std::vector<std::string>());

  // resolves the id of an OPEN or GEN action; false for a nonterminal the
  // frozen vocabulary has never seen
  bool lookup_action(ActionType type, const std::string& symbol, Action* action);

  Action open_action(int label) const { return Action::open(label, nonterminals.Convert(label)); }
  Action gen_action(int word) const { return Action::gen(word, terminals.Convert(word)); }

  cnn::Dict terminals;
  cnn::Dict nonterminals;

private:
  bool frozen;
};

// top-down derivation of a tree: NT(X) ... REDUCE around children, SHIFT per word
std::vector<Action> extract_actions(const Tree& tree, Vocabulary* vocab, unsigned sentence_index);

// replays a discriminative derivation symbolically and returns its tree;
// MalformedOracleError unless it is legal and finishes exactly at its end
TreePtr replay(const Sentence& sentence, const std::vector<Action>& actions, unsigned sentence_index);

// replaces the i-th SHIFT with GEN of the i-th word of the sentence
std::vector<Action> to_generative(const Sentence& sentence, const std::vector<Action>& actions,
                                  unsigned sentence_index);

// A corpus of sentences, with gold derivations and trees when the source
// has them. Sentences whose derivation is malformed are reported on stderr
// and skipped; their positions in the source are kept in `skipped`.
class Corpus {
public:
  explicit Corpus(Vocabulary* vocab) : vocab(vocab) {}

  unsigned size() const { return sents.size(); }
  bool has_gold() const { return !trees.empty(); }

  // blocks separated by blank lines:
  //   # (S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))
  //   POS tags
  //   raw tokens
  //   lowercased tokens
  //   tokens with OOVs replaced
  //   one action per line
  void load_oracle(const std::string& file);

  // one bracketed tree per line
  void load_bracketed(const std::string& file, bool has_tags);

  // one whitespace-tokenized sentence per line, no gold structure
  void load_sentences(const std::string& file);

  Vocabulary* vocab;
  std::vector<Sentence> sents;
  std::vector<std::vector<Action>> actions;
  std::vector<TreePtr> trees;
  std::vector<unsigned> skipped;

private:
  void report_loaded() const;
};

} // namespace rnng

#endif
