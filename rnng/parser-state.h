#ifndef RNNG_PARSER_STATE_H_
#define RNNG_PARSER_STATE_H_

#include <vector>

#include "cnn/expr.h"

#include "rnng/actions.h"
#include "rnng/buffer.h"
#include "rnng/composer.h"
#include "rnng/featurizer.h"
#include "rnng/history.h"
#include "rnng/oracle.h"
#include "rnng/stack.h"
#include "rnng/tree.h"

namespace rnng {

const unsigned kMaxOpenNonterminals = 100;

// One configuration of the transition system. perform_action returns a new
// state and leaves this one untouched, so states can be forked freely.
//
// Discriminative states consume the words of a sentence with SHIFT.
// Generative states produce words with GEN; given a sentence they may only
// generate its words in order, without one they generate freely.
class ParserState {
public:
  enum class Mode { kDiscriminative, kGenerative };

  ParserState(Mode mode,
              const Sentence* sentence,
              Featurizer* featurizer = nullptr,
              Composer* composer = nullptr,
              unsigned max_open_nts = kMaxOpenNonterminals);

  bool is_legal(const Action& action) const;
  bool is_legal(ActionType type) const;

  // legal slots of the three-way action distribution, in index order
  std::vector<unsigned> valid_action_indices() const;

  bool is_finished() const { return stack.is_finished(); }

  ParserState perform_action(const Action& action) const;

  // concatenated stack, buffer (or terminal) and history encodings
  cnn::expr::Expression representation() const;

  // the completed tree; only defined once finished
  TreePtr tree() const;

  bool is_generative() const { return mode == Mode::kGenerative; }
  const Sentence* get_sentence() const { return sentence; }

  const Stack& get_stack() const { return stack; }
  const Buffer& get_buffer() const { return buffer; }
  const Terminal& get_terminal() const { return terminal; }
  const History& get_history() const { return history; }

  unsigned open_count() const { return stack.open_count(); }

  // words shifted or generated so far
  unsigned words_consumed() const;

  // the sentence has no words left to shift or generate
  bool words_exhausted() const;

private:
  Mode mode;
  const Sentence* sentence;
  Featurizer* featurizer;
  Composer* composer;
  unsigned max_open_nts;

  Stack stack;
  Buffer buffer;
  Terminal terminal;
  History history;
};

} // namespace rnng

#endif
