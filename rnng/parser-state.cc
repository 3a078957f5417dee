#include "rnng/parser-state.h"

#include "rnng/errors.h"

using namespace std;
using namespace cnn::expr;

namespace rnng {

namespace {

Sentence empty_sentence;

} // namespace

ParserState::ParserState(Mode mode, const Sentence* sentence, Featurizer* featurizer, Composer* composer,
                         unsigned max_open_nts) :
    mode(mode),
    sentence(sentence),
    featurizer(featurizer),
    composer(composer),
    max_open_nts(max_open_nts),
    stack(featurizer, composer),
    buffer(mode == Mode::kDiscriminative && sentence ? *sentence : empty_sentence,
           mode == Mode::kDiscriminative ? featurizer : nullptr),
    terminal(mode == Mode::kGenerative ? featurizer : nullptr),
    history(featurizer) {
  if (mode == Mode::kDiscriminative && !sentence)
    BOOST_THROW_EXCEPTION(Error("a discriminative parser state needs a sentence"));
  if (sentence && sentence->size() == 0)
    BOOST_THROW_EXCEPTION(Error("empty sentences cannot be parsed"));
}

unsigned ParserState::words_consumed() const {
  if (mode == Mode::kGenerative)
    return terminal.size();
  return sentence->size() - buffer.size();
}

bool ParserState::words_exhausted() const {
  if (mode == Mode::kGenerative)
    return sentence && terminal.size() >= sentence->size();
  return buffer.is_empty();
}

bool ParserState::is_legal(ActionType type) const {
  if (is_finished()) return false;

  unsigned o = stack.open_count();
  bool be = words_exhausted();

  switch (type) {
    case ActionType::kShift:
      return mode == Mode::kDiscriminative && !be && o >= 1;
    case ActionType::kGen:
      return mode == Mode::kGenerative && !be && o >= 1;
    case ActionType::kOpen:
      return !be && o < max_open_nts;
    case ActionType::kReduce: {
      // unconditional generation has no words to wait for before closing the root
      bool may_close_root = be || (mode == Mode::kGenerative && !sentence);
      return history.last_action().type != ActionType::kOpen && o >= 1 && (o >= 2 || may_close_root);
    }
    default:
      return false;
  }
}

bool ParserState::is_legal(const Action& action) const {
  if (!is_legal(action.type)) return false;
  if (action.type == ActionType::kOpen)
    return action.id >= 0 || !featurizer;
  if (action.type == ActionType::kGen) {
    if (sentence)
      return action.id == sentence->raw[terminal.size()];
    return action.id >= 0 || !featurizer;
  }
  return true;
}

vector<unsigned> ParserState::valid_action_indices() const {
  vector<unsigned> valid;
  if (is_legal(mode == Mode::kGenerative ? ActionType::kGen : ActionType::kShift))
    valid.push_back(kShiftIndex);
  if (is_legal(ActionType::kReduce))
    valid.push_back(kReduceIndex);
  if (is_legal(ActionType::kOpen))
    valid.push_back(kOpenIndex);
  return valid;
}

ParserState ParserState::perform_action(const Action& action) const {
  if (!is_legal(action)) {
    BOOST_THROW_EXCEPTION(IllegalActionError("illegal action " + action.to_string() +
                                             " with " + std::to_string(open_count()) + " open nonterminals")
                          << action_info(action.to_string()));
  }

  ParserState next(*this);
  switch (action.type) {
    case ActionType::kShift: {
      TokenFrame word = next.buffer.pop();
      next.stack.push(Tree::leaf(word.symbol, word.index, word.tag), word.embedding);
      break;
    }
    case ActionType::kGen: {
      unsigned index = next.terminal.size();
      // print the surface token when the sentence is known, not its UNKed form
      const string& symbol = sentence ? sentence->words[index] : action.symbol;
      string tag;
      if (sentence && index < sentence->tags.size())
        tag = sentence->tags[index];
      Expression embedding;
      if (featurizer)
        embedding = featurizer->word_embedding(action.id);
      next.terminal.push(action.id, symbol, embedding);
      next.stack.push(Tree::leaf(symbol, index, tag), embedding);
      break;
    }
    case ActionType::kOpen:
      next.stack.open(action.id, action.symbol);
      break;
    case ActionType::kReduce:
      next.stack.reduce();
      break;
    default:
      break;
  }
  next.history.push(action);
  return next;
}

Expression ParserState::representation() const {
  if (!featurizer)
    BOOST_THROW_EXCEPTION(Error("a symbolic parser state has no representation"));
  Expression words = mode == Mode::kGenerative ? terminal.top_encoding() : buffer.top_encoding();
  return concatenate({stack.top_encoding(), words, history.top_encoding()});
}

TreePtr ParserState::tree() const {
  if (!is_finished())
    BOOST_THROW_EXCEPTION(Error("the parse is not finished"));
  return stack.top().tree;
}

} // namespace rnng
