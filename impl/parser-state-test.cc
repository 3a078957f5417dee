#include <assert.h>
#include <iostream>
#include <random>
#include <string>
#include <vector>

#include "rnng/errors.h"
#include "rnng/oracle.h"
#include "rnng/parser-state.h"

using namespace std;
using namespace rnng;

namespace {

typedef ParserState::Mode Mode;

struct Fixture {
  Fixture() {
    sentence = vocab.make_sentence({"The", "cat", "sleeps"}, {"DT", "NN", "VBZ"});
    S = vocab.open_action(vocab.nonterminals.Convert("S"));
    NP = vocab.open_action(vocab.nonterminals.Convert("NP"));
    VP = vocab.open_action(vocab.nonterminals.Convert("VP"));
    vocab.freeze();
  }

  Vocabulary vocab;
  Sentence sentence;
  Action S, NP, VP;
};

bool throws_illegal(const ParserState& state, const Action& action) {
  try {
    state.perform_action(action);
  } catch (IllegalActionError&) {
    return true;
  }
  return false;
}

unsigned open_frames(const ParserState& state) {
  unsigned n = 0;
  for (const StackFrame& frame : state.get_stack().values())
    if (frame.is_open()) n++;
  return n;
}

void test_scenario() {
  Fixture f;
  vector<Action> actions{f.S, f.NP, Action::shift(), Action::shift(), Action::reduce(), f.VP, Action::shift(),
                         Action::reduce(), Action::reduce()};
  ParserState state(Mode::kDiscriminative, &f.sentence);
  for (const Action& action : actions) {
    unsigned before = state.open_count();
    state = state.perform_action(action);
    if (action.type == ActionType::kOpen)
      assert(state.open_count() == before + 1);
    else if (action.type == ActionType::kReduce)
      assert(state.open_count() == before - 1);
    else
      assert(state.open_count() == before);
    assert(state.open_count() == open_frames(state));
  }
  assert(state.is_finished());
  assert(state.open_count() == 0);
  assert(state.get_stack().size() == 1);
  assert(state.tree()->linearize() == "(S (NP The cat) (VP sleeps))");
  assert(state.tree()->linearize(true) == "(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))");
  assert(state.get_history().actions() == actions);
  assert(state.valid_action_indices().empty());
}

void test_reduce_first_is_illegal() {
  Fixture f;
  ParserState state(Mode::kDiscriminative, &f.sentence);
  assert(!state.is_legal(ActionType::kReduce));
  assert(throws_illegal(state, Action::reduce()));
  assert(throws_illegal(state, Action::shift()));
  assert(state.valid_action_indices() == vector<unsigned>({kOpenIndex}));
}

void test_legality() {
  Fixture f;
  ParserState state(Mode::kDiscriminative, &f.sentence);
  ParserState opened = state.perform_action(f.S);
  // forks leave the original untouched
  assert(state.open_count() == 0 && state.get_history().size() == 0);
  assert(opened.open_count() == 1 && opened.get_history().size() == 1);

  // no REDUCE straight after an OPEN
  assert(!opened.is_legal(ActionType::kReduce));
  ParserState shifted = opened.perform_action(Action::shift());
  // the root stays open while words remain
  assert(!shifted.is_legal(ActionType::kReduce));
  assert(shifted.valid_action_indices() == vector<unsigned>({kShiftIndex, kOpenIndex}));
  ParserState nested = shifted.perform_action(f.NP).perform_action(Action::shift());
  assert(nested.is_legal(ActionType::kReduce));
  // GEN is for generative parsers only
  assert(!nested.is_legal(ActionType::kGen));

  ParserState done = nested.perform_action(Action::shift());
  assert(done.words_exhausted());
  assert(!done.is_legal(ActionType::kShift));
  assert(!done.is_legal(ActionType::kOpen));
  assert(done.valid_action_indices() == vector<unsigned>({kReduceIndex}));
  ParserState finished = done.perform_action(Action::reduce()).perform_action(Action::reduce());
  assert(finished.is_finished());
  assert(finished.tree()->linearize() == "(S The (NP cat sleeps))");
  assert(throws_illegal(finished, Action::reduce()));
}

void test_open_limit() {
  Fixture f;
  ParserState state(Mode::kDiscriminative, &f.sentence, nullptr, nullptr, 2);
  state = state.perform_action(f.S).perform_action(f.NP);
  assert(!state.is_legal(ActionType::kOpen));
  assert(throws_illegal(state, f.VP));
  assert(state.valid_action_indices() == vector<unsigned>({kShiftIndex}));
}

void test_bad_inputs() {
  Fixture f;
  bool thrown = false;
  try {
    ParserState state(Mode::kDiscriminative, nullptr);
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);

  Sentence empty;
  thrown = false;
  try {
    ParserState state(Mode::kDiscriminative, &empty);
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);

  ParserState state(Mode::kDiscriminative, &f.sentence);
  thrown = false;
  try {
    state.tree();
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);

  Buffer buffer(f.vocab.make_sentence({"cat"}));
  assert(buffer.pop().symbol == "cat");
  assert(buffer.is_empty());
  thrown = false;
  try {
    buffer.pop();
  } catch (EmptyStructureError&) {
    thrown = true;
  }
  assert(thrown);
}

// a rejected REDUCE leaves every frame in place
void test_rejected_reduce_keeps_stack() {
  Stack stack;
  stack.push(Tree::leaf("The", 0), cnn::expr::Expression());
  stack.push(Tree::leaf("cat", 1), cnn::expr::Expression());
  bool thrown = false;
  try {
    stack.reduce();
  } catch (IllegalActionError&) {
    thrown = true;
  }
  assert(thrown);
  assert(stack.size() == 2);
  assert(stack.top().tree->get_symbol() == "cat");

  stack.open(0, "NP");
  thrown = false;
  try {
    stack.reduce();
  } catch (IllegalActionError&) {
    thrown = true;
  }
  assert(thrown);
  assert(stack.size() == 3);
  assert(stack.open_count() == 1);

  stack.push(Tree::leaf("sleeps", 2), cnn::expr::Expression());
  stack.reduce();
  assert(stack.size() == 3);
  assert(stack.open_count() == 0);
  assert(stack.top().tree->linearize() == "(NP sleeps)");
}

// random legal derivations always finish balanced; a REDUCE over n children
// pops n + 1 frames and pushes one
void test_random_walks() {
  Fixture f;
  mt19937 rng(1);
  vector<Action> labels{f.S, f.NP, f.VP};
  for (unsigned length = 1; length <= 6; ++length) {
    vector<string> words;
    for (unsigned i = 0; i < length; ++i)
      words.push_back(i % 2 ? "cat" : "The");
    Sentence sentence = f.vocab.make_sentence(words);
    for (unsigned trial = 0; trial < 50; ++trial) {
      ParserState state(Mode::kDiscriminative, &sentence, nullptr, nullptr, 4);
      unsigned steps = 0;
      while (!state.is_finished()) {
        vector<unsigned> valid = state.valid_action_indices();
        assert(!valid.empty());
        unsigned index = valid[rng() % valid.size()];
        Action action = index == kShiftIndex ? Action::shift()
                      : index == kReduceIndex ? Action::reduce()
                      : labels[rng() % labels.size()];
        assert(state.is_legal(action));
        size_t frames = state.get_stack().size();
        state = state.perform_action(action);
        assert(state.open_count() == open_frames(state));
        if (index == kReduceIndex) {
          const StackFrame& top = state.get_stack().top();
          assert(!top.is_open());
          assert(!top.tree->get_children().empty());
          assert(state.get_stack().size() == frames - (top.tree->get_children().size() + 1) + 1);
        }
        assert(++steps < 10000);
      }
      assert(state.open_count() == 0);
      assert(state.tree()->leaves() == words);
      assert(state.get_history().last_action() == Action::reduce());
    }
  }
}

void test_generative_legality() {
  Fixture f;
  ParserState state(Mode::kGenerative, &f.sentence);
  Action gen_the = f.vocab.gen_action(f.sentence.raw[0]);
  Action gen_cat = f.vocab.gen_action(f.sentence.raw[1]);
  assert(!state.is_legal(ActionType::kGen));
  assert(!state.is_legal(ActionType::kShift));
  state = state.perform_action(f.S);
  assert(state.is_legal(ActionType::kGen));
  // only the next word of the sentence may be generated
  assert(!state.is_legal(gen_cat));
  assert(throws_illegal(state, gen_cat));
  state = state.perform_action(gen_the);
  assert(!state.is_legal(ActionType::kReduce));
  assert(state.words_consumed() == 1);
  state = state.perform_action(gen_cat).perform_action(f.vocab.gen_action(f.sentence.raw[2]));
  assert(state.words_exhausted());
  assert(!state.is_legal(ActionType::kGen));
  state = state.perform_action(Action::reduce());
  assert(state.is_finished());
  assert(state.tree()->linearize() == "(S The cat sleeps)");
  assert(state.get_terminal().words() == f.sentence.words);

  // without a sentence the root may close after any word
  ParserState unconditional(Mode::kGenerative, nullptr);
  unconditional = unconditional.perform_action(f.S).perform_action(gen_cat);
  assert(unconditional.is_legal(ActionType::kReduce));
  assert(unconditional.is_legal(ActionType::kGen));
  assert(unconditional.is_legal(ActionType::kOpen));
  unconditional = unconditional.perform_action(Action::reduce());
  assert(unconditional.is_finished());
  assert(unconditional.tree()->linearize() == "(S cat)");
}

} // namespace

int main() {
  test_scenario();
  test_reduce_first_is_illegal();
  test_legality();
  test_open_limit();
  test_bad_inputs();
  test_rejected_reduce_keeps_stack();
  test_random_walks();
  test_generative_legality();
  cerr << "parser-state-test passed" << endl;
  return 0;
}
