#include <assert.h>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <boost/exception/get_error_info.hpp>
#include <boost/filesystem.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include "rnng/errors.h"
#include "rnng/oracle.h"

using namespace std;
using namespace rnng;

namespace {

const char* kOracle =
    "# (S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .))\n"
    "DT NN VBZ .\n"
    "The cat sleeps .\n"
    "the cat sleeps .\n"
    "The cat sleeps .\n"
    "NT(S)\n"
    "NT(NP)\n"
    "SHIFT\n"
    "SHIFT\n"
    "REDUCE\n"
    "NT(VP)\n"
    "SHIFT\n"
    "REDUCE\n"
    "SHIFT\n"
    "REDUCE\n"
    "\n"
    "# (S (NP (NNS Dogs)) (VP (VBP bark)))\n"
    "NNS VBP\n"
    "Dogs bark\n"
    "dogs bark\n"
    "Dogs bark\n"
    "NT(S)\n"
    "NT(NP)\n"
    "SHIFT\n"
    "REDUCE\n"
    "NT(VP)\n"
    "REDUCE\n"
    "\n"
    "# (S (NP (NNS Dogs)) (VP (VBP bark)))\n"
    "NNS VBP\n"
    "Dogs bark\n"
    "dogs bark\n"
    "Dogs bark\n"
    "NT(S)\n"
    "NT(NP)\n"
    "SHIFT\n"
    "REDUCE\n"
    "NT(VP)\n"
    "SHIFT\n"
    "REDUCE\n"
    "REDUCE\n";

const char* kTestOracle =
    "# (SBAR (NP (DT The) (NN dog)))\n"
    "DT NN\n"
    "The dog\n"
    "the dog\n"
    "The UNK\n"
    "NT(SBAR)\n"
    "NT(NP)\n"
    "SHIFT\n"
    "SHIFT\n"
    "REDUCE\n"
    "REDUCE\n"
    "\n"
    "# (S (NP (DT The) (NN dog)) (VP (VBZ sleeps)))\n"
    "DT NN VBZ\n"
    "The dog sleeps\n"
    "the dog sleeps\n"
    "The UNK sleeps\n"
    "NT(S)\n"
    "NT(NP)\n"
    "SHIFT\n"
    "SHIFT\n"
    "REDUCE\n"
    "NT(VP)\n"
    "SHIFT\n"
    "REDUCE\n"
    "REDUCE\n";

string temp_path(const string& suffix) {
  return (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path()).string() + suffix;
}

string write_file(const string& contents, const string& suffix = "") {
  string path = temp_path(suffix);
  ofstream out(path.c_str());
  out << contents;
  return path;
}

string write_gzip_file(const string& contents) {
  string path = temp_path(".gz");
  ofstream file(path.c_str(), ios_base::out | ios_base::binary);
  boost::iostreams::filtering_ostream out;
  out.push(boost::iostreams::gzip_compressor());
  out.push(file);
  out << contents;
  return path;
}

void test_round_trip() {
  Vocabulary vocab;
  const vector<string> trees{
      "(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .))",
      "(S (NP (NP (DT the) (NN man)) (PP (IN with) (NP (DT a) (NN hat)))) (VP (VBD left)))",
      "(FRAG (ADVP (RB now)))"};
  for (unsigned i = 0; i < trees.size(); ++i) {
    TreePtr tree = parse_bracketed(trees[i], true);
    Sentence sentence = vocab.make_sentence(tree->leaves(), tree->tags());
    vector<Action> actions = extract_actions(*tree, &vocab, i);
    TreePtr replayed = replay(sentence, actions, i);
    assert(replayed->linearize() == tree->linearize());
    assert(replayed->linearize(true) == tree->linearize(true));

    vector<Action> generative = to_generative(sentence, actions, i);
    assert(generative.size() == actions.size());
    unsigned word = 0;
    for (unsigned j = 0; j < actions.size(); ++j) {
      if (actions[j].type == ActionType::kShift) {
        assert(generative[j].type == ActionType::kGen);
        assert(generative[j].id == sentence.raw[word]);
        assert(generative[j].symbol == sentence.words[word]);
        word++;
      } else {
        assert(generative[j] == actions[j]);
      }
    }
  }
}

void test_malformed() {
  Vocabulary vocab;
  TreePtr tree = parse_bracketed("(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))", true);
  Sentence sentence = vocab.make_sentence(tree->leaves());
  vector<Action> actions = extract_actions(*tree, &vocab, 0);
  vocab.freeze();

  bool thrown = false;
  try {
    extract_actions(*parse_bracketed("(SBAR (NP (DT The) (NN cat)))", true), &vocab, 5);
  } catch (MalformedOracleError& e) {
    thrown = true;
    assert(e.sentence_index == 5);
  }
  assert(thrown);

  vector<Action> truncated(actions.begin(), actions.end() - 1);
  thrown = false;
  try {
    replay(sentence, truncated, 2);
  } catch (MalformedOracleError& e) {
    thrown = true;
    assert(e.sentence_index == 2);
  }
  assert(thrown);

  vector<Action> extra_shift(actions);
  extra_shift.insert(extra_shift.end() - 1, Action::shift());
  thrown = false;
  try {
    replay(sentence, extra_shift, 2);
  } catch (MalformedOracleError&) {
    thrown = true;
  }
  assert(thrown);

  thrown = false;
  try {
    to_generative(sentence, extra_shift, 2);
  } catch (MalformedOracleError&) {
    thrown = true;
  }
  assert(thrown);
}

void test_action_tokens() {
  ActionType type;
  string symbol;
  assert(parse_action_token("SHIFT", &type, &symbol) && type == ActionType::kShift && symbol.empty());
  assert(parse_action_token("REDUCE", &type, &symbol) && type == ActionType::kReduce);
  assert(parse_action_token("NT(NP)", &type, &symbol) && type == ActionType::kOpen && symbol == "NP");
  assert(parse_action_token("GEN(-LRB-)", &type, &symbol) && type == ActionType::kGen && symbol == "-LRB-");
  assert(parse_action_token("GEN())", &type, &symbol) && symbol == ")");
  assert(!parse_action_token("NT()", &type, &symbol));
  assert(!parse_action_token("SWAP", &type, &symbol));
  assert(!parse_action_token("NT(NP", &type, &symbol));

  Action open = Action::open(3, "VP");
  assert(open.to_string() == "NT(VP)");
  assert(open.code() == 5);
  assert(Action::gen(7, "cat").to_string() == "GEN(cat)");
  assert(Action::gen(7, "cat").code() == Action::shift().code());
  assert(Action().to_string() == "EMPTY");
  assert(action_codes({Action::shift(), Action::reduce(), open}) == vector<int>({0, 1, 5}));
}

void test_load_oracle() {
  Vocabulary vocab;
  string training_path = write_file(kOracle);
  Corpus training(&vocab);
  training.load_oracle(training_path);
  // the second entry has fewer SHIFTs than words
  assert(training.size() == 2);
  assert(training.skipped == vector<unsigned>({1}));
  assert(training.has_gold());
  assert(training.trees[0]->linearize(true) == "(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .))");
  assert(training.sents[1].words == vector<string>({"Dogs", "bark"}));
  assert(training.sents[0].tags == vector<string>({"DT", "NN", "VBZ", "."}));
  assert(replay(training.sents[0], training.actions[0], 0)->linearize() == training.trees[0]->linearize());
  vocab.freeze();

  // after freezing, ids come from the UNKed line and words from the raw line
  string test_path = write_gzip_file(kTestOracle);
  Corpus test(&vocab);
  test.load_oracle(test_path);
  assert(test.size() == 1);
  assert(test.skipped == vector<unsigned>({0}));
  assert(test.sents[0].words == vector<string>({"The", "dog", "sleeps"}));
  assert(test.sents[0].raw[1] == vocab.terminals.Convert(kUNK));
  assert(test.sents[0].raw[2] == vocab.terminals.Convert("sleeps"));

  boost::filesystem::remove(training_path);
  boost::filesystem::remove(test_path);
}

void test_load_bracketed_and_sentences() {
  Vocabulary vocab;
  string path = write_file("(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))\n\n(S (NP (NNS Dogs)) (VP (VBP bark)))\n");
  Corpus corpus(&vocab);
  corpus.load_bracketed(path, true);
  assert(corpus.size() == 2);
  assert(corpus.trees[1]->linearize() == "(S (NP Dogs) (VP bark))");
  assert(corpus.sents[1].tags == vector<string>({"NNS", "VBP"}));
  assert(corpus.actions[1].size() == 8);
  boost::filesystem::remove(path);

  string bad_path = write_file("(S (NP (DT The) (NN cat))\n");
  bool thrown = false;
  try {
    corpus.load_bracketed(bad_path, true);
  } catch (Error& e) {
    thrown = true;
    const unsigned* line = boost::get_error_info<line_number_info>(e);
    assert(line && *line == 1);
  }
  assert(thrown);
  boost::filesystem::remove(bad_path);

  vocab.freeze();
  string sentences_path = write_file("The cat barks\n\n  Dogs   sleep \n");
  Corpus sentences(&vocab);
  sentences.load_sentences(sentences_path);
  assert(sentences.size() == 2);
  assert(!sentences.has_gold());
  assert(sentences.sents[0].raw[2] == vocab.terminals.Convert(kUNK));
  assert(sentences.sents[1].words == vector<string>({"Dogs", "sleep"}));
  boost::filesystem::remove(sentences_path);

  bool missing = false;
  try {
    sentences.load_sentences(temp_path(".missing"));
  } catch (Error&) {
    missing = true;
  }
  assert(missing);
}

} // namespace

int main() {
  test_round_trip();
  test_malformed();
  test_action_tokens();
  test_load_oracle();
  test_load_bracketed_and_sentences();
  cerr << "oracle-test passed" << endl;
  return 0;
}
