#include "rnng/oracle.h"

#include <iostream>

#include <boost/algorithm/string.hpp>

#include "rnng/compressed-fstream.h"
#include "rnng/errors.h"
#include "rnng/parser-state.h"

using namespace std;

namespace rnng {

const string kUNK = "UNK";

namespace {

vector<string> split_tokens(const string& line) {
  vector<string> tokens;
  string trimmed = boost::trim_copy(line);
  if (trimmed.empty()) return tokens;
  boost::split(tokens, trimmed, boost::is_space(), boost::token_compress_on);
  return tokens;
}

void extract_actions_helper(const Tree& node, Vocabulary* vocab, unsigned sentence_index, vector<Action>* actions) {
  if (node.is_leaf()) {
    actions->push_back(Action::shift());
    return;
  }
  Action open;
  if (!vocab->lookup_action(ActionType::kOpen, node.get_symbol(), &open))
    BOOST_THROW_EXCEPTION(MalformedOracleError("unknown nonterminal " + node.get_symbol(), sentence_index));
  actions->push_back(open);
  for (const TreePtr& child : node.get_children())
    extract_actions_helper(*child, vocab, sentence_index, actions);
  actions->push_back(Action::reduce());
}

} // namespace

void Vocabulary::freeze() {
  if (frozen) return;
  terminals.Freeze();
  terminals.SetUnk(kUNK);
  nonterminals.Freeze();
  frozen = true;
}

Sentence Vocabulary::make_sentence(const vector<string>& words, const vector<string>& tags) {
  Sentence sentence;
  sentence.words = words;
  sentence.tags = tags;
  for (const string& word : words)
    sentence.raw.push_back(terminals.Convert(word));
  return sentence;
}

bool Vocabulary::lookup_action(ActionType type, const string& symbol, Action* action) {
  switch (type) {
    case ActionType::kOpen:
      if (frozen && !nonterminals.Contains(symbol)) return false;
      *action = Action::open(nonterminals.Convert(symbol), symbol);
      return true;
    case ActionType::kGen:
      *action = Action::gen(terminals.Convert(symbol), symbol);
      return true;
    case ActionType::kShift:
      *action = Action::shift();
      return true;
    case ActionType::kReduce:
      *action = Action::reduce();
      return true;
    default:
      return false;
  }
}

vector<Action> extract_actions(const Tree& tree, Vocabulary* vocab, unsigned sentence_index) {
  vector<Action> actions;
  extract_actions_helper(tree, vocab, sentence_index, &actions);
  return actions;
}

TreePtr replay(const Sentence& sentence, const vector<Action>& actions, unsigned sentence_index) {
  ParserState state(ParserState::Mode::kDiscriminative, &sentence);
  for (unsigned i = 0; i < actions.size(); ++i) {
    if (!state.is_legal(actions[i])) {
      BOOST_THROW_EXCEPTION(MalformedOracleError("illegal action " + actions[i].to_string() +
                                                 " at position " + std::to_string(i), sentence_index));
    }
    state = state.perform_action(actions[i]);
  }
  if (!state.is_finished()) {
    BOOST_THROW_EXCEPTION(MalformedOracleError(
        "derivation ends with " + std::to_string(state.open_count()) + " open nonterminals and " +
        std::to_string(state.get_buffer().size()) + " words unshifted", sentence_index));
  }
  return state.tree();
}

vector<Action> to_generative(const Sentence& sentence, const vector<Action>& actions, unsigned sentence_index) {
  vector<Action> converted;
  unsigned words = 0;
  for (const Action& action : actions) {
    if (action.type == ActionType::kShift) {
      if (words >= sentence.size())
        BOOST_THROW_EXCEPTION(MalformedOracleError("more SHIFTs than words", sentence_index));
      converted.push_back(Action::gen(sentence.raw[words], sentence.words[words]));
      words++;
    } else {
      converted.push_back(action);
    }
  }
  return converted;
}

void Corpus::report_loaded() const {
  cerr << "Loaded " << sents.size() << " sentences";
  if (!skipped.empty())
    cerr << " (skipped " << skipped.size() << " malformed)";
  cerr << "\n";
  cerr << "    cumulative    terminal vocab size: " << vocab->terminals.size() << endl;
  cerr << "    cumulative nonterminal vocab size: " << vocab->nonterminals.size() << endl;
}

void Corpus::load_oracle(const string& file) {
  cerr << "Loading top-down oracle from " << file << endl;
  compressed_ifstream in(file);
  if (!in)
    BOOST_THROW_EXCEPTION(Error("could not open " + file) << file_name_info(file));

  unsigned lc = 0;
  unsigned sentence_index = 0;
  string line;
  while (getline(in, line)) {
    ++lc;
    if (boost::trim_copy(line).empty()) continue;
    if (line[0] != '#')
      BOOST_THROW_EXCEPTION(Error("expected a # tree line") << file_name_info(file) << line_number_info(lc));

    TreePtr gold;
    try {
      gold = parse_bracketed(line.substr(1), true);
    } catch (Error& e) {
      e << file_name_info(file) << line_number_info(lc);
      throw;
    }

    // POS, raw, lowercased, unked
    vector<vector<string>> views;
    for (unsigned i = 0; i < 4; ++i) {
      if (!getline(in, line))
        BOOST_THROW_EXCEPTION(Error("truncated oracle entry") << file_name_info(file) << line_number_info(lc));
      ++lc;
      views.push_back(split_tokens(line));
    }

    vector<string> action_tokens;
    while (getline(in, line)) {
      ++lc;
      if (boost::trim_copy(line).empty()) break;
      action_tokens.push_back(boost::trim_copy(line));
    }

    unsigned index = sentence_index++;
    try {
      const vector<string>& tags = views[0];
      const vector<string>& words = views[1];
      const vector<string>& unked = views[3];
      if (words.empty())
        BOOST_THROW_EXCEPTION(MalformedOracleError("empty sentence", index));
      if (tags.size() != words.size() || views[2].size() != words.size() || unked.size() != words.size())
        BOOST_THROW_EXCEPTION(MalformedOracleError("mismatched lengths of input strings", index));

      // at training time the raw tokens build the vocabulary; afterwards the
      // UNKed view gives the ids the model was trained with
      Sentence sentence = vocab->make_sentence(vocab->is_frozen() ? unked : words, tags);
      sentence.words = words;

      vector<Action> cur_acts;
      unsigned termc = 0;
      for (const string& token : action_tokens) {
        ActionType type;
        string symbol;
        Action action;
        if (!parse_action_token(token, &type, &symbol) || type == ActionType::kGen ||
            !vocab->lookup_action(type, symbol, &action))
          BOOST_THROW_EXCEPTION(MalformedOracleError("malformed action " + token, index));
        if (type == ActionType::kShift) termc++;
        cur_acts.push_back(action);
      }
      if (termc != sentence.size()) {
        BOOST_THROW_EXCEPTION(MalformedOracleError(
            "mismatched number of tokens (" + std::to_string(sentence.size()) + ") and SHIFTs (" +
            std::to_string(termc) + ")", index));
      }
      replay(sentence, cur_acts, index);

      sents.push_back(sentence);
      actions.push_back(cur_acts);
      trees.push_back(gold);
    } catch (MalformedOracleError& e) {
      cerr << "Skipping oracle entry before line " << lc << ": " << e.what() << endl;
      skipped.push_back(index);
    }
  }
  report_loaded();
}

void Corpus::load_bracketed(const string& file, bool has_tags) {
  cerr << "Loading bracketed trees from " << file << endl;
  compressed_ifstream in(file);
  if (!in)
    BOOST_THROW_EXCEPTION(Error("could not open " + file) << file_name_info(file));

  unsigned lc = 0;
  unsigned sentence_index = 0;
  string line;
  while (getline(in, line)) {
    ++lc;
    if (boost::trim_copy(line).empty()) continue;
    unsigned index = sentence_index++;
    TreePtr tree;
    try {
      tree = parse_bracketed(line, has_tags);
    } catch (Error& e) {
      e << file_name_info(file) << line_number_info(lc);
      throw;
    }
    try {
      vector<Action> cur_acts = extract_actions(*tree, vocab, index);
      sents.push_back(vocab->make_sentence(tree->leaves(), has_tags ? tree->tags() : vector<string>()));
      actions.push_back(cur_acts);
      trees.push_back(tree);
    } catch (MalformedOracleError& e) {
      cerr << "Skipping tree on line " << lc << ": " << e.what() << endl;
      skipped.push_back(index);
    }
  }
  report_loaded();
}

void Corpus::load_sentences(const string& file) {
  cerr << "Loading sentences from " << file << endl;
  compressed_ifstream in(file);
  if (!in)
    BOOST_THROW_EXCEPTION(Error("could not open " + file) << file_name_info(file));

  string line;
  while (getline(in, line)) {
    vector<string> words = split_tokens(line);
    if (words.empty()) continue;
    sents.push_back(vocab->make_sentence(words));
  }
  report_loaded();
}

} // namespace rnng
