#include "rnng/tree.h"

#include <cctype>

#include "rnng/errors.h"

using namespace std;

namespace rnng {

const set<string> PUNCTUATION = {",", ".", ":", "``", "''", "PU"};

const string kDummyTag = "XX";

Tree::Tree(const string& symbol, const string& tag, const vector<TreePtr>& children, int leaf_index):
    symbol(symbol), tag(tag), children(children), leaf_index(leaf_index) {
  if (leaf_index >= 0) {
    left = right = (unsigned) leaf_index;
  } else {
    left = children.front()->left_span();
    right = children.back()->right_span();
  }
}

TreePtr Tree::leaf(const string& word, unsigned leaf_index, const string& tag) {
  return TreePtr(new Tree(word, tag, vector<TreePtr>(), (int) leaf_index));
}

TreePtr Tree::node(const string& label, const vector<TreePtr>& children) {
  if (children.empty())
    BOOST_THROW_EXCEPTION(Error("constituent " + label + " has no children"));
  return TreePtr(new Tree(label, "", children, -1));
}

void Tree::collect_leaves(vector<const Tree*>* leaves) const {
  if (is_leaf()) {
    leaves->push_back(this);
    return;
  }
  for (const TreePtr& child : children)
    child->collect_leaves(leaves);
}

vector<string> Tree::leaves() const {
  vector<const Tree*> nodes;
  collect_leaves(&nodes);
  vector<string> words;
  for (const Tree* node : nodes)
    words.push_back(node->symbol);
  return words;
}

vector<string> Tree::tags() const {
  vector<const Tree*> nodes;
  collect_leaves(&nodes);
  vector<string> tags;
  for (const Tree* node : nodes)
    tags.push_back(node->tag);
  return tags;
}

void Tree::linearize_helper(string* out, bool include_tags) const {
  if (is_leaf()) {
    if (include_tags) {
      *out += "(" + (tag.empty() ? kDummyTag : tag) + " " + symbol + ")";
    } else {
      *out += symbol;
    }
    return;
  }
  *out += "(" + symbol;
  for (const TreePtr& child : children) {
    *out += " ";
    child->linearize_helper(out, include_tags);
  }
  *out += ")";
}

string Tree::linearize(bool include_tags) const {
  string out;
  linearize_helper(&out, include_tags);
  return out;
}

BracketCounts Tree::brackets(bool advp_prt, bool remove_punct) const {
  vector<const Tree*> leaves;
  collect_leaves(&leaves);
  BracketCounts bracket_counts;
  update_bracket_counts(bracket_counts, leaves, advp_prt, remove_punct);
  return bracket_counts;
}

void Tree::update_bracket_counts(BracketCounts& bracket_counts, const vector<const Tree*>& leaves,
                                 bool advp_prt, bool remove_punct) const {
  if (is_leaf()) return;

  string nonterm = symbol;
  if (advp_prt && nonterm == "PRT")
    nonterm = "ADVP";

  // punctuation is recognized by tag when tags are known, otherwise by word
  auto is_punct = [&](unsigned i) {
    const Tree* leaf = leaves[i];
    const string& key = leaf->tag.empty() ? leaf->symbol : leaf->tag;
    return PUNCTUATION.find(key) != PUNCTUATION.end();
  };

  unsigned l = left;
  unsigned r = right;
  if (remove_punct) {
    while (l <= right && l < leaves.size() && is_punct(l))
      l++;
    while (r >= left && r > 0 && is_punct(r))
      r--;
  }

  if (l <= r && nonterm != "TOP") {
    auto key = make_tuple(nonterm, l, r);
    bracket_counts[key]++;
  }
  for (const TreePtr& child : children)
    child->update_bracket_counts(bracket_counts, leaves, advp_prt, remove_punct);
}

MatchCounts Tree::compare(const Tree& gold, bool spmrl) const {
  bool advp_prt = !spmrl;
  bool remove_punct = !spmrl;
  BracketCounts predicted_brackets = brackets(advp_prt, remove_punct);
  BracketCounts gold_brackets = gold.brackets(advp_prt, remove_punct);

  MatchCounts match_counts;
  for (const auto& pair : gold_brackets) {
    match_counts.gold += pair.second;
    auto it = predicted_brackets.find(pair.first);
    if (it != predicted_brackets.end())
      match_counts.correct += min(it->second, pair.second);
  }
  for (const auto& pair : predicted_brackets)
    match_counts.predicted += pair.second;
  return match_counts;
}

vector<string> tokenize_bracketed(const string& line) {
  vector<string> tokens;
  string current;
  for (char c : line) {
    if (c == '(' || c == ')' || isspace((unsigned char) c)) {
      if (!current.empty()) {
        tokens.push_back(current);
        current.clear();
      }
      if (c == '(' || c == ')')
        tokens.push_back(string(1, c));
    } else {
      current += c;
    }
  }
  if (!current.empty())
    tokens.push_back(current);
  return tokens;
}

namespace {

struct BracketedParser {
  BracketedParser(const vector<string>& tokens, const string& line, bool has_tags)
      : tokens(tokens), line(line), has_tags(has_tags), pos(0), leaf_index(0) {}

  const string& next() {
    if (pos >= tokens.size())
      BOOST_THROW_EXCEPTION(Error("unexpected end of tree: " + line));
    return tokens[pos++];
  }

  TreePtr parse_constituent() {
    if (next() != "(")
      BOOST_THROW_EXCEPTION(Error("expected ( in tree: " + line));
    string label;
    if (pos < tokens.size() && tokens[pos] != "(" && tokens[pos] != ")")
      label = next();

    vector<TreePtr> children;
    vector<string> words;
    while (true) {
      if (pos >= tokens.size())
        BOOST_THROW_EXCEPTION(Error("unbalanced brackets in tree: " + line));
      const string& token = tokens[pos];
      if (token == ")") {
        pos++;
        break;
      } else if (token == "(") {
        children.push_back(parse_constituent());
      } else {
        words.push_back(next());
        children.push_back(Tree::leaf(words.back(), leaf_index++));
      }
    }

    if (children.empty())
      BOOST_THROW_EXCEPTION(Error("empty constituent in tree: " + line));
    if (has_tags && children.size() == 1 && words.size() == 1)
      return Tree::leaf(words.front(), children.front()->left_span(), label);
    if (label.empty()) {
      if (children.size() != 1)
        BOOST_THROW_EXCEPTION(Error("unlabeled constituent in tree: " + line));
      return children.front();
    }
    return Tree::node(label, children);
  }

  const vector<string>& tokens;
  const string& line;
  bool has_tags;
  unsigned pos;
  unsigned leaf_index;
};

} // namespace

TreePtr parse_bracketed(const string& line, bool has_tags) {
  vector<string> tokens = tokenize_bracketed(line);
  BracketedParser parser(tokens, line, has_tags);
  TreePtr tree = parser.parse_constituent();
  if (parser.pos != tokens.size())
    BOOST_THROW_EXCEPTION(Error("trailing tokens after tree: " + line));
  if (tree->is_leaf())
    BOOST_THROW_EXCEPTION(Error("tree has no constituents: " + line));
  return tree;
}

} // namespace rnng
