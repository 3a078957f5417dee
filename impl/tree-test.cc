#include <assert.h>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "rnng/errors.h"
#include "rnng/tree.h"

using namespace std;
using namespace rnng;

namespace {

bool parse_fails(const string& line) {
  try {
    parse_bracketed(line, true);
  } catch (Error&) {
    return true;
  }
  return false;
}

} // namespace

int main() {
  TreePtr leaf_the = Tree::leaf("The", 0, "DT");
  TreePtr leaf_cat = Tree::leaf("cat", 1);
  TreePtr np = Tree::node("NP", {leaf_the, leaf_cat});
  TreePtr vp = Tree::node("VP", {Tree::leaf("sleeps", 2, "VBZ")});
  TreePtr s = Tree::node("S", {np, vp});

  assert(s->linearize() == "(S (NP The cat) (VP sleeps))");
  assert(s->linearize(true) == "(S (NP (DT The) (XX cat)) (VP (VBZ sleeps)))");
  assert(s->leaves() == vector<string>({"The", "cat", "sleeps"}));
  assert(s->tags() == vector<string>({"DT", "", "VBZ"}));
  assert(np->left_span() == 0 && np->right_span() == 1);
  assert(vp->left_span() == 2 && vp->right_span() == 2);

  bool thrown = false;
  try {
    Tree::node("NP", {});
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);

  assert(tokenize_bracketed("(S (NP a))") == vector<string>({"(", "S", "(", "NP", "a", ")", ")"}));

  // with tags, (X w) is a tagged leaf; the unlabeled outer bracket is dropped
  TreePtr parsed = parse_bracketed("( (S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .)) )", true);
  assert(parsed->get_symbol() == "S");
  assert(parsed->linearize() == "(S (NP The cat) (VP sleeps) .)");
  assert(parsed->linearize(true) == "(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .))");
  assert(parsed->tags() == vector<string>({"DT", "NN", "VBZ", "."}));

  // without tags the same brackets are constituents
  TreePtr untagged = parse_bracketed("(S (NP The cat) (VP sleeps))", false);
  assert(untagged->linearize() == "(S (NP The cat) (VP sleeps))");
  assert(untagged->get_children()[1]->get_symbol() == "VP");
  assert(!untagged->get_children()[1]->is_leaf());

  assert(parse_fails("(S (NP The cat)"));
  assert(parse_fails("(S (NP The cat)) extra"));
  assert(parse_fails("(S ())"));
  assert(parse_fails("(DT The)"));

  // punctuation is excluded from spans and TOP is not counted
  BracketCounts brackets = parse_bracketed("(TOP (S (NP (DT The) (NN cat)) (VP (VBZ sleeps)) (. .)))", true)->brackets();
  assert(brackets.size() == 3);
  assert(brackets.count(make_tuple(string("S"), 0u, 2u)) == 1);
  assert(brackets.count(make_tuple(string("NP"), 0u, 1u)) == 1);
  assert(brackets.count(make_tuple(string("VP"), 2u, 2u)) == 1);

  // PRT and ADVP are the same bracket
  TreePtr prt = parse_bracketed("(S (VP (VB give) (PRT (RP up))))", true);
  TreePtr advp = parse_bracketed("(S (VP (VB give) (ADVP (RP up))))", true);
  assert(prt->compare(*advp) == MatchCounts(3, 3, 3));
  assert(prt->compare(*advp, true) == MatchCounts(2, 3, 3));

  TreePtr gold = parse_bracketed("(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))", true);
  TreePtr flat = parse_bracketed("(S (DT The) (NN cat) (VBZ sleeps))", true);
  MatchCounts counts = flat->compare(*gold);
  assert(counts == MatchCounts(1, 3, 1));
  Metrics metrics = counts.metrics();
  assert(metrics.precision == 100.0);
  assert(fabs(metrics.f1 - 50.0) < 1e-9);

  MatchCounts total = counts;
  total += gold->compare(*gold);
  assert(total == MatchCounts(4, 6, 4));

  cerr << "tree-test passed" << endl;
  return 0;
}
