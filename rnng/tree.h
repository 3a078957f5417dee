#ifndef RNNG_TREE_H_
#define RNNG_TREE_H_

#include <map>
#include <memory>
#include <set>
#include <string>
#include <tuple>
#include <vector>

#include "rnng/eval.h"

namespace rnng {

class Tree;
typedef std::shared_ptr<const Tree> TreePtr;

typedef std::map<std::tuple<std::string, unsigned, unsigned>, unsigned> BracketCounts;

extern const std::set<std::string> PUNCTUATION;

// tag printed for leaves whose part of speech is unknown
extern const std::string kDummyTag;

// Immutable constituency tree. Leaves carry a word, its position in the
// sentence and an optional tag; internal nodes carry a label and at least one
// child. Subtrees are shared, never copied.
class Tree {
public:
  static TreePtr leaf(const std::string& word, unsigned leaf_index, const std::string& tag = "");
  static TreePtr node(const std::string& label, const std::vector<TreePtr>& children);

  bool is_leaf() const { return leaf_index >= 0; }

  // label for internal nodes, the word for leaves
  const std::string& get_symbol() const { return symbol; }
  const std::string& get_tag() const { return tag; }
  const std::vector<TreePtr>& get_children() const { return children; }

  // first and last leaf positions covered, inclusive
  unsigned left_span() const { return left; }
  unsigned right_span() const { return right; }

  std::vector<std::string> leaves() const;
  std::vector<std::string> tags() const;

  // "(S (NP The cat) (VP sleeps))", or with (TAG word) preterminals
  std::string linearize(bool include_tags = false) const;

  BracketCounts brackets(bool advp_prt = true, bool remove_punct = true) const;
  MatchCounts compare(const Tree& gold, bool spmrl = false) const;

private:
  Tree(const std::string& symbol, const std::string& tag, const std::vector<TreePtr>& children, int leaf_index);

  void collect_leaves(std::vector<const Tree*>* leaves) const;
  void linearize_helper(std::string* out, bool include_tags) const;
  void update_bracket_counts(BracketCounts& bracket_counts, const std::vector<const Tree*>& leaves,
                             bool advp_prt, bool remove_punct) const;

  std::string symbol;
  std::string tag;
  std::vector<TreePtr> children;
  int leaf_index;
  unsigned left;
  unsigned right;
};

std::vector<std::string> tokenize_bracketed(const std::string& line);

// parses one bracketed tree. with has_tags, "(X w)" becomes a leaf w tagged X;
// otherwise it is a constituent X over the single word w. an unlabeled outer
// bracket, as in "( (S ...) )", is removed.
TreePtr parse_bracketed(const std::string& line, bool has_tags);

} // namespace rnng

#endif
