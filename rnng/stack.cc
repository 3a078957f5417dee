#include "rnng/stack.h"

#include <algorithm>

#include "rnng/errors.h"

using namespace std;
using namespace cnn::expr;

namespace rnng {

Stack::Stack(Featurizer* featurizer, Composer* composer) :
    featurizer(featurizer), composer(composer), nopen_parens(0) {
  if (featurizer)
    guard = featurizer->start(Sequence::kStack, featurizer->guard(Sequence::kStack));
}

void Stack::push_frame(StackFrame frame) {
  if (featurizer) {
    const Encoding& previous = frames.empty() ? guard : frames.back().encoding;
    frame.encoding = featurizer->extend(Sequence::kStack, previous, frame.embedding);
  }
  frames = frames.push_back(frame);
}

void Stack::open(int label, const string& symbol) {
  StackFrame frame;
  frame.label = label;
  frame.symbol = symbol;
  if (featurizer)
    frame.embedding = featurizer->nonterminal_embedding(label);
  push_frame(frame);
  nopen_parens++;
}

void Stack::push(const TreePtr& subtree, const Expression& embedding) {
  StackFrame frame;
  frame.tree = subtree;
  frame.embedding = embedding;
  push_frame(frame);
}

StackFrame Stack::pop() {
  StackFrame frame = frames.back();
  frames = frames.pop_back();
  if (frame.is_open())
    nopen_parens--;
  return frame;
}

void Stack::reduce() {
  // a rejected REDUCE leaves the stack untouched
  if (nopen_parens == 0)
    BOOST_THROW_EXCEPTION(IllegalActionError("REDUCE without an open nonterminal"));
  if (frames.back().is_open())
    BOOST_THROW_EXCEPTION(IllegalActionError("REDUCE would close an empty constituent"));
  vector<StackFrame> children;
  while (!frames.back().is_open()) {
    children.push_back(frames.back());
    frames = frames.pop_back();
  }
  StackFrame marker = pop();
  reverse(children.begin(), children.end());

  vector<TreePtr> subtrees;
  vector<Expression> child_vectors;
  for (const StackFrame& child : children) {
    subtrees.push_back(child.tree);
    child_vectors.push_back(child.embedding);
  }

  StackFrame frame;
  frame.tree = Tree::node(marker.symbol, subtrees);
  if (composer)
    frame.embedding = composer->compose(marker.embedding, child_vectors);
  push_frame(frame);
}

Expression Stack::top_encoding() const {
  return frames.empty() ? guard.output : frames.back().encoding.output;
}

bool Stack::is_finished() const {
  return frames.size() == 1 && !frames.back().is_open();
}

} // namespace rnng
