#ifndef RNNG_STACK_H_
#define RNNG_STACK_H_

#include <string>
#include <vector>

#include "cnn/expr.h"

#include "rnng/composer.h"
#include "rnng/featurizer.h"
#include "rnng/persistent-stack.h"
#include "rnng/tree.h"

namespace rnng {

// an open nonterminal marker, or a completed subtree
struct StackFrame {
  StackFrame() : label(-1) {}

  bool is_open() const { return !tree; }

  int label; // nonterminal id of an open marker
  std::string symbol; // its label string
  TreePtr tree; // completed subtree, null for an open marker
  cnn::expr::Expression embedding;
  Encoding encoding;
};

// Parser stack. Copies are cheap and independent: frames live in a
// persistent stack and closed subtrees are immutable. Without a featurizer
// the stack is purely symbolic and frames carry no vectors.
class Stack {
public:
  explicit Stack(Featurizer* featurizer = nullptr, Composer* composer = nullptr);

  void open(int label, const std::string& symbol);
  void push(const TreePtr& subtree, const cnn::expr::Expression& embedding);
  StackFrame pop();

  // closes the most recently opened nonterminal over the frames above it
  void reduce();

  const StackFrame& top() const { return frames.back(); }

  // encoding of the whole stack; the guard's when empty
  cnn::expr::Expression top_encoding() const;

  bool empty() const { return frames.empty(); }
  unsigned size() const { return frames.size(); }
  unsigned open_count() const { return nopen_parens; }

  // exactly one frame left and it is a completed tree
  bool is_finished() const;

  // bottom first
  std::vector<StackFrame> values() const { return frames.values(); }

private:
  void push_frame(StackFrame frame);

  Featurizer* featurizer;
  Composer* composer;
  Encoding guard;
  PersistentStack<StackFrame> frames;
  unsigned nopen_parens;
};

} // namespace rnng

#endif
