#ifndef RNNG_HISTORY_H_
#define RNNG_HISTORY_H_

#include <vector>

#include "cnn/expr.h"

#include "rnng/actions.h"
#include "rnng/featurizer.h"
#include "rnng/persistent-stack.h"

namespace rnng {

struct HistoryFrame {
  Action action;
  cnn::expr::Expression embedding;
  Encoding encoding;
};

// Actions taken so far, seeded with an EMPTY sentinel action.
class History {
public:
  explicit History(Featurizer* featurizer = nullptr);

  void push(const Action& action);

  // the sentinel (an Action of type kNone) before any action is taken
  const Action& last_action() const { return frames.back().action; }

  // taken actions in order, without the sentinel
  std::vector<Action> actions() const;

  unsigned size() const { return frames.size() - 1; }

  cnn::expr::Expression top_encoding() const { return frames.back().encoding.output; }

private:
  Featurizer* featurizer;
  PersistentStack<HistoryFrame> frames;
};

} // namespace rnng

#endif
