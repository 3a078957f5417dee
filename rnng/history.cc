#include "rnng/history.h"

using namespace std;

namespace rnng {

History::History(Featurizer* featurizer) : featurizer(featurizer) {
  HistoryFrame frame;
  if (featurizer) {
    frame.embedding = featurizer->guard(Sequence::kHistory);
    frame.encoding = featurizer->start(Sequence::kHistory, frame.embedding);
  }
  frames = frames.push_back(frame);
}

void History::push(const Action& action) {
  HistoryFrame frame;
  frame.action = action;
  if (featurizer) {
    frame.embedding = featurizer->action_embedding(action);
    frame.encoding = featurizer->extend(Sequence::kHistory, frames.back().encoding, frame.embedding);
  }
  frames = frames.push_back(frame);
}

vector<Action> History::actions() const {
  vector<HistoryFrame> values = frames.values();
  vector<Action> actions;
  for (unsigned i = 1; i < values.size(); ++i)
    actions.push_back(values[i].action);
  return actions;
}

} // namespace rnng
