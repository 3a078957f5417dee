#ifndef RNNG_EVAL_H_
#define RNNG_EVAL_H_

#include <iostream>

namespace rnng {

struct Metrics {
  Metrics(double precision, double recall, double f1):
      precision(precision), recall(recall), f1(f1) {}

  double precision, recall, f1;
};

// labeled bracket counts, summed over a corpus with +=
struct MatchCounts {
  MatchCounts() {}

  MatchCounts(unsigned correct, unsigned gold, unsigned predicted):
      correct(correct), predicted(predicted), gold(gold) {}

  unsigned correct = 0;
  unsigned predicted = 0;
  unsigned gold = 0;

  Metrics metrics() const {
    double precision = 0.0;
    if (predicted > 0)
      precision = (100.0 * correct) / predicted;

    double recall = 0.0;
    if (gold > 0)
      recall = (100.0 * correct) / gold;

    double f1 = 0.0;
    if (precision + recall > 0)
      f1 = (2 * precision * recall) / (precision + recall);

    return Metrics(precision, recall, f1);
  }

  MatchCounts& operator+=(const MatchCounts& m) {
    correct += m.correct;
    predicted += m.predicted;
    gold += m.gold;
    return *this;
  }

  bool operator==(const MatchCounts& other) const {
    return correct == other.correct && predicted == other.predicted && gold == other.gold;
  }

  bool operator!=(const MatchCounts& other) const {
    return !(*this == other);
  }
};

inline std::ostream& operator<<(std::ostream& os, const MatchCounts& counts) {
  return os << "correct=" << counts.correct
            << ", gold=" << counts.gold
            << ", predicted=" << counts.predicted;
}

} // namespace rnng

#endif
