#ifndef RNNG_SAMPLES_H_
#define RNNG_SAMPLES_H_

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "rnng/tree.h"

namespace rnng {

// one line of a proposal sample file:
//   <sentence index> ||| <log-probability> ||| <untagged bracketed tree>
struct ProposalSample {
  unsigned sentence_index;
  double log_prob;
  TreePtr tree;
};

void write_sample(std::ostream& out, unsigned sentence_index, double log_prob, const Tree& tree);

bool parse_sample_line(const std::string& line, ProposalSample* sample);

// proposal samples grouped by sentence, in file order
class ProposalSamples {
public:
  void load(const std::string& file);
  void add(const ProposalSample& sample);

  // the first `count` samples of a sentence; SampleCountMismatchError if
  // fewer are available
  std::vector<ProposalSample> samples_for(unsigned sentence_index, unsigned count) const;

  unsigned count(unsigned sentence_index) const;
  unsigned size() const { return total; }

private:
  std::map<unsigned, std::vector<ProposalSample>> by_sentence;
  unsigned total = 0;
};

} // namespace rnng

#endif
