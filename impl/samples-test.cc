#include <assert.h>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>
#include <vector>

#include <boost/exception/get_error_info.hpp>
#include <boost/filesystem.hpp>

#include "rnng/errors.h"
#include "rnng/samples.h"
#include "rnng/utils.h"

using namespace std;
using namespace rnng;

namespace {

void test_sample_lines() {
  TreePtr tree = parse_bracketed("(S (NP (DT The) (NN cat)) (VP (VBZ sleeps)))", true);
  stringstream out;
  write_sample(out, 3, -1.25, *tree);
  assert(out.str() == "3 ||| -1.25 ||| (S (NP The cat) (VP sleeps))\n");

  // log-probabilities survive printing exactly
  stringstream precise;
  double lp = -12.345678901234567;
  write_sample(precise, 0, lp, *tree);
  ProposalSample sample;
  assert(parse_sample_line(precise.str().substr(0, precise.str().size() - 1), &sample));
  assert(sample.log_prob == lp);

  assert(parse_sample_line("12 ||| -3.5e-2 ||| (S (NP Dogs) (VP bark))", &sample));
  assert(sample.sentence_index == 12);
  assert(fabs(sample.log_prob + 0.035) < 1e-12);
  assert(sample.tree->linearize() == "(S (NP Dogs) (VP bark))");

  assert(!parse_sample_line("12 ||| x ||| (S a)", &sample));
  assert(!parse_sample_line("-1 ||| 0 ||| (S a)", &sample));
  assert(!parse_sample_line("1 ||| 0 ||| (S a", &sample));
  assert(!parse_sample_line("1 ||| 0", &sample));
}

void test_sample_file() {
  string path = (boost::filesystem::temp_directory_path() / boost::filesystem::unique_path()).string();
  {
    ofstream out(path.c_str());
    out << "0 ||| -1.0 ||| (S (NP The cat) (VP sleeps))\n"
        << "0 ||| -2.0 ||| (S The cat sleeps)\n"
        << "\n"
        << "2 ||| -0.5 ||| (S (NP Dogs) (VP bark))\n"
        << "0 ||| -3.0 ||| (S (NP The cat) (VP sleeps))\n";
  }
  ProposalSamples samples;
  samples.load(path);
  assert(samples.size() == 4);
  assert(samples.count(0) == 3);
  assert(samples.count(1) == 0);
  assert(samples.count(2) == 1);

  vector<ProposalSample> first = samples.samples_for(0, 2);
  assert(first.size() == 2);
  assert(first[0].log_prob == -1.0);
  assert(first[1].tree->linearize() == "(S The cat sleeps)");
  assert(samples.samples_for(1, 0).empty());

  bool thrown = false;
  try {
    samples.samples_for(2, 3);
  } catch (SampleCountMismatchError& e) {
    thrown = true;
    assert(e.sentence_index == 2);
    assert(e.requested == 3);
    assert(e.available == 1);
  }
  assert(thrown);

  {
    ofstream out(path.c_str());
    out << "0 ||| -1.0 ||| (S (NP The cat) (VP sleeps))\n"
        << "garbage\n";
  }
  ProposalSamples bad;
  thrown = false;
  try {
    bad.load(path);
  } catch (Error& e) {
    thrown = true;
    const unsigned* line = boost::get_error_info<line_number_info>(e);
    assert(line && *line == 2);
  }
  assert(thrown);
  boost::filesystem::remove(path);
}

void test_block_range() {
  // 10 sentences in 3 blocks: 4, 3, 3
  assert(utils::block_range(10, 3, 0) == make_pair(0u, 4u));
  assert(utils::block_range(10, 3, 1) == make_pair(4u, 7u));
  assert(utils::block_range(10, 3, 2) == make_pair(7u, 10u));
  assert(utils::block_range(10, 0, 0) == make_pair(0u, 10u));
  assert(utils::block_range(2, 4, 3) == make_pair(2u, 2u));

  bool thrown = false;
  try {
    utils::block_range(10, 3, 3);
  } catch (Error&) {
    thrown = true;
  }
  assert(thrown);
}

void test_logsumexp() {
  assert(fabs(utils::logsumexp({0.0, 0.0}) - log(2.0)) < 1e-12);
  assert(fabs(utils::logsumexp({-1000.0, -1000.0}) - (-1000.0 + log(2.0))) < 1e-9);
  assert(fabs(utils::logsumexp({1000.0}) - 1000.0) < 1e-9);
  assert(std::isinf(utils::logsumexp({})));
  assert(utils::to_string_precision(1.23456, 2) == "1.23");
}

} // namespace

int main() {
  test_sample_lines();
  test_sample_file();
  test_block_range();
  test_logsumexp();
  cerr << "samples-test passed" << endl;
  return 0;
}
