#include "rnng/samples.h"

#include <limits>

#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/regex.hpp>

#include "rnng/compressed-fstream.h"
#include "rnng/errors.h"

using namespace std;

namespace rnng {

void write_sample(ostream& out, unsigned sentence_index, double log_prob, const Tree& tree) {
  streamsize precision = out.precision(numeric_limits<double>::max_digits10);
  out << sentence_index << " ||| " << log_prob << " ||| " << tree.linearize(false) << "\n";
  out.precision(precision);
}

bool parse_sample_line(const string& line, ProposalSample* sample) {
  static const boost::regex kSampleLine("^\\s*(\\d+)\\s*\\|\\|\\|\\s*(\\S+)\\s*\\|\\|\\|\\s*(.+?)\\s*$");
  boost::smatch what;
  if (!boost::regex_match(line, what, kSampleLine))
    return false;
  try {
    sample->sentence_index = boost::lexical_cast<unsigned>(what[1].str());
    sample->log_prob = boost::lexical_cast<double>(what[2].str());
    sample->tree = parse_bracketed(what[3].str(), false);
  } catch (const boost::bad_lexical_cast&) {
    return false;
  } catch (const Error&) {
    return false;
  }
  return true;
}

void ProposalSamples::add(const ProposalSample& sample) {
  by_sentence[sample.sentence_index].push_back(sample);
  total++;
}

void ProposalSamples::load(const string& file) {
  cerr << "Loading proposal samples from " << file << endl;
  compressed_ifstream in(file);
  if (!in)
    BOOST_THROW_EXCEPTION(Error("could not open " + file) << file_name_info(file));
  unsigned lc = 0;
  string line;
  while (getline(in, line)) {
    ++lc;
    if (boost::trim_copy(line).empty()) continue;
    ProposalSample sample;
    if (!parse_sample_line(line, &sample))
      BOOST_THROW_EXCEPTION(Error("malformed sample line") << file_name_info(file) << line_number_info(lc));
    add(sample);
  }
  cerr << "Loaded " << total << " samples for " << by_sentence.size() << " sentences" << endl;
}

unsigned ProposalSamples::count(unsigned sentence_index) const {
  auto it = by_sentence.find(sentence_index);
  return it == by_sentence.end() ? 0 : it->second.size();
}

vector<ProposalSample> ProposalSamples::samples_for(unsigned sentence_index, unsigned count) const {
  unsigned available = this->count(sentence_index);
  if (available < count)
    BOOST_THROW_EXCEPTION(SampleCountMismatchError(sentence_index, count, available));
  if (count == 0)
    return vector<ProposalSample>();
  const vector<ProposalSample>& samples = by_sentence.find(sentence_index)->second;
  return vector<ProposalSample>(samples.begin(), samples.begin() + count);
}

} // namespace rnng
