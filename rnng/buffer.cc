#include "rnng/buffer.h"

#include "rnng/errors.h"

using namespace std;
using namespace cnn::expr;

namespace rnng {

namespace {

TokenFrame sentinel(Featurizer* featurizer) {
  TokenFrame frame;
  if (featurizer) {
    frame.embedding = featurizer->guard(Sequence::kBuffer);
    frame.encoding = featurizer->start(Sequence::kBuffer, frame.embedding);
  }
  return frame;
}

} // namespace

Buffer::Buffer(const Sentence& sentence, Featurizer* featurizer) {
  frames = frames.push_back(sentinel(featurizer));
  // encoded right to left so the top frame's encoding covers the rest of the sentence
  for (int i = (int) sentence.size() - 1; i >= 0; --i) {
    TokenFrame frame;
    frame.word = sentence.raw[i];
    frame.symbol = sentence.words[i];
    if (i < (int) sentence.tags.size())
      frame.tag = sentence.tags[i];
    frame.index = (unsigned) i;
    if (featurizer) {
      frame.embedding = featurizer->word_embedding(frame.word);
      frame.encoding = featurizer->extend(Sequence::kBuffer, frames.back().encoding, frame.embedding);
    }
    frames = frames.push_back(frame);
  }
}

const TokenFrame& Buffer::top() const {
  if (is_empty())
    BOOST_THROW_EXCEPTION(EmptyStructureError("buffer has no words left"));
  return frames.back();
}

TokenFrame Buffer::pop() {
  TokenFrame frame = top();
  frames = frames.pop_back();
  return frame;
}

Terminal::Terminal(Featurizer* featurizer) : featurizer(featurizer) {
  frames = frames.push_back(sentinel(featurizer));
}

void Terminal::push(int word, const string& symbol, const Expression& embedding) {
  TokenFrame frame;
  frame.word = word;
  frame.symbol = symbol;
  frame.index = size();
  frame.embedding = embedding;
  if (featurizer)
    frame.encoding = featurizer->extend(Sequence::kBuffer, frames.back().encoding, embedding);
  frames = frames.push_back(frame);
}

vector<string> Terminal::words() const {
  vector<string> words;
  for (const TokenFrame& frame : frames.values()) {
    if (!frame.is_sentinel())
      words.push_back(frame.symbol);
  }
  return words;
}

} // namespace rnng
