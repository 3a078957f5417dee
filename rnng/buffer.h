#ifndef RNNG_BUFFER_H_
#define RNNG_BUFFER_H_

#include <string>
#include <vector>

#include "cnn/expr.h"

#include "rnng/featurizer.h"
#include "rnng/oracle.h"
#include "rnng/persistent-stack.h"

namespace rnng {

// a word of the input, or of the generated sentence
struct TokenFrame {
  TokenFrame() : word(-1), index(0) {}

  bool is_sentinel() const { return word < 0; }

  int word;
  std::string symbol;
  std::string tag;
  unsigned index; // position in the sentence
  cnn::expr::Expression embedding;
  Encoding encoding;
};

// Words not yet shifted, next word on top, over an EMPTY sentinel so the
// top encoding is defined even when every word has been shifted.
class Buffer {
public:
  Buffer(const Sentence& sentence, Featurizer* featurizer = nullptr);

  TokenFrame pop();
  const TokenFrame& top() const;
  cnn::expr::Expression top_encoding() const { return frames.back().encoding.output; }

  bool is_empty() const { return frames.size() <= 1; }
  unsigned size() const { return frames.size() - 1; }

private:
  PersistentStack<TokenFrame> frames;
};

// Words generated so far in generative mode. Append only.
class Terminal {
public:
  explicit Terminal(Featurizer* featurizer = nullptr);

  void push(int word, const std::string& symbol, const cnn::expr::Expression& embedding);
  cnn::expr::Expression top_encoding() const { return frames.back().encoding.output; }

  unsigned size() const { return frames.size() - 1; }
  std::vector<std::string> words() const;

private:
  Featurizer* featurizer;
  PersistentStack<TokenFrame> frames;
};

} // namespace rnng

#endif
