#ifndef RNNG_FEATURIZER_H_
#define RNNG_FEATURIZER_H_

#include "cnn/cnn.h"
#include "cnn/expr.h"
#include "cnn/lstm.h"
#include "cnn/model.h"
#include "cnn/rnn.h"

#include "rnng/actions.h"

namespace rnng {

// the three sequences a parser state encodes; the buffer encoder also
// encodes generated words in generative mode
enum class Sequence { kStack, kBuffer, kHistory };

// output of a sequential encoder after reading one more element, plus the
// position to extend from. frames keep their own Encoding so a forked state
// never depends on an encoder's "current" state.
struct Encoding {
  Encoding() : position(cnn::NULL_RNN_POINTER) {}
  Encoding(cnn::RNNPointer position, const cnn::expr::Expression& output)
      : position(position), output(output) {}

  cnn::RNNPointer position;
  cnn::expr::Expression output;
};

// Embeddings and sequential encoders consumed by the transition system.
class Featurizer {
public:
  virtual ~Featurizer() {}

  virtual void new_graph(cnn::ComputationGraph* hg) = 0;

  virtual cnn::expr::Expression word_embedding(int word) = 0;
  virtual cnn::expr::Expression nonterminal_embedding(int label) = 0;
  virtual cnn::expr::Expression action_embedding(const Action& action) = 0;

  // vector standing in for an empty stack, buffer or history
  virtual cnn::expr::Expression guard(Sequence sequence) = 0;

  // begins a new sequence; encodings from an earlier start of the same
  // sequence are invalid afterwards, so a graph holds one initial state
  virtual Encoding start(Sequence sequence, const cnn::expr::Expression& guard) = 0;
  virtual Encoding extend(Sequence sequence, const Encoding& previous, const cnn::expr::Expression& input) = 0;

  // width of the concatenated stack, buffer and history encodings
  virtual unsigned representation_dim() const = 0;
};

struct ModelDimensions {
  unsigned layers = 2;
  unsigned input_dim = 32;
  unsigned lstm_input_dim = 60;
  unsigned hidden_dim = 64;
  unsigned action_dim = 16;
};

// stack, buffer and action LSTMs over learned word, nonterminal and action
// embeddings
class LSTMFeaturizer : public Featurizer {
public:
  LSTMFeaturizer(cnn::Model* model, const ModelDimensions& dims, unsigned vocab_size, unsigned nt_size);

  void new_graph(cnn::ComputationGraph* hg) override;

  cnn::expr::Expression word_embedding(int word) override;
  cnn::expr::Expression nonterminal_embedding(int label) override;
  cnn::expr::Expression action_embedding(const Action& action) override;
  cnn::expr::Expression guard(Sequence sequence) override;

  Encoding start(Sequence sequence, const cnn::expr::Expression& guard) override;
  Encoding extend(Sequence sequence, const Encoding& previous, const cnn::expr::Expression& input) override;

  unsigned representation_dim() const override { return 3 * hidden_dim; }

private:
  cnn::LSTMBuilder& builder(Sequence sequence);

  unsigned hidden_dim;

  cnn::LSTMBuilder stack_lstm;
  cnn::LSTMBuilder buffer_lstm;
  cnn::LSTMBuilder action_lstm;
  cnn::LookupParameters* p_w; // word embeddings
  cnn::LookupParameters* p_nt; // nonterminal embeddings
  cnn::LookupParameters* p_a; // action embeddings
  cnn::Parameters* p_w2l; // word to LSTM input
  cnn::Parameters* p_ib; // LSTM input bias
  cnn::Parameters* p_stack_guard;
  cnn::Parameters* p_buffer_guard;
  cnn::Parameters* p_action_start;

  cnn::ComputationGraph* hg;
  cnn::expr::Expression w2l, ib;
};

} // namespace rnng

#endif
