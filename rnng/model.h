#ifndef RNNG_MODEL_H_
#define RNNG_MODEL_H_

#include <string>

#include "cnn/model.h"

#include "rnng/composer.h"
#include "rnng/featurizer.h"
#include "rnng/oracle.h"
#include "rnng/scorer.h"

namespace rnng {

// A parameter collection with the components that own parameters in it.
// Components register their parameters in declaration order, so an archive
// only loads into a model built with the same dimensions and vocabulary.
template <class ScorerT>
struct ParserModel {
  ParserModel(const ModelDimensions& dims, const Vocabulary& vocab);

  void load(const std::string& path, bool text_format);

  cnn::Model model;
  LSTMFeaturizer featurizer;
  BiLSTMComposer composer;
  ScorerT scorer;
};

// the generative scorer also needs the vocabulary size
template <>
ParserModel<GenerativeMLPScorer>::ParserModel(const ModelDimensions& dims, const Vocabulary& vocab);

typedef ParserModel<MLPScorer> DiscriminativeModel;
typedef ParserModel<GenerativeMLPScorer> GenerativeModel;

// the archive inside a model directory
std::string model_path(const std::string& dir);

} // namespace rnng

#endif
