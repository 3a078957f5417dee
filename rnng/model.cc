#include "rnng/model.h"

#include <fstream>
#include <iostream>

#include <boost/archive/binary_iarchive.hpp>
#include <boost/archive/text_iarchive.hpp>
#include <boost/filesystem.hpp>

#include "rnng/errors.h"

using namespace std;

namespace rnng {

template <class ScorerT>
ParserModel<ScorerT>::ParserModel(const ModelDimensions& dims, const Vocabulary& vocab) :
    featurizer(&model, dims, vocab.terminals.size(), vocab.nonterminals.size()),
    composer(&model, dims.layers, dims.lstm_input_dim),
    scorer(&model, featurizer.representation_dim(), dims.hidden_dim, vocab.nonterminals.size()) {}

template <>
ParserModel<GenerativeMLPScorer>::ParserModel(const ModelDimensions& dims, const Vocabulary& vocab) :
    featurizer(&model, dims, vocab.terminals.size(), vocab.nonterminals.size()),
    composer(&model, dims.layers, dims.lstm_input_dim),
    scorer(&model, featurizer.representation_dim(), dims.hidden_dim, vocab.nonterminals.size(),
           vocab.terminals.size()) {}

template <class ScorerT>
void ParserModel<ScorerT>::load(const string& path, bool text_format) {
  if (!boost::filesystem::exists(path))
    BOOST_THROW_EXCEPTION(Error("no model at " + path) << file_name_info(path));
  ifstream in(path.c_str());
  if (!in)
    BOOST_THROW_EXCEPTION(Error("could not open model " + path) << file_name_info(path));
  if (text_format) {
    boost::archive::text_iarchive ia(in);
    ia >> model;
  } else {
    boost::archive::binary_iarchive ia(in);
    ia >> model;
  }
  cerr << "Loaded model from " << path << endl;
}

template struct ParserModel<MLPScorer>;
template struct ParserModel<GenerativeMLPScorer>;

string model_path(const string& dir) {
  return (boost::filesystem::path(dir) / "model.bin").string();
}

} // namespace rnng
