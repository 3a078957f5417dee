#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>

#include "cnn/cnn.h"
#include "cnn/init.h"

#include "rnng/decoders.h"
#include "rnng/errors.h"
#include "rnng/eval.h"
#include "rnng/model.h"
#include "rnng/oracle.h"
#include "rnng/samples.h"
#include "rnng/utils.h"

using namespace std;
using namespace rnng;
namespace po = boost::program_options;

namespace {

const vector<string> kDecoders{"greedy", "sample", "beam", "generate", "score", "importance"};

void InitCommandLine(int argc, char** argv, po::variables_map* conf) {
  po::options_description opts("Configuration options");
  opts.add_options()
        ("training_data,T", po::value<string>(), "Training oracle, used to build the vocabulary")
        ("test_data,p", po::value<string>(), "Test oracle")
        ("bracketed_test_data", po::value<string>(), "Test trees, one bracketed tree per line")
        ("bracketed_has_tags", "Bracketed test trees carry POS preterminals")
        ("test_sentences", po::value<string>(), "Test sentences, one tokenized sentence per line")
        ("model_dir,m", po::value<string>(), "Directory holding the discriminative model")
        ("gen_model_dir", po::value<string>(), "Directory holding the generative model")
        ("text_format", "Models are text archives")
        ("decoder", po::value<string>()->default_value("greedy"), "greedy, sample, beam, generate, score or importance")
        ("beam_size,b", po::value<unsigned>()->default_value(10), "Beam size")
        ("samples,s", po::value<unsigned>()->default_value(1), "Samples per sentence when sampling or generating")
        ("alpha", po::value<float>()->default_value(0.8f), "Flattening exponent of the sampling distribution")
        ("num_samples", po::value<unsigned>()->default_value(GenerativeImportanceSamplingDecoder::kDefaultSamples),
         "Proposal samples per sentence for importance sampling")
        ("proposal_samples", po::value<string>(), "Read importance sampling proposals from this sample file")
        ("output_file,O", po::value<string>(), "Write trees, samples or scores here instead of stdout")
        ("output_tags", "Print POS preterminals in output trees")
        ("max_open_nts", po::value<unsigned>()->default_value(kMaxOpenNonterminals), "Maximum number of open nonterminals")
        ("layers", po::value<unsigned>()->default_value(2), "number of LSTM layers")
        ("action_dim", po::value<unsigned>()->default_value(16), "action embedding size")
        ("input_dim", po::value<unsigned>()->default_value(32), "input embedding size")
        ("hidden_dim", po::value<unsigned>()->default_value(64), "hidden dimension")
        ("lstm_input_dim", po::value<unsigned>()->default_value(60), "LSTM input dimension")
        ("block_count", po::value<unsigned>()->default_value(0), "divide the test set up into this many blocks and only decode one of them (indexed by block_num)")
        ("block_num", po::value<unsigned>()->default_value(0), "decode only this block (0-indexed), must be used with block_count")
        ("help,h", "Help");
  po::options_description dcmdline_options;
  dcmdline_options.add(opts);
  po::store(parse_command_line(argc, argv, dcmdline_options), *conf);
  po::notify(*conf);
  if (conf->count("help")) {
    cerr << dcmdline_options << endl;
    exit(1);
  }
  if (conf->count("training_data") == 0) {
    cerr << "Please specify --training_data (-T): this is required to determine the vocabulary mapping, even if the parser is used in prediction mode.\n";
    cerr << dcmdline_options << endl;
    exit(1);
  }
  unsigned sources = conf->count("test_data") + conf->count("bracketed_test_data") + conf->count("test_sentences");
  string decoder = (*conf)["decoder"].as<string>();
  if (find(kDecoders.begin(), kDecoders.end(), decoder) == kDecoders.end()) {
    cerr << "Unknown decoder " << decoder << endl << dcmdline_options << endl;
    exit(1);
  }
  for (const char* positive : {"max_open_nts", "num_samples", "beam_size", "samples"}) {
    if ((*conf)[positive].as<unsigned>() == 0) {
      cerr << "--" << positive << " must be positive\n";
      cerr << dcmdline_options << endl;
      exit(1);
    }
  }
  if (decoder != "generate" && sources != 1) {
    cerr << "Please specify exactly one of --test_data, --bracketed_test_data and --test_sentences\n";
    exit(1);
  }
  bool needs_disc = decoder == "greedy" || decoder == "sample" || decoder == "beam" ||
                    (decoder == "score" && !conf->count("gen_model_dir")) ||
                    (decoder == "importance" && !conf->count("proposal_samples"));
  bool needs_gen = decoder == "generate" || decoder == "importance";
  if (needs_disc && !conf->count("model_dir")) {
    cerr << "Decoder " << decoder << " needs --model_dir\n";
    exit(1);
  }
  if (needs_gen && !conf->count("gen_model_dir")) {
    cerr << "Decoder " << decoder << " needs --gen_model_dir\n";
    exit(1);
  }
}

ModelDimensions dimensions(const po::variables_map& conf) {
  ModelDimensions dims;
  dims.layers = conf["layers"].as<unsigned>();
  dims.input_dim = conf["input_dim"].as<unsigned>();
  dims.lstm_input_dim = conf["lstm_input_dim"].as<unsigned>();
  dims.hidden_dim = conf["hidden_dim"].as<unsigned>();
  dims.action_dim = conf["action_dim"].as<unsigned>();
  return dims;
}

void report_f1(const MatchCounts& counts) {
  Metrics metrics = counts.metrics();
  cerr << counts << endl;
  cerr << "precision: " << utils::to_string_precision(metrics.precision, 2)
       << " recall: " << utils::to_string_precision(metrics.recall, 2)
       << " F1score: " << utils::to_string_precision(metrics.f1, 2) << endl;
}

int run(int argc, char** argv) {
  cnn::Initialize(argc, argv);

  cerr << "COMMAND LINE:";
  for (unsigned i = 0; i < static_cast<unsigned>(argc); ++i) cerr << ' ' << argv[i];
  cerr << endl;

  po::variables_map conf;
  InitCommandLine(argc, argv, &conf);

  const string decoder_name = conf["decoder"].as<string>();
  const bool text_format = conf.count("text_format");
  const bool output_tags = conf.count("output_tags");
  const unsigned max_open_nts = conf["max_open_nts"].as<unsigned>();
  cerr << "max open nts: " << max_open_nts << endl;

  Vocabulary vocab;
  {
    Corpus training(&vocab);
    training.load_oracle(conf["training_data"].as<string>());
  }
  vocab.freeze();
  cerr << "    cumulative terminal vocab size: " << vocab.terminals.size() << endl;
  cerr << "    cumulative nonterminal vocab size: " << vocab.nonterminals.size() << endl;

  Corpus test(&vocab);
  if (conf.count("test_data"))
    test.load_oracle(conf["test_data"].as<string>());
  else if (conf.count("bracketed_test_data"))
    test.load_bracketed(conf["bracketed_test_data"].as<string>(), conf.count("bracketed_has_tags"));
  else if (conf.count("test_sentences"))
    test.load_sentences(conf["test_sentences"].as<string>());

  ModelDimensions dims = dimensions(conf);
  unique_ptr<DiscriminativeModel> disc;
  unique_ptr<GenerativeModel> gen;
  if (conf.count("model_dir")) {
    disc.reset(new DiscriminativeModel(dims, vocab));
    disc->load(model_path(conf["model_dir"].as<string>()), text_format);
  }
  if (conf.count("gen_model_dir")) {
    gen.reset(new GenerativeModel(dims, vocab));
    gen->load(model_path(conf["gen_model_dir"].as<string>()), text_format);
  }

  ofstream out_file;
  if (conf.count("output_file")) {
    out_file.open(conf["output_file"].as<string>().c_str());
    if (!out_file)
      BOOST_THROW_EXCEPTION(Error("could not write " + conf["output_file"].as<string>()));
  }
  ostream& out = conf.count("output_file") ? out_file : cout;

  if (decoder_name == "generate") {
    GenerativeSamplingDecoder generator(&vocab, &gen->featurizer, &gen->composer, &gen->scorer,
                                        conf["alpha"].as<float>(), max_open_nts);
    unsigned count = conf["samples"].as<unsigned>();
    for (unsigned i = 0; i < count; ++i) {
      cnn::ComputationGraph hg;
      Derivation derivation = generator.generate(&hg);
      out << derivation.log_prob << " ||| " << derivation.tree->linearize(output_tags) << endl;
    }
    return 0;
  }

  auto range = utils::block_range(test.size(), conf["block_count"].as<unsigned>(), conf["block_num"].as<unsigned>());
  cerr << "decoding sentences " << range.first << " to " << range.second << " of " << test.size() << endl;

  const bool evaluate = test.has_gold();
  MatchCounts match_counts;
  double llh = 0;
  double dwords = 0;
  unsigned skipped = 0;

  unique_ptr<GreedyDecoder> greedy;
  unique_ptr<SamplingDecoder> sampler;
  unique_ptr<BeamSearchDecoder> beam;
  unique_ptr<Decoder> scorer;
  unique_ptr<GenerativeImportanceSamplingDecoder> importance;
  ProposalSamples proposal_samples;

  if (decoder_name == "greedy") {
    greedy.reset(new GreedyDecoder(&vocab, &disc->featurizer, &disc->composer, &disc->scorer, max_open_nts));
  } else if (decoder_name == "sample") {
    sampler.reset(new SamplingDecoder(&vocab, &disc->featurizer, &disc->composer, &disc->scorer,
                                      conf["alpha"].as<float>(), max_open_nts));
  } else if (decoder_name == "beam") {
    beam.reset(new BeamSearchDecoder(&vocab, &disc->featurizer, &disc->composer, &disc->scorer,
                                     conf["beam_size"].as<unsigned>(), max_open_nts));
  } else if (decoder_name == "score") {
    if (!evaluate) {
      cerr << "Decoder score needs gold derivations: use --test_data or --bracketed_test_data\n";
      return 1;
    }
    if (gen)
      scorer.reset(new Decoder(&vocab, &gen->featurizer, &gen->composer, &gen->scorer, max_open_nts));
    else
      scorer.reset(new Decoder(&vocab, &disc->featurizer, &disc->composer, &disc->scorer, max_open_nts));
  } else if (decoder_name == "importance") {
    importance.reset(new GenerativeImportanceSamplingDecoder(&vocab, &gen->featurizer, &gen->composer,
                                                             &gen->scorer, conf["num_samples"].as<unsigned>(),
                                                             max_open_nts));
    if (conf.count("proposal_samples")) {
      proposal_samples.load(conf["proposal_samples"].as<string>());
      importance->set_proposal_samples(&proposal_samples);
    } else {
      sampler.reset(new SamplingDecoder(&vocab, &disc->featurizer, &disc->composer, &disc->scorer,
                                        conf["alpha"].as<float>(), max_open_nts));
      importance->set_proposal(sampler.get());
    }
  }

  for (unsigned sii = range.first; sii < range.second; ++sii) {
    const Sentence& sentence = test.sents[sii];
    cerr << "\rsentence " << sii;
    try {
      TreePtr predicted;
      if (greedy) {
        cnn::ComputationGraph hg;
        predicted = greedy->decode(&hg, sentence).tree;
      } else if (beam) {
        cnn::ComputationGraph hg;
        vector<Derivation> beams = beam->decode(&hg, sentence);
        if (beams.empty())
          BOOST_THROW_EXCEPTION(Error("beam search finished no parse for sentence " + to_string(sii)));
        predicted = beams.front().tree;
      } else if (sampler && !importance) {
        for (const Derivation& derivation : sampler->sample(sentence, conf["samples"].as<unsigned>()))
          write_sample(out, sii, derivation.sample_log_prob, *derivation.tree);
      } else if (scorer) {
        vector<Action> actions = test.actions[sii];
        if (gen)
          actions = to_generative(sentence, actions, sii);
        cnn::ComputationGraph hg;
        double lp = scorer->score(&hg, sentence, actions, sii);
        out << sentence.size() << '\t' << lp << endl;
        llh += lp;
        dwords += sentence.size();
      } else if (importance) {
        vector<ScoredSample> samples = importance->scored_samples(sentence, sii);
        double lp = GenerativeImportanceSamplingDecoder::log_probability_estimate(samples);
        llh += lp;
        dwords += sentence.size();
        predicted = GenerativeImportanceSamplingDecoder::map_estimate(samples).tree;
        cerr << "\rsentence " << sii << " log p(x)=" << lp << " perplexity=" << exp(-lp / sentence.size()) << endl;
      }
      if (predicted) {
        out << predicted->linearize(output_tags) << endl;
        if (evaluate)
          match_counts += predicted->compare(*test.trees[sii]);
      }
    } catch (MalformedOracleError& e) {
      cerr << "\nSkipping sentence " << sii << ": " << e.what() << endl;
      ++skipped;
    }
  }
  cerr << endl;

  if (skipped)
    cerr << "skipped " << skipped << " sentences" << endl;
  if (evaluate && (greedy || beam || importance))
    report_f1(match_counts);
  if (dwords > 0) {
    cerr << "test     total -llh=" << utils::to_string_precision(-llh, 4) << endl;
    cerr << "test ppl (per word)=" << utils::to_string_precision(exp(-llh / dwords), 4) << endl;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  try {
    return run(argc, argv);
  } catch (const boost::exception& e) {
    cerr << boost::diagnostic_information(e) << endl;
    return 1;
  } catch (const std::exception& e) {
    cerr << "error: " << e.what() << endl;
    return 1;
  }
}
