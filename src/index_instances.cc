#include <iostream>
#include <boost/program_options.hpp>
#include "data_indexer.h"
#include "dataset.h"
#include "tokenizer.h"
#include "utils.h"

using namespace std;
namespace po = boost::program_options;

int main(int argc, char** argv) {
  cerr << "Invoked as:";
  for (int i = 0; i < argc; ++i) {
    cerr << " " << argv[i];
  }
  cerr << "\n";

  po::options_description desc("description");
  desc.add_options()
  ("help", "Display this help message")

  ("train", po::value<string>()->required(), "Instances to index, one per line")
  ("background", po::value<string>()->default_value(""), "Background sentences, one line per instance index: [index]\\t[sentence]\\t[sentence]...")
  ("default_label", po::value<string>()->default_value(""), "Label expected on every instance, \"1\" or \"0\". Lines without a label get this one")
  ("logical_forms", "Read instances as logical forms such as a(b(c), d(e, f)) instead of sentences")
  ("tokenizer,t", po::value<string>()->default_value("default"), "Tokenizer. One of \"words\" (default), \"whitespace\" or \"characters\"")
  ("num_options,n", po::value<unsigned>()->default_value(0), "Group every n consecutive instances into a multiple choice question. 0 disables grouping")
  ("min_count,m", po::value<unsigned>()->default_value(1), "Words seen fewer than m times are mapped to the unknown word")
  ("max_sentence_words", po::value<unsigned>(), "Pad and truncate sentences to this many words instead of the longest sentence's length")
  ("max_background_sentences", po::value<unsigned>(), "Pad and truncate background to this many sentences")
  ("dump", "Write every padded instance to stdout");

  po::positional_options_description positional_options;
  positional_options.add("train", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).positional(positional_options).run(), vm);
    if (vm.count("help")) {
      cerr << desc;
      return 1;
    }
    po::notify(vm);
  }
  catch (const po::error& e) {
    cerr << e.what() << endl;
    cerr << desc;
    return 1;
  }

  if (vm.count("logical_forms") && !vm["tokenizer"].defaulted()) {
    cerr << "--tokenizer has no effect with --logical_forms, which are split on parentheses, commas and whitespace." << endl;
    return 1;
  }

  boost::optional<bool> default_label;
  const string default_label_string = vm["default_label"].as<string>();
  if (default_label_string.length() > 0) {
    if (default_label_string != "0" && default_label_string != "1") {
      cerr << "Invalid default label \"" << default_label_string << "\". Use 1 or 0." << endl;
      return 1;
    }
    default_label = (default_label_string == "1");
  }

  try {
    shared_ptr<const Tokenizer> tokenizer = GetTokenizer(vm["tokenizer"].as<string>());

    TextDataset dataset;
    const string train_filename = vm["train"].as<string>();
    if (!dataset.ReadFromFile(train_filename, default_label, tokenizer, vm.count("logical_forms") > 0)) {
      cerr << "Unable to open " << train_filename << " for reading." << endl;
      return 1;
    }
    cerr << "Read " << dataset.size() << " instances from " << train_filename << endl;

    const string background_filename = vm["background"].as<string>();
    if (background_filename.length() > 0) {
      if (!dataset.ReadBackgroundFromFile(background_filename)) {
        cerr << "Unable to open " << background_filename << " for reading." << endl;
        return 1;
      }
      cerr << "Attached background from " << background_filename << endl;
    }

    const unsigned num_options = vm["num_options"].as<unsigned>();
    if (num_options > 0) {
      dataset.GroupIntoQuestions(num_options);
      cerr << "Grouped into " << dataset.size() << " questions of " << num_options << " options" << endl;
    }

    DataIndexer data_indexer;
    data_indexer.Fit(dataset, vm["min_count"].as<unsigned>());
    data_indexer.Freeze();
    cerr << "Vocabulary size: " << data_indexer.VocabSize() << endl;

    IndexedDataset indexed_dataset = dataset.ToIndexedDataset(data_indexer);
    cerr << "Padding lengths before padding: " << JoinLengths(indexed_dataset.GetPaddingLengths()) << endl;

    PaddingLengths max_lengths;
    if (vm.count("max_sentence_words")) {
      max_lengths["num_sentence_words"] = vm["max_sentence_words"].as<unsigned>();
    }
    if (vm.count("max_background_sentences")) {
      max_lengths["background_sentences"] = vm["max_background_sentences"].as<unsigned>();
    }
    indexed_dataset.PadInstances(max_lengths);
    cerr << "Padding lengths after padding: " << JoinLengths(indexed_dataset.GetPaddingLengths()) << endl;

    if (vm.count("dump")) {
      for (unsigned i = 0; i < indexed_dataset.size(); ++i) {
        cout << indexed_dataset.GetInstance(i) << "\n";
      }
    }
  }
  catch (const runtime_error& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }
  catch (const logic_error& e) {
    cerr << "Error: " << e.what() << endl;
    return 1;
  }

  return 0;
}
