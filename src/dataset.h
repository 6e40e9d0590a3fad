#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "data_indexer.h"
#include "indexed_instance.h"
#include "text_instance.h"

using namespace std;

class IndexedDataset;

class TextDataset {
public:
  TextDataset();
  explicit TextDataset(vector<unique_ptr<TextInstance>> instances);

  unsigned size() const;
  const TextInstance& GetInstance(unsigned i) const;
  void AddInstance(unique_ptr<TextInstance> instance);

  // Reads one instance per non-empty line (see TrueFalseInstance::ReadFromLine).
  // Returns false if the file can't be opened.
  bool ReadFromFile(const string& filename, const boost::optional<bool>& default_label = boost::none,
                    shared_ptr<const Tokenizer> tokenizer = DefaultTokenizer(), bool logical_forms = false);

  // Each line is [index]\t[sentence]\t[sentence]... Every instance with that
  // index is wrapped in a BackgroundInstance holding those sentences. Calling
  // it again appends to the background already attached.
  // Returns false if the file can't be opened.
  bool ReadBackgroundFromFile(const string& filename);

  // Groups each run of options_per_question consecutive instances into a
  // QuestionInstance.
  void GroupIntoQuestions(unsigned options_per_question);

  // How often each word occurs, in order of first occurrence
  vector<pair<string, unsigned>> WordCounts() const;

  IndexedDataset ToIndexedDataset(const DataIndexer& data_indexer) const;

private:
  vector<unique_ptr<TextInstance>> instances;
};

class IndexedDataset {
public:
  IndexedDataset();
  explicit IndexedDataset(vector<unique_ptr<IndexedInstance>> instances);

  unsigned size() const;
  const IndexedInstance& GetInstance(unsigned i) const;

  // The longest length of each dimension over all instances
  PaddingLengths GetPaddingLengths() const;
  // Pads every instance to GetPaddingLengths(), except that dimensions named
  // in max_lengths use the given length instead.
  void PadInstances(const PaddingLengths& max_lengths = PaddingLengths());

private:
  vector<unique_ptr<IndexedInstance>> instances;
};
