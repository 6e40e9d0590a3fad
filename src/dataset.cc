#include <cassert>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>
#include <boost/lexical_cast.hpp>
#include "dataset.h"
#include "utils.h"

TextDataset::TextDataset() {}

TextDataset::TextDataset(vector<unique_ptr<TextInstance>> instances) : instances(move(instances)) {}

unsigned TextDataset::size() const {
  return instances.size();
}

const TextInstance& TextDataset::GetInstance(unsigned i) const {
  assert (i < instances.size());
  return *instances[i];
}

void TextDataset::AddInstance(unique_ptr<TextInstance> instance) {
  instances.push_back(move(instance));
}

bool TextDataset::ReadFromFile(const string& filename, const boost::optional<bool>& default_label, shared_ptr<const Tokenizer> tokenizer, bool logical_forms) {
  ifstream f(filename);
  if (!f.is_open()) {
    return false;
  }

  for (string line; getline(f, line);) {
    if (strip(line).length() == 0) {
      continue;
    }
    if (logical_forms) {
      instances.push_back(LogicalFormInstance::ReadFromLine(line, default_label, tokenizer));
    }
    else {
      instances.push_back(TrueFalseInstance::ReadFromLine(line, default_label, tokenizer));
    }
  }
  return true;
}

bool TextDataset::ReadBackgroundFromFile(const string& filename) {
  ifstream f(filename);
  if (!f.is_open()) {
    return false;
  }

  unordered_map<unsigned, vector<string>> background;
  for (string line; getline(f, line);) {
    if (strip(line).length() == 0) {
      continue;
    }
    vector<string> fields = tokenize(strip(line), '\t');
    if (!IsDecimal(fields[0])) {
      throw FormatError("Background line does not start with an instance index: " + line);
    }
    unsigned index;
    try {
      index = ParseIndex(fields[0]);
    }
    catch (const boost::bad_lexical_cast&) {
      throw FormatError("Background instance index is out of range: " + line);
    }
    vector<string>& sentences = background[index];
    sentences.insert(sentences.end(), fields.begin() + 1, fields.end());
  }

  for (unique_ptr<TextInstance>& instance : instances) {
    if (!instance->index()) {
      continue;
    }
    auto it = background.find(*instance->index());
    if (it == background.end()) {
      continue;
    }
    if (BackgroundInstance* existing = dynamic_cast<BackgroundInstance*>(instance.get())) {
      existing->AddBackground(it->second);
    }
    else {
      unique_ptr<TextInstance> wrapped(new BackgroundInstance(move(instance), it->second));
      instance = move(wrapped);
    }
  }
  return true;
}

void TextDataset::GroupIntoQuestions(unsigned options_per_question) {
  if (options_per_question == 0 || instances.size() % options_per_question != 0) {
    stringstream ss;
    ss << "Cannot group " << instances.size() << " instances into questions of " << options_per_question << " options";
    throw FormatError(ss.str());
  }

  // Check every group before taking any instance apart, so a failure leaves
  // the dataset as it was.
  for (unsigned i = 0; i < instances.size(); i += options_per_question) {
    unsigned num_true = 0;
    for (unsigned j = i; j < i + options_per_question; ++j) {
      if (IsTrue(instances[j]->label())) {
        num_true++;
      }
    }
    if (num_true != 1) {
      stringstream ss;
      ss << "A question needs exactly one option labeled true, got " << num_true << " of " << options_per_question
         << " in instances " << i << " to " << i + options_per_question - 1;
      throw InvariantViolation(ss.str());
    }
  }

  vector<unique_ptr<TextInstance>> questions;
  for (unsigned i = 0; i < instances.size(); i += options_per_question) {
    vector<unique_ptr<TextInstance>> options;
    for (unsigned j = i; j < i + options_per_question; ++j) {
      options.push_back(move(instances[j]));
    }
    questions.push_back(unique_ptr<TextInstance>(new QuestionInstance(move(options))));
  }
  instances = move(questions);
}

vector<pair<string, unsigned>> TextDataset::WordCounts() const {
  vector<pair<string, unsigned>> counts;
  unordered_map<string, unsigned> positions;
  for (const unique_ptr<TextInstance>& instance : instances) {
    for (const string& word : instance->Words()) {
      auto it = positions.find(word);
      if (it == positions.end()) {
        positions[word] = counts.size();
        counts.push_back(make_pair(word, 1));
      }
      else {
        counts[it->second].second++;
      }
    }
  }
  return counts;
}

IndexedDataset TextDataset::ToIndexedDataset(const DataIndexer& data_indexer) const {
  vector<unique_ptr<IndexedInstance>> indexed_instances;
  for (const unique_ptr<TextInstance>& instance : instances) {
    indexed_instances.push_back(instance->ToIndexedInstance(data_indexer));
  }
  return IndexedDataset(move(indexed_instances));
}

IndexedDataset::IndexedDataset() {}

IndexedDataset::IndexedDataset(vector<unique_ptr<IndexedInstance>> instances) : instances(move(instances)) {}

unsigned IndexedDataset::size() const {
  return instances.size();
}

const IndexedInstance& IndexedDataset::GetInstance(unsigned i) const {
  assert (i < instances.size());
  return *instances[i];
}

PaddingLengths IndexedDataset::GetPaddingLengths() const {
  PaddingLengths lengths;
  for (const unique_ptr<IndexedInstance>& instance : instances) {
    MaxPaddingLengths(lengths, instance->GetPaddingLengths());
  }
  return lengths;
}

void IndexedDataset::PadInstances(const PaddingLengths& max_lengths) {
  PaddingLengths lengths = GetPaddingLengths();
  for (const auto& kvp : max_lengths) {
    lengths[kvp.first] = kvp.second;
  }

  for (unique_ptr<IndexedInstance>& instance : instances) {
    instance->Pad(lengths);
  }
}
