#include <cassert>
#include <stdexcept>
#include "data_indexer.h"
#include "dataset.h"

const string DataIndexer::kPaddingToken = "@@PADDING@@";
const string DataIndexer::kUnknownToken = "@@UNKNOWN@@";
const WordId DataIndexer::kPaddingIndex;
const WordId DataIndexer::kUnknownIndex;

DataIndexer::DataIndexer() : frozen(false) {
  WordId padding = vocab.convert(kPaddingToken);
  WordId unknown = vocab.convert(kUnknownToken);
  assert (padding == kPaddingIndex);
  assert (unknown == kUnknownIndex);
}

WordId DataIndexer::AddWord(const string& word) {
  if (frozen) {
    throw logic_error("Cannot add \"" + word + "\" to a frozen DataIndexer");
  }
  return vocab.convert(word);
}

void DataIndexer::Fit(const TextDataset& dataset, unsigned min_count) {
  for (const pair<string, unsigned>& word_count : dataset.WordCounts()) {
    if (word_count.second >= min_count) {
      AddWord(word_count.first);
    }
  }
}

void DataIndexer::Freeze() {
  if (!frozen) {
    vocab.freeze();
    vocab.set_unk(kUnknownToken);
    frozen = true;
  }
}

bool DataIndexer::IsFrozen() const {
  return frozen;
}

WordId DataIndexer::GetWordIndex(const string& word) const {
  if (!frozen) {
    throw logic_error("DataIndexer must be frozen before words are indexed");
  }
  return vocab.convert(word);
}

const string& DataIndexer::GetWord(WordId index) const {
  if (index < 0 || (unsigned)index >= vocab.size()) {
    throw out_of_range("Word index out of range: " + to_string(index));
  }
  return vocab.convert(index);
}

unsigned DataIndexer::VocabSize() const {
  return vocab.size();
}
