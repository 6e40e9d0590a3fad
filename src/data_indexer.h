#pragma once
#include <string>
#include "dynet/dict.h"
#include "utils.h"

using namespace std;
using namespace dynet;

class TextDataset;

// Maps words to indices and back. Index 0 is reserved for padding and index 1
// for words that were never added, so every lookup on a frozen indexer
// succeeds.
class DataIndexer {
public:
  static const string kPaddingToken;
  static const string kUnknownToken;
  static const WordId kPaddingIndex = 0;
  static const WordId kUnknownIndex = 1;

  DataIndexer();

  WordId AddWord(const string& word);
  // Adds every word that occurs at least min_count times in the dataset
  void Fit(const TextDataset& dataset, unsigned min_count = 1);
  void Freeze();
  bool IsFrozen() const;

  // Only valid once the indexer is frozen
  WordId GetWordIndex(const string& word) const;
  const string& GetWord(WordId index) const;
  unsigned VocabSize() const;

private:
  // dynet's Dict does not const-qualify its lookups
  mutable Dict vocab;
  bool frozen;
};
