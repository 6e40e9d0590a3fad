#pragma once
#include <map>
#include <memory>
#include <ostream>
#include <string>
#include <vector>
#include "instance.h"
#include "shift_reduce.h"
#include "utils.h"

using namespace std;

// Maps a padded dimension (e.g. "num_sentence_words") to its length
typedef map<string, unsigned> PaddingLengths;

// Brings sequence to exactly length entries. Short sequences get padding
// added on the left; long ones lose their leftmost entries, so the end of the
// sequence is always kept.
template <class T>
void PadSequenceToLength(vector<T>& sequence, unsigned length, const T& padding) {
  if (sequence.size() < length) {
    sequence.insert(sequence.begin(), length - sequence.size(), padding);
  }
  else if (sequence.size() > length) {
    sequence.erase(sequence.begin(), sequence.begin() + (sequence.size() - length));
  }
}

// Raises every entry of lengths to at least the matching entry of other
void MaxPaddingLengths(PaddingLengths& lengths, const PaddingLengths& other);

class IndexedInstance {
public:
  IndexedInstance(const Label& label, const InstanceIndex& index);
  virtual ~IndexedInstance();

  const Label& label() const;
  const InstanceIndex& index() const;

  // The length each padded dimension of this instance has before padding
  virtual PaddingLengths GetPaddingLengths() const = 0;
  // Pads or truncates every dimension named in lengths. Dimensions lengths
  // doesn't mention are left alone.
  virtual void Pad(const PaddingLengths& lengths) = 0;
  // An instance of the same kind with no content, used as filler
  virtual unique_ptr<IndexedInstance> Empty() const = 0;
  virtual string ToString() const = 0;

protected:
  Label label_;
  InstanceIndex index_;
};

ostream& operator<< (ostream& stream, const IndexedInstance& instance);

class IndexedTrueFalseInstance : public IndexedInstance {
public:
  IndexedTrueFalseInstance(const vector<WordId>& word_indices, const Label& label, const InstanceIndex& index = boost::none);

  PaddingLengths GetPaddingLengths() const;
  void Pad(const PaddingLengths& lengths);
  unique_ptr<IndexedInstance> Empty() const;
  string ToString() const;

  vector<WordId> word_indices;
};

class IndexedLogicalFormInstance : public IndexedTrueFalseInstance {
public:
  IndexedLogicalFormInstance(const vector<WordId>& word_indices, const vector<Transition>& transitions, const Label& label, const InstanceIndex& index = boost::none);

  PaddingLengths GetPaddingLengths() const;
  void Pad(const PaddingLengths& lengths);
  unique_ptr<IndexedInstance> Empty() const;
  string ToString() const;

  vector<Transition> transitions;
};

class IndexedBackgroundInstance : public IndexedInstance {
public:
  IndexedBackgroundInstance(unique_ptr<IndexedInstance> indexed_instance, const vector<vector<WordId>>& background_indices);

  PaddingLengths GetPaddingLengths() const;
  void Pad(const PaddingLengths& lengths);
  unique_ptr<IndexedInstance> Empty() const;
  string ToString() const;

  const IndexedInstance& instance() const;

  vector<vector<WordId>> background_indices;
private:
  unique_ptr<IndexedInstance> indexed_instance_;
};

// Options are padded and truncated on the right, since the label points at
// one of them. Added options are empty copies of the option with the most
// padding dimensions.
class IndexedQuestionInstance : public IndexedInstance {
public:
  IndexedQuestionInstance(vector<unique_ptr<IndexedInstance>> options, int label);

  PaddingLengths GetPaddingLengths() const;
  void Pad(const PaddingLengths& lengths);
  unique_ptr<IndexedInstance> Empty() const;
  string ToString() const;

  unsigned NumOptions() const;
  const IndexedInstance& GetOption(unsigned i) const;
private:
  vector<unique_ptr<IndexedInstance>> options_;
};
