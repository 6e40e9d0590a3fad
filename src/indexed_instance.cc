#include <algorithm>
#include <cassert>
#include <sstream>
#include "data_indexer.h"
#include "indexed_instance.h"

void MaxPaddingLengths(PaddingLengths& lengths, const PaddingLengths& other) {
  for (const auto& kvp : other) {
    unsigned& length = lengths[kvp.first];
    length = max(length, kvp.second);
  }
}

template <class T>
static void WriteSequence(ostream& stream, const vector<T>& sequence) {
  stream << "[";
  for (unsigned i = 0; i < sequence.size(); ++i) {
    stream << (i == 0 ? "" : " ") << sequence[i];
  }
  stream << "]";
}

static void WriteLabelAndIndex(ostream& stream, const Label& label, const InstanceIndex& index) {
  stream << "label=" << LabelToString(label);
  if (index) {
    stream << ", index=" << *index;
  }
}

IndexedInstance::IndexedInstance(const Label& label, const InstanceIndex& index) : label_(label), index_(index) {}

IndexedInstance::~IndexedInstance() {}

const Label& IndexedInstance::label() const {
  return label_;
}

const InstanceIndex& IndexedInstance::index() const {
  return index_;
}

ostream& operator<< (ostream& stream, const IndexedInstance& instance) {
  return stream << instance.ToString();
}

IndexedTrueFalseInstance::IndexedTrueFalseInstance(const vector<WordId>& word_indices, const Label& label, const InstanceIndex& index) :
  IndexedInstance(label, index), word_indices(word_indices) {}

PaddingLengths IndexedTrueFalseInstance::GetPaddingLengths() const {
  PaddingLengths lengths;
  lengths["num_sentence_words"] = word_indices.size();
  return lengths;
}

void IndexedTrueFalseInstance::Pad(const PaddingLengths& lengths) {
  auto it = lengths.find("num_sentence_words");
  if (it != lengths.end()) {
    PadSequenceToLength(word_indices, it->second, DataIndexer::kPaddingIndex);
  }
}

unique_ptr<IndexedInstance> IndexedTrueFalseInstance::Empty() const {
  return unique_ptr<IndexedInstance>(new IndexedTrueFalseInstance(vector<WordId>(), Label()));
}

string IndexedTrueFalseInstance::ToString() const {
  stringstream ss;
  ss << "IndexedTrueFalseInstance(";
  WriteSequence(ss, word_indices);
  ss << ", ";
  WriteLabelAndIndex(ss, label_, index_);
  ss << ")";
  return ss.str();
}

IndexedLogicalFormInstance::IndexedLogicalFormInstance(const vector<WordId>& word_indices, const vector<Transition>& transitions, const Label& label, const InstanceIndex& index) :
  IndexedTrueFalseInstance(word_indices, label, index), transitions(transitions) {}

PaddingLengths IndexedLogicalFormInstance::GetPaddingLengths() const {
  PaddingLengths lengths = IndexedTrueFalseInstance::GetPaddingLengths();
  lengths["num_transitions"] = transitions.size();
  return lengths;
}

void IndexedLogicalFormInstance::Pad(const PaddingLengths& lengths) {
  IndexedTrueFalseInstance::Pad(lengths);
  auto it = lengths.find("num_transitions");
  if (it != lengths.end()) {
    PadSequenceToLength(transitions, it->second, kNoTransition);
  }
}

unique_ptr<IndexedInstance> IndexedLogicalFormInstance::Empty() const {
  return unique_ptr<IndexedInstance>(new IndexedLogicalFormInstance(vector<WordId>(), vector<Transition>(), Label()));
}

string IndexedLogicalFormInstance::ToString() const {
  stringstream ss;
  ss << "IndexedLogicalFormInstance(";
  WriteSequence(ss, word_indices);
  ss << ", ";
  WriteSequence(ss, transitions);
  ss << ", ";
  WriteLabelAndIndex(ss, label_, index_);
  ss << ")";
  return ss.str();
}

IndexedBackgroundInstance::IndexedBackgroundInstance(unique_ptr<IndexedInstance> indexed_instance, const vector<vector<WordId>>& background_indices) :
  IndexedInstance(indexed_instance->label(), indexed_instance->index()),
  background_indices(background_indices), indexed_instance_(move(indexed_instance)) {}

PaddingLengths IndexedBackgroundInstance::GetPaddingLengths() const {
  PaddingLengths lengths = indexed_instance_->GetPaddingLengths();
  unsigned& num_sentence_words = lengths["num_sentence_words"];
  for (const vector<WordId>& sentence : background_indices) {
    num_sentence_words = max(num_sentence_words, (unsigned)sentence.size());
  }
  lengths["background_sentences"] = background_indices.size();
  return lengths;
}

void IndexedBackgroundInstance::Pad(const PaddingLengths& lengths) {
  indexed_instance_->Pad(lengths);

  auto it = lengths.find("background_sentences");
  if (it != lengths.end()) {
    PadSequenceToLength(background_indices, it->second, vector<WordId>());
  }

  it = lengths.find("num_sentence_words");
  if (it != lengths.end()) {
    for (vector<WordId>& sentence : background_indices) {
      PadSequenceToLength(sentence, it->second, DataIndexer::kPaddingIndex);
    }
  }
}

unique_ptr<IndexedInstance> IndexedBackgroundInstance::Empty() const {
  return unique_ptr<IndexedInstance>(new IndexedBackgroundInstance(indexed_instance_->Empty(), vector<vector<WordId>>()));
}

string IndexedBackgroundInstance::ToString() const {
  stringstream ss;
  ss << "IndexedBackgroundInstance(" << indexed_instance_->ToString() << ", [";
  for (unsigned i = 0; i < background_indices.size(); ++i) {
    ss << (i == 0 ? "" : " ");
    WriteSequence(ss, background_indices[i]);
  }
  ss << "])";
  return ss.str();
}

const IndexedInstance& IndexedBackgroundInstance::instance() const {
  return *indexed_instance_;
}

IndexedQuestionInstance::IndexedQuestionInstance(vector<unique_ptr<IndexedInstance>> options, int label) :
  IndexedInstance(Label(label), boost::none), options_(move(options)) {
  assert (label >= 0 && (unsigned)label < options_.size());
}

PaddingLengths IndexedQuestionInstance::GetPaddingLengths() const {
  PaddingLengths lengths;
  for (const unique_ptr<IndexedInstance>& option : options_) {
    MaxPaddingLengths(lengths, option->GetPaddingLengths());
  }
  lengths["num_options"] = options_.size();
  return lengths;
}

void IndexedQuestionInstance::Pad(const PaddingLengths& lengths) {
  auto it = lengths.find("num_options");
  if (it != lengths.end()) {
    const unsigned num_options = it->second;
    const int label = boost::get<int>(label_);
    if ((unsigned)label >= num_options) {
      stringstream ss;
      ss << "Cannot truncate a question to " << num_options << " options, its answer is option " << label;
      throw invalid_argument(ss.str());
    }

    if (options_.size() > num_options) {
      options_.erase(options_.begin() + num_options, options_.end());
    }
    // Fillers take the shape of the option with the most dimensions, so a
    // question mixing sentences and logical forms still pads transitions.
    if (options_.size() < num_options) {
      unsigned widest = 0;
      for (unsigned i = 1; i < options_.size(); ++i) {
        if (options_[i]->GetPaddingLengths().size() > options_[widest]->GetPaddingLengths().size()) {
          widest = i;
        }
      }
      while (options_.size() < num_options) {
        options_.push_back(options_[widest]->Empty());
      }
    }
  }

  for (unique_ptr<IndexedInstance>& option : options_) {
    option->Pad(lengths);
  }
}

unique_ptr<IndexedInstance> IndexedQuestionInstance::Empty() const {
  vector<unique_ptr<IndexedInstance>> empty_options;
  for (const unique_ptr<IndexedInstance>& option : options_) {
    empty_options.push_back(option->Empty());
  }
  return unique_ptr<IndexedInstance>(new IndexedQuestionInstance(move(empty_options), 0));
}

string IndexedQuestionInstance::ToString() const {
  stringstream ss;
  ss << "IndexedQuestionInstance([";
  for (unsigned i = 0; i < options_.size(); ++i) {
    ss << (i == 0 ? "" : ", ") << options_[i]->ToString();
  }
  ss << "], label=" << LabelToString(label_) << ")";
  return ss.str();
}

unsigned IndexedQuestionInstance::NumOptions() const {
  return options_.size();
}

const IndexedInstance& IndexedQuestionInstance::GetOption(unsigned i) const {
  assert (i < options_.size());
  return *options_[i];
}
