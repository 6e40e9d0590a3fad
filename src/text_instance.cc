#include <cassert>
#include <cctype>
#include <sstream>
#include <boost/lexical_cast.hpp>
#include "shift_reduce.h"
#include "text_instance.h"
#include "utils.h"

TextInstance::TextInstance(const Label& label, const InstanceIndex& index, shared_ptr<const Tokenizer> tokenizer) :
  Instance(label, index), tokenizer_(tokenizer) {}

shared_ptr<const Tokenizer> TextInstance::tokenizer() const {
  return tokenizer_;
}

vector<string> TextInstance::Tokenize(const string& sentence) const {
  if (tokenizer_ == nullptr) {
    throw logic_error("Instance has no tokenizer: \"" + sentence + "\"");
  }
  return tokenizer_->Tokenize(sentence);
}

vector<WordId> TextInstance::IndexWords(const vector<string>& words, const DataIndexer& data_indexer) const {
  vector<WordId> indices;
  indices.reserve(words.size());
  for (const string& word : words) {
    indices.push_back(data_indexer.GetWordIndex(word));
  }
  return indices;
}

TrueFalseInstance::TrueFalseInstance(const string& text, const boost::optional<bool>& label, const InstanceIndex& index, shared_ptr<const Tokenizer> tokenizer) :
  TextInstance(MakeLabel(label), index, tokenizer), text_(text) {}

const string& TrueFalseInstance::text() const {
  return text_;
}

vector<string> TrueFalseInstance::Words() const {
  return Tokenize(lowercase(text_));
}

unique_ptr<IndexedInstance> TrueFalseInstance::ToIndexedInstance(const DataIndexer& data_indexer) const {
  vector<WordId> indices = IndexWords(Words(), data_indexer);
  return unique_ptr<IndexedInstance>(new IndexedTrueFalseInstance(indices, label_, index_));
}

static void CheckLabel(const boost::optional<bool>& label, const boost::optional<bool>& default_label, const string& line) {
  if (label && default_label && *label != *default_label) {
    stringstream ss;
    ss << "Label " << *label << " read from line does not match default label " << *default_label << ": " << line;
    throw LabelMismatchError(ss.str());
  }
}

static InstanceIndex ReadIndex(const string& field, const string& line) {
  if (!IsDecimal(field)) {
    throw FormatError("Instance index is not a number: " + line);
  }
  try {
    return ParseIndex(field);
  }
  catch (const boost::bad_lexical_cast&) {
    throw FormatError("Instance index is out of range: " + line);
  }
}

// The fields of a line in one of the TrueFalseInstance formats
struct LineRecord {
  string text;
  boost::optional<bool> label;
  InstanceIndex index;
};

static LineRecord ParseLine(const string& raw_line, const boost::optional<bool>& default_label) {
  string line = raw_line;
  while (line.length() > 0 && (line[line.length() - 1] == '\r' || line[line.length() - 1] == '\n')) {
    line.erase(line.length() - 1);
  }

  vector<string> fields = tokenize(line, '\t');
  LineRecord record;
  if (fields.size() == 3) {
    record.index = ReadIndex(fields[0], line);
    record.text = fields[1];
    record.label = (fields[2] == "1");
    CheckLabel(record.label, default_label, line);
  }
  else if (fields.size() == 2) {
    if (IsDecimal(fields[0])) {
      record.index = ReadIndex(fields[0], line);
      record.text = fields[1];
      record.label = default_label;
    }
    else if (IsDecimal(fields[1])) {
      record.text = fields[0];
      record.label = (fields[1] == "1");
      CheckLabel(record.label, default_label, line);
    }
    else {
      throw FormatError("Unrecognized line format: " + line);
    }
  }
  else if (fields.size() == 1) {
    record.text = fields[0];
    record.label = default_label;
  }
  else {
    throw FormatError("Unrecognized line format: " + line);
  }
  return record;
}

unique_ptr<TrueFalseInstance> TrueFalseInstance::ReadFromLine(const string& line, const boost::optional<bool>& default_label, shared_ptr<const Tokenizer> tokenizer) {
  LineRecord record = ParseLine(line, default_label);
  return unique_ptr<TrueFalseInstance>(new TrueFalseInstance(record.text, record.label, record.index, tokenizer));
}

LogicalFormInstance::LogicalFormInstance(const string& text, const boost::optional<bool>& label, const InstanceIndex& index, shared_ptr<const Tokenizer> tokenizer) :
  TrueFalseInstance(text, label, index, tokenizer) {}

static bool IsStructural(const string& token) {
  return token == "(" || token == ")" || token == ",";
}

vector<string> LogicalFormInstance::Words() const {
  vector<string> words;
  for (const string& token : Tokens()) {
    if (!IsStructural(token)) {
      words.push_back(token);
    }
  }
  return words;
}

vector<string> LogicalFormInstance::Tokens() const {
  vector<string> tokens;
  string atom;
  for (char c : lowercase(text_)) {
    if (c == '(' || c == ')' || c == ',' || isspace(static_cast<unsigned char>(c))) {
      if (atom.length() > 0) {
        tokens.push_back(atom);
        atom.clear();
      }
      if (!isspace(static_cast<unsigned char>(c))) {
        tokens.push_back(string(1, c));
      }
    }
    else {
      atom += c;
    }
  }
  if (atom.length() > 0) {
    tokens.push_back(atom);
  }
  return tokens;
}

unique_ptr<IndexedInstance> LogicalFormInstance::ToIndexedInstance(const DataIndexer& data_indexer) const {
  vector<string> elements;
  vector<Transition> transitions;
  if (!LinearizeLogicalForm(Tokens(), elements, transitions)) {
    throw MalformedTreeError("Malformed binary semantic parse: " + text_);
  }
  vector<WordId> indices = IndexWords(elements, data_indexer);
  return unique_ptr<IndexedInstance>(new IndexedLogicalFormInstance(indices, transitions, label_, index_));
}

unique_ptr<LogicalFormInstance> LogicalFormInstance::ReadFromLine(const string& line, const boost::optional<bool>& default_label, shared_ptr<const Tokenizer> tokenizer) {
  LineRecord record = ParseLine(line, default_label);
  return unique_ptr<LogicalFormInstance>(new LogicalFormInstance(record.text, record.label, record.index, tokenizer));
}

BackgroundInstance::BackgroundInstance(unique_ptr<TextInstance> instance, const vector<string>& background) :
  TextInstance(instance->label(), instance->index(), instance->tokenizer()),
  instance_(move(instance)), background_(background) {}

const TextInstance& BackgroundInstance::instance() const {
  return *instance_;
}

const vector<string>& BackgroundInstance::background() const {
  return background_;
}

void BackgroundInstance::AddBackground(const vector<string>& sentences) {
  background_.insert(background_.end(), sentences.begin(), sentences.end());
}

vector<string> BackgroundInstance::Words() const {
  vector<string> words = instance_->Words();
  for (const string& sentence : background_) {
    vector<string> sentence_words = Tokenize(lowercase(sentence));
    words.insert(words.end(), sentence_words.begin(), sentence_words.end());
  }
  return words;
}

unique_ptr<IndexedInstance> BackgroundInstance::ToIndexedInstance(const DataIndexer& data_indexer) const {
  unique_ptr<IndexedInstance> indexed_instance = instance_->ToIndexedInstance(data_indexer);
  vector<vector<WordId>> background_indices;
  for (const string& sentence : background_) {
    background_indices.push_back(IndexWords(Tokenize(lowercase(sentence)), data_indexer));
  }
  return unique_ptr<IndexedInstance>(new IndexedBackgroundInstance(move(indexed_instance), background_indices));
}

QuestionInstance::QuestionInstance(vector<unique_ptr<TextInstance>> options) :
  TextInstance(Label(FindCorrectOption(options)), boost::none, FirstTokenizer(options)),
  options_(move(options)) {}

shared_ptr<const Tokenizer> QuestionInstance::FirstTokenizer(const vector<unique_ptr<TextInstance>>& options) {
  return options.empty() ? shared_ptr<const Tokenizer>() : options[0]->tokenizer();
}

int QuestionInstance::FindCorrectOption(const vector<unique_ptr<TextInstance>>& options) {
  vector<unsigned> positive;
  for (unsigned i = 0; i < options.size(); ++i) {
    if (IsTrue(options[i]->label())) {
      positive.push_back(i);
    }
  }
  if (positive.size() != 1) {
    stringstream ss;
    ss << "A question needs exactly one option labeled true, got " << positive.size() << " of " << options.size();
    throw InvariantViolation(ss.str());
  }
  return positive[0];
}

unsigned QuestionInstance::NumOptions() const {
  return options_.size();
}

const TextInstance& QuestionInstance::GetOption(unsigned i) const {
  assert (i < options_.size());
  return *options_[i];
}

vector<string> QuestionInstance::Words() const {
  vector<string> words;
  for (const unique_ptr<TextInstance>& option : options_) {
    vector<string> option_words = option->Words();
    words.insert(words.end(), option_words.begin(), option_words.end());
  }
  return words;
}

unique_ptr<IndexedInstance> QuestionInstance::ToIndexedInstance(const DataIndexer& data_indexer) const {
  vector<unique_ptr<IndexedInstance>> indexed_options;
  for (const unique_ptr<TextInstance>& option : options_) {
    indexed_options.push_back(option->ToIndexedInstance(data_indexer));
  }
  return unique_ptr<IndexedInstance>(new IndexedQuestionInstance(move(indexed_options), boost::get<int>(label_)));
}
