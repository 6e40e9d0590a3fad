#pragma once
#include <memory>
#include <string>
#include <vector>
#include "data_indexer.h"
#include "indexed_instance.h"
#include "instance.h"
#include "tokenizer.h"

using namespace std;

// An instance whose content is text. words() lists every word in it, which is
// what the DataIndexer is fit on; ToIndexedInstance() then turns the text
// into indices.
class TextInstance : public Instance {
public:
  TextInstance(const Label& label, const InstanceIndex& index, shared_ptr<const Tokenizer> tokenizer);

  shared_ptr<const Tokenizer> tokenizer() const;

  virtual vector<string> Words() const = 0;
  // The indexer must already be frozen
  virtual unique_ptr<IndexedInstance> ToIndexedInstance(const DataIndexer& data_indexer) const = 0;

protected:
  vector<string> Tokenize(const string& sentence) const;
  vector<WordId> IndexWords(const vector<string>& words, const DataIndexer& data_indexer) const;

  shared_ptr<const Tokenizer> tokenizer_;
};

class TrueFalseInstance : public TextInstance {
public:
  TrueFalseInstance(const string& text, const boost::optional<bool>& label, const InstanceIndex& index = boost::none, shared_ptr<const Tokenizer> tokenizer = DefaultTokenizer());

  const string& text() const;
  vector<string> Words() const;
  unique_ptr<IndexedInstance> ToIndexedInstance(const DataIndexer& data_indexer) const;

  // Reads one of
  //   [text]
  //   [index]\t[text]
  //   [text]\t[label]
  //   [index]\t[text]\t[label]
  // where label is "1" or "0". For the first two, the label is default_label.
  // For the last two, default_label (if given) has to agree with the label in
  // the line. If you passed a default label you expect every line to have it,
  // so a disagreement means some parameter is wrong somewhere else.
  static unique_ptr<TrueFalseInstance> ReadFromLine(const string& line, const boost::optional<bool>& default_label = boost::none, shared_ptr<const Tokenizer> tokenizer = DefaultTokenizer());

protected:
  string text_;
};

// A tree-structured logical form such as "for(depend_on(human, plant), oxygen)",
// for use with tree encoders.
class LogicalFormInstance : public TrueFalseInstance {
public:
  LogicalFormInstance(const string& text, const boost::optional<bool>& label, const InstanceIndex& index = boost::none, shared_ptr<const Tokenizer> tokenizer = DefaultTokenizer());

  // Predicates and arguments, with commas and parentheses removed
  vector<string> Words() const;
  // Predicates, arguments, commas and parentheses. Atoms are split on those
  // three symbols and whitespace; the instance's tokenizer is not used.
  vector<string> Tokens() const;
  // Throws MalformedTreeError if the parentheses and commas don't balance
  unique_ptr<IndexedInstance> ToIndexedInstance(const DataIndexer& data_indexer) const;

  static unique_ptr<LogicalFormInstance> ReadFromLine(const string& line, const boost::optional<bool>& default_label = boost::none, shared_ptr<const Tokenizer> tokenizer = DefaultTokenizer());
};

// An instance together with background sentences related to it. The label,
// index and tokenizer are those of the wrapped instance.
class BackgroundInstance : public TextInstance {
public:
  BackgroundInstance(unique_ptr<TextInstance> instance, const vector<string>& background);

  const TextInstance& instance() const;
  const vector<string>& background() const;
  // Appends more sentences while a dataset is being assembled
  void AddBackground(const vector<string>& sentences);
  vector<string> Words() const;
  unique_ptr<IndexedInstance> ToIndexedInstance(const DataIndexer& data_indexer) const;

private:
  unique_ptr<TextInstance> instance_;
  vector<string> background_;
};

// A group of answer options of which exactly one is labeled true. The label of
// the question is the position of that option.
class QuestionInstance : public TextInstance {
public:
  // Throws InvariantViolation unless exactly one option is labeled true
  explicit QuestionInstance(vector<unique_ptr<TextInstance>> options);

  unsigned NumOptions() const;
  const TextInstance& GetOption(unsigned i) const;
  vector<string> Words() const;
  unique_ptr<IndexedInstance> ToIndexedInstance(const DataIndexer& data_indexer) const;

private:
  static int FindCorrectOption(const vector<unique_ptr<TextInstance>>& options);
  static shared_ptr<const Tokenizer> FirstTokenizer(const vector<unique_ptr<TextInstance>>& options);

  vector<unique_ptr<TextInstance>> options_;
};
