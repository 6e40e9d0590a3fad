#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace std;

class Tokenizer {
public:
  virtual ~Tokenizer();
  virtual vector<string> Tokenize(const string& text) const = 0;
};

// Splits on whitespace, then separates punctuation and English contractions
// from the ends of each field: "isn't." -> "is" "n't" "."
class WordTokenizer : public Tokenizer {
public:
  WordTokenizer();
  vector<string> Tokenize(const string& text) const;
private:
  bool CanSplit(const string& field) const;

  set<string> special_cases;
  vector<string> contractions;
  set<char> beginning_punctuation;
  set<char> ending_punctuation;
};

class WhitespaceTokenizer : public Tokenizer {
public:
  vector<string> Tokenize(const string& text) const;
};

// One token per UTF-8 character. Whitespace is dropped.
class CharacterTokenizer : public Tokenizer {
public:
  vector<string> Tokenize(const string& text) const;
};

// Process-wide shared tokenizers. Valid names are "default", "words",
// "whitespace" and "characters".
shared_ptr<const Tokenizer> GetTokenizer(const string& name);
shared_ptr<const Tokenizer> DefaultTokenizer();
