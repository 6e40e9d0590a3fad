#include <cctype>
#include <map>
#include <stdexcept>
#include <boost/algorithm/string.hpp>
#include "tokenizer.h"
#include "utils.h"

Tokenizer::~Tokenizer() {}

WordTokenizer::WordTokenizer() {
  special_cases = {"mr.", "mrs.", "etc.", "e.g.", "cf.", "c.f.", "eg.", "al."};
  contractions = {"n't", "'s", "'ve", "'re", "'ll", "'d", "'m"};
  beginning_punctuation = {'"', '\'', '(', '[', '{', '#', '$'};
  ending_punctuation = {'"', '\'', '.', ',', ';', ')', ']', '}', ':', '!', '?', '%'};
}

bool WordTokenizer::CanSplit(const string& field) const {
  return field.length() > 0 && special_cases.count(lowercase(field)) == 0;
}

vector<string> WordTokenizer::Tokenize(const string& text) const {
  vector<string> fields;
  string trimmed = strip(text);
  if (trimmed.length() > 0) {
    boost::algorithm::split(fields, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
  }

  vector<string> tokens;
  for (string field : fields) {
    while (CanSplit(field) && beginning_punctuation.count(field[0]) > 0) {
      tokens.push_back(field.substr(0, 1));
      field = field.substr(1);
    }

    // Everything peeled off the end of the field, in reverse order
    vector<string> suffixes;
    while (CanSplit(field) && ending_punctuation.count(field[field.length() - 1]) > 0) {
      suffixes.push_back(field.substr(field.length() - 1));
      field = field.substr(0, field.length() - 1);
    }

    // Removing one contraction can expose another, so keep going until
    // nothing matches.
    bool removed = true;
    while (removed) {
      removed = false;
      for (const string& contraction : contractions) {
        if (CanSplit(field) && boost::algorithm::iends_with(field, contraction)) {
          suffixes.push_back(field.substr(field.length() - contraction.length()));
          field = field.substr(0, field.length() - contraction.length());
          removed = true;
        }
      }
    }

    if (field.length() > 0) {
      tokens.push_back(field);
    }
    tokens.insert(tokens.end(), suffixes.rbegin(), suffixes.rend());
  }
  return tokens;
}

vector<string> WhitespaceTokenizer::Tokenize(const string& text) const {
  vector<string> tokens;
  string trimmed = strip(text);
  if (trimmed.length() > 0) {
    boost::algorithm::split(tokens, trimmed, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
  }
  return tokens;
}

vector<string> CharacterTokenizer::Tokenize(const string& text) const {
  vector<string> tokens;
  for (unsigned i = 0; i < text.length(); ) {
    unsigned len = UTF8Len(text[i]);
    string c = text.substr(i, len);
    if (!(len == 1 && isspace(static_cast<unsigned char>(c[0])))) {
      tokens.push_back(c);
    }
    i += len;
  }
  return tokens;
}

shared_ptr<const Tokenizer> GetTokenizer(const string& name) {
  // Built on first use and shared by every instance afterwards
  static const map<string, shared_ptr<const Tokenizer>> tokenizers = {
    {"words", make_shared<WordTokenizer>()},
    {"whitespace", make_shared<WhitespaceTokenizer>()},
    {"characters", make_shared<CharacterTokenizer>()},
  };

  const string key = (name == "default") ? "words" : name;
  auto it = tokenizers.find(key);
  if (it == tokenizers.end()) {
    throw invalid_argument("Unknown tokenizer: " + name);
  }
  return it->second;
}

shared_ptr<const Tokenizer> DefaultTokenizer() {
  return GetTokenizer("default");
}
