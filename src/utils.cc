#include <iostream>
#include <sstream>
#include <vector>
#include <map>
#include <cassert>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "utils.h"

using namespace std;

// given the first character of a UTF8 block, find out how wide it is
// see http://en.wikipedia.org/wiki/UTF-8 for more info
unsigned int UTF8Len(unsigned char x) {
  if (x < 0x80) return 1;
  else if ((x >> 5) == 0x06) return 2;
  else if ((x >> 4) == 0x0e) return 3;
  else if ((x >> 3) == 0x1e) return 4;
  else if ((x >> 2) == 0x3e) return 5;
  else if ((x >> 1) == 0x7e) return 6;
  // Stray continuation byte. Treat it as its own character.
  else return 1;
}

vector<string> tokenize(string input, string delimiter, unsigned max_times) {
  vector<string> tokens;
  size_t last = 0;
  size_t next = 0;
  while ((next = input.find(delimiter, last)) != string::npos && tokens.size() < max_times) {
    tokens.push_back(input.substr(last, next-last));
    last = next + delimiter.length();
  }
  tokens.push_back(input.substr(last));
  return tokens;
}

vector<string> tokenize(string input, string delimiter) {
  return tokenize(input, delimiter, input.length());
}

vector<string> tokenize(string input, char delimiter) {
  return tokenize(input, string(1, delimiter));
}

string strip(const string& input) {
  string output = input;
  boost::algorithm::trim(output);
  return output;
}

string lowercase(const string& input) {
  return boost::algorithm::to_lower_copy(input);
}

bool IsDecimal(const string& input) {
  return !input.empty() && boost::algorithm::all(input, boost::algorithm::is_digit());
}

unsigned ParseIndex(const string& input) {
  assert (IsDecimal(input));
  return boost::lexical_cast<unsigned>(input);
}

string JoinLengths(const map<string, unsigned>& lengths) {
  stringstream ss;
  ss << "{";
  for (auto it = lengths.begin(); it != lengths.end(); ++it) {
    if (it != lengths.begin()) {
      ss << ", ";
    }
    ss << it->first << ": " << it->second;
  }
  ss << "}";
  return ss.str();
}
