#pragma once
#include <vector>
#include <map>
#include <string>

using namespace std;

typedef int WordId;

unsigned int UTF8Len(unsigned char x);

vector<string> tokenize(string input, string delimiter, unsigned max_times);
vector<string> tokenize(string input, string delimiter);
vector<string> tokenize(string input, char delimiter);

string strip(const string& input);

string lowercase(const string& input);

// True iff input is non-empty and made up only of the digits 0-9
bool IsDecimal(const string& input);
unsigned ParseIndex(const string& input);

string JoinLengths(const map<string, unsigned>& lengths);
