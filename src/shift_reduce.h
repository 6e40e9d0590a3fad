#pragma once
#include <ostream>
#include <string>
#include <vector>

using namespace std;

// Operations of a stack-based tree encoder. SHIFT pushes the next element,
// REDUCE2 and REDUCE3 combine the top two or three stack entries.
// 0 is left free so that transition sequences can be padded.
enum Transition {
  kNoTransition = 0,
  kShift = 1,
  kReduce2 = 2,
  kReduce3 = 3
};

// Splits the tokens of a logical form such as "a ( b ( c ) , d ( e , f ) )"
// into its predicates and arguments (elements) and the transitions that build
// the tree back up from them:
//   elements:    a b c d e f
//   transitions: S S S R2 S S S R3 R3
// Returns false if the parentheses and commas do not balance.
bool LinearizeLogicalForm(const vector<string>& tokens, vector<string>& elements, vector<Transition>& transitions);

string TransitionName(Transition transition);
ostream& operator<< (ostream& stream, Transition transition);
