#include <stack>
#include "shift_reduce.h"

bool LinearizeLogicalForm(const vector<string>& tokens, vector<string>& elements, vector<Transition>& transitions) {
  elements.clear();
  transitions.clear();

  // Open parens and the commas following them which have not been closed yet
  stack<string> last_symbols;
  bool is_malformed = false;
  for (const string& token : tokens) {
    if (token == "," || token == "(") {
      last_symbols.push(token);
    }
    else if (token == ")") {
      if (last_symbols.empty()) {
        // A closing paren without an opening paren
        is_malformed = true;
        break;
      }
      string last_symbol = last_symbols.top();
      last_symbols.pop();
      if (last_symbol == "(") {
        transitions.push_back(kReduce2);
      }
      else {
        // The last symbol was a comma. Pop the open paren before it as well.
        if (last_symbols.empty()) {
          is_malformed = true;
          break;
        }
        last_symbols.pop();
        transitions.push_back(kReduce3);
      }
    }
    else {
      // A predicate or an argument
      transitions.push_back(kShift);
      elements.push_back(token);
    }
  }

  return !is_malformed && last_symbols.empty();
}

string TransitionName(Transition transition) {
  switch (transition) {
    case kShift: return "S";
    case kReduce2: return "R2";
    case kReduce3: return "R3";
    default: return "-";
  }
}

ostream& operator<< (ostream& stream, Transition transition) {
  return stream << TransitionName(transition);
}
