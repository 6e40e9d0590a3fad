#pragma once
#include <stdexcept>
#include <string>
#include <boost/blank.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>

using namespace std;

// A label is either missing, a truth value, or the index of a class (for
// example the correct answer among several options).
typedef boost::variant<boost::blank, bool, int> Label;
typedef boost::optional<unsigned> InstanceIndex;

bool HasLabel(const Label& label);
bool IsTrue(const Label& label);
Label MakeLabel(const boost::optional<bool>& label);
string LabelToString(const Label& label);

// A record whose shape doesn't match any of the accepted line formats
class FormatError : public runtime_error {
public:
  explicit FormatError(const string& what);
};

// A label read from the data disagrees with the label the caller expected
class LabelMismatchError : public runtime_error {
public:
  explicit LabelMismatchError(const string& what);
};

// Unbalanced parentheses or commas in a logical form
class MalformedTreeError : public runtime_error {
public:
  explicit MalformedTreeError(const string& what);
};

// A grouping of instances breaks a structural requirement, e.g. a question
// without exactly one correct option
class InvariantViolation : public runtime_error {
public:
  explicit InvariantViolation(const string& what);
};

class Instance {
public:
  Instance(const Label& label, const InstanceIndex& index);
  virtual ~Instance();

  const Label& label() const;
  const InstanceIndex& index() const;

protected:
  Label label_;
  InstanceIndex index_;
};
