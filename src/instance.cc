#include <sstream>
#include "instance.h"

bool HasLabel(const Label& label) {
  return label.which() != 0;
}

bool IsTrue(const Label& label) {
  const bool* b = boost::get<bool>(&label);
  return b != nullptr && *b;
}

Label MakeLabel(const boost::optional<bool>& label) {
  if (label) {
    return Label(*label);
  }
  return Label();
}

string LabelToString(const Label& label) {
  stringstream ss;
  if (const bool* b = boost::get<bool>(&label)) {
    ss << (*b ? "true" : "false");
  }
  else if (const int* i = boost::get<int>(&label)) {
    ss << *i;
  }
  else {
    ss << "none";
  }
  return ss.str();
}

FormatError::FormatError(const string& what) : runtime_error(what) {}
LabelMismatchError::LabelMismatchError(const string& what) : runtime_error(what) {}
MalformedTreeError::MalformedTreeError(const string& what) : runtime_error(what) {}
InvariantViolation::InvariantViolation(const string& what) : runtime_error(what) {}

Instance::Instance(const Label& label, const InstanceIndex& index) : label_(label), index_(index) {}

Instance::~Instance() {}

const Label& Instance::label() const {
  return label_;
}

const InstanceIndex& Instance::index() const {
  return index_;
}
