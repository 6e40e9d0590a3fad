#define BOOST_TEST_MODULE TextInstanceTest
#include <boost/test/unit_test.hpp>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "data_indexer.h"
#include "indexed_instance.h"
#include "text_instance.h"

using namespace std;

static string InstanceToLine(const string& text, const boost::optional<bool>& label, const InstanceIndex& index) {
  stringstream ss;
  if (index) {
    ss << *index << "\t";
  }
  ss << text;
  if (label) {
    ss << "\t" << (*label ? "1" : "0");
  }
  return ss.str();
}

static unique_ptr<TextInstance> MakeOption(const string& text, bool label) {
  return unique_ptr<TextInstance>(new TrueFalseInstance(text, label));
}

// Indexes every word of the given instance, in order of appearance
static DataIndexer FitIndexer(const TextInstance& instance) {
  DataIndexer indexer;
  for (const string& word : instance.Words()) {
    indexer.AddWord(word);
  }
  indexer.Freeze();
  return indexer;
}

BOOST_AUTO_TEST_CASE(ReadFromLineHandlesOneColumn) {
  const string text = "this is a sentence";
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine(text);
  BOOST_CHECK_EQUAL(instance->text(), text);
  BOOST_CHECK(!HasLabel(instance->label()));
  BOOST_CHECK(!instance->index());
}

BOOST_AUTO_TEST_CASE(ReadFromLineHandlesThreeColumns) {
  const string text = "this is a sentence";
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine(InstanceToLine(text, true, 23u));
  BOOST_CHECK_EQUAL(instance->text(), text);
  BOOST_CHECK(instance->label() == Label(true));
  BOOST_CHECK(instance->index() == InstanceIndex(23u));
}

BOOST_AUTO_TEST_CASE(ReadFromLineHandlesTwoColumnsWithLabel) {
  const string text = "this is a sentence";
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine(InstanceToLine(text, false, boost::none));
  BOOST_CHECK_EQUAL(instance->text(), text);
  BOOST_CHECK(instance->label() == Label(false));
  BOOST_CHECK(!instance->index());
}

BOOST_AUTO_TEST_CASE(ReadFromLineHandlesTwoColumnsWithIndex) {
  const string text = "this is a sentence";
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine(InstanceToLine(text, boost::none, 23u));
  BOOST_CHECK_EQUAL(instance->text(), text);
  BOOST_CHECK(!HasLabel(instance->label()));
  BOOST_CHECK(instance->index() == InstanceIndex(23u));
}

BOOST_AUTO_TEST_CASE(ReadFromLineChecksIndexColumnFirst) {
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine("7\t1984");
  BOOST_CHECK_EQUAL(instance->text(), "1984");
  BOOST_CHECK(instance->index() == InstanceIndex(7u));
  BOOST_CHECK(!HasLabel(instance->label()));
}

BOOST_AUTO_TEST_CASE(ReadFromLineUsesDefaultLabel) {
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine("4\tplants need water", true);
  BOOST_CHECK(instance->label() == Label(true));

  instance = TrueFalseInstance::ReadFromLine("4\tplants need water\t0", false);
  BOOST_CHECK(instance->label() == Label(false));
}

BOOST_AUTO_TEST_CASE(ReadFromLineStripsCarriageReturn) {
  unique_ptr<TrueFalseInstance> instance = TrueFalseInstance::ReadFromLine("plants need water\t1\r");
  BOOST_CHECK_EQUAL(instance->text(), "plants need water");
  BOOST_CHECK(instance->label() == Label(true));
}

BOOST_AUTO_TEST_CASE(ReadFromLineRejectsMismatchedLabel) {
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("3\tplants need water\t1", false), LabelMismatchError);
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("plants need water\t0", true), LabelMismatchError);
}

BOOST_AUTO_TEST_CASE(ReadFromLineRejectsBadShapes) {
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("plants\tneed water"), FormatError);
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("1\tplants\t1\textra"), FormatError);
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("one\tplants need water\t1"), FormatError);
  BOOST_CHECK_THROW(TrueFalseInstance::ReadFromLine("99999999999999999999\tplants need water\t1"), FormatError);
}

BOOST_AUTO_TEST_CASE(FormatErrorNamesTheLine) {
  try {
    TrueFalseInstance::ReadFromLine("plants\tneed water");
    BOOST_FAIL("expected a FormatError");
  }
  catch (const FormatError& e) {
    BOOST_CHECK(string(e.what()).find("plants\tneed water") != string::npos);
  }
}

BOOST_AUTO_TEST_CASE(WordsTokenizesTheSentence) {
  vector<string> expected = {"this", "is", "a", "sentence", "."};
  vector<string> words = TrueFalseInstance("This is a sentence.", boost::none).Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());

  expected = {"this", "is", "n't", "a", "sentence", "."};
  words = TrueFalseInstance("This isn't a sentence.", boost::none).Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());

  expected = {"and", ",", "i", "have", "commas", "."};
  words = TrueFalseInstance("And, I have commas.", boost::none).Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(ToIndexedInstanceIndexesWords) {
  TrueFalseInstance instance("Plants need water", true, 5u);
  DataIndexer indexer;
  indexer.AddWord("plants");
  indexer.AddWord("water");
  indexer.Freeze();

  unique_ptr<IndexedInstance> indexed = instance.ToIndexedInstance(indexer);
  const IndexedTrueFalseInstance& tf = dynamic_cast<const IndexedTrueFalseInstance&>(*indexed);
  vector<WordId> expected = {2, DataIndexer::kUnknownIndex, 3};
  BOOST_CHECK_EQUAL_COLLECTIONS(tf.word_indices.begin(), tf.word_indices.end(), expected.begin(), expected.end());
  BOOST_CHECK(tf.label() == Label(true));
  BOOST_CHECK(tf.index() == InstanceIndex(5u));
}

BOOST_AUTO_TEST_CASE(LogicalFormTokensKeepPunctuation) {
  LogicalFormInstance instance("a(b(c), d(e, f))", boost::none);
  vector<string> expected = {"a", "(", "b", "(", "c", ")", ",", "d", "(", "e", ",", "f", ")", ")"};
  vector<string> tokens = instance.Tokens();
  BOOST_CHECK_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());

  expected = {"a", "b", "c", "d", "e", "f"};
  vector<string> words = instance.Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(LogicalFormToIndexedInstanceLinearizesTree) {
  LogicalFormInstance instance("a(b(c), d(e, f))", true, 2u);
  DataIndexer indexer = FitIndexer(instance);

  unique_ptr<IndexedInstance> indexed = instance.ToIndexedInstance(indexer);
  const IndexedLogicalFormInstance& lf = dynamic_cast<const IndexedLogicalFormInstance&>(*indexed);
  vector<WordId> expected_indices = {2, 3, 4, 5, 6, 7};
  vector<Transition> expected_transitions = {kShift, kShift, kShift, kReduce2, kShift, kShift, kShift, kReduce3, kReduce3};
  BOOST_CHECK_EQUAL_COLLECTIONS(lf.word_indices.begin(), lf.word_indices.end(), expected_indices.begin(), expected_indices.end());
  BOOST_CHECK_EQUAL_COLLECTIONS(lf.transitions.begin(), lf.transitions.end(), expected_transitions.begin(), expected_transitions.end());
  BOOST_CHECK(lf.label() == Label(true));
  BOOST_CHECK(lf.index() == InstanceIndex(2u));
}

BOOST_AUTO_TEST_CASE(MalformedLogicalFormsAreRejected) {
  DataIndexer indexer;
  indexer.Freeze();
  BOOST_CHECK_THROW(LogicalFormInstance("a(b))", boost::none).ToIndexedInstance(indexer), MalformedTreeError);
  BOOST_CHECK_THROW(LogicalFormInstance("a(b(c)", boost::none).ToIndexedInstance(indexer), MalformedTreeError);

  try {
    LogicalFormInstance("for(human, plant", boost::none).ToIndexedInstance(indexer);
    BOOST_FAIL("expected a MalformedTreeError");
  }
  catch (const MalformedTreeError& e) {
    BOOST_CHECK_EQUAL(string(e.what()), "Malformed binary semantic parse: for(human, plant");
  }
}

BOOST_AUTO_TEST_CASE(LogicalFormReadFromLine) {
  unique_ptr<LogicalFormInstance> instance = LogicalFormInstance::ReadFromLine("12\tfor(depend_on(human, plant), oxygen)\t1");
  BOOST_CHECK_EQUAL(instance->text(), "for(depend_on(human, plant), oxygen)");
  BOOST_CHECK(instance->label() == Label(true));
  BOOST_CHECK(instance->index() == InstanceIndex(12u));
  vector<string> expected = {"for", "depend_on", "human", "plant", "oxygen"};
  vector<string> words = instance->Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(BackgroundWordsFollowInstanceWords) {
  unique_ptr<TextInstance> inner(new TrueFalseInstance("Plants need water.", true, 3u));
  BackgroundInstance instance(move(inner), {"Water is WET.", "Plants aren't rocks"});
  vector<string> expected = {"plants", "need", "water", ".", "water", "is", "wet", ".", "plants", "are", "n't", "rocks"};
  vector<string> words = instance.Words();
  BOOST_CHECK_EQUAL_COLLECTIONS(words.begin(), words.end(), expected.begin(), expected.end());
  BOOST_CHECK(instance.label() == Label(true));
  BOOST_CHECK(instance.index() == InstanceIndex(3u));
  BOOST_CHECK(instance.tokenizer() == instance.instance().tokenizer());
}

BOOST_AUTO_TEST_CASE(BackgroundToIndexedInstance) {
  unique_ptr<TextInstance> inner(new TrueFalseInstance("a b", false));
  BackgroundInstance instance(move(inner), {"b c", "a"});
  DataIndexer indexer = FitIndexer(instance);

  unique_ptr<IndexedInstance> indexed = instance.ToIndexedInstance(indexer);
  const IndexedBackgroundInstance& background = dynamic_cast<const IndexedBackgroundInstance&>(*indexed);
  const IndexedTrueFalseInstance& tf = dynamic_cast<const IndexedTrueFalseInstance&>(background.instance());
  vector<WordId> expected = {2, 3};
  BOOST_CHECK_EQUAL_COLLECTIONS(tf.word_indices.begin(), tf.word_indices.end(), expected.begin(), expected.end());
  BOOST_REQUIRE_EQUAL(background.background_indices.size(), 2u);
  expected = {3, 4};
  BOOST_CHECK_EQUAL_COLLECTIONS(background.background_indices[0].begin(), background.background_indices[0].end(), expected.begin(), expected.end());
  expected = {2};
  BOOST_CHECK_EQUAL_COLLECTIONS(background.background_indices[1].begin(), background.background_indices[1].end(), expected.begin(), expected.end());
  BOOST_CHECK(background.label() == Label(false));
}

BOOST_AUTO_TEST_CASE(QuestionLabelIsPositionOfTrueOption) {
  vector<unique_ptr<TextInstance>> options;
  options.push_back(MakeOption("plants need rocks", false));
  options.push_back(MakeOption("plants need light", false));
  options.push_back(MakeOption("plants need water", true));
  QuestionInstance question(move(options));
  BOOST_CHECK(question.label() == Label(2));
  BOOST_CHECK(!question.index());
  BOOST_CHECK_EQUAL(question.NumOptions(), 3u);
  BOOST_CHECK(question.tokenizer() == question.GetOption(0).tokenizer());
  BOOST_CHECK_EQUAL(question.Words().size(), 9u);
}

BOOST_AUTO_TEST_CASE(QuestionNeedsExactlyOneTrueOption) {
  vector<unique_ptr<TextInstance>> none_true;
  none_true.push_back(MakeOption("a", false));
  none_true.push_back(MakeOption("b", false));
  BOOST_CHECK_THROW(QuestionInstance question(move(none_true)), InvariantViolation);

  vector<unique_ptr<TextInstance>> two_true;
  two_true.push_back(MakeOption("a", true));
  two_true.push_back(MakeOption("b", true));
  BOOST_CHECK_THROW(QuestionInstance question(move(two_true)), InvariantViolation);

  vector<unique_ptr<TextInstance>> unlabeled;
  unlabeled.push_back(unique_ptr<TextInstance>(new TrueFalseInstance("a", boost::none)));
  BOOST_CHECK_THROW(QuestionInstance question(move(unlabeled)), InvariantViolation);

  BOOST_CHECK_THROW(QuestionInstance question((vector<unique_ptr<TextInstance>>())), InvariantViolation);
}

BOOST_AUTO_TEST_CASE(QuestionToIndexedInstance) {
  vector<unique_ptr<TextInstance>> options;
  options.push_back(MakeOption("a b", true));
  options.push_back(MakeOption("c", false));
  QuestionInstance question(move(options));
  DataIndexer indexer = FitIndexer(question);

  unique_ptr<IndexedInstance> indexed = question.ToIndexedInstance(indexer);
  const IndexedQuestionInstance& iq = dynamic_cast<const IndexedQuestionInstance&>(*indexed);
  BOOST_CHECK(iq.label() == Label(0));
  BOOST_REQUIRE_EQUAL(iq.NumOptions(), 2u);
  const IndexedTrueFalseInstance& second = dynamic_cast<const IndexedTrueFalseInstance&>(iq.GetOption(1));
  BOOST_REQUIRE_EQUAL(second.word_indices.size(), 1u);
  BOOST_CHECK_EQUAL(second.word_indices[0], 4);
}

BOOST_AUTO_TEST_CASE(LogicalFormTokensIgnoreTokenizer) {
  LogicalFormInstance instance("depend_on(human, plant)", boost::none, boost::none, GetTokenizer("characters"));
  vector<string> expected = {"depend_on", "(", "human", ",", "plant", ")"};
  vector<string> tokens = instance.Tokens();
  BOOST_CHECK_EQUAL_COLLECTIONS(tokens.begin(), tokens.end(), expected.begin(), expected.end());
}
