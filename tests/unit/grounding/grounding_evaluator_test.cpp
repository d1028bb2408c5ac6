#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "ragline_core/grounding/grounding_evaluator.hpp"

namespace ragline_core {

class GroundingEvaluatorTest : public ::testing::Test {
 protected:
  Fragment make_fragment(const std::string &id, const std::string &content) {
    Fragment fragment;
    fragment.id = id;
    fragment.knowledge_base_id = "kb";
    fragment.content = content;
    return fragment;
  }

  GroundingEvaluator evaluator_;
};

TEST_F(GroundingEvaluatorTest, Evaluate_NoFragments_IsNotGrounded) {
  auto decision = evaluator_.evaluate("q", "Paris is the capital", {});

  EXPECT_FALSE(decision.is_grounded);
  EXPECT_DOUBLE_EQ(decision.confidence, 0.0);
  EXPECT_EQ(decision.reasoning, "No chunks retrieved");
  EXPECT_TRUE(decision.supporting_fragment_ids.empty());
}

TEST_F(GroundingEvaluatorTest, Evaluate_OnlyStopWords_IsNotGrounded) {
  std::vector<Fragment> fragments = {make_fragment("f1", "it is what it is")};

  auto decision = evaluator_.evaluate("q", "It is what it is", fragments);

  EXPECT_FALSE(decision.is_grounded);
  EXPECT_DOUBLE_EQ(decision.confidence, 0.0);
  EXPECT_EQ(decision.reasoning, "No meaningful content in answer");
}

TEST_F(GroundingEvaluatorTest, Evaluate_EmptyAnswer_IsNotGrounded) {
  std::vector<Fragment> fragments = {make_fragment("f1", "some text")};

  auto decision = evaluator_.evaluate("q", "", fragments);

  EXPECT_FALSE(decision.is_grounded);
  EXPECT_EQ(decision.reasoning, "No meaningful content in answer");
}

TEST_F(GroundingEvaluatorTest, Evaluate_AllWordsSupported_IsGroundedWithFullConfidence) {
  // Arrange
  std::vector<Fragment> fragments = {make_fragment("f1", "Paris is the capital of France."),
                                     make_fragment("f2", "Bananas grow in tropical climates.")};

  // Act
  auto decision = evaluator_.evaluate("What is the capital?", "Paris is the capital", fragments);

  // Assert
  EXPECT_TRUE(decision.is_grounded);
  EXPECT_DOUBLE_EQ(decision.confidence, 1.0);
  EXPECT_EQ(decision.reasoning, "Found 2/2 meaningful words in retrieved chunks");
  EXPECT_EQ(decision.supporting_fragment_ids, std::set<std::string>{"f1"});
}

TEST_F(GroundingEvaluatorTest, Evaluate_BelowThreshold_IsNotGrounded) {
  std::vector<Fragment> fragments = {make_fragment("f1", "paris is the capital")};

  // 1 of 4 meaningful words is supported
  auto decision = evaluator_.evaluate("q", "paris quantum gluons neutrinos", fragments);

  EXPECT_FALSE(decision.is_grounded);
  EXPECT_DOUBLE_EQ(decision.confidence, 0.25);
  EXPECT_EQ(decision.reasoning, "Found 1/4 meaningful words in retrieved chunks");
}

TEST_F(GroundingEvaluatorTest, Evaluate_ExactlyAtThreshold_IsGrounded) {
  std::vector<Fragment> fragments = {make_fragment("f1", "red green blue")};

  // 3 of 10 meaningful words are supported
  auto decision = evaluator_.evaluate(
      "q", "red green blue qa qb qc qd qe qf qg", fragments);

  EXPECT_DOUBLE_EQ(decision.confidence, 0.3);
  EXPECT_TRUE(decision.is_grounded);
}

TEST_F(GroundingEvaluatorTest, Evaluate_MatchesSubstringsCaseInsensitively) {
  std::vector<Fragment> fragments = {make_fragment("f1", "Houseplants need LIGHT")};

  // "ant" occurs inside "houseplants"; "light" differs only in case
  auto decision = evaluator_.evaluate("q", "ANT light", fragments);

  EXPECT_TRUE(decision.is_grounded);
  EXPECT_DOUBLE_EQ(decision.confidence, 1.0);
}

TEST_F(GroundingEvaluatorTest, Evaluate_PunctuationStaysAttachedToWords) {
  std::vector<Fragment> fragments = {make_fragment("f1", "the city is paris")};

  // "paris." is not a substring of the fragment text
  auto decision = evaluator_.evaluate("q", "Paris.", fragments);

  EXPECT_FALSE(decision.is_grounded);
  EXPECT_EQ(decision.reasoning, "Found 0/1 meaningful words in retrieved chunks");
}

TEST_F(GroundingEvaluatorTest, Evaluate_WordsMayBeSpreadAcrossFragments) {
  std::vector<Fragment> fragments = {make_fragment("f1", "alpha only"),
                                     make_fragment("f2", "beta only"),
                                     make_fragment("f3", "nothing relevant")};

  auto decision = evaluator_.evaluate("q", "alpha beta", fragments);

  EXPECT_TRUE(decision.is_grounded);
  EXPECT_EQ(decision.supporting_fragment_ids, (std::set<std::string>{"f1", "f2"}));
}

TEST_F(GroundingEvaluatorTest, Evaluate_IsDeterministic) {
  std::vector<Fragment> fragments = {make_fragment("f1", "alpha beta gamma")};

  auto first = evaluator_.evaluate("q", "alpha delta", fragments);
  auto second = evaluator_.evaluate("q", "alpha delta", fragments);

  EXPECT_EQ(first, second);
}

TEST_F(GroundingEvaluatorTest, MeaningfulWords_LowercasesDeduplicatesAndDropsStopWords) {
  auto words = GroundingEvaluator::meaningful_words("The Cat and the cat SAT on a mat");

  EXPECT_EQ(words, (std::set<std::string>{"cat", "sat", "mat"}));
}

TEST_F(GroundingEvaluatorTest, IsStopWord_KnownWords) {
  EXPECT_TRUE(GroundingEvaluator::is_stop_word("the"));
  EXPECT_TRUE(GroundingEvaluator::is_stop_word("because"));
  EXPECT_FALSE(GroundingEvaluator::is_stop_word("capital"));
}

}  // namespace ragline_core
