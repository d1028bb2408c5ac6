#include "ragline_core/grounding/grounding_evaluator.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace ragline_core {

namespace {

const std::unordered_set<std::string> &stop_words() {
  static const std::unordered_set<std::string> words = {
      // articles
      "a", "an", "the",
      // pronouns and determiners
      "i", "me", "my", "we", "our", "you", "your", "he", "him", "his", "she", "her", "it", "its",
      "they", "them", "their", "this", "that", "these", "those", "what", "which", "who", "whom",
      // auxiliary verbs
      "is", "are", "was", "were", "be", "been", "being", "am", "have", "has", "had", "do", "does",
      "did", "will", "would", "shall", "should", "can", "could", "may", "might", "must",
      // conjunctions
      "and", "or", "but", "nor", "so", "yet", "if", "then", "than", "because", "as",
      // prepositions
      "in", "on", "at", "to", "of", "for", "with", "by", "from", "about", "into", "over", "up",
      "out",
      // negation
      "not", "no"};
  return words;
}

std::string to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool contains_any(const std::string &haystack, const std::set<std::string> &needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
  });
}

}  // namespace

bool GroundingEvaluator::is_stop_word(const std::string &word) {
  return stop_words().count(word) > 0;
}

std::set<std::string> GroundingEvaluator::meaningful_words(const std::string &answer) {
  std::set<std::string> words;
  std::istringstream stream(to_lower(answer));
  std::string word;
  while (stream >> word) {
    if (!is_stop_word(word)) {
      words.insert(word);
    }
  }
  return words;
}

GroundingDecision GroundingEvaluator::evaluate(const std::string & /*question*/,
                                               const std::string &answer,
                                               const std::vector<Fragment> &fragments) const {
  GroundingDecision decision;

  if (fragments.empty()) {
    decision.reasoning = "No chunks retrieved";
    return decision;
  }

  std::vector<std::string> lowered_fragments;
  lowered_fragments.reserve(fragments.size());
  std::string corpus;
  for (const auto &fragment : fragments) {
    lowered_fragments.push_back(to_lower(fragment.content));
    if (!corpus.empty()) {
      corpus += ' ';
    }
    corpus += lowered_fragments.back();
  }

  const std::set<std::string> meaningful = meaningful_words(answer);
  if (meaningful.empty()) {
    decision.reasoning = "No meaningful content in answer";
    return decision;
  }

  size_t overlap_count = 0;
  for (const auto &word : meaningful) {
    if (corpus.find(word) != std::string::npos) {
      overlap_count++;
    }
  }

  decision.confidence = static_cast<double>(overlap_count) / static_cast<double>(meaningful.size());
  decision.is_grounded = decision.confidence >= GROUNDING_THRESHOLD;

  for (size_t i = 0; i < fragments.size(); ++i) {
    if (contains_any(lowered_fragments[i], meaningful)) {
      decision.supporting_fragment_ids.insert(fragments[i].id);
    }
  }

  decision.reasoning = "Found " + std::to_string(overlap_count) + "/" +
                       std::to_string(meaningful.size()) +
                       " meaningful words in retrieved chunks";
  return decision;
}

}  // namespace ragline_core
