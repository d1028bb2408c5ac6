#pragma once

#include <set>
#include <string>
#include <vector>

#include "ragline_core/types/fragment.hpp"
#include "ragline_core/types/interaction.hpp"

namespace ragline_core {

/**
 * @class GroundingEvaluator
 * @brief Decides whether a generated answer is lexically supported by retrieved fragments.
 *
 * The answer is split on whitespace, lower-cased, de-duplicated and stripped of
 * stop words. Each remaining word counts as supported when it occurs as a
 * substring anywhere in the lower-cased fragment text. Matching is plain
 * substring containment, so "an" is found inside "bananas".
 *
 * The evaluator holds no state; evaluate() may be called from any thread.
 */
class GroundingEvaluator {
 public:
  static constexpr double GROUNDING_THRESHOLD = 0.30;

  GroundingDecision evaluate(const std::string &question,
                             const std::string &answer,
                             const std::vector<Fragment> &fragments) const;

  // Lower-cased, de-duplicated answer words that are not stop words
  static std::set<std::string> meaningful_words(const std::string &answer);

  static bool is_stop_word(const std::string &word);
};

}  // namespace ragline_core
