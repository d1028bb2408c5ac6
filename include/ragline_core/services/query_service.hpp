#pragma once

#include <memory>
#include <string>
#include <vector>

#include "ragline_core/db/interaction_store.hpp"
#include "ragline_core/grounding/grounding_evaluator.hpp"
#include "ragline_core/llm/language_model.hpp"
#include "ragline_core/types/interaction.hpp"
#include "ragline_core/vector/vector_index.hpp"

namespace ragline_core {

struct QueryOptions {
  static constexpr int DEFAULT_TOP_K = 5;

  int top_k = DEFAULT_TOP_K;
};

/**
 * @class QueryService
 * @brief Answers one question from one knowledge base, or refuses.
 *
 * Pipeline: embed the question, retrieve the nearest fragments of the
 * knowledge base, generate an answer from them, and keep the answer only if
 * the grounding evaluator accepts it. Every call that does not throw records
 * exactly one interaction whose id is the returned interaction_id.
 *
 * Language model failures (including timeouts) are not retried; they produce
 * an "error" result and an ERROR interaction. A VectorIndexError means the
 * index and the embedding model disagree on dimension and is rethrown.
 */
class QueryService {
 public:
  static constexpr const char *UNKNOWN_MESSAGE =
      "I don't have that information in the provided knowledge base.";

  QueryService(std::shared_ptr<LanguageModel> language_model,
               std::shared_ptr<VectorIndex> vector_index,
               std::shared_ptr<InteractionStore> interaction_store,
               QueryOptions options = {});

  QueryService(const QueryService &) = delete;
  QueryService &operator=(const QueryService &) = delete;

  QueryResult execute(const std::string &knowledge_base_id, const std::string &question);

  static std::string build_context(const std::vector<Fragment> &fragments);
  static std::string build_prompt(const std::string &question, const std::string &context);

  const QueryOptions &options() const {
    return options_;
  }

 private:
  QueryResult finish(Interaction interaction);
  QueryResult fail(Interaction interaction, const std::string &stage, const std::string &reason);

  static std::vector<Citation> build_citations(const std::vector<Fragment> &fragments,
                                               const GroundingDecision &decision);

  std::shared_ptr<LanguageModel> language_model_;
  std::shared_ptr<VectorIndex> vector_index_;
  std::shared_ptr<InteractionStore> interaction_store_;
  GroundingEvaluator grounding_evaluator_;
  QueryOptions options_;
};

}  // namespace ragline_core
