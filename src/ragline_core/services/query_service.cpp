#include "ragline_core/services/query_service.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

#include "ragline_core/utils/id_generator.hpp"

namespace ragline_core {

QueryService::QueryService(std::shared_ptr<LanguageModel> language_model,
                           std::shared_ptr<VectorIndex> vector_index,
                           std::shared_ptr<InteractionStore> interaction_store,
                           QueryOptions options)
    : language_model_(std::move(language_model)),
      vector_index_(std::move(vector_index)),
      interaction_store_(std::move(interaction_store)),
      options_(options) {
  if (!language_model_ || !vector_index_ || !interaction_store_) {
    throw std::invalid_argument("QueryService requires a language model, vector index and store");
  }
  if (options_.top_k <= 0) {
    throw std::invalid_argument("top_k must be positive, got " + std::to_string(options_.top_k));
  }
}

std::string QueryService::build_context(const std::vector<Fragment> &fragments) {
  std::ostringstream oss;
  for (size_t i = 0; i < fragments.size(); ++i) {
    oss << "[Chunk " << fragments[i].id << "]: " << fragments[i].content;
    if (i + 1 < fragments.size()) {
      oss << "\n\n";
    }
  }
  return oss.str();
}

std::string QueryService::build_prompt(const std::string &question, const std::string &context) {
  return "Answer the following question based ONLY on the provided context. "
         "If the context doesn't contain the answer, say so.\n\n"
         "Context:\n" +
         context + "\n\nQuestion: " + question;
}

std::vector<Citation> QueryService::build_citations(const std::vector<Fragment> &fragments,
                                                    const GroundingDecision &decision) {
  std::vector<Citation> citations;
  for (const auto &fragment : fragments) {
    if (decision.supporting_fragment_ids.count(fragment.id) == 0) {
      continue;
    }
    Citation citation;
    citation.source_document = fragment.source_document();
    citation.page = fragment.page();
    citation.fragment_id = fragment.id;
    citation.relevance_score = 0.0;
    citations.push_back(std::move(citation));
  }
  return citations;
}

QueryResult QueryService::finish(Interaction interaction) {
  interaction_store_->save(interaction);

  QueryResult result;
  result.status = interaction.status;
  result.answer = std::move(interaction.answer);
  result.citations = std::move(interaction.citations);
  result.interaction_id = std::move(interaction.id);
  return result;
}

QueryResult QueryService::fail(Interaction interaction,
                               const std::string &stage,
                               const std::string &reason) {
  std::cerr << "[QueryService] " << stage << " failed for interaction " << interaction.id << ": "
            << reason << std::endl;

  interaction.status = InteractionStatus::ERROR;
  interaction.answer.reset();
  interaction.citations.clear();
  try {
    interaction_store_->save(interaction);
  } catch (const InteractionStoreError &e) {
    std::cerr << "[QueryService] Could not record failed interaction " << interaction.id << ": "
              << e.what() << std::endl;
  }

  QueryResult result;
  result.status = InteractionStatus::ERROR;
  result.interaction_id = interaction.id;
  return result;
}

QueryResult QueryService::execute(const std::string &knowledge_base_id,
                                  const std::string &question) {
  Interaction interaction;
  interaction.id = generate_uuid();
  interaction.knowledge_base_id = knowledge_base_id;
  interaction.question = question;
  interaction.created_at = std::chrono::system_clock::now();

  std::vector<float> query_vector;
  try {
    query_vector = language_model_->embed(question);
  } catch (const LanguageModelError &e) {
    return fail(std::move(interaction), "Embedding", e.what());
  }

  std::vector<FragmentSearchResult> hits =
      vector_index_->search(query_vector, knowledge_base_id, options_.top_k);

  if (hits.empty()) {
    interaction.status = InteractionStatus::UNKNOWN;
    interaction.answer = UNKNOWN_MESSAGE;
    return finish(std::move(interaction));
  }

  std::vector<Fragment> fragments;
  fragments.reserve(hits.size());
  for (auto &hit : hits) {
    fragments.push_back(std::move(hit.fragment));
  }

  const std::string context = build_context(fragments);
  std::string generated;
  try {
    generated = language_model_->generate(build_prompt(question, context), context);
  } catch (const LanguageModelError &e) {
    return fail(std::move(interaction), "Generation", e.what());
  }

  const GroundingDecision decision = grounding_evaluator_.evaluate(question, generated, fragments);
  if (!decision.is_grounded) {
    std::cout << "[QueryService] Answer rejected for interaction " << interaction.id << ": "
              << decision.reasoning << std::endl;
    interaction.status = InteractionStatus::UNKNOWN;
    interaction.answer = UNKNOWN_MESSAGE;
    return finish(std::move(interaction));
  }

  interaction.status = InteractionStatus::ANSWERED;
  interaction.answer = std::move(generated);
  interaction.citations = build_citations(fragments, decision);
  return finish(std::move(interaction));
}

}  // namespace ragline_core
