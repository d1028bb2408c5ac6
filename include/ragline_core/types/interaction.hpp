#pragma once

#include <chrono>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace ragline_core {

enum class InteractionStatus { ANSWERED, UNKNOWN, ERROR };

inline std::string to_string(InteractionStatus status) {
  switch (status) {
    case InteractionStatus::ANSWERED:
      return "answered";
    case InteractionStatus::UNKNOWN:
      return "unknown";
    case InteractionStatus::ERROR:
      return "error";
    default:
      return "unknown";
  }
}

inline InteractionStatus interaction_status_from_string(const std::string &str) {
  if (str == "answered")
    return InteractionStatus::ANSWERED;
  if (str == "unknown")
    return InteractionStatus::UNKNOWN;
  if (str == "error")
    return InteractionStatus::ERROR;
  throw std::invalid_argument("Unknown InteractionStatus: " + str);
}

struct GroundingDecision {
  bool is_grounded = false;
  double confidence = 0.0;
  std::string reasoning;
  std::set<std::string> supporting_fragment_ids;

  bool operator==(const GroundingDecision &) const = default;
};

struct Citation {
  std::string source_document;
  std::optional<int> page;
  std::string fragment_id;
  double relevance_score = 0.0;

  bool operator==(const Citation &) const = default;
};

// Append-only record of one query execution
struct Interaction {
  std::string id;
  std::string knowledge_base_id;
  std::string question;
  std::optional<std::string> answer;
  InteractionStatus status = InteractionStatus::UNKNOWN;
  std::vector<Citation> citations;
  std::chrono::system_clock::time_point created_at;
};

// What the caller of a query gets back
struct QueryResult {
  InteractionStatus status = InteractionStatus::UNKNOWN;
  std::optional<std::string> answer;
  std::vector<Citation> citations;
  std::string interaction_id;
};

}  // namespace ragline_core
