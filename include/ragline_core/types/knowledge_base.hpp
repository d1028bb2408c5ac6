#pragma once

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace ragline_core {

enum class DocumentStatus { PENDING, PROCESSING, INDEXED, ERROR };

inline std::string to_string(DocumentStatus status) {
  switch (status) {
    case DocumentStatus::PENDING:
      return "pending";
    case DocumentStatus::PROCESSING:
      return "processing";
    case DocumentStatus::INDEXED:
      return "indexed";
    case DocumentStatus::ERROR:
      return "error";
    default:
      return "pending";
  }
}

inline DocumentStatus document_status_from_string(const std::string &str) {
  if (str == "pending")
    return DocumentStatus::PENDING;
  if (str == "processing")
    return DocumentStatus::PROCESSING;
  if (str == "indexed")
    return DocumentStatus::INDEXED;
  if (str == "error")
    return DocumentStatus::ERROR;
  throw std::invalid_argument("Unknown DocumentStatus: " + str);
}

struct KnowledgeBase {
  std::string id;
  std::string name;
  std::optional<std::string> description;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point updated_at;
};

struct Document {
  std::string id;
  std::string knowledge_base_id;
  std::string filename;
  std::string content_hash;
  DocumentStatus status = DocumentStatus::PENDING;
  int chunks_count = 0;
  std::optional<std::string> error_message;
  std::chrono::system_clock::time_point uploaded_at;
};

}  // namespace ragline_core
