#include "ragline_core/types/fragment.hpp"

namespace ragline_core {

std::optional<std::string> metadata_string(const FragmentMetadata &metadata,
                                           const std::string &key) {
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return std::nullopt;
  }
  if (const auto *text = std::get_if<std::string>(&it->second)) {
    return *text;
  }
  return std::to_string(std::get<int>(it->second));
}

std::optional<int> metadata_int(const FragmentMetadata &metadata, const std::string &key) {
  auto it = metadata.find(key);
  if (it == metadata.end()) {
    return std::nullopt;
  }
  if (const auto *number = std::get_if<int>(&it->second)) {
    return *number;
  }
  return std::nullopt;
}

std::string Fragment::source_document() const {
  return metadata_string(metadata, kMetaSourceDocument).value_or("");
}

std::optional<int> Fragment::page() const {
  return metadata_int(metadata, kMetaPage);
}

}  // namespace ragline_core
