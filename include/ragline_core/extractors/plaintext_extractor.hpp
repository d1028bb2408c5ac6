#pragma once

#include "ragline_core/extractors/content_extractor.hpp"

namespace ragline_core {

// Text and Markdown files, read whole as page 1. The factory also falls back to it.
class PlainTextExtractor : public ContentExtractor {
 public:
  bool can_handle(const std::filesystem::path &file_path) const override;

 protected:
  std::vector<std::string> split_pages(const std::string &content) const override;
};

}  // namespace ragline_core
