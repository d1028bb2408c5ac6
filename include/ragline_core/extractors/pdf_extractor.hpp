#pragma once

#include "ragline_core/extractors/content_extractor.hpp"

namespace ragline_core {

/**
 * @class PdfExtractor
 * @brief Reads PDF text page by page through poppler-cpp.
 *
 * Page numbers are the 1-based page positions in the PDF, so a blank page
 * leaves a gap instead of shifting the pages after it.
 *
 * @throw ContentExtractorError for data poppler cannot open and for
 *        password-protected documents.
 */
class PdfExtractor : public ContentExtractor {
 public:
  static constexpr int MAX_PAGES = 1000;

  bool can_handle(const std::filesystem::path &file_path) const override;

 protected:
  std::vector<std::string> split_pages(const std::string &content) const override;
};

}  // namespace ragline_core
