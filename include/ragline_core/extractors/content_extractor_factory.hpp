#pragma once

#include <filesystem>
#include <memory>
#include <vector>

#include "ragline_core/extractors/content_extractor.hpp"
#include "ragline_core/extractors/plaintext_extractor.hpp"

namespace ragline_core {

/**
 * @class ContentExtractorFactory
 * @brief Picks the ContentExtractor for a file by its extension.
 *
 * PDFs get the PdfExtractor. Every other file is read as plain text.
 */
class ContentExtractorFactory {
 public:
  ContentExtractorFactory();
  virtual ~ContentExtractorFactory() = default;

  virtual const ContentExtractor &get_extractor_for(const std::filesystem::path &file_path) const;

  ContentExtractorFactory(const ContentExtractorFactory &) = delete;
  ContentExtractorFactory &operator=(const ContentExtractorFactory &) = delete;

 private:
  std::vector<ContentExtractorPtr> extractors_;
  ContentExtractorPtr fallback_extractor_;
};

}  // namespace ragline_core
