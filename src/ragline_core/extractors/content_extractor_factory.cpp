#include "ragline_core/extractors/content_extractor_factory.hpp"

#include "ragline_core/extractors/pdf_extractor.hpp"

namespace ragline_core {

ContentExtractorFactory::ContentExtractorFactory()
    : fallback_extractor_(std::make_unique<PlainTextExtractor>()) {
  extractors_.push_back(std::make_unique<PdfExtractor>());
}

const ContentExtractor &ContentExtractorFactory::get_extractor_for(
    const std::filesystem::path &file_path) const {
  for (const auto &extractor : extractors_) {
    if (extractor->can_handle(file_path)) {
      return *extractor;
    }
  }
  return *fallback_extractor_;
}

}  // namespace ragline_core
