#include "ragline_core/extractors/pdf_extractor.hpp"

#include <poppler-document.h>
#include <poppler-page.h>

#include <algorithm>
#include <iostream>

#include "ragline_core/extractors/extension_utils.hpp"

namespace ragline_core {

bool PdfExtractor::can_handle(const std::filesystem::path &file_path) const {
  return lower_extension(file_path) == ".pdf";
}

std::vector<std::string> PdfExtractor::split_pages(const std::string &content) const {
  std::unique_ptr<poppler::document> document(
      poppler::document::load_from_raw_data(content.data(), static_cast<int>(content.size())));
  if (!document) {
    throw ContentExtractorError("Failed to load PDF document");
  }
  if (document->is_locked()) {
    throw ContentExtractorError("PDF is encrypted or password-protected");
  }

  const int page_count = document->pages();
  const int pages_to_process = std::min(page_count, MAX_PAGES);
  if (page_count > MAX_PAGES) {
    std::cout << "[PdfExtractor] PDF has " << page_count << " pages, reading the first "
              << MAX_PAGES << std::endl;
  }

  std::vector<std::string> pages;
  pages.reserve(static_cast<size_t>(pages_to_process));
  for (int i = 0; i < pages_to_process; ++i) {
    std::unique_ptr<poppler::page> page(document->create_page(i));
    if (!page) {
      // Keep the slot so later pages keep their numbers
      pages.emplace_back();
      continue;
    }
    const poppler::byte_array utf8_text = page->text().to_utf8();
    pages.emplace_back(utf8_text.begin(), utf8_text.end());
  }
  return pages;
}

}  // namespace ragline_core
