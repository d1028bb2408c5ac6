#include "ragline_core/extractors/content_extractor.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include "ragline_core/utils/hash_utils.hpp"

namespace ragline_core {

std::string ContentExtractor::read_file(const std::filesystem::path &file_path) {
  std::ifstream file_stream(file_path, std::ios::binary);
  if (!file_stream.is_open()) {
    throw ContentExtractorError("Could not open file: " + file_path.string());
  }

  std::stringstream buffer;
  buffer << file_stream.rdbuf();
  return buffer.str();
}

std::string ContentExtractor::sanitize_utf8(const std::string &content) {
  if (utf8::is_valid(content.begin(), content.end())) {
    return content;
  }
  std::string sanitized;
  utf8::replace_invalid(content.begin(), content.end(), std::back_inserter(sanitized));
  return sanitized;
}

bool ContentExtractor::is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

ExtractedDocument ContentExtractor::extract(const std::filesystem::path &file_path) const {
  return extract_text(file_path.filename().string(), read_file(file_path));
}

ExtractedDocument ContentExtractor::extract_text(const std::string &source_document,
                                                 const std::string &content) const {
  ExtractedDocument document;
  // Hash the bytes as received so re-uploads of the same file compare equal
  document.content_hash = sha256_hex(content);

  std::vector<std::string> pages = split_pages(content);
  for (size_t i = 0; i < pages.size(); ++i) {
    if (is_blank(pages[i])) {
      continue;
    }
    ExtractedPage page;
    page.content = sanitize_utf8(pages[i]);
    page.page_number = static_cast<int>(i) + 1;
    page.source_document = source_document;
    document.pages.push_back(std::move(page));
  }
  return document;
}

}  // namespace ragline_core
