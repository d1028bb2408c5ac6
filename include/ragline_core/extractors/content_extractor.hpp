#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace ragline_core {

class ContentExtractorError : public std::exception {
 public:
  explicit ContentExtractorError(const std::string &message) : message_(message) {}
  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ExtractedPage {
  std::string content;
  int page_number = 1;
  std::string source_document;
};

struct ExtractedDocument {
  std::string content_hash;
  std::vector<ExtractedPage> pages;
};

/**
 * @class ContentExtractor
 * @brief Turns a source file into hashed, page-numbered text.
 *
 * The hash covers the raw bytes. Invalid UTF-8 sequences in each page are
 * replaced after splitting. Pages that hold only whitespace are dropped; page
 * numbers of the remaining pages are unchanged.
 */
class ContentExtractor {
 public:
  virtual ~ContentExtractor() = default;

  virtual bool can_handle(const std::filesystem::path &file_path) const = 0;

  // Reads the file once for both the hash and the pages
  ExtractedDocument extract(const std::filesystem::path &file_path) const;

  // Same as extract() for text that did not come from disk
  ExtractedDocument extract_text(const std::string &source_document,
                                 const std::string &content) const;

 protected:
  // Page i of the result is page number i + 1
  virtual std::vector<std::string> split_pages(const std::string &content) const = 0;

  static std::string read_file(const std::filesystem::path &file_path);
  static std::string sanitize_utf8(const std::string &content);
  static bool is_blank(const std::string &text);
};

using ContentExtractorPtr = std::unique_ptr<ContentExtractor>;

}  // namespace ragline_core
