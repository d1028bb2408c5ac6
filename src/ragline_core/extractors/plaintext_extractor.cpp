#include "ragline_core/extractors/plaintext_extractor.hpp"

#include "ragline_core/extractors/extension_utils.hpp"

namespace ragline_core {

bool PlainTextExtractor::can_handle(const std::filesystem::path &file_path) const {
  const std::string extension = lower_extension(file_path);
  return extension == ".txt" || extension == ".text" || extension == ".md" ||
         extension == ".markdown";
}

std::vector<std::string> PlainTextExtractor::split_pages(const std::string &content) const {
  return {content};
}

}  // namespace ragline_core
