#pragma once

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>

namespace ragline_core {

inline std::string lower_extension(const std::filesystem::path &file_path) {
  std::string extension = file_path.extension().string();
  std::transform(extension.begin(), extension.end(), extension.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return extension;
}

}  // namespace ragline_core
