#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ragline_core {

class CompressionError : public std::exception {
 public:
  explicit CompressionError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Zstandard codec for fragment text at rest
class CompressionService {
 public:
  static constexpr int DEFAULT_LEVEL = 3;

  /**
   * @brief Compresses a block of text.
   * @param data The text to compress. Empty input yields an empty buffer.
   * @param compression_level The zstd compression level.
   */
  static std::vector<char> compress(std::string_view data, int compression_level = DEFAULT_LEVEL);

  /**
   * @brief Restores text produced by compress().
   * @throws CompressionError if the buffer is not a complete zstd frame.
   */
  static std::string decompress(const std::vector<char> &compressed_data);
};

}  // namespace ragline_core
