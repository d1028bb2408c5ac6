#include "ragline_core/services/compression_service.hpp"

#include <zstd.h>

namespace ragline_core {

std::vector<char> CompressionService::compress(std::string_view data, int compression_level) {
  if (data.empty()) {
    return {};
  }

  std::vector<char> buffer(ZSTD_compressBound(data.size()));
  const size_t compressed_size =
      ZSTD_compress(buffer.data(), buffer.size(), data.data(), data.size(), compression_level);
  if (ZSTD_isError(compressed_size)) {
    throw CompressionError("ZSTD compression failed: " +
                           std::string(ZSTD_getErrorName(compressed_size)));
  }

  buffer.resize(compressed_size);
  return buffer;
}

std::string CompressionService::decompress(const std::vector<char> &compressed_data) {
  if (compressed_data.empty()) {
    return "";
  }

  const unsigned long long expected_size =
      ZSTD_getFrameContentSize(compressed_data.data(), compressed_data.size());
  if (expected_size == ZSTD_CONTENTSIZE_ERROR || expected_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CompressionError("Failed to get decompressed size or data is not zstd format.");
  }

  std::string text(expected_size, '\0');
  const size_t actual_size =
      ZSTD_decompress(text.data(), text.size(), compressed_data.data(), compressed_data.size());
  if (ZSTD_isError(actual_size)) {
    throw CompressionError("ZSTD decompression failed: " +
                           std::string(ZSTD_getErrorName(actual_size)));
  }
  if (actual_size != expected_size) {
    throw CompressionError("ZSTD decompression produced " + std::to_string(actual_size) +
                           " bytes, expected " + std::to_string(expected_size));
  }
  return text;
}

}  // namespace ragline_core
