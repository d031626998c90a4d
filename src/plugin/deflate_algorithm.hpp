#ifndef CRUSH_DEFLATE_ALGORITHM_HPP
#define CRUSH_DEFLATE_ALGORITHM_HPP

#include "plugin/algorithm.hpp"

namespace crush {

// Raw DEFLATE (RFC 1951) through zlib. The same implementation backs every
// built-in DEFLATE variant; only the zlib level and the declared metadata
// differ.
class DeflateAlgorithm : public ICompressionAlgorithm {
public:
  DeflateAlgorithm(AlgorithmMetadata metadata, int level);

  std::vector<uint8_t> compress(const std::vector<uint8_t> &input,
                                const CancellationToken &cancel) override;

  std::vector<uint8_t> decompress(const std::vector<uint8_t> &input,
                                  size_t max_output,
                                  const CancellationToken &cancel) override;

  // DEFLATE accepts any data; it is the general purpose fallback.
  bool detect(const uint8_t *data, size_t len) const override;

  AlgorithmMetadata metadata() const override { return metadata_; }

  int level() const { return level_; }

private:
  AlgorithmMetadata metadata_;
  int level_;
};

// "deflate": zlib level 6, magic 43 52 01 00. Process default and fallback.
AlgorithmPtr make_deflate_algorithm();

// "deflate-fast": zlib level 1, magic 43 52 01 01.
AlgorithmPtr make_deflate_fast_algorithm();

constexpr const char *DEFAULT_ALGORITHM_NAME = "deflate";

} // namespace crush

#endif // CRUSH_DEFLATE_ALGORITHM_HPP
