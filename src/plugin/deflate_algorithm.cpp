#include "plugin/deflate_algorithm.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <zlib.h>

#include <algorithm>
#include <string>

namespace crush {

namespace {

// Output is drained in chunks of the same size as the cancellation block.
constexpr size_t OUTPUT_CHUNK_SIZE = CANCEL_CHECK_BLOCK_SIZE;

// Raw DEFLATE, no zlib/gzip wrapper.
constexpr int RAW_WINDOW_BITS = -15;
constexpr int MEM_LEVEL = 8;

// Owns a z_stream and releases it on every exit path.
class ZStream {
public:
  enum class Mode { Deflate, Inflate };

  ZStream(Mode mode, int level) : mode_(mode) {
    int ret = mode_ == Mode::Deflate
                  ? deflateInit2(&stream_, level, Z_DEFLATED, RAW_WINDOW_BITS,
                                 MEM_LEVEL, Z_DEFAULT_STRATEGY)
                  : inflateInit2(&stream_, RAW_WINDOW_BITS);
    if (ret != Z_OK) {
      throw CrushError(ErrorKind::OperationFailed,
                       std::string("zlib initialisation failed: ") +
                           (stream_.msg ? stream_.msg : zError(ret)));
    }
    initialised_ = true;
  }

  ~ZStream() {
    if (!initialised_)
      return;
    if (mode_ == Mode::Deflate)
      deflateEnd(&stream_);
    else
      inflateEnd(&stream_);
  }

  ZStream(const ZStream &) = delete;
  ZStream &operator=(const ZStream &) = delete;

  z_stream *get() { return &stream_; }

private:
  z_stream stream_{};
  Mode mode_;
  bool initialised_ = false;
};

void throw_if_cancelled(const CancellationToken &cancel, const char *what) {
  if (cancel.is_cancelled()) {
    LOG(LogLevel::DEBUG, LogComponent::PLUGIN_ALGORITHM,
        what << " observed cancellation at block boundary");
    throw CrushError(ErrorKind::Cancelled, std::string(what) + " cancelled");
  }
}

std::string zlib_message(const z_stream *stream, int ret) {
  return stream->msg ? stream->msg : zError(ret);
}

} // namespace

DeflateAlgorithm::DeflateAlgorithm(AlgorithmMetadata metadata, int level)
    : metadata_(std::move(metadata)), level_(level) {}

std::vector<uint8_t>
DeflateAlgorithm::compress(const std::vector<uint8_t> &input,
                           const CancellationToken &cancel) {
  throw_if_cancelled(cancel, "DEFLATE compression");

  ZStream zs(ZStream::Mode::Deflate, level_);
  z_stream *strm = zs.get();

  std::vector<uint8_t> output;
  output.reserve(deflateBound(strm, static_cast<uLong>(std::min<size_t>(
                                        input.size(), 64 * 1024 * 1024))));
  std::vector<uint8_t> chunk(OUTPUT_CHUNK_SIZE);

  size_t offset = 0;
  int flush = Z_NO_FLUSH;
  do {
    throw_if_cancelled(cancel, "DEFLATE compression");

    size_t block = std::min(CANCEL_CHECK_BLOCK_SIZE, input.size() - offset);
    flush = (offset + block == input.size()) ? Z_FINISH : Z_NO_FLUSH;
    strm->next_in = const_cast<Bytef *>(input.data() + offset);
    strm->avail_in = static_cast<uInt>(block);

    do {
      strm->next_out = chunk.data();
      strm->avail_out = static_cast<uInt>(chunk.size());
      int ret = deflate(strm, flush);
      if (ret == Z_STREAM_ERROR) {
        throw CrushError(ErrorKind::OperationFailed,
                         "DEFLATE compression failed: " +
                             zlib_message(strm, ret));
      }
      output.insert(output.end(), chunk.data(),
                    chunk.data() + (chunk.size() - strm->avail_out));
    } while (strm->avail_out == 0);

    offset += block;
  } while (flush != Z_FINISH);

  return output;
}

std::vector<uint8_t>
DeflateAlgorithm::decompress(const std::vector<uint8_t> &input,
                             size_t max_output,
                             const CancellationToken &cancel) {
  throw_if_cancelled(cancel, "DEFLATE decompression");

  ZStream zs(ZStream::Mode::Inflate, 0);
  z_stream *strm = zs.get();

  std::vector<uint8_t> output;
  if (max_output != NO_OUTPUT_LIMIT)
    output.reserve(std::min<size_t>(max_output, 64 * 1024 * 1024));
  std::vector<uint8_t> chunk(OUTPUT_CHUNK_SIZE);

  size_t offset = 0;
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    throw_if_cancelled(cancel, "DEFLATE decompression");

    if (offset >= input.size())
      throw CrushError(ErrorKind::Corruption,
                       "DEFLATE stream is truncated");

    size_t block = std::min(CANCEL_CHECK_BLOCK_SIZE, input.size() - offset);
    strm->next_in = const_cast<Bytef *>(input.data() + offset);
    strm->avail_in = static_cast<uInt>(block);

    do {
      // A small input block can expand a lot; poll per output chunk as well.
      throw_if_cancelled(cancel, "DEFLATE decompression");

      strm->next_out = chunk.data();
      strm->avail_out = static_cast<uInt>(chunk.size());
      ret = inflate(strm, Z_NO_FLUSH);
      switch (ret) {
      case Z_NEED_DICT:
      case Z_DATA_ERROR:
        throw CrushError(ErrorKind::Corruption,
                         "DEFLATE decompression failed: " +
                             zlib_message(strm, ret));
      case Z_MEM_ERROR:
      case Z_STREAM_ERROR:
        throw CrushError(ErrorKind::OperationFailed,
                         "DEFLATE decompression failed: " +
                             zlib_message(strm, ret));
      default:
        break;
      }
      const size_t produced = chunk.size() - strm->avail_out;
      if (produced > max_output - output.size()) {
        throw CrushError(ErrorKind::Corruption,
                         "DEFLATE stream decodes to more than the expected " +
                             std::to_string(max_output) + " bytes");
      }
      output.insert(output.end(), chunk.data(), chunk.data() + produced);
    } while (strm->avail_out == 0 && ret != Z_STREAM_END);

    offset += block - strm->avail_in;
  }

  if (offset < input.size()) {
    LOG(LogLevel::DEBUG, LogComponent::PLUGIN_ALGORITHM,
        "Ignoring " << (input.size() - offset)
                    << " trailing bytes after DEFLATE stream end");
  }
  return output;
}

bool DeflateAlgorithm::detect(const uint8_t * /*data*/, size_t /*len*/) const {
  return true;
}

AlgorithmPtr make_deflate_algorithm() {
  AlgorithmMetadata meta;
  meta.name = DEFAULT_ALGORITHM_NAME;
  meta.version = "1.0.0";
  meta.magic_number = {MAGIC_PREFIX_0, MAGIC_PREFIX_1, FORMAT_VERSION, 0x00};
  meta.throughput_mbps = 200.0;
  meta.compression_ratio = 0.35;
  meta.description = "Standard DEFLATE compression (RFC 1951)";
  return std::make_shared<DeflateAlgorithm>(std::move(meta), 6);
}

AlgorithmPtr make_deflate_fast_algorithm() {
  AlgorithmMetadata meta;
  meta.name = "deflate-fast";
  meta.version = "1.0.0";
  meta.magic_number = {MAGIC_PREFIX_0, MAGIC_PREFIX_1, FORMAT_VERSION, 0x01};
  meta.throughput_mbps = 400.0;
  meta.compression_ratio = 0.45;
  meta.description = "DEFLATE tuned for speed (zlib level 1)";
  return std::make_shared<DeflateAlgorithm>(std::move(meta), Z_BEST_SPEED);
}

} // namespace crush
