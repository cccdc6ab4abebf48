#include "jose/compression.hpp"

#include <zlib.h>

#include <string>

#include "jose/error.hpp"
#include "jose/logging.hpp"

namespace jose {
namespace compression {

namespace {

// Negative window bits select a raw stream
constexpr int kRawWindowBits = -15;
constexpr size_t kChunkSize = 16384;

class ZStream {
 public:
  explicit ZStream(bool deflating) : deflating_(deflating) {
    int rc = deflating_
                 ? deflateInit2(&stream_, Z_DEFAULT_COMPRESSION, Z_DEFLATED,
                                kRawWindowBits, 8, Z_DEFAULT_STRATEGY)
                 : inflateInit2(&stream_, kRawWindowBits);
    if (rc == Z_MEM_ERROR) throwOsError("zlib stream init", ENOMEM);
    if (rc != Z_OK) {
      throw CryptoError("zlib initialization failed: " + std::to_string(rc));
    }
  }

  ~ZStream() {
    if (deflating_) {
      deflateEnd(&stream_);
    } else {
      inflateEnd(&stream_);
    }
  }

  ZStream(const ZStream&) = delete;
  ZStream& operator=(const ZStream&) = delete;

  z_stream* get() noexcept { return &stream_; }

 private:
  z_stream stream_{};
  bool deflating_;
};

}  // namespace

std::vector<uint8_t> deflate(std::span<const uint8_t> data) {
  ZStream zs(true);
  auto* stream = zs.get();
  stream->next_in = const_cast<Bytef*>(data.data());
  stream->avail_in = static_cast<uInt>(data.size());

  std::vector<uint8_t> out;
  uint8_t chunk[kChunkSize];
  int rc = Z_OK;
  do {
    stream->next_out = chunk;
    stream->avail_out = sizeof(chunk);
    rc = ::deflate(stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      throw CryptoError("DEFLATE compression failed");
    }
    out.insert(out.end(), chunk, chunk + (sizeof(chunk) - stream->avail_out));
  } while (rc != Z_STREAM_END);
  return out;
}

std::vector<uint8_t> inflate(std::span<const uint8_t> data, size_t max_size) {
  ZStream zs(false);
  auto* stream = zs.get();
  stream->next_in = const_cast<Bytef*>(data.data());
  stream->avail_in = static_cast<uInt>(data.size());

  std::vector<uint8_t> out;
  uint8_t chunk[kChunkSize];
  int rc = Z_OK;
  do {
    stream->next_out = chunk;
    stream->avail_out = sizeof(chunk);
    rc = ::inflate(stream, Z_NO_FLUSH);
    if (rc == Z_MEM_ERROR) throwOsError("inflate", ENOMEM);
    if (rc != Z_OK && rc != Z_STREAM_END) {
      throw CryptoError("DEFLATE decompression failed: " +
                        std::string(stream->msg ? stream->msg : "truncated"));
    }
    size_t produced = sizeof(chunk) - stream->avail_out;
    if (produced > max_size - out.size()) {
      throw CryptoError("DEFLATE decompression exceeds " +
                        std::to_string(max_size) + " bytes");
    }
    out.insert(out.end(), chunk, chunk + produced);
    if (rc == Z_OK && stream->avail_in == 0 && stream->avail_out != 0) {
      throw CryptoError("DEFLATE decompression failed: truncated stream");
    }
  } while (rc != Z_STREAM_END);
  return out;
}

std::vector<uint8_t> compress(const JweHeader& header,
                              std::span<const uint8_t> plaintext) {
  auto zip = header.compression();
  if (!zip) return {plaintext.begin(), plaintext.end()};
  switch (*zip) {
    case CompressionAlgorithm::DEF:
      return deflate(plaintext);
  }
  throw UnsupportedAlgorithmError("Unsupported JWE compression algorithm");
}

std::vector<uint8_t> decompress(const JweHeader& header,
                                std::span<const uint8_t> data,
                                size_t max_size) {
  auto zip = header.compression();
  if (!zip) return {data.begin(), data.end()};
  switch (*zip) {
    case CompressionAlgorithm::DEF:
      return inflate(data, max_size);
  }
  throw UnsupportedAlgorithmError("Unsupported JWE compression algorithm");
}

}  // namespace compression
}  // namespace jose
