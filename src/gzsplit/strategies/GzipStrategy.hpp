#ifndef GZIP_STRATEGY_HPP
#define GZIP_STRATEGY_HPP

#include <zlib.h>
#include "CompressionStrategy.hpp"

namespace GzSplit {

// Streaming deflate session producing gzip framing (windowBits = 15 + 16).
class GzipStreamCompressor : public IStreamCompressor {
public:
    explicit GzipStreamCompressor(int compressionLevel);
    ~GzipStreamCompressor() override;

    GzipStreamCompressor(const GzipStreamCompressor&) = delete;
    GzipStreamCompressor& operator=(const GzipStreamCompressor&) = delete;

    void compress(const std::byte* data, size_t size, std::vector<std::byte>& out) override;
    void finish(std::vector<std::byte>& out) override;

private:
    int run(int flush, std::vector<std::byte>& out);

    z_stream strm_;
    bool finished_ = false;
};

// Compression strategy using zlib's gzip format
class GzipStrategy : public ICompressionStrategy {
public:
    explicit GzipStrategy(int compressionLevel = Z_DEFAULT_COMPRESSION);

    std::unique_ptr<IStreamCompressor> createCompressor() const override;

    // Accepts concatenated gzip members, as produced by `cat a.gz b.gz`.
    uint64_t decompress(std::istream& in, std::ostream& out) const override;

    std::string extension() const override { return ".gz"; }

    int compressionLevel() const { return compression_level_; }

private:
    int compression_level_;
    static constexpr size_t CHUNK_SIZE = 16384; // zlib in/out buffer size
};

} // namespace GzSplit

#endif // GZIP_STRATEGY_HPP
