#include "GzipStrategy.hpp"
#include <zlib.h>
#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

namespace GzSplit {

// --- Compression ---
GzipStreamCompressor::GzipStreamCompressor(int compressionLevel) {
    strm_.zalloc = Z_NULL;
    strm_.zfree = Z_NULL;
    strm_.opaque = Z_NULL;

    int ret = deflateInit2(&strm_, compressionLevel, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw CompressionError("zlib deflateInit failed: " + std::to_string(ret));
    }
}

GzipStreamCompressor::~GzipStreamCompressor() {
    deflateEnd(&strm_);
}

int GzipStreamCompressor::run(int flush, std::vector<std::byte>& out) {
    std::byte buffer[16384];
    int ret;
    do {
        strm_.avail_out = static_cast<uInt>(sizeof(buffer));
        strm_.next_out = reinterpret_cast<Bytef*>(buffer);
        ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            throw CompressionError("zlib deflate failed: Z_STREAM_ERROR");
        }
        size_t have = sizeof(buffer) - strm_.avail_out;
        out.insert(out.end(), buffer, buffer + have);
    } while (strm_.avail_out == 0); // output buffer filled, more may be pending
    return ret;
}

void GzipStreamCompressor::compress(const std::byte* data, size_t size, std::vector<std::byte>& out) {
    if (finished_) {
        throw CompressionError("compress called after finish");
    }

    // avail_in is a uInt; feed very large chunks in slices
    while (size > 0) {
        size_t slice = std::min<size_t>(size, 1u << 30);
        strm_.avail_in = static_cast<uInt>(slice);
        strm_.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(data));
        run(Z_NO_FLUSH, out);
        if (strm_.avail_in != 0) {
            throw CompressionError("zlib deflate left input unconsumed");
        }
        data += slice;
        size -= slice;
    }
}

void GzipStreamCompressor::finish(std::vector<std::byte>& out) {
    if (finished_) {
        return;
    }
    strm_.avail_in = 0;
    strm_.next_in = Z_NULL;
    int ret = run(Z_FINISH, out);
    if (ret != Z_STREAM_END) {
        throw CompressionError("zlib deflate failed to produce Z_STREAM_END: " + std::to_string(ret));
    }
    finished_ = true;
}

GzipStrategy::GzipStrategy(int compressionLevel)
    : compression_level_(compressionLevel)
{
    if (compressionLevel < Z_DEFAULT_COMPRESSION || compressionLevel > Z_BEST_COMPRESSION) {
        throw std::invalid_argument("gzip compression level must be between -1 and 9");
    }
}

std::unique_ptr<IStreamCompressor> GzipStrategy::createCompressor() const {
    return std::make_unique<GzipStreamCompressor>(compression_level_);
}

// --- Decompression ---
uint64_t GzipStrategy::decompress(std::istream& in, std::ostream& out) const {
    z_stream strm;
    strm.zalloc = Z_NULL;
    strm.zfree = Z_NULL;
    strm.opaque = Z_NULL;
    strm.avail_in = 0;
    strm.next_in = Z_NULL;

    int ret = inflateInit2(&strm, 15 + 16);
    if (ret != Z_OK) {
        throw CompressionError("zlib inflateInit failed: " + std::to_string(ret));
    }

    std::vector<char> inBuffer(CHUNK_SIZE);
    std::vector<char> outBuffer(CHUNK_SIZE);
    uint64_t written = 0;
    bool sawInput = false;
    bool pending = false; // inflate filled the output buffer last round
    ret = Z_OK;

    try {
        while (true) {
            if (strm.avail_in == 0 && !pending) {
                in.read(inBuffer.data(), static_cast<std::streamsize>(inBuffer.size()));
                if (in.bad()) {
                    throw CompressionError("Failed to read compressed input");
                }
                strm.avail_in = static_cast<uInt>(in.gcount());
                strm.next_in = reinterpret_cast<Bytef*>(inBuffer.data());
                if (strm.avail_in == 0) {
                    break;
                }
                sawInput = true;
            }

            strm.avail_out = static_cast<uInt>(outBuffer.size());
            strm.next_out = reinterpret_cast<Bytef*>(outBuffer.data());
            ret = inflate(&strm, Z_NO_FLUSH);

            switch (ret) {
                case Z_STREAM_ERROR:
                    throw CompressionError("zlib inflate failed: Z_STREAM_ERROR");
                case Z_NEED_DICT:
                case Z_DATA_ERROR:
                    throw CompressionError("zlib inflate failed: Z_DATA_ERROR");
                case Z_MEM_ERROR:
                    throw CompressionError("zlib inflate failed: Z_MEM_ERROR");
                default:
                    break;
            }

            pending = (strm.avail_out == 0);
            size_t have = outBuffer.size() - strm.avail_out;
            out.write(outBuffer.data(), static_cast<std::streamsize>(have));
            if (!out) {
                throw CompressionError("Failed to write decompressed output");
            }
            written += have;

            if (ret == Z_STREAM_END) {
                // Another gzip member may follow
                inflateReset(&strm);
                pending = false;
            }
        }
    } catch (...) {
        inflateEnd(&strm);
        throw;
    }

    inflateEnd(&strm);

    if (!sawInput) {
        throw CompressionError("Empty compressed data");
    }
    if (ret != Z_STREAM_END) {
        throw CompressionError("Truncated gzip stream");
    }
    return written;
}

} // namespace GzSplit
