#ifndef GZSPLIT_UTILS_SHA256_H
#define GZSPLIT_UTILS_SHA256_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace GzSplit {

// Incremental SHA-256. Used to derive short content hashes for object names.
class SHA256 {
public:
    SHA256();
    void update(const void* data, size_t len);
    void update(const std::string& data);
    std::array<uint8_t, 32> digest(); // resets the hasher
    std::string hexdigest();          // 64 lowercase hex chars
    void reset();
private:
    std::array<uint32_t, 8> state_;
    std::array<uint8_t, 64> block_;
    size_t blockLen_;
    uint64_t totalBytes_;
    void compressBlock(const uint8_t* block);
};

} // namespace GzSplit

#endif // GZSPLIT_UTILS_SHA256_H
