#ifndef DESTINATION_NAMING_HPP
#define DESTINATION_NAMING_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace GzSplit {

// Keeps only [A-Za-z0-9_]
std::string sanitizeName(const std::string& name);

// Keeps [A-Za-z0-9_.-]; used for the original file name component
std::string sanitizeFileName(const std::string& name);

// First `digits` hex chars of SHA-256 over the file identity
// (absolute path, size in bytes, modification time). The file body is
// not read. Throws SourceReadError if the file cannot be inspected.
std::string contentHash(const std::string& path, size_t digits = 8);

// Same hash from explicit identity fields
std::string identityHash(const std::string& absolutePath, uint64_t size, int64_t mtime, size_t digits = 8);

// "{sanitized_table}_{hash}_{file_name}"
std::string makeBasePath(const std::string& table, const std::string& hash, const std::string& fileName);

// Index encoded in a segment object name ("..._chunk000000012.gz" -> 12)
std::optional<size_t> parseSegmentIndex(const std::string& objectName);

// Downstream encoding of a produced object list
std::string joinObjectList(const std::vector<std::string>& objects, char separator = ',');
std::vector<std::string> splitObjectList(const std::string& joined, char separator = ',');

} // namespace GzSplit

#endif // DESTINATION_NAMING_HPP
