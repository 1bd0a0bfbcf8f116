#include "DestinationNaming.hpp"
#include "sha256.h"
#include "../core/SplitterErrors.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace GzSplit {

std::string sanitizeName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            out += c;
        }
    }
    return out;
}

std::string sanitizeFileName(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '-') {
            out += c;
        }
    }
    return out;
}

std::string identityHash(const std::string& absolutePath, uint64_t size, int64_t mtime, size_t digits) {
    SHA256 hasher;
    hasher.update(absolutePath);
    hasher.update("\n" + std::to_string(size) + "\n" + std::to_string(mtime));
    std::string hex = hasher.hexdigest();
    return hex.substr(0, std::min(digits, hex.size()));
}

std::string contentHash(const std::string& path, size_t digits) {
    std::error_code ec;
    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        throw SourceReadError("Cannot resolve " + path + ": " + ec.message());
    }
    uint64_t size = fs::file_size(absolute, ec);
    if (ec) {
        throw SourceReadError("Cannot stat " + path + ": " + ec.message());
    }
    auto mtime = fs::last_write_time(absolute, ec);
    if (ec) {
        throw SourceReadError("Cannot stat " + path + ": " + ec.message());
    }
    int64_t ticks = static_cast<int64_t>(mtime.time_since_epoch().count());
    return identityHash(absolute.string(), size, ticks, digits);
}

std::string makeBasePath(const std::string& table, const std::string& hash, const std::string& fileName) {
    std::string cleanTable = sanitizeName(table);
    std::string cleanFile = sanitizeFileName(fileName);
    if (cleanTable.empty()) {
        throw std::invalid_argument("Table name '" + table + "' has no usable characters");
    }
    if (cleanFile.empty()) {
        throw std::invalid_argument("File name '" + fileName + "' has no usable characters");
    }
    return cleanTable + "_" + hash + "_" + cleanFile;
}

std::optional<size_t> parseSegmentIndex(const std::string& objectName) {
    static const std::string marker = "_chunk";
    const size_t digits = 9;
    size_t pos = objectName.rfind(marker);
    if (pos == std::string::npos || pos + marker.size() + digits > objectName.size()) {
        return std::nullopt;
    }
    size_t value = 0;
    for (size_t i = pos + marker.size(); i < pos + marker.size() + digits; ++i) {
        char c = objectName[i];
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

std::string joinObjectList(const std::vector<std::string>& objects, char separator) {
    std::string joined;
    for (size_t i = 0; i < objects.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += objects[i];
    }
    return joined;
}

std::vector<std::string> splitObjectList(const std::string& joined, char separator) {
    std::vector<std::string> objects;
    if (joined.empty()) {
        return objects;
    }
    size_t start = 0;
    while (true) {
        size_t pos = joined.find(separator, start);
        objects.push_back(joined.substr(start, pos - start));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return objects;
}

} // namespace GzSplit
