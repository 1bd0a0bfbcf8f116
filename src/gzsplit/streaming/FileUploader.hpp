#ifndef FILE_UPLOADER_HPP
#define FILE_UPLOADER_HPP

#include "../core/Splitter.hpp"
#include "../core/SourceStream.hpp"
#include <memory>
#include <string>
#include <vector>

namespace GzSplit {

// Structure to hold upload statistics
struct UploadStats {
    uint64_t originalSize = 0;
    uint64_t compressedSize = 0;
    double compressionRatio = 0.0;
    double elapsedMs = 0.0;
    size_t numSegments = 0;
    uint64_t peakBufferedBytes = 0;
};

struct UploadReport {
    std::string basePath;
    std::vector<std::string> objects;     // in creation order
    std::vector<SegmentResult> segments;
    std::string manifestObject;           // empty when no manifest was written
    UploadStats stats;
};

// Runs one Splitter per source: a producer thread reads chunks and feeds
// the splitter, while the calling thread waits on the completion signal.
// Sources are processed one at a time.
class FileUploader {
public:
    FileUploader(SplitterConfig config,
                 std::shared_ptr<const ICompressionStrategy> strategy,
                 std::shared_ptr<IObjectStore> store);

    void setWriteManifest(bool enabled) { writeManifest_ = enabled; }

    // Checks (and if missing, creates) the destination container
    void prepareDestination();

    UploadReport upload(ISourceStream& source, const std::string& basePath);

    // Derives the base path from table, file identity hash and file name
    UploadReport uploadFile(const std::string& path, const std::string& table);

    std::vector<UploadReport> uploadFiles(const std::vector<std::string>& paths, const std::string& table);

private:
    SplitterConfig config_;
    std::shared_ptr<const ICompressionStrategy> strategy_;
    std::shared_ptr<IObjectStore> store_;
    bool writeManifest_ = true;
};

} // namespace GzSplit

#endif // FILE_UPLOADER_HPP
