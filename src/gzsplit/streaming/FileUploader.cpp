#include "FileUploader.hpp"
#include "UploadManifest.hpp"
#include "../core/ChunkReader.hpp"
#include "../utils/DestinationNaming.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace GzSplit {

FileUploader::FileUploader(SplitterConfig config,
                           std::shared_ptr<const ICompressionStrategy> strategy,
                           std::shared_ptr<IObjectStore> store)
    : config_(config), strategy_(std::move(strategy)), store_(std::move(store))
{
    if (!strategy_ || !store_) {
        throw std::invalid_argument("FileUploader requires a compression strategy and an object store.");
    }
}

void FileUploader::prepareDestination() {
    store_->ensureContainer();
}

UploadReport FileUploader::upload(ISourceStream& source, const std::string& basePath) {
    auto startTime = std::chrono::steady_clock::now();
    Splitter splitter(config_, basePath, strategy_, store_);

    std::thread producer([&splitter, &source, this] {
        try {
            ChunkReader reader(source, static_cast<size_t>(config_.chunkSize));
            bool end = false;
            while (!end) {
                ChunkEvent event = reader.next();
                end = isEndOfStream(event);
                splitter.submit(std::move(event));
            }
        } catch (...) {
            splitter.abort(std::current_exception());
        }
    });

    try {
        splitter.completion().wait();
    } catch (...) {
        producer.join();
        throw;
    }
    producer.join();

    UploadReport report;
    report.basePath = basePath;
    report.objects = splitter.producedObjects();
    report.segments = splitter.segments();
    for (const auto& segment : report.segments) {
        report.stats.originalSize += segment.originalSize;
        report.stats.compressedSize += segment.compressedSize;
    }
    report.stats.numSegments = report.segments.size();
    report.stats.peakBufferedBytes = splitter.bufferGauge().peak();
    report.stats.compressionRatio = report.stats.compressedSize > 0
        ? static_cast<double>(report.stats.originalSize) / report.stats.compressedSize
        : 0.0;

    if (writeManifest_) {
        report.manifestObject = basePath + "_manifest.json";
        writeManifest(*store_, report.manifestObject, buildManifest(report));
    }

    auto endTime = std::chrono::steady_clock::now();
    report.stats.elapsedMs = std::chrono::duration<double, std::milli>(endTime - startTime).count();
    return report;
}

UploadReport FileUploader::uploadFile(const std::string& path, const std::string& table) {
    std::string fileName = std::filesystem::path(path).filename().string();
    std::string basePath = makeBasePath(table, contentHash(path), fileName);
    if (config_.verbose) {
        std::cout << "Uploading " << path << " as " << basePath << std::endl;
    }
    FileSourceStream source(path);
    return upload(source, basePath);
}

std::vector<UploadReport> FileUploader::uploadFiles(const std::vector<std::string>& paths, const std::string& table) {
    std::vector<UploadReport> reports;
    reports.reserve(paths.size());
    for (const auto& path : paths) {
        reports.push_back(uploadFile(path, table));
    }
    return reports;
}

} // namespace GzSplit
