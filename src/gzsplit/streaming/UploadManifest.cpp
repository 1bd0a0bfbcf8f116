#include "UploadManifest.hpp"
#include "FileUploader.hpp"
#include "../utils/DestinationNaming.hpp"

using json = nlohmann::json;

namespace GzSplit {

json buildManifest(const UploadReport& report) {
    json segments = json::array();
    for (const auto& segment : report.segments) {
        segments.push_back({
            {"index", segment.index},
            {"object", segment.objectName},
            {"original_bytes", segment.originalSize},
            {"compressed_bytes", segment.compressedSize}
        });
    }

    json manifest;
    manifest["base_path"] = report.basePath;
    manifest["object_list"] = joinObjectList(report.objects);
    manifest["total_original_bytes"] = report.stats.originalSize;
    manifest["total_compressed_bytes"] = report.stats.compressedSize;
    manifest["segments"] = segments;
    return manifest;
}

void writeManifest(IObjectStore& store, const std::string& objectName, const json& manifest) {
    const std::string text = manifest.dump(4) + "\n";
    auto sink = store.openSink(objectName);
    sink->write(reinterpret_cast<const std::byte*>(text.data()), text.size());
    sink->close();
}

std::vector<std::string> manifestObjects(const json& manifest) {
    std::vector<std::string> objects;
    for (const auto& segment : manifest.at("segments")) {
        objects.push_back(segment.at("object").get<std::string>());
    }
    return objects;
}

} // namespace GzSplit
