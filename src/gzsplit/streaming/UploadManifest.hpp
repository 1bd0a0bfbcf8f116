#ifndef UPLOAD_MANIFEST_HPP
#define UPLOAD_MANIFEST_HPP

#include "../storage/ObjectStore.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace GzSplit {

struct UploadReport;

// {
//   "base_path": ..., "object_list": "a,b,c",
//   "total_original_bytes": N, "total_compressed_bytes": N,
//   "segments": [{"index", "object", "original_bytes", "compressed_bytes"}, ...]
// }
nlohmann::json buildManifest(const UploadReport& report);

// Writes the manifest as one object through the store's normal sink
void writeManifest(IObjectStore& store, const std::string& objectName, const nlohmann::json& manifest);

// Object names listed in a manifest, in segment order
std::vector<std::string> manifestObjects(const nlohmann::json& manifest);

} // namespace GzSplit

#endif // UPLOAD_MANIFEST_HPP
