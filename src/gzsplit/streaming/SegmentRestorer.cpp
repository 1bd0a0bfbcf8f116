#include "SegmentRestorer.hpp"
#include "../utils/DestinationNaming.hpp"
#include <fstream>
#include <stdexcept>

namespace GzSplit {

uint64_t SegmentRestorer::restore(const std::vector<std::string>& objects, std::ostream& out) const {
    uint64_t total = 0;
    for (size_t i = 0; i < objects.size(); ++i) {
        auto index = parseSegmentIndex(objects[i]);
        if (!index || *index != i) {
            throw std::invalid_argument("Object " + objects[i] + " is not segment " + std::to_string(i));
        }

        auto path = store_.objectPath(objects[i]);
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw SourceReadError("Failed to open segment object " + path.string());
        }
        total += strategy_.decompress(in, out);
    }
    out.flush();
    if (!out) {
        throw SplitterError("Failed to write restored output");
    }
    return total;
}

} // namespace GzSplit
