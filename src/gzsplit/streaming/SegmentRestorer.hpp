#ifndef SEGMENT_RESTORER_HPP
#define SEGMENT_RESTORER_HPP

#include "../storage/LocalObjectStore.hpp"
#include "../strategies/CompressionStrategy.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace GzSplit {

// Rebuilds the original byte stream from produced segment objects.
class SegmentRestorer {
public:
    SegmentRestorer(const LocalObjectStore& store, const ICompressionStrategy& strategy)
        : store_(store), strategy_(strategy) {}

    // Decompresses `objects` in order and appends them to `out`.
    // The objects must carry contiguous segment indices starting at 0.
    // Throws CompressionError, SourceReadError or std::invalid_argument.
    uint64_t restore(const std::vector<std::string>& objects, std::ostream& out) const;

private:
    const LocalObjectStore& store_;
    const ICompressionStrategy& strategy_;
};

} // namespace GzSplit

#endif // SEGMENT_RESTORER_HPP
