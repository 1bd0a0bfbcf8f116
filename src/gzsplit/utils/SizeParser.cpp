#include "SizeParser.hpp"
#include <cctype>
#include <limits>
#include <stdexcept>

namespace GzSplit {

uint64_t parseSize(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        throw std::invalid_argument("invalid size '" + text + "'");
    }
    size_t consumed = 0;
    unsigned long long value = std::stoull(text, &consumed);
    std::string suffix = text.substr(consumed);

    int shift = 0;
    if (suffix.empty()) {
        shift = 0;
    } else if (suffix == "K" || suffix == "k") {
        shift = 10;
    } else if (suffix == "M" || suffix == "m") {
        shift = 20;
    } else if (suffix == "G" || suffix == "g") {
        shift = 30;
    } else {
        throw std::invalid_argument("unknown size suffix '" + suffix + "'");
    }

    if (value > (std::numeric_limits<uint64_t>::max() >> shift)) {
        throw std::out_of_range("size '" + text + "' does not fit in 64 bits");
    }
    return static_cast<uint64_t>(value) << shift;
}

} // namespace GzSplit
