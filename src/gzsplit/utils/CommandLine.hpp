#ifndef COMMAND_LINE_HPP
#define COMMAND_LINE_HPP

#include "gzsplit/api/c_api.hpp"
#include <string>
#include <vector>

namespace GzSplit {

struct UploadArguments {
    std::vector<std::string> sources;
    std::string table;
    std::string destination;
};

// Parses the arguments that follow "-u": one or more sources, then the
// table and the destination, with options anywhere in between. String
// options are stored in `options` as pointers into `args`, which must
// outlive it. Throws std::invalid_argument (or std::out_of_range for sizes).
UploadArguments parseUploadArguments(const std::vector<std::string>& args, GzSplitOptions& options);

} // namespace GzSplit

#endif // COMMAND_LINE_HPP
