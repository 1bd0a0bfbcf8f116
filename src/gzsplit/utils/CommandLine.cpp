#include "CommandLine.hpp"
#include "SizeParser.hpp"
#include <stdexcept>

namespace GzSplit {

UploadArguments parseUploadArguments(const std::vector<std::string>& args, GzSplitOptions& options) {
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        auto value = [&]() -> const std::string& {
            if (i + 1 >= args.size()) {
                throw std::invalid_argument(arg + " needs a value");
            }
            return args[++i];
        };
        if (arg == "--chunk-size") {
            options.chunk_size = parseSize(value());
        } else if (arg == "--max-segment-size") {
            options.max_segment_size = parseSize(value());
        } else if (arg == "--level") {
            options.compression_level = std::stoi(value());
        } else if (arg == "--command") {
            options.upload_command = value().c_str();
        } else if (arg == "--check-command") {
            options.check_command = value().c_str();
        } else if (arg == "--create-command") {
            options.create_command = value().c_str();
        } else if (arg == "--no-manifest") {
            options.write_manifest = 0;
        } else if (arg == "--stats") {
            options.show_stats = 1;
        } else if (arg == "-v") {
            options.verbose = 1;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("unknown option " + arg);
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 3) {
        throw std::invalid_argument("expected <source>... <table> <dest_root>");
    }
    UploadArguments parsed;
    parsed.destination = positional.back();
    positional.pop_back();
    parsed.table = positional.back();
    positional.pop_back();
    parsed.sources = std::move(positional);
    return parsed;
}

} // namespace GzSplit
