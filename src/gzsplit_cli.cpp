#include <iostream>
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include "gzsplit/api/c_api.hpp"
#include "gzsplit/utils/CommandLine.hpp"

// Function prototypes
void printUsage(const char* programName);
int uploadFiles(const std::vector<std::string>& sources, const char* table, const char* destination,
                const GzSplitOptions& options);
int restoreObjects(const char* destination, const char* object_list, const char* output_path);

void printUsage(const char* programName) {
    std::cout << "gzsplit: split, gzip and upload large files as numbered segments\n";
    std::cout << "Usage:\n";
    std::cout << "  " << programName << " -u <source>... <table> <dest_root> [options]   (Upload)\n";
    std::cout << "  " << programName << " -r <dest_root> <object_list> <output_path>    (Restore)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  --chunk-size N         bytes per read and hand-off (default 8M)\n";
    std::cout << "  --max-segment-size N   uncompressed bytes per object (default 4G)\n";
    std::cout << "  --level N              gzip level -1..9 (default 6)\n";
    std::cout << "  --command TMPL         upload through a command reading stdin; {object} is the object name\n";
    std::cout << "  --check-command CMD    with --command: exits 0 when the destination exists\n";
    std::cout << "  --create-command CMD   with --command: creates a missing destination\n";
    std::cout << "  --no-manifest          do not write {base}_manifest.json\n";
    std::cout << "  --stats                print per-file statistics\n";
    std::cout << "  -v                     verbose progress\n";
    std::cout << "\nSizes accept K, M and G suffixes (powers of 1024).\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << programName << " -u events_2024.csv events ./out\n";
    std::cout << "  " << programName << " -u big.csv events bucket --command \"gsutil -q cp - gs://bucket/{object}\"\n";
    std::cout << "  " << programName << " -r ./out events_1a2b3c4d_events_2024.csv_chunk000000000.gz restored.csv\n";
}

int main(int argc, char** argv) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    std::string mode = argv[1];
    if (mode == "-u") {
        GzSplitOptions options;
        GzSplitError error = gzsplit_options_init(&options);
        if (error.code != 0) {
            std::cerr << "Error initializing options: " << error.message << " (code: " << error.code << ")\n";
            gzsplit_error_free(&error);
            return 1;
        }

        std::vector<std::string> args(argv + 2, argv + argc);
        GzSplit::UploadArguments parsed;
        try {
            parsed = GzSplit::parseUploadArguments(args, options);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            printUsage(argv[0]);
            return 1;
        }
        return uploadFiles(parsed.sources, parsed.table.c_str(), parsed.destination.c_str(), options);
    } else if (mode == "-r") {
        if (argc < 5) {
            printUsage(argv[0]);
            return 1;
        }
        return restoreObjects(argv[2], argv[3], argv[4]);
    } else {
        printUsage(argv[0]);
        return 1;
    }
}

int uploadFiles(const std::vector<std::string>& sources, const char* table, const char* destination,
                const GzSplitOptions& options) {
    std::vector<const char*> paths;
    for (const auto& source : sources) {
        paths.push_back(source.c_str());
    }
    std::vector<GzSplitUploadResult> results(sources.size());

    std::cout << "Uploading " << sources.size() << " file(s) for table " << table << " to " << destination << "\n";
    GzSplitError error = gzsplit_upload_files(paths.data(), paths.size(), table, destination, &options, results.data());
    int status = 0;
    if (error.code != 0) {
        std::cerr << "Error uploading: " << error.message << " (code: " << error.code << ")\n";
        std::cerr << "Segments already uploaded for the failing file are not cleaned up.\n";
        gzsplit_error_free(&error);
        status = 1;
    }

    for (size_t i = 0; i < results.size(); ++i) {
        GzSplitUploadResult& result = results[i];
        if (!result.object_list) {
            continue;
        }
        std::cout << sources[i] << ": " << result.object_list << "\n";
        if (options.show_stats) {
            std::cout << "Upload Stats:\n";
            std::cout << "  Segments: " << result.num_segments << "\n";
            std::cout << "  Original size: " << result.original_size << " bytes\n";
            std::cout << "  Compressed size: " << result.compressed_size << " bytes\n";
            std::cout << "  Compression ratio: " << result.compression_ratio << ":1\n";
            std::cout << "  Peak buffered: " << result.peak_buffered_bytes << " bytes\n";
            std::cout << "  Elapsed: " << result.elapsed_ms << " ms\n";
            if (result.manifest_object) {
                std::cout << "  Manifest: " << result.manifest_object << "\n";
            }
        }
        gzsplit_upload_result_free(&result);
    }
    return status;
}

int restoreObjects(const char* destination, const char* object_list, const char* output_path) {
    std::cout << "Restoring into " << output_path << " from " << destination << std::endl;
    uint64_t restored = 0;
    GzSplitError error = gzsplit_restore(destination, object_list, output_path, &restored);
    if (error.code != 0) {
        std::cerr << "Error restoring: " << error.message << " (code: " << error.code << ")" << std::endl;
        gzsplit_error_free(&error);
        return 1;
    }
    std::cout << "Restored " << restored << " bytes." << std::endl;
    return 0;
}
