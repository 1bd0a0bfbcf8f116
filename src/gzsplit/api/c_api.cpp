#include "c_api.hpp"
#include "../core/Splitter.hpp"
#include "../storage/CommandObjectStore.hpp"
#include "../storage/LocalObjectStore.hpp"
#include "../strategies/GzipStrategy.hpp"
#include "../streaming/FileUploader.hpp"
#include "../streaming/SegmentRestorer.hpp"
#include "../utils/DestinationNaming.hpp"
#include <cstring>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace GzSplit;

namespace {
    char* str_to_c(const std::string& str) {
        char* cstr = new char[str.length() + 1];
        std::strcpy(cstr, str.c_str());
        return cstr;
    }

    GzSplitError make_error(int code, const std::string& message) {
        return {str_to_c(message), code};
    }

    // Must be called from inside a catch block
    GzSplitError convert_current_exception() {
        try {
            throw;
        } catch (const StoreError& e) {
            int code = e.kind() == StoreErrorKind::NotFound ? GZSPLIT_ERROR_DESTINATION_NOT_FOUND
                                                            : GZSPLIT_ERROR_DESTINATION_ACCESS;
            return make_error(code, e.what());
        } catch (const SourceReadError& e) {
            return make_error(GZSPLIT_ERROR_SOURCE_READ, e.what());
        } catch (const CompressionError& e) {
            return make_error(GZSPLIT_ERROR_COMPRESSION, e.what());
        } catch (const UploadError& e) {
            return make_error(GZSPLIT_ERROR_UPLOAD, e.what());
        } catch (const std::invalid_argument& e) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, e.what());
        } catch (const std::logic_error& e) {
            return make_error(GZSPLIT_ERROR_INTERNAL, e.what());
        } catch (const std::exception& e) {
            return make_error(GZSPLIT_ERROR_UNKNOWN, e.what());
        } catch (...) {
            return make_error(GZSPLIT_ERROR_UNKNOWN, "Unknown non-standard exception");
        }
    }

    GzSplitError validate_options(const GzSplitOptions* options) {
        if (!options) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "Invalid options pointer");
        }
        if (options->chunk_size == 0) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "chunk_size must be greater than zero");
        }
        if (options->max_segment_size == 0) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "max_segment_size must be greater than zero");
        }
        if (options->compression_level < -1 || options->compression_level > 9) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "compression_level must be between -1 and 9");
        }
        return {nullptr, GZSPLIT_SUCCESS};
    }

    std::shared_ptr<IObjectStore> make_store(const char* destination, const GzSplitOptions* options) {
        if (options->upload_command && *options->upload_command) {
            CommandStoreConfig config;
            config.uploadTemplate = options->upload_command;
            config.checkTemplate = options->check_command ? options->check_command : "";
            config.createTemplate = options->create_command ? options->create_command : "";
            return std::make_shared<CommandObjectStore>(config);
        }
        return std::make_shared<LocalObjectStore>(destination);
    }

    void fill_result(const UploadReport& report, GzSplitUploadResult* result) {
        result->base_path = str_to_c(report.basePath);
        result->object_list = str_to_c(joinObjectList(report.objects));
        result->manifest_object = report.manifestObject.empty() ? nullptr : str_to_c(report.manifestObject);
        result->num_segments = report.stats.numSegments;
        result->original_size = report.stats.originalSize;
        result->compressed_size = report.stats.compressedSize;
        result->compression_ratio = report.stats.compressionRatio;
        result->elapsed_ms = report.stats.elapsedMs;
        result->peak_buffered_bytes = report.stats.peakBufferedBytes;
    }
}

GzSplitError gzsplit_options_init(GzSplitOptions* options) {
    if (!options) {
        return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "Invalid options pointer");
    }
    options->chunk_size = DEFAULT_CHUNK_SIZE;
    options->max_segment_size = DEFAULT_MAX_SEGMENT_SIZE;
    options->compression_level = 6;
    options->verbose = 0;
    options->show_stats = 0;
    options->write_manifest = 1;
    options->upload_command = nullptr;
    options->check_command = nullptr;
    options->create_command = nullptr;
    return {nullptr, GZSPLIT_SUCCESS};
}

GzSplitError gzsplit_upload_files(const char* const* source_paths,
                                  size_t count,
                                  const char* table,
                                  const char* destination,
                                  const GzSplitOptions* options,
                                  GzSplitUploadResult* results) {
    try {
        if (!source_paths || !table || !destination || !results) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "Invalid arguments (null pointers)");
        }
        GzSplitError invalid = validate_options(options);
        if (invalid.code != GZSPLIT_SUCCESS) {
            return invalid;
        }
        for (size_t i = 0; i < count; ++i) {
            std::memset(&results[i], 0, sizeof(GzSplitUploadResult));
        }

        SplitterConfig config;
        config.chunkSize = options->chunk_size;
        config.maxSegmentSize = options->max_segment_size;
        config.verbose = options->verbose != 0;

        auto strategy = std::make_shared<GzipStrategy>(options->compression_level);
        FileUploader uploader(config, strategy, make_store(destination, options));
        uploader.setWriteManifest(options->write_manifest != 0);
        uploader.prepareDestination();

        for (size_t i = 0; i < count; ++i) {
            if (!source_paths[i]) {
                return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "Null source path at index " + std::to_string(i));
            }
            UploadReport report = uploader.uploadFile(source_paths[i], table);
            fill_result(report, &results[i]);
            if (options->verbose) {
                std::cout << "Uploaded " << source_paths[i] << " as " << report.stats.numSegments
                          << " segment(s)" << std::endl;
            }
        }
        return {nullptr, GZSPLIT_SUCCESS};
    } catch (...) {
        return convert_current_exception();
    }
}

GzSplitError gzsplit_restore(const char* destination,
                             const char* object_list,
                             const char* output_path,
                             uint64_t* bytes_restored) {
    try {
        if (!destination || !object_list || !output_path) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, "Invalid arguments (null pointers)");
        }
        std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error(GZSPLIT_ERROR_INVALID_ARGUMENT, std::string("Failed to open output file: ") + output_path);
        }

        LocalObjectStore store(destination);
        GzipStrategy strategy;
        SegmentRestorer restorer(store, strategy);
        uint64_t total = restorer.restore(splitObjectList(object_list), out);
        if (bytes_restored) {
            *bytes_restored = total;
        }
        return {nullptr, GZSPLIT_SUCCESS};
    } catch (...) {
        return convert_current_exception();
    }
}

void gzsplit_upload_result_free(GzSplitUploadResult* result) {
    if (!result) {
        return;
    }
    delete[] result->base_path;
    delete[] result->object_list;
    delete[] result->manifest_object;
    result->base_path = nullptr;
    result->object_list = nullptr;
    result->manifest_object = nullptr;
}

void gzsplit_error_free(GzSplitError* error) {
    if (error && error->message) {
        delete[] error->message;
        error->message = nullptr;
    }
}
