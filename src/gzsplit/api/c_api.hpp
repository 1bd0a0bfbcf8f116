#ifndef GZSPLIT_C_API_HPP
#define GZSPLIT_C_API_HPP

#include "gzsplit_export.h"
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * Status codes returned in GzSplitError::code
 */
typedef enum {
    GZSPLIT_SUCCESS = 0,
    GZSPLIT_ERROR_INVALID_ARGUMENT = -1,
    GZSPLIT_ERROR_SOURCE_READ = -2,
    GZSPLIT_ERROR_COMPRESSION = -3,
    GZSPLIT_ERROR_UPLOAD = -4,
    GZSPLIT_ERROR_DESTINATION_NOT_FOUND = -5,
    GZSPLIT_ERROR_DESTINATION_ACCESS = -6,
    GZSPLIT_ERROR_INTERNAL = -7,
    GZSPLIT_ERROR_UNKNOWN = -99
} GzSplitStatus;

// Error handling
typedef struct {
    const char* message;
    int code;
} GzSplitError;

// Upload options
typedef struct {
    uint64_t chunk_size;          // bytes per read and per hand-off (default 8 MiB)
    uint64_t max_segment_size;    // uncompressed bytes per object (default 4 GiB)
    int compression_level;        // zlib level, -1..9 (default 6)
    int verbose;
    int show_stats;
    int write_manifest;           // write {base}_manifest.json next to the segments (default 1)
    const char* upload_command;   // NULL: local directory store; else template with {object}
    const char* check_command;    // optional container check for the command store
    const char* create_command;   // optional container creation for the command store
} GzSplitOptions;

// Result of uploading one source file
typedef struct {
    char* base_path;
    char* object_list;            // comma separated, creation order
    char* manifest_object;        // NULL when no manifest was written
    size_t num_segments;
    uint64_t original_size;
    uint64_t compressed_size;
    double compression_ratio;
    double elapsed_ms;
    uint64_t peak_buffered_bytes;
} GzSplitUploadResult;

// Initialize upload options with defaults
GZSPLIT_API GzSplitError gzsplit_options_init(GzSplitOptions* options);

// Upload `count` files for `table`, one after another. `results` must hold
// `count` entries; on failure the entries of files already finished are
// filled in and must still be released.
GZSPLIT_API GzSplitError gzsplit_upload_files(
    const char* const* source_paths,
    size_t count,
    const char* table,
    const char* destination,
    const GzSplitOptions* options,
    GzSplitUploadResult* results
);

// Decompress the listed segment objects from a local destination, in order,
// into output_path
GZSPLIT_API GzSplitError gzsplit_restore(
    const char* destination,
    const char* object_list,
    const char* output_path,
    uint64_t* bytes_restored
);

GZSPLIT_API void gzsplit_upload_result_free(GzSplitUploadResult* result);

// Free error message
GZSPLIT_API void gzsplit_error_free(GzSplitError* error);

#ifdef __cplusplus
}
#endif

#endif // GZSPLIT_C_API_HPP
