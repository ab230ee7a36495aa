/// @file
/// @brief Stream log-like text into gzip-compressed chunk files.
/// Usage: write-gzip-chunks [output-directory] [max-chunk-size-mb]
/// The output directory is created if it does not exist.

#include "chunked.writer.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

void
on_warning(const char* message, void* user_data)
{
    auto* warnings = static_cast<int*>(user_data);
    ++*warnings;
    fprintf(stderr, "Rotation warning: %s\n", message);
}

int
main(int argc, char* argv[])
{
    const std::string output_directory =
      argc > 1 ? argv[1] : (fs::temp_directory_path() / "gzip-chunks").string();
    const uint32_t max_chunk_size_mb =
      argc > 2 ? static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10)) : 1;

    std::error_code ec;
    fs::create_directories(output_directory, ec);
    if (ec) {
        fprintf(stderr,
                "Failed to create %s: %s\n",
                output_directory.c_str(),
                ec.message().c_str());
        return 1;
    }

    if (Chunked_set_log_level(ChunkedLogLevel_Info) != ChunkedStatus_Success) {
        fprintf(stderr, "Failed to set log level\n");
        return 1;
    }

    int warnings = 0;
    ChunkedWriterSettings settings{};
    settings.output_directory = output_directory.c_str();
    settings.naming_scheme = "events";
    settings.max_chunk_size_mb = max_chunk_size_mb;
    settings.compression = ChunkedCompression_Gzip;
    settings.compression_level = 6;
    settings.on_warning = on_warning;
    settings.user_data = &warnings;

    ChunkedStatus status;
    ChunkedWriter* writer = ChunkedWriter_create(&settings, &status);
    if (!writer) {
        fprintf(stderr,
                "Failed to create writer: %s\n",
                Chunked_get_status_message(status));
        return 1;
    }

    srand(static_cast<unsigned>(time(nullptr)));

    int retval = 0;
    char line[256];
    for (auto i = 0; i < 200000; ++i) {
        const int n = snprintf(line,
                               sizeof(line),
                               "%d\tsensor-%02d\t%d.%03d\n",
                               i,
                               rand() % 16,
                               rand() % 1000,
                               rand() % 1000);
        status = ChunkedWriter_write(writer, line, static_cast<size_t>(n));
        if (status != ChunkedStatus_Success) {
            fprintf(stderr,
                    "Failed to write line %d: %s\n",
                    i,
                    Chunked_get_status_message(status));
            retval = 1;
            break;
        }
    }

    if ((status = ChunkedWriter_close(writer)) != ChunkedStatus_Success) {
        fprintf(stderr,
                "Failed to close writer: %s\n",
                Chunked_get_status_message(status));
        retval = 1;
    }

    uint32_t chunk_count = 0;
    if (ChunkedWriter_get_chunk_count(writer, &chunk_count) !=
        ChunkedStatus_Success) {
        fprintf(stderr, "Failed to get chunk count\n");
        retval = 1;
    }
    printf("Wrote %u chunk(s) to %s with %d warning(s)\n",
           chunk_count,
           output_directory.c_str(),
           warnings);

    ChunkedWriter_destroy(writer);

    return retval;
}
