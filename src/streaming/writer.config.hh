#pragma once

#include "chunked.common.hh" // CompressionMode

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>

namespace chunked {
/// The outgoing chunk of a rotation could not be finalized. Its tail may be
/// missing; the writer has moved on to the next chunk regardless.
struct RotationWarning
{
    std::string chunk_path;
    std::string message;
};

using RotationWarningHandler = std::function<void(const RotationWarning&)>;

struct WriterConfig
{
    std::filesystem::path output_directory;
    std::string naming_scheme;
    uint32_t max_chunk_size_mb{ 0 };
    CompressionMode compression{ compression::Gzip{} };

    /// Optional. Called with the writer lock held.
    RotationWarningHandler on_warning;
};

/**
 * @brief Check that a writer configuration is usable.
 * @details The output directory must exist, be a directory, and be writable.
 * The maximum chunk size must be positive. The naming scheme, once trimmed,
 * must be nonempty and must not contain a path separator. A gzip level must
 * be -1 (the zlib default) or in [0, 9].
 * @throws chunked::ConfigurationError naming the first problem found.
 */
void
validate_writer_config(const WriterConfig& config);

/**
 * @brief Parse a writer configuration from a JSON object.
 * @details Keys: "output_directory" (string, required), "naming_scheme"
 * (string, required), "max_chunk_size_mb" (unsigned integer, required),
 * "compression" ("gzip" or "none", default "gzip"), and "compression_level"
 * (0-9, where 0 selects the zlib default; default 0). The result is not
 * validated.
 * @throws chunked::ConfigurationError if the document is malformed.
 */
[[nodiscard]]
WriterConfig
writer_config_from_json(std::string_view json);
} // namespace chunked
