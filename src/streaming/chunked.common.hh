#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace chunked {
namespace compression {
/// Chunks are written as they are given.
struct Plain
{
};

/// Chunks are written as gzip streams.
struct Gzip
{
    /// 1 (fastest) through 9 (smallest), or -1 for the zlib default.
    int level = -1;
};
} // namespace compression

using CompressionMode = std::variant<compression::Plain, compression::Gzip>;

/**
 * @brief Trim whitespace from a string.
 * @param s The string to trim.
 * @return The string with leading and trailing whitespace removed.
 */
[[nodiscard]]
std::string
trim(std::string_view s);

/**
 * @brief Check if a string is empty, including whitespace.
 * @param s The string to check.
 * @param err_on_empty The message to log if the string is empty.
 * @return True if the string is empty, false otherwise.
 */
bool
is_empty_string(std::string_view s, std::string_view err_on_empty);

/**
 * @brief Convert a size in megabytes to bytes.
 * @param megabytes The size in units of 1024 * 1024 bytes.
 * @return The size in bytes.
 */
[[nodiscard]]
uint64_t
megabytes_to_bytes(uint32_t megabytes) noexcept;

/// @return ".gz" for gzip compression, otherwise the empty string.
[[nodiscard]]
std::string_view
chunk_file_suffix(const CompressionMode& mode) noexcept;

/**
 * @brief Get the file name for a chunk.
 * @details The name is `<naming_scheme>-<index>`, with the index zero-padded
 * to 5 digits, followed by the suffix for @p mode.
 * @param naming_scheme The prefix shared by all chunks of one writer.
 * @param chunk_index The index of the chunk.
 * @param mode The compression mode of the writer.
 * @return The chunk file name, without a directory.
 */
[[nodiscard]]
std::string
chunk_file_name(std::string_view naming_scheme,
                uint32_t chunk_index,
                const CompressionMode& mode);
} // namespace chunked
