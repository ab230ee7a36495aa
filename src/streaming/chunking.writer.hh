#pragma once

#include "sink.creator.hh"
#include "writer.config.hh"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace chunked {
/**
 * @brief Appends text to a rotating sequence of chunk files.
 * @details Chunk files are named `<naming_scheme>-<index>` with the index
 * zero-padded to 5 digits, plus `.gz` when gzip-compressed. Before each write
 * the size of the current chunk is checked, and once it exceeds the configured
 * maximum the next write goes to a fresh chunk. A single write is never split,
 * so a chunk can exceed the maximum by up to one write.
 *
 * The size checked is Sink::bytes_on_disk(), the count of bytes the sink has
 * handed to its file, not a file size queried from the filesystem. For gzip
 * chunks it counts compressed bytes emitted so far, so the deflate tail
 * written on close is not included.
 *
 * No file is created until the first write. All writes are serialized.
 */
class ChunkingWriter
{
  public:
    /// @throws chunked::ConfigurationError if @p config is invalid.
    explicit ChunkingWriter(WriterConfig config);

    /// @throws chunked::ConfigurationError if the arguments are invalid.
    ChunkingWriter(const std::filesystem::path& output_directory,
                   std::string_view naming_scheme,
                   uint32_t max_chunk_size_mb,
                   CompressionMode compression = compression::Gzip{});

    /**
     * @brief Construct with a custom sink factory.
     * @throws chunked::ConfigurationError if @p config is invalid.
     */
    ChunkingWriter(WriterConfig config,
                   std::unique_ptr<SinkCreator> sink_creator);

    ~ChunkingWriter() noexcept;

    ChunkingWriter(const ChunkingWriter&) = delete;
    ChunkingWriter& operator=(const ChunkingWriter&) = delete;

    /**
     * @brief Append @p text to the current chunk, rotating first if needed.
     * @throws chunked::IOFailure if a chunk cannot be opened or written.
     */
    void write(std::string_view text);

    /**
     * @brief Flush and release the current chunk, if any.
     * @details Subsequent calls are no-ops until the next write.
     * @throws chunked::IOFailure if the chunk cannot be flushed.
     */
    void close();

    /// @return The number of chunks opened so far.
    [[nodiscard]] uint32_t chunk_count() const;

    /// @return The path of the open chunk, or an empty path if none is open.
    [[nodiscard]] std::filesystem::path current_chunk_path() const;

    /// @return The number of rotations whose outgoing chunk failed to close.
    [[nodiscard]] uint32_t rotation_warning_count() const;

    [[nodiscard]] const WriterConfig& config() const noexcept;

  private:
    const WriterConfig config_;
    const uint64_t max_chunk_bytes_;
    std::unique_ptr<SinkCreator> sink_creator_;

    mutable std::mutex mutex_;
    uint32_t chunk_index_;
    std::filesystem::path current_path_;
    std::unique_ptr<Sink> current_sink_;
    uint32_t rotation_warnings_;

    [[nodiscard]] bool should_rotate_() const noexcept;
    void rotate_();
    void report_rotation_warning_(const std::filesystem::path& chunk_path,
                                  const std::string& message);
};
} // namespace chunked
