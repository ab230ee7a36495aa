#pragma once

#include "sink.hh"

#include <zlib.h>

#include <fstream>
#include <string_view>
#include <vector>

namespace chunked {
/// Deflates bytes into a gzip-framed file, truncating it on open.
class GzipSink : public Sink
{
  public:
    /**
     * @param filename The file to write.
     * @param level zlib compression level, 1-9, or Z_DEFAULT_COMPRESSION.
     * @throw chunked::IOFailure if the file cannot be opened.
     * @throw chunked::CompressionFailure if zlib rejects @p level or cannot
     * initialize the deflate stream.
     */
    GzipSink(std::string_view filename, int level);
    ~GzipSink() override;

    bool write(std::span<const std::byte> data) override;
    uint64_t bytes_on_disk() const noexcept override;

  protected:
    bool flush_() override;

  private:
    static constexpr size_t buffer_size_ = 16384;

    std::ofstream file_;
    z_stream stream_;
    bool stream_open_;
    std::vector<Bytef> out_;
    uint64_t bytes_written_;

    /// Run deflate until it has consumed its input (or finished, for
    /// Z_FINISH), writing its output to the file.
    [[nodiscard]] bool deflate_(int flush);
    void end_stream_() noexcept;
};
} // namespace chunked
