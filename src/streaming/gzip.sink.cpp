#include "gzip.sink.hh"
#include "macros.hh"

#include <algorithm>
#include <string>

namespace {
// 15 bits of window, +16 for a gzip header and trailer instead of zlib's
constexpr int gzip_window_bits = 15 + 16;
constexpr int default_mem_level = 8;
} // namespace

chunked::GzipSink::GzipSink(std::string_view filename, int level)
  : file_(std::string(filename), std::ios::binary | std::ios::trunc)
  , stream_{}
  , stream_open_{ false }
  , out_(buffer_size_)
  , bytes_written_{ 0 }
{
    EXPECT_IO(file_.is_open(), "Failed to open file '", filename, "'");

    stream_.zalloc = Z_NULL;
    stream_.zfree = Z_NULL;
    stream_.opaque = Z_NULL;

    const int ret = deflateInit2(&stream_,
                                 level,
                                 Z_DEFLATED,
                                 gzip_window_bits,
                                 default_mem_level,
                                 Z_DEFAULT_STRATEGY);
    EXPECT_COMPRESSION(ret == Z_OK, "zlib deflateInit2 failed: ", ret);
    stream_open_ = true;
}

chunked::GzipSink::~GzipSink()
{
    end_stream_();
}

bool
chunked::GzipSink::write(std::span<const std::byte> data)
{
    if (data.data() == nullptr || data.empty()) {
        return true;
    }

    if (!stream_open_) {
        LOG_ERROR("Cannot write to a finished gzip stream");
        return false;
    }

    // avail_in is 32 bits wide; larger buffers are fed in pieces
    constexpr size_t max_piece = 1u << 30;
    if (data.size() > max_piece) {
        for (size_t offset = 0; offset < data.size(); offset += max_piece) {
            if (!write(data.subspan(
                  offset, std::min(max_piece, data.size() - offset)))) {
                return false;
            }
        }
        return true;
    }

    // zlib takes a non-const input pointer but does not modify the input
    stream_.next_in =
      reinterpret_cast<Bytef*>(const_cast<std::byte*>(data.data()));
    stream_.avail_in = static_cast<uInt>(data.size());

    return deflate_(Z_NO_FLUSH);
}

uint64_t
chunked::GzipSink::bytes_on_disk() const noexcept
{
    return bytes_written_;
}

bool
chunked::GzipSink::flush_()
{
    bool success = true;
    if (stream_open_) {
        stream_.next_in = Z_NULL;
        stream_.avail_in = 0;
        success = deflate_(Z_FINISH);
        end_stream_();
    }

    file_.flush();
    file_.close();

    return success && !file_.fail();
}

bool
chunked::GzipSink::deflate_(int flush)
{
    int ret;
    do {
        stream_.next_out = out_.data();
        stream_.avail_out = static_cast<uInt>(out_.size());

        ret = deflate(&stream_, flush);
        if (ret == Z_STREAM_ERROR) {
            LOG_ERROR("zlib deflate failed: Z_STREAM_ERROR");
            return false;
        }

        const size_t have = out_.size() - stream_.avail_out;
        if (have > 0) {
            file_.write(reinterpret_cast<const char*>(out_.data()), have);
            if (!file_.good()) {
                LOG_ERROR("Failed to write ", have, " compressed bytes");
                return false;
            }
            bytes_written_ += have;
        }
    } while (stream_.avail_out == 0);

    if (flush == Z_FINISH && ret != Z_STREAM_END) {
        LOG_ERROR("zlib deflate failed to produce Z_STREAM_END: ", ret);
        return false;
    }

    return true;
}

void
chunked::GzipSink::end_stream_() noexcept
{
    if (stream_open_) {
        deflateEnd(&stream_);
        stream_open_ = false;
    }
}
