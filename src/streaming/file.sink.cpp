#include "file.sink.hh"
#include "macros.hh"

#include <string>

chunked::FileSink::FileSink(std::string_view filename)
  : file_(std::string(filename), std::ios::binary | std::ios::trunc)
  , bytes_written_{ 0 }
{
    EXPECT_IO(file_.is_open(), "Failed to open file '", filename, "'");
}

bool
chunked::FileSink::write(std::span<const std::byte> data)
{
    const auto bytes_of_buf = data.size();
    if (data.data() == nullptr || bytes_of_buf == 0) {
        return true;
    }

    file_.write(reinterpret_cast<const char*>(data.data()), bytes_of_buf);
    if (!file_.good()) {
        LOG_ERROR("Failed to write ", bytes_of_buf, " bytes to file");
        return false;
    }

    bytes_written_ += bytes_of_buf;
    return true;
}

uint64_t
chunked::FileSink::bytes_on_disk() const noexcept
{
    return bytes_written_;
}

bool
chunked::FileSink::flush_()
{
    file_.flush();
    file_.close();

    return !file_.fail();
}
