#pragma once

#include "sink.hh"

#include <fstream>
#include <string_view>

namespace chunked {
/// Writes bytes unchanged to a file, truncating it on open.
class FileSink : public Sink
{
  public:
    /// @throw chunked::IOFailure if the file cannot be opened.
    explicit FileSink(std::string_view filename);

    bool write(std::span<const std::byte> data) override;
    uint64_t bytes_on_disk() const noexcept override;

  protected:
    bool flush_() override;

  private:
    std::ofstream file_;
    uint64_t bytes_written_;
};
} // namespace chunked
