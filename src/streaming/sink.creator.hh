#pragma once

#include "chunked.common.hh" // CompressionMode
#include "sink.hh"

#include <memory>
#include <string_view>

namespace chunked {
class SinkCreator
{
  public:
    SinkCreator() = default;
    virtual ~SinkCreator() noexcept = default;

    /**
     * @brief Create a sink for a chunk file.
     * @details The file is created, or truncated if it exists. Its parent
     * directory must already exist.
     * @param file_path The path to the chunk file.
     * @param mode Selects a plain or a gzip sink.
     * @return Pointer to the sink created.
     * @throws chunked::IOFailure if the file cannot be opened.
     * @throws std::runtime_error if the file path is empty.
     */
    [[nodiscard]] virtual std::unique_ptr<Sink> make_sink(
      std::string_view file_path,
      const CompressionMode& mode);
};
} // namespace chunked
