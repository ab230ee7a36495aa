#include "macros.hh"
#include "sink.creator.hh"
#include "file.sink.hh"
#include "gzip.sink.hh"

#include <zlib.h>

#include <filesystem>

namespace fs = std::filesystem;

namespace {
template<class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
} // namespace

std::unique_ptr<chunked::Sink>
chunked::SinkCreator::make_sink(std::string_view file_path,
                                const CompressionMode& mode)
{
    if (file_path.starts_with("file://")) {
        file_path = file_path.substr(7);
    }

    EXPECT(!file_path.empty(), "File path must not be empty.");

    fs::path path(file_path);
    EXPECT(!path.filename().empty(), "Invalid file path: ", file_path);

    return std::visit(
      overloaded{
        [&](const compression::Plain&) -> std::unique_ptr<Sink> {
            return std::make_unique<FileSink>(file_path);
        },
        [&](const compression::Gzip& gzip) -> std::unique_ptr<Sink> {
            const int level =
              gzip.level < 0 ? Z_DEFAULT_COMPRESSION : gzip.level;
            return std::make_unique<GzipSink>(file_path, level);
        },
      },
      mode);
}
