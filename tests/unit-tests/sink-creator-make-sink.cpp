#include "chunked.errors.hh"
#include "file.sink.hh"
#include "gzip.sink.hh"
#include "sink.creator.hh"
#include "test.utilities.hh"
#include "unit.test.macros.hh"

#include <string_view>

namespace {
std::span<const std::byte>
bytes_of(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}
} // namespace

int
main()
{
    int retval = 0;
    const fs::path tmp_dir = test::make_scratch_directory(TEST);

    try {
        chunked::SinkCreator creator;

        {
            const fs::path path = tmp_dir / "plain-00000";
            auto sink =
              creator.make_sink(path.string(), chunked::compression::Plain{});
            CHECK(sink);
            CHECK(dynamic_cast<chunked::FileSink*>(sink.get()) != nullptr);
            CHECK(fs::is_regular_file(path));

            CHECK(sink->write(bytes_of("plain text")));
            CHECK(chunked::finalize_sink(std::move(sink)));
            EXPECT_STR_EQ(test::read_file(path), "plain text");
        }

        {
            const fs::path path = tmp_dir / "gzip-00000.gz";
            auto sink = creator.make_sink("file://" + path.string(),
                                          chunked::compression::Gzip{ 9 });
            CHECK(sink);
            CHECK(dynamic_cast<chunked::GzipSink*>(sink.get()) != nullptr);
            CHECK(fs::is_regular_file(path));

            CHECK(sink->write(bytes_of("gzip text")));
            CHECK(chunked::finalize_sink(std::move(sink)));
            EXPECT_STR_EQ(test::read_gzip_file(path), "gzip text");
        }

        // the default level is accepted
        {
            const fs::path path = tmp_dir / "gzip-00001.gz";
            auto sink =
              creator.make_sink(path.string(), chunked::compression::Gzip{});
            CHECK(chunked::finalize_sink(std::move(sink)));
            CHECK(fs::is_regular_file(path));
        }

        // an existing file is truncated
        {
            const fs::path path = tmp_dir / "plain-00000";
            auto sink =
              creator.make_sink(path.string(), chunked::compression::Plain{});
            CHECK(chunked::finalize_sink(std::move(sink)));
            EXPECT_EQ(uintmax_t, fs::file_size(path), 0);
        }

        EXPECT_THROWS(std::runtime_error,
                      creator.make_sink("", chunked::compression::Plain{}));

        // a level zlib rejects surfaces as a compression failure
        EXPECT_THROWS(chunked::CompressionFailure,
                      creator.make_sink((tmp_dir / "bad-level.gz").string(),
                                        chunked::compression::Gzip{ 42 }));
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
        retval = 1;
    }

    std::error_code ec;
    fs::remove_all(tmp_dir, ec);
    if (ec) {
        LOG_ERROR("Failed to remove directory: ", ec.message());
        retval = 1;
    }

    return retval;
}
