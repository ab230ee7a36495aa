#include "chunked.errors.hh"
#include "chunking.writer.hh"
#include "test.utilities.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 0;
    const fs::path tmp_dir = test::make_scratch_directory(TEST);

    try {
        // nothing is created before the first write
        {
            chunked::ChunkingWriter writer(tmp_dir, "lazy", 1);
            CHECK(test::list_files(tmp_dir).empty());
            EXPECT_EQ(uint32_t, writer.chunk_count(), 0);
            CHECK(writer.current_chunk_path().empty());

            // closing without a write is a no-op
            writer.close();
            CHECK(test::list_files(tmp_dir).empty());
        }

        // nor on destruction
        CHECK(test::list_files(tmp_dir).empty());

        // the first write creates the first chunk
        {
            chunked::ChunkingWriter writer(
              tmp_dir, "lazy", 1, chunked::compression::Plain{});
            writer.write("");

            const auto files = test::list_files(tmp_dir);
            EXPECT_EQ(size_t, files.size(), 1);
            EXPECT_STR_EQ(files[0].filename().string(), "lazy-00000");
            CHECK(writer.current_chunk_path() == tmp_dir / "lazy-00000");
            EXPECT_EQ(uint32_t, writer.chunk_count(), 1);
        }
        fs::remove_all(tmp_dir);
        fs::create_directories(tmp_dir);

        // a missing directory fails at construction, not at the first write
        const fs::path missing = tmp_dir / "missing";
        EXPECT_THROWS(chunked::ConfigurationError,
                      chunked::ChunkingWriter(missing, "lazy", 1));
        CHECK(!fs::exists(missing));
        CHECK(test::list_files(tmp_dir).empty());

        // as does a zero chunk size
        EXPECT_THROWS(chunked::ConfigurationError,
                      chunked::ChunkingWriter(tmp_dir, "lazy", 0));
        CHECK(test::list_files(tmp_dir).empty());

        // the naming scheme is trimmed
        {
            chunked::ChunkingWriter writer(tmp_dir, "  spaced\t", 1);
            EXPECT_STR_EQ(writer.config().naming_scheme, "spaced");
            writer.write("x");
            writer.close();

            const auto files = test::list_files(tmp_dir);
            EXPECT_EQ(size_t, files.size(), 1);
            EXPECT_STR_EQ(files[0].filename().string(), "spaced-00000.gz");
        }
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
