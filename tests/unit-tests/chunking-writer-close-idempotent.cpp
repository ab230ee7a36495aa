#include "chunking.writer.hh"
#include "test.utilities.hh"
#include "unit.test.macros.hh"

int
main()
{
    int retval = 0;
    const fs::path tmp_dir = test::make_scratch_directory(TEST);

    try {
        chunked::ChunkingWriter writer(tmp_dir, "idem", 1);

        writer.write("first line\n");
        CHECK(writer.current_chunk_path() == tmp_dir / "idem-00000.gz");

        writer.close();
        CHECK(writer.current_chunk_path().empty());
        const auto size_after_close = fs::file_size(tmp_dir / "idem-00000.gz");

        // a second close touches nothing
        writer.close();
        writer.close();
        EXPECT_EQ(uintmax_t,
                  fs::file_size(tmp_dir / "idem-00000.gz"),
                  size_after_close);
        EXPECT_EQ(uint32_t, writer.chunk_count(), 1);
        EXPECT_STR_EQ(test::read_gzip_file(tmp_dir / "idem-00000.gz"),
                      "first line\n");

        // writing after a close opens the next chunk rather than reopening
        // the closed one
        writer.write("second line\n");
        EXPECT_EQ(uint32_t, writer.chunk_count(), 2);
        CHECK(writer.current_chunk_path() == tmp_dir / "idem-00001.gz");
        writer.close();

        const auto files = test::list_files(tmp_dir);
        EXPECT_EQ(size_t, files.size(), 2);
        EXPECT_STR_EQ(test::read_gzip_file(files[0]), "first line\n");
        EXPECT_STR_EQ(test::read_gzip_file(files[1]), "second line\n");
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
