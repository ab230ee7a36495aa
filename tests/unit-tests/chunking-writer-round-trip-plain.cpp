#include "chunking.writer.hh"
#include "test.utilities.hh"
#include "unit.test.macros.hh"

#include <random>

namespace {
constexpr uint64_t max_chunk_bytes = 1024 * 1024;

std::string
make_record(std::mt19937& rng, size_t index)
{
    std::uniform_int_distribution<size_t> length(0, 200000);
    std::string record = "{\"id\": " + std::to_string(index) + ", \"body\": \"";
    record.append(length(rng), static_cast<char>('a' + index % 26));
    record += "\", \"note\": \"naïve café\"}\n";

    return record;
}
} // namespace

int
main()
{
    int retval = 0;
    const fs::path tmp_dir = test::make_scratch_directory(TEST);

    try {
        std::mt19937 rng(42);
        std::string expected;
        uint32_t expected_chunks = 0;
        uint64_t bytes_in_chunk = 0;

        {
            chunked::ChunkingWriter writer(
              tmp_dir, "records", 1, chunked::compression::Plain{});

            for (size_t i = 0; i < 80; ++i) {
                const auto record = make_record(rng, i);

                // mirror the rotation rule
                if (expected_chunks == 0 || bytes_in_chunk > max_chunk_bytes) {
                    ++expected_chunks;
                    bytes_in_chunk = 0;
                }
                bytes_in_chunk += record.size();

                writer.write(record);
                expected += record;
                EXPECT_EQ(uint32_t, writer.chunk_count(), expected_chunks);
            }

            writer.close();
        }

        CHECK(expected_chunks > 2);

        const auto files = test::list_files(tmp_dir);
        EXPECT_EQ(size_t, files.size(), expected_chunks);

        std::string actual;
        for (size_t i = 0; i < files.size(); ++i) {
            EXPECT_STR_EQ(files[i].filename().string(),
                          chunked::chunk_file_name(
                            "records",
                            static_cast<uint32_t>(i),
                            chunked::compression::Plain{}));

            const auto contents = test::read_file(files[i]);
            CHECK(!contents.empty());

            // every chunk but the last was observed over the limit
            if (i + 1 < files.size()) {
                CHECK(contents.size() > max_chunk_bytes);
            }
            actual += contents;
        }

        EXPECT_EQ(size_t, actual.size(), expected.size());
        CHECK(actual == expected);
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
