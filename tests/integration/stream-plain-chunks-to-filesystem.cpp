#include "chunked.writer.h"
#include "test.macros.hh"

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {
const fs::path test_path = fs::temp_directory_path() / TEST;
const std::string test_dir = test_path.string();

const uint32_t max_chunk_size_mb = 2;
const uint64_t max_chunk_bytes = max_chunk_size_mb * 1024ULL * 1024ULL;
const int records_to_write = 4000;

std::string
make_record(int i)
{
    return "record " + std::to_string(i) + " " +
           std::string(1000 + (i * 37) % 1500, static_cast<char>('a' + i % 26)) + "\n";
}

ChunkedWriter*
setup()
{
    ChunkedWriterSettings settings{};
    settings.output_directory = test_dir.c_str();
    settings.naming_scheme = "plain";
    settings.max_chunk_size_mb = max_chunk_size_mb;
    settings.compression = ChunkedCompression_None;

    ChunkedStatus status = ChunkedStatus_InternalError;
    ChunkedWriter* writer = ChunkedWriter_create(&settings, &status);
    CHECK_OK(status);
    CHECK(writer);

    return writer;
}

std::vector<fs::path>
list_chunks()
{
    std::vector<fs::path> chunks;
    for (const auto& entry : fs::directory_iterator(test_path)) {
        chunks.push_back(entry.path());
    }
    std::sort(chunks.begin(), chunks.end());

    return chunks;
}

void
validate(const std::string& expected, uint32_t chunk_count)
{
    const auto chunks = list_chunks();
    EXPECT_EQ(size_t, chunks.size(), chunk_count);

    std::string actual;
    for (size_t i = 0; i < chunks.size(); ++i) {
        char name[32];
        snprintf(name, sizeof(name), "plain-%05zu", i);
        EXPECT_STR_EQ(chunks[i].filename().string(), name);

        const auto size = fs::file_size(chunks[i]);
        if (i + 1 < chunks.size()) {
            CHECK(size > max_chunk_bytes);
            CHECK(size < max_chunk_bytes + 4096);
        }

        std::ifstream ifs(chunks[i], std::ios::binary);
        CHECK(ifs.is_open());
        actual.append(std::istreambuf_iterator<char>(ifs),
                      std::istreambuf_iterator<char>());
    }

    EXPECT_EQ(size_t, actual.size(), expected.size());
    CHECK(actual == expected);
}
} // namespace

int
main()
{
    int retval = 1;

    try {
        fs::remove_all(test_path);
        fs::create_directories(test_path);

        auto* writer = setup();
        std::string expected;

        // empty writes are allowed and open the first chunk
        CHECK_OK(ChunkedWriter_write(writer, nullptr, 0));
        CHECK(fs::exists(test_path / "plain-00000"));

        for (auto i = 0; i < records_to_write; ++i) {
            const auto record = make_record(i);
            CHECK_OK(ChunkedWriter_write(writer, record.data(), record.size()));
            expected += record;
        }

        uint32_t chunk_count = 0;
        CHECK_OK(ChunkedWriter_get_chunk_count(writer, &chunk_count));
        CHECK(chunk_count > 1);

        uint32_t warnings = 1;
        CHECK_OK(ChunkedWriter_get_rotation_warning_count(writer, &warnings));
        EXPECT_EQ(uint32_t, warnings, 0);

        CHECK_OK(ChunkedWriter_close(writer));
        CHECK_OK(ChunkedWriter_close(writer));
        ChunkedWriter_destroy(writer);

        validate(expected, chunk_count);

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    std::error_code ec;
    fs::remove_all(test_path, ec);

    return retval;
}
