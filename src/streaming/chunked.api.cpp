#include "chunked.writer.h"
#include "chunking.writer.hh"
#include "macros.hh"

#include <cstdint> // uint32_t
#include <new>     // std::bad_alloc
#include <string>
#include <utility> // std::move

struct ChunkedWriter_s
{
  public:
    explicit ChunkedWriter_s(chunked::WriterConfig config)
      : writer(std::move(config))
    {
    }

    chunked::ChunkingWriter writer;
};

namespace {
void
set_status(ChunkedStatus* status, ChunkedStatus value)
{
    if (status) {
        *status = value;
    }
}

chunked::WriterConfig
make_config(const ChunkedWriterSettings* settings)
{
    chunked::WriterConfig config;
    config.output_directory =
      settings->output_directory ? settings->output_directory : "";
    config.naming_scheme =
      settings->naming_scheme ? settings->naming_scheme : "";
    config.max_chunk_size_mb = settings->max_chunk_size_mb;

    if (settings->compression == ChunkedCompression_None) {
        config.compression = chunked::compression::Plain{};
    } else {
        const int level = settings->compression_level == 0
                            ? -1
                            : static_cast<int>(settings->compression_level);
        config.compression = chunked::compression::Gzip{ level };
    }

    if (settings->on_warning) {
        auto callback = settings->on_warning;
        auto user_data = settings->user_data;
        config.on_warning = [callback,
                             user_data](const chunked::RotationWarning& w) {
            const std::string message = w.chunk_path + ": " + w.message;
            callback(message.c_str(), user_data);
        };
    }

    return config;
}

/// Build a config with @p make_config and a writer from it. Every exception
/// either step throws is turned into a status here.
template<typename MakeConfig>
ChunkedWriter*
create_writer(MakeConfig&& make_config, ChunkedStatus* status)
{
    ChunkedWriter* writer = nullptr;

    try {
        writer = new ChunkedWriter_s(make_config());
    } catch (const chunked::ConfigurationError& e) {
        LOG_ERROR("Invalid chunked writer settings: ", e.what());
        set_status(status, ChunkedStatus_InvalidSettings);
        return nullptr;
    } catch (const std::bad_alloc&) {
        LOG_ERROR("Failed to allocate memory for chunked writer");
        set_status(status, ChunkedStatus_OutOfMemory);
        return nullptr;
    } catch (const std::exception& e) {
        LOG_ERROR("Error creating chunked writer: ", e.what());
        set_status(status, ChunkedStatus_InternalError);
        return nullptr;
    }

    set_status(status, ChunkedStatus_Success);
    return writer;
}

/// Run an observer, mapping a failure to lock the writer to a status.
template<typename Get>
ChunkedStatus
observe(const ChunkedWriter* writer, uint32_t* count, Get&& get)
{
    try {
        *count = get(writer->writer);
    } catch (const std::exception& e) {
        LOG_ERROR("Error reading writer state: ", e.what());
        return ChunkedStatus_InternalError;
    }

    return ChunkedStatus_Success;
}
} // namespace

extern "C"
{
    uint32_t Chunked_get_api_version()
    {
        return CHUNKED_WRITER_API_VERSION;
    }

    ChunkedStatus Chunked_set_log_level(ChunkedLogLevel level)
    {
        EXPECT_VALID_ARGUMENT(
          level >= ChunkedLogLevel_Debug && level < ChunkedLogLevelCount,
          "Invalid log level: ",
          static_cast<int>(level));

        Logger::set_log_level(level);
        return ChunkedStatus_Success;
    }

    ChunkedLogLevel Chunked_get_log_level()
    {
        return Logger::get_log_level();
    }

    const char* Chunked_get_status_message(ChunkedStatus status)
    {
        switch (status) {
            case ChunkedStatus_Success:
                return "Success";
            case ChunkedStatus_InvalidArgument:
                return "Invalid argument";
            case ChunkedStatus_InternalError:
                return "Internal error";
            case ChunkedStatus_OutOfMemory:
                return "Out of memory";
            case ChunkedStatus_IOError:
                return "I/O error";
            case ChunkedStatus_CompressionError:
                return "Compression error";
            case ChunkedStatus_InvalidSettings:
                return "Invalid settings";
            default:
                return "Unknown error";
        }
    }

    ChunkedWriter* ChunkedWriter_create(const ChunkedWriterSettings* settings,
                                        ChunkedStatus* status)
    {
        if (!settings) {
            LOG_ERROR("Null pointer: settings");
            set_status(status, ChunkedStatus_InvalidArgument);
            return nullptr;
        }

        if (settings->compression >= ChunkedCompressionCount) {
            LOG_ERROR("Invalid compression: ",
                      static_cast<int>(settings->compression));
            set_status(status, ChunkedStatus_InvalidSettings);
            return nullptr;
        }

        return create_writer([settings] { return make_config(settings); },
                             status);
    }

    ChunkedWriter* ChunkedWriter_create_from_json(const char* json,
                                                  ChunkedStatus* status)
    {
        if (!json) {
            LOG_ERROR("Null pointer: json");
            set_status(status, ChunkedStatus_InvalidArgument);
            return nullptr;
        }

        return create_writer(
          [json] { return chunked::writer_config_from_json(json); }, status);
    }

    void ChunkedWriter_destroy(ChunkedWriter* writer)
    {
        delete writer;
    }

    ChunkedStatus ChunkedWriter_write(ChunkedWriter* writer,
                                      const char* data,
                                      size_t bytes_of_data)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");
        EXPECT_VALID_ARGUMENT(data || bytes_of_data == 0, "Null pointer: data");

        try {
            writer->writer.write({ data ? data : "", bytes_of_data });
        } catch (const chunked::CompressionFailure& e) {
            LOG_ERROR("Error compressing chunk: ", e.what());
            return ChunkedStatus_CompressionError;
        } catch (const chunked::IOFailure& e) {
            LOG_ERROR("Error writing chunk: ", e.what());
            return ChunkedStatus_IOError;
        } catch (const std::bad_alloc&) {
            LOG_ERROR("Out of memory writing chunk");
            return ChunkedStatus_OutOfMemory;
        } catch (const std::exception& e) {
            LOG_ERROR("Error writing chunk: ", e.what());
            return ChunkedStatus_InternalError;
        }

        return ChunkedStatus_Success;
    }

    ChunkedStatus ChunkedWriter_close(ChunkedWriter* writer)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");

        try {
            writer->writer.close();
        } catch (const chunked::IOFailure& e) {
            LOG_ERROR("Error closing chunk: ", e.what());
            return ChunkedStatus_IOError;
        } catch (const std::exception& e) {
            LOG_ERROR("Error closing chunk: ", e.what());
            return ChunkedStatus_InternalError;
        }

        return ChunkedStatus_Success;
    }

    ChunkedStatus ChunkedWriter_get_chunk_count(const ChunkedWriter* writer,
                                                uint32_t* count)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");
        EXPECT_VALID_ARGUMENT(count, "Null pointer: count");

        return observe(writer, count, [](const chunked::ChunkingWriter& w) {
            return w.chunk_count();
        });
    }

    ChunkedStatus ChunkedWriter_get_rotation_warning_count(
      const ChunkedWriter* writer,
      uint32_t* count)
    {
        EXPECT_VALID_ARGUMENT(writer, "Null pointer: writer");
        EXPECT_VALID_ARGUMENT(count, "Null pointer: count");

        return observe(writer, count, [](const chunked::ChunkingWriter& w) {
            return w.rotation_warning_count();
        });
    }
}
