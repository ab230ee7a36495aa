#include "macros.hh"
#include "chunking.writer.hh"

#include <utility>

namespace fs = std::filesystem;

namespace {
chunked::WriterConfig
make_valid_config(chunked::WriterConfig config)
{
    chunked::validate_writer_config(config);
    config.naming_scheme = chunked::trim(config.naming_scheme);

    return config;
}
} // namespace

chunked::ChunkingWriter::ChunkingWriter(WriterConfig config)
  : ChunkingWriter(std::move(config), std::make_unique<SinkCreator>())
{
}

chunked::ChunkingWriter::ChunkingWriter(const fs::path& output_directory,
                                        std::string_view naming_scheme,
                                        uint32_t max_chunk_size_mb,
                                        CompressionMode compression)
  : ChunkingWriter(WriterConfig{
      .output_directory = output_directory,
      .naming_scheme = std::string(naming_scheme),
      .max_chunk_size_mb = max_chunk_size_mb,
      .compression = compression,
    })
{
}

chunked::ChunkingWriter::ChunkingWriter(
  WriterConfig config,
  std::unique_ptr<SinkCreator> sink_creator)
  : config_(make_valid_config(std::move(config)))
  , max_chunk_bytes_(megabytes_to_bytes(config_.max_chunk_size_mb))
  , sink_creator_(std::move(sink_creator))
  , chunk_index_{ 0 }
  , rotation_warnings_{ 0 }
{
    CHECK(sink_creator_);
}

chunked::ChunkingWriter::~ChunkingWriter() noexcept
{
    try {
        close();
    } catch (const std::exception& exc) {
        LOG_ERROR("Error closing chunk writer: ", exc.what());
    }
}

void
chunked::ChunkingWriter::write(std::string_view text)
{
    std::scoped_lock lock(mutex_);

    if (should_rotate_()) {
        rotate_();
    }

    std::span data{ reinterpret_cast<const std::byte*>(text.data()),
                    text.size() };
    if (!current_sink_->write(data)) {
        // drop the broken chunk so that the next write starts a fresh one
        const auto path = current_path_;
        current_sink_.reset();
        current_path_.clear();

        const std::string err =
          LOG_ERROR("Failed to write ", text.size(), " bytes to ", path);
        throw IOFailure(err);
    }
}

void
chunked::ChunkingWriter::close()
{
    std::scoped_lock lock(mutex_);

    if (!current_sink_) {
        return;
    }

    const auto path = current_path_;
    current_path_.clear();

    EXPECT_IO(finalize_sink(std::move(current_sink_)),
              "Failed to finalize chunk ",
              path);
    LOG_DEBUG("Closed chunk ", path);
}

uint32_t
chunked::ChunkingWriter::chunk_count() const
{
    std::scoped_lock lock(mutex_);
    return chunk_index_;
}

fs::path
chunked::ChunkingWriter::current_chunk_path() const
{
    std::scoped_lock lock(mutex_);
    return current_path_;
}

uint32_t
chunked::ChunkingWriter::rotation_warning_count() const
{
    std::scoped_lock lock(mutex_);
    return rotation_warnings_;
}

const chunked::WriterConfig&
chunked::ChunkingWriter::config() const noexcept
{
    return config_;
}

bool
chunked::ChunkingWriter::should_rotate_() const noexcept
{
    return !current_sink_ || current_sink_->bytes_on_disk() > max_chunk_bytes_;
}

void
chunked::ChunkingWriter::rotate_()
{
    fs::path outgoing;
    if (current_sink_) {
        outgoing = current_path_;
        current_path_.clear();

        // a failed close must not stop the rotation
        try {
            if (!finalize_sink(std::move(current_sink_))) {
                report_rotation_warning_(outgoing, "Failed to finalize chunk");
            }
        } catch (const std::exception& exc) {
            current_sink_.reset();
            report_rotation_warning_(outgoing, exc.what());
        }
    }

    const auto path =
      config_.output_directory /
      chunk_file_name(config_.naming_scheme, chunk_index_++, config_.compression);

    current_sink_ = sink_creator_->make_sink(path.string(), config_.compression);
    EXPECT_IO(current_sink_, "Failed to create sink for chunk ", path);
    current_path_ = path;

    if (outgoing.empty()) {
        LOG_DEBUG("Opened chunk ", path);
    } else {
        LOG_INFO("Rotated from ", outgoing, " to ", path);
    }
}

void
chunked::ChunkingWriter::report_rotation_warning_(const fs::path& chunk_path,
                                                  const std::string& message)
{
    ++rotation_warnings_;
    LOG_WARNING("Rotating away from chunk ", chunk_path, ": ", message);

    if (!config_.on_warning) {
        return;
    }

    try {
        config_.on_warning(RotationWarning{
          .chunk_path = chunk_path.string(),
          .message = message,
        });
    } catch (const std::exception& exc) {
        LOG_ERROR("Rotation warning handler threw: ", exc.what());
    }
}
