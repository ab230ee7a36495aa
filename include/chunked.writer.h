#pragma once

#include "chunked.types.h"

#ifdef __cplusplus
extern "C"
{
#endif

#define CHUNKED_WRITER_API_VERSION 0

    /**
     * @brief The settings for a chunked writer.
     * @details Chunk files are written to @p output_directory and named
     * `<naming_scheme>-<index>`, with the index zero-padded to 5 digits and a
     * `.gz` suffix when compressing. A new chunk is started once the current
     * one has grown past @p max_chunk_size_mb megabytes.
     * @note The output directory must already exist and be writable.
     */
    typedef struct ChunkedWriterSettings_s
    {
        const char* output_directory; /**< Directory to write chunks into. */
        const char* naming_scheme; /**< Prefix shared by all chunk file names. */
        uint32_t max_chunk_size_mb; /**< Rotation threshold in MiB. Must be positive. */
        ChunkedCompression compression; /**< Compression of each chunk. */
        uint8_t compression_level; /**< Gzip level 1-9, or 0 for the zlib default. */
        ChunkedWarningCallback on_warning; /**< Optional rotation warning callback. */
        void* user_data; /**< Passed back to @p on_warning. */
    } ChunkedWriterSettings;

    typedef struct ChunkedWriter_s ChunkedWriter;

    /**
     * @brief Get the version of the chunked writer API.
     * @return The version of the chunked writer API.
     */
    uint32_t Chunked_get_api_version();

    /**
     * @brief Set the log level for the library.
     * @param level The log level.
     * @return ChunkedStatus_Success on success, or an error code on failure.
     */
    ChunkedStatus Chunked_set_log_level(ChunkedLogLevel level);

    /**
     * @brief Get the log level for the library.
     * @return The log level for the library.
     */
    ChunkedLogLevel Chunked_get_log_level();

    /**
     * @brief Get the message for the given status code.
     * @param status The status code.
     * @return A human-readable status message.
     */
    const char* Chunked_get_status_message(ChunkedStatus status);

    /**
     * @brief Create a chunked writer.
     * @details No file is created until the first call to ChunkedWriter_write.
     * @param[in] settings The settings for the writer.
     * @param[out] status Optional. Receives ChunkedStatus_InvalidSettings if
     * the settings are rejected.
     * @return A pointer to the writer, or NULL on failure.
     */
    ChunkedWriter* ChunkedWriter_create(const ChunkedWriterSettings* settings,
                                        ChunkedStatus* status);

    /**
     * @brief Create a chunked writer from a JSON configuration document.
     * @details Recognized keys are "output_directory", "naming_scheme",
     * "max_chunk_size_mb", "compression" ("gzip" or "none") and
     * "compression_level".
     * @param[in] json A null-terminated JSON object.
     * @param[out] status Optional. Receives the failure status.
     * @return A pointer to the writer, or NULL on failure.
     */
    ChunkedWriter* ChunkedWriter_create_from_json(const char* json,
                                                  ChunkedStatus* status);

    /**
     * @brief Close and destroy a chunked writer.
     * @details Errors while closing are logged, not reported.
     * @param writer The writer to destroy.
     */
    void ChunkedWriter_destroy(ChunkedWriter* writer);

    /**
     * @brief Append data to the current chunk.
     * @details Rotates to a new chunk first if the current chunk has grown
     * past the configured size. The data is written as a single unit.
     * Safe to call from multiple threads.
     * @param[in, out] writer The writer.
     * @param[in] data The bytes to append, UTF-8 text.
     * @param[in] bytes_of_data The number of bytes in @p data.
     * @return ChunkedStatus_Success on success, or an error code on failure.
     */
    ChunkedStatus ChunkedWriter_write(ChunkedWriter* writer,
                                      const char* data,
                                      size_t bytes_of_data);

    /**
     * @brief Flush and close the current chunk, if any.
     * @details Calling this more than once is harmless.
     * @param[in, out] writer The writer.
     * @return ChunkedStatus_Success on success, or an error code on failure.
     */
    ChunkedStatus ChunkedWriter_close(ChunkedWriter* writer);

    /**
     * @brief Get the number of chunks opened so far.
     * @param[in] writer The writer.
     * @param[out] count The number of chunks.
     * @return ChunkedStatus_Success on success, or an error code on failure.
     */
    ChunkedStatus ChunkedWriter_get_chunk_count(const ChunkedWriter* writer,
                                                uint32_t* count);

    /**
     * @brief Get the number of rotations whose outgoing chunk could not be
     * finalized.
     * @param[in] writer The writer.
     * @param[out] count The number of warnings.
     * @return ChunkedStatus_Success on success, or an error code on failure.
     */
    ChunkedStatus ChunkedWriter_get_rotation_warning_count(
      const ChunkedWriter* writer,
      uint32_t* count);

#ifdef __cplusplus
}
#endif
