#ifndef H_CHUNKED_WRITER_TYPES_V0
#define H_CHUNKED_WRITER_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        ChunkedStatus_Success = 0,
        ChunkedStatus_InvalidArgument,
        ChunkedStatus_InternalError,
        ChunkedStatus_OutOfMemory,
        ChunkedStatus_IOError,
        ChunkedStatus_CompressionError,
        ChunkedStatus_InvalidSettings,
        ChunkedStatusCount,
    } ChunkedStatus;

    typedef enum
    {
        ChunkedLogLevel_Debug,
        ChunkedLogLevel_Info,
        ChunkedLogLevel_Warning,
        ChunkedLogLevel_Error,
        ChunkedLogLevel_None,
        ChunkedLogLevelCount
    } ChunkedLogLevel;

    /**
     * @brief Compression applied to each chunk file.
     * @note Gzip is the zero value, so zero-initialized settings compress.
     */
    typedef enum
    {
        ChunkedCompression_Gzip = 0,
        ChunkedCompression_None,
        ChunkedCompressionCount
    } ChunkedCompression;

    /**
     * @brief Called when the outgoing chunk could not be finalized during a
     * rotation. The writer has already moved on to the next chunk.
     * @param message A description of the failure.
     * @param user_data The pointer supplied in the writer settings.
     */
    typedef void (*ChunkedWarningCallback)(const char* message,
                                           void* user_data);

#ifdef __cplusplus
}
#endif

#endif // H_CHUNKED_WRITER_TYPES_V0
