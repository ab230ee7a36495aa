#pragma once

#include "chunked.errors.hh"
#include "logger.hh"

#define EXPECT(e, ...)                                                         \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw std::runtime_error(__err);                                   \
        }                                                                      \
    } while (0)
#define CHECK(e) EXPECT(e, "Expression evaluated as false:\n\t", #e)

#define EXPECT_CONFIG(e, ...)                                                  \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw chunked::ConfigurationError(__err);                          \
        }                                                                      \
    } while (0)

#define EXPECT_IO(e, ...)                                                      \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw chunked::IOFailure(__err);                                   \
        }                                                                      \
    } while (0)

#define EXPECT_COMPRESSION(e, ...)                                             \
    do {                                                                       \
        if (!(e)) {                                                            \
            const std::string __err = LOG_ERROR(__VA_ARGS__);                  \
            throw chunked::CompressionFailure(__err);                          \
        }                                                                      \
    } while (0)

#define EXPECT_VALID_ARGUMENT(e, ...)                                          \
    do {                                                                       \
        if (!(e)) {                                                            \
            LOG_ERROR(__VA_ARGS__);                                            \
            return ChunkedStatus_InvalidArgument;                              \
        }                                                                      \
    } while (0)
