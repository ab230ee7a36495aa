#pragma once

#include <stdexcept>
#include <string>

namespace chunked {
/// Invalid writer settings: the output directory is unusable, the size is
/// not positive, or the naming scheme is malformed.
class ConfigurationError : public std::runtime_error
{
  public:
    explicit ConfigurationError(const std::string& what)
      : std::runtime_error(what)
    {
    }
};

/// A chunk file could not be opened, written, flushed, or closed.
class IOFailure : public std::runtime_error
{
  public:
    explicit IOFailure(const std::string& what)
      : std::runtime_error(what)
    {
    }
};

/// zlib refused to set up or run a deflate stream.
class CompressionFailure : public IOFailure
{
  public:
    explicit CompressionFailure(const std::string& what)
      : IOFailure(what)
    {
    }
};
} // namespace chunked
