#pragma once

#include <cstddef> // size_t, std::byte
#include <cstdint> // uint64_t
#include <memory>  // std::unique_ptr
#include <span>    // std::span

namespace chunked {
class Sink
{
  public:
    virtual ~Sink() = default;

    /**
     * @brief Append data to the sink.
     * @param buf The buffer to append to the sink.
     * @return True if the write was successful, false otherwise.
     */
    [[nodiscard]] virtual bool write(std::span<const std::byte> buf) = 0;

    /**
     * @brief The number of bytes this sink has handed to its file so far.
     * @details Data still held by an encoder is not counted, so this can lag
     * behind the number of bytes written.
     */
    [[nodiscard]] virtual uint64_t bytes_on_disk() const noexcept = 0;

  protected:
    [[nodiscard]] virtual bool flush_() = 0;

    friend bool finalize_sink(std::unique_ptr<Sink>&& sink);
};

/**
 * @brief Flush a sink and release it.
 * @details The sink is destroyed whether or not the flush succeeds.
 * @return False if the flush failed, true otherwise. A null sink is a no-op.
 */
bool
finalize_sink(std::unique_ptr<Sink>&& sink);
} // namespace chunked
